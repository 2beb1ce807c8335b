#pragma once

#include "metastore_errors.hpp"

#include <cstdint>
#include <string>

namespace dumper {

//===--------------------------------------------------------------------===//
// HmsProtocolVersion — metastore wire revisions with distinct adapters
//
//   V1: Hive 0.13 - 1.x  (no bulk function listing)
//   V2: Hive 2.x         (get_all_functions, rewriteEnabled)
//   V3: Hive 3.x - 4.x   (catalogs, table owner type)
//===--------------------------------------------------------------------===//
enum class HmsProtocolVersion : uint8_t { V1 = 1, V2 = 2, V3 = 3 };

inline const char *HmsProtocolVersionToString(HmsProtocolVersion version) {
	switch (version) {
	case HmsProtocolVersion::V1:
		return "v1";
	case HmsProtocolVersion::V2:
		return "v2";
	case HmsProtocolVersion::V3:
		return "v3";
	default:
		return "unknown";
	}
}

//===--------------------------------------------------------------------===//
// HmsCapabilities — what the negotiated revision carries
//
// Determined once per session and immutable afterwards. A field the revision
// does not carry is reported as "no data available" regardless of what the
// decoder produced.
//===--------------------------------------------------------------------===//
struct HmsCapabilities {
	HmsProtocolVersion version = HmsProtocolVersion::V3;
	//! Version string reported by the server, empty when pinned by config
	std::string server_version;
	//! Database.catalogName, Table.catName, Partition.catName, Function.catName
	bool catalog_names = false;
	//! Table.ownerType
	bool table_owner_type = false;
	//! Table.rewriteEnabled
	bool rewrite_enabled = false;
	//! get_all_functions; otherwise functions are enumerated per database
	bool bulk_function_listing = false;
	//! Largest partition-name count one get_partition_names call can return
	int16_t max_partition_names_per_call = 0;
};

//! Capability table for a revision
HmsCapabilities CapabilitiesFor(HmsProtocolVersion version);

//! Map a reported server version ("2.3.9", "3.1.3-amzn-1", "4.0.0-beta-1")
//! onto a revision. UnsupportedProtocolVersion for anything outside 0.13 - 4.x
//! or an unparseable string.
MetastoreResult<HmsProtocolVersion> ProtocolVersionFromServer(const std::string &server_version);

//! Parse a pinned protocol_version value: "1", "2", "3" (optionally prefixed
//! with "v"). "auto" is handled by the selector; anything else is
//! UnsupportedProtocolVersion.
MetastoreResult<HmsProtocolVersion> ParseProtocolVersionOption(const std::string &option);

} // namespace dumper
