#include "providers/hms/hms_capabilities.hpp"
#include "hive_metastore_constants.h"

#include <algorithm>
#include <cctype>

namespace dumper {

namespace {

//! Leading unsigned integer of `text` starting at `pos`; advances `pos`
bool ReadNumber(const std::string &text, size_t &pos, int &out) {
	size_t start = pos;
	int value = 0;
	while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
		if (value > 100000) {
			return false;
		}
		value = value * 10 + (text[pos] - '0');
		pos++;
	}
	if (pos == start) {
		return false;
	}
	out = value;
	return true;
}

} // namespace

HmsCapabilities CapabilitiesFor(HmsProtocolVersion version) {
	HmsCapabilities caps;
	caps.version = version;
	caps.max_partition_names_per_call = hms::api::g_hive_metastore_constants.MAX_PARTITION_NAMES_PER_CALL;
	switch (version) {
	case HmsProtocolVersion::V1:
		break;
	case HmsProtocolVersion::V2:
		caps.rewrite_enabled = true;
		caps.bulk_function_listing = true;
		break;
	case HmsProtocolVersion::V3:
		caps.catalog_names = true;
		caps.table_owner_type = true;
		caps.rewrite_enabled = true;
		caps.bulk_function_listing = true;
		break;
	}
	return caps;
}

MetastoreResult<HmsProtocolVersion> ProtocolVersionFromServer(const std::string &server_version) {
	using Result = MetastoreResult<HmsProtocolVersion>;

	// Some distributions prefix the string, e.g. "Hive 2.3.9"
	size_t pos = 0;
	while (pos < server_version.size() && !std::isdigit(static_cast<unsigned char>(server_version[pos]))) {
		pos++;
	}
	int major = 0;
	int minor = 0;
	if (!ReadNumber(server_version, pos, major) || pos >= server_version.size() || server_version[pos] != '.') {
		return Result::Error(MetastoreErrorCode::UnsupportedProtocolVersion,
		                     "Unable to parse metastore server version", server_version);
	}
	pos++;
	if (!ReadNumber(server_version, pos, minor)) {
		return Result::Error(MetastoreErrorCode::UnsupportedProtocolVersion,
		                     "Unable to parse metastore server version", server_version);
	}

	if (major == 0 && minor >= 13) {
		return Result::Success(HmsProtocolVersion::V1);
	}
	switch (major) {
	case 1:
		return Result::Success(HmsProtocolVersion::V1);
	case 2:
		return Result::Success(HmsProtocolVersion::V2);
	case 3:
	case 4:
		return Result::Success(HmsProtocolVersion::V3);
	default:
		return Result::Error(MetastoreErrorCode::UnsupportedProtocolVersion,
		                     "No metastore adapter for server version", server_version);
	}
}

MetastoreResult<HmsProtocolVersion> ParseProtocolVersionOption(const std::string &option) {
	using Result = MetastoreResult<HmsProtocolVersion>;
	std::string value = option;
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (!value.empty() && value[0] == 'v') {
		value.erase(0, 1);
	}
	if (value == "1") {
		return Result::Success(HmsProtocolVersion::V1);
	}
	if (value == "2") {
		return Result::Success(HmsProtocolVersion::V2);
	}
	if (value == "3") {
		return Result::Success(HmsProtocolVersion::V3);
	}
	return Result::Error(MetastoreErrorCode::UnsupportedProtocolVersion,
	                     "Configured protocol_version must be auto, 1, 2 or 3", option);
}

} // namespace dumper
