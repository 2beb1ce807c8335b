#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dumper {

typedef uint64_t idx_t;

//===--------------------------------------------------------------------===//
// Metastore entity views
//
// Read-only snapshots of one RPC response. Every attribute is optional:
// std::nullopt means "no data available", either because the server left the
// field unset on the wire or because the negotiated protocol revision does
// not carry it at all. A set-but-empty string stays "".
//===--------------------------------------------------------------------===//

struct MetastoreFieldView {
	std::optional<std::string> name;
	std::optional<std::string> type;
	std::optional<std::string> comment;
};

//! Partition keys share the field shape
using MetastorePartitionKeyView = MetastoreFieldView;

struct MetastorePartitionView {
	//! Name as enumerated by the server, e.g. "dt=2024-01-01/region=eu"
	std::string partition_name;
	std::vector<std::string> values;
	std::optional<std::string> location;
	std::optional<int32_t> create_time;
};

struct MetastoreDatabaseView {
	std::optional<std::string> name;
	std::optional<std::string> description;
	std::optional<std::string> location;
	std::optional<std::string> owner_name;
	std::optional<std::string> catalog_name;
};

struct MetastoreTableView {
	std::optional<std::string> database_name;
	std::optional<std::string> table_name;
	std::optional<std::string> table_type;
	std::optional<int32_t> create_time;
	std::optional<int32_t> last_access_time;
	std::optional<std::string> owner;
	std::optional<std::string> owner_type;
	std::optional<std::string> view_original_text;
	std::optional<std::string> view_expanded_text;
	std::optional<std::string> location;
	std::optional<std::string> catalog_name;
	std::optional<bool> temporary;
	std::optional<bool> rewrite_enabled;

	//! Columns as returned by the dedicated field listing call
	std::vector<MetastoreFieldView> fields;
	std::vector<MetastorePartitionKeyView> partition_keys;
	//! Fully fetched; a failure on any partition fails the whole table
	std::vector<MetastorePartitionView> partitions;

	bool IsPartitioned() const {
		return !partition_keys.empty();
	}
};

struct MetastoreFunctionView {
	std::optional<std::string> database_name;
	std::optional<std::string> function_name;
	//! Rendered enum name, e.g. "JAVA"
	std::optional<std::string> function_type;
	std::optional<std::string> class_name;
	std::optional<std::string> owner_name;
	std::optional<int32_t> create_time;
	std::optional<std::string> catalog_name;
};

} // namespace dumper
