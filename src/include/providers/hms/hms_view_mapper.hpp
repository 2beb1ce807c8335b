#pragma once

#include "main/metastore_types.hpp"
#include "providers/hms/hms_capabilities.hpp"
#include "hive_metastore_types.h"

#include <string>

namespace dumper {

//===--------------------------------------------------------------------===//
// HmsViewMapper — decoded Thrift structs to metastore views
//
// An attribute is present in the view only when the struct's __isset flag
// is raised and the negotiated revision carries it. Values are copied as
// received; a set-but-empty string stays "".
//===--------------------------------------------------------------------===//
class HmsViewMapper {
public:
	static MetastoreDatabaseView MapDatabase(const hms::api::Database &database, const HmsCapabilities &caps);
	static MetastoreTableView MapTable(const hms::api::Table &table, const HmsCapabilities &caps);
	static MetastoreFieldView MapField(const hms::api::FieldSchema &field);
	//! `partition_name` is the name the partition was fetched by
	static MetastorePartitionView MapPartition(const std::string &partition_name, const hms::api::Partition &partition);
	static MetastoreFunctionView MapFunction(const hms::api::Function &function, const HmsCapabilities &caps);

	static const char *PrincipalTypeToString(hms::api::PrincipalType::type type);
	static const char *FunctionTypeToString(hms::api::FunctionType::type type);
};

} // namespace dumper
