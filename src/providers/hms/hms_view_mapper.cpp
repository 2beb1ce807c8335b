#include "providers/hms/hms_view_mapper.hpp"

namespace dumper {

namespace {

template <class T>
std::optional<T> IfSet(bool isset, const T &value) {
	if (!isset) {
		return std::nullopt;
	}
	return value;
}

template <class T>
std::optional<T> IfCarried(bool carried, bool isset, const T &value) {
	return IfSet(carried && isset, value);
}

std::optional<std::string> StorageLocation(bool sd_isset, const hms::api::StorageDescriptor &sd) {
	return IfSet(sd_isset && sd.__isset.location, sd.location);
}

} // namespace

const char *HmsViewMapper::PrincipalTypeToString(hms::api::PrincipalType::type type) {
	switch (type) {
	case hms::api::PrincipalType::USER:
		return "USER";
	case hms::api::PrincipalType::ROLE:
		return "ROLE";
	case hms::api::PrincipalType::GROUP:
		return "GROUP";
	default:
		return "UNKNOWN";
	}
}

const char *HmsViewMapper::FunctionTypeToString(hms::api::FunctionType::type type) {
	switch (type) {
	case hms::api::FunctionType::JAVA:
		return "JAVA";
	default:
		return "UNKNOWN";
	}
}

MetastoreDatabaseView HmsViewMapper::MapDatabase(const hms::api::Database &database, const HmsCapabilities &caps) {
	MetastoreDatabaseView view;
	view.name = IfSet(database.__isset.name, database.name);
	view.description = IfSet(database.__isset.description, database.description);
	view.location = IfSet(database.__isset.locationUri, database.locationUri);
	view.owner_name = IfSet(database.__isset.ownerName, database.ownerName);
	view.catalog_name = IfCarried(caps.catalog_names, database.__isset.catalogName, database.catalogName);
	return view;
}

MetastoreFieldView HmsViewMapper::MapField(const hms::api::FieldSchema &field) {
	MetastoreFieldView view;
	view.name = IfSet(field.__isset.name, field.name);
	view.type = IfSet(field.__isset.type, field.type);
	view.comment = IfSet(field.__isset.comment, field.comment);
	return view;
}

MetastoreTableView HmsViewMapper::MapTable(const hms::api::Table &table, const HmsCapabilities &caps) {
	MetastoreTableView view;
	view.database_name = IfSet(table.__isset.dbName, table.dbName);
	view.table_name = IfSet(table.__isset.tableName, table.tableName);
	view.table_type = IfSet(table.__isset.tableType, table.tableType);
	view.create_time = IfSet(table.__isset.createTime, table.createTime);
	view.last_access_time = IfSet(table.__isset.lastAccessTime, table.lastAccessTime);
	view.owner = IfSet(table.__isset.owner, table.owner);
	view.view_original_text = IfSet(table.__isset.viewOriginalText, table.viewOriginalText);
	view.view_expanded_text = IfSet(table.__isset.viewExpandedText, table.viewExpandedText);
	view.location = StorageLocation(table.__isset.sd, table.sd);
	view.temporary = IfSet(table.__isset.temporary, table.temporary);
	view.rewrite_enabled = IfCarried(caps.rewrite_enabled, table.__isset.rewriteEnabled, table.rewriteEnabled);
	view.catalog_name = IfCarried(caps.catalog_names, table.__isset.catName, table.catName);
	if (caps.table_owner_type && table.__isset.ownerType) {
		view.owner_type = std::string(PrincipalTypeToString(table.ownerType));
	}
	if (table.__isset.partitionKeys) {
		view.partition_keys.reserve(table.partitionKeys.size());
		for (const auto &key : table.partitionKeys) {
			view.partition_keys.push_back(MapField(key));
		}
	}
	return view;
}

MetastorePartitionView HmsViewMapper::MapPartition(const std::string &partition_name,
                                                   const hms::api::Partition &partition) {
	MetastorePartitionView view;
	view.partition_name = partition_name;
	if (partition.__isset.values) {
		view.values = partition.values;
	}
	view.location = StorageLocation(partition.__isset.sd, partition.sd);
	view.create_time = IfSet(partition.__isset.createTime, partition.createTime);
	return view;
}

MetastoreFunctionView HmsViewMapper::MapFunction(const hms::api::Function &function, const HmsCapabilities &caps) {
	MetastoreFunctionView view;
	view.database_name = IfSet(function.__isset.dbName, function.dbName);
	view.function_name = IfSet(function.__isset.functionName, function.functionName);
	if (function.__isset.functionType) {
		view.function_type = std::string(FunctionTypeToString(function.functionType));
	}
	view.class_name = IfSet(function.__isset.className, function.className);
	view.owner_name = IfSet(function.__isset.ownerName, function.ownerName);
	view.create_time = IfSet(function.__isset.createTime, function.createTime);
	view.catalog_name = IfCarried(caps.catalog_names, function.__isset.catName, function.catName);
	return view;
}

} // namespace dumper
