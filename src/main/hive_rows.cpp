#include "main/hive_rows.hpp"

#include <utility>

namespace dumper {

//===--------------------------------------------------------------------===//
// HiveDatabaseRow
//===--------------------------------------------------------------------===//
HiveDatabaseRow::HiveDatabaseRow(Values values) : values_(std::move(values)) {
}

const RowSchema &HiveDatabaseRow::Schema() {
	static const RowSchema schema {"hive_databases",
	                               {"database_name", "description", "location", "owner_name", "catalog_name"}};
	return schema;
}

HiveDatabaseRow::Values HiveDatabaseRow::Read(const RowReader &reader) {
	Values v;
	v.database_name = reader.RequiredString(0);
	v.description = reader.NullableString(1);
	v.location = reader.NullableString(2);
	v.owner_name = reader.NullableString(3);
	v.catalog_name = reader.NullableString(4);
	return v;
}

HiveDatabaseRow HiveDatabaseRow::FromView(const MetastoreDatabaseView &view) {
	RecordCellSource source("view", {view.name, view.description, view.location, view.owner_name, view.catalog_name});
	return FromSource(source);
}

std::vector<Cell> HiveDatabaseRow::Cells() const {
	return {values_.database_name, values_.description, values_.location, values_.owner_name, values_.catalog_name};
}

//===--------------------------------------------------------------------===//
// HiveTableRow
//===--------------------------------------------------------------------===//
HiveTableRow::HiveTableRow(Values values) : values_(std::move(values)) {
}

const RowSchema &HiveTableRow::Schema() {
	static const RowSchema schema {"hive_tables",
	                               {"database_name", "table_name", "table_type", "owner", "create_time",
	                                "last_access_time", "location", "view_original_text", "view_expanded_text",
	                                "catalog_name"}};
	return schema;
}

HiveTableRow::Values HiveTableRow::Read(const RowReader &reader) {
	Values v;
	v.database_name = reader.RequiredString(0);
	v.table_name = reader.RequiredString(1);
	v.table_type = reader.NullableString(2);
	v.owner = reader.NullableString(3);
	v.create_time = reader.NullableInteger(4);
	v.last_access_time = reader.NullableInteger(5);
	v.location = reader.NullableString(6);
	v.view_original_text = reader.NullableString(7);
	v.view_expanded_text = reader.NullableString(8);
	v.catalog_name = reader.NullableString(9);
	return v;
}

HiveTableRow HiveTableRow::FromView(const MetastoreTableView &view) {
	RecordCellSource source("view", {view.database_name, view.table_name, view.table_type, view.owner,
	                                 IntegerCell(view.create_time), IntegerCell(view.last_access_time), view.location,
	                                 view.view_original_text, view.view_expanded_text, view.catalog_name});
	return FromSource(source);
}

std::vector<Cell> HiveTableRow::Cells() const {
	return {values_.database_name,
	        values_.table_name,
	        values_.table_type,
	        values_.owner,
	        IntegerCell(values_.create_time),
	        IntegerCell(values_.last_access_time),
	        values_.location,
	        values_.view_original_text,
	        values_.view_expanded_text,
	        values_.catalog_name};
}

//===--------------------------------------------------------------------===//
// HiveColumnRow
//===--------------------------------------------------------------------===//
HiveColumnRow::HiveColumnRow(Values values) : values_(std::move(values)) {
}

const RowSchema &HiveColumnRow::Schema() {
	static const RowSchema schema {"hive_columns",
	                               {"database_name", "table_name", "ordinal_position", "column_name", "data_type",
	                                "comment", "is_partition_key"}};
	return schema;
}

HiveColumnRow::Values HiveColumnRow::Read(const RowReader &reader) {
	Values v;
	v.database_name = reader.RequiredString(0);
	v.table_name = reader.RequiredString(1);
	v.ordinal_position = reader.RequiredInteger(2);
	v.column_name = reader.RequiredString(3);
	v.data_type = reader.NullableString(4);
	v.comment = reader.NullableString(5);
	v.is_partition_key = reader.RequiredString(6);
	return v;
}

std::vector<HiveColumnRow> HiveColumnRow::FromTable(const MetastoreTableView &view) {
	std::vector<HiveColumnRow> rows;
	rows.reserve(view.fields.size() + view.partition_keys.size());
	idx_t ordinal = 0;
	auto append = [&](const MetastoreFieldView &field, const char *is_partition_key) {
		ordinal++;
		RecordCellSource source("view",
		                        {view.database_name, view.table_name, IntegerCell(static_cast<int64_t>(ordinal)),
		                         field.name, field.type, field.comment, std::string(is_partition_key)},
		                        ordinal);
		rows.push_back(FromSource(source));
	};
	for (const auto &field : view.fields) {
		append(field, "NO");
	}
	for (const auto &key : view.partition_keys) {
		append(key, "YES");
	}
	return rows;
}

std::vector<Cell> HiveColumnRow::Cells() const {
	return {values_.database_name, values_.table_name, IntegerCell(values_.ordinal_position), values_.column_name,
	        values_.data_type,     values_.comment,    values_.is_partition_key};
}

//===--------------------------------------------------------------------===//
// HivePartitionRow
//===--------------------------------------------------------------------===//
HivePartitionRow::HivePartitionRow(Values values) : values_(std::move(values)) {
}

const RowSchema &HivePartitionRow::Schema() {
	static const RowSchema schema {"hive_partitions",
	                               {"database_name", "table_name", "partition_name", "location", "create_time"}};
	return schema;
}

HivePartitionRow::Values HivePartitionRow::Read(const RowReader &reader) {
	Values v;
	v.database_name = reader.RequiredString(0);
	v.table_name = reader.RequiredString(1);
	v.partition_name = reader.RequiredString(2);
	v.location = reader.NullableString(3);
	v.create_time = reader.NullableInteger(4);
	return v;
}

std::vector<HivePartitionRow> HivePartitionRow::FromTable(const MetastoreTableView &view) {
	std::vector<HivePartitionRow> rows;
	rows.reserve(view.partitions.size());
	idx_t index = 0;
	for (const auto &partition : view.partitions) {
		index++;
		RecordCellSource source("view",
		                        {view.database_name, view.table_name, partition.partition_name, partition.location,
		                         IntegerCell(partition.create_time)},
		                        index);
		rows.push_back(FromSource(source));
	}
	return rows;
}

std::vector<Cell> HivePartitionRow::Cells() const {
	return {values_.database_name, values_.table_name, values_.partition_name, values_.location,
	        IntegerCell(values_.create_time)};
}

//===--------------------------------------------------------------------===//
// HiveFunctionRow
//===--------------------------------------------------------------------===//
HiveFunctionRow::HiveFunctionRow(Values values) : values_(std::move(values)) {
}

const RowSchema &HiveFunctionRow::Schema() {
	static const RowSchema schema {"hive_functions",
	                               {"database_name", "function_name", "function_type", "class_name", "owner_name",
	                                "create_time", "catalog_name"}};
	return schema;
}

HiveFunctionRow::Values HiveFunctionRow::Read(const RowReader &reader) {
	Values v;
	v.database_name = reader.NullableString(0);
	v.function_name = reader.NullableString(1);
	v.function_type = reader.NullableString(2);
	v.class_name = reader.NullableString(3);
	v.owner_name = reader.NullableString(4);
	v.create_time = reader.NullableInteger(5);
	v.catalog_name = reader.NullableString(6);
	return v;
}

HiveFunctionRow HiveFunctionRow::FromView(const MetastoreFunctionView &view) {
	RecordCellSource source("view", {view.database_name, view.function_name, view.function_type, view.class_name,
	                                 view.owner_name, IntegerCell(view.create_time), view.catalog_name});
	return FromSource(source);
}

std::vector<Cell> HiveFunctionRow::Cells() const {
	return {values_.database_name, values_.function_name, values_.function_type, values_.class_name,
	        values_.owner_name,    IntegerCell(values_.create_time), values_.catalog_name};
}

} // namespace dumper
