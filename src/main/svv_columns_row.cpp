#include "main/svv_columns_row.hpp"

#include <utility>

namespace dumper {

namespace {

enum SvvColumnsAttribute : idx_t {
	TABLE_CATALOG,
	TABLE_SCHEMA,
	TABLE_NAME,
	COLUMN_NAME,
	ORDINAL_POSITION,
	COLUMN_DEFAULT,
	IS_NULLABLE,
	DATA_TYPE,
	CHARACTER_MAXIMUM_LENGTH,
	NUMERIC_PRECISION,
	NUMERIC_PRECISION_RADIX,
	NUMERIC_SCALE,
	DATETIME_PRECISION,
	INTERVAL_TYPE,
	INTERVAL_PRECISION,
	CHARACTER_SET_CATALOG,
	CHARACTER_SET_SCHEMA,
	CHARACTER_SET_NAME,
	COLLATION_CATALOG,
	COLLATION_SCHEMA,
	COLLATION_NAME,
	DOMAIN_NAME,
	REMARKS
};

} // namespace

SvvColumnsRow::SvvColumnsRow(Values values) : values_(std::move(values)) {
}

const RowSchema &SvvColumnsRow::Schema() {
	static const RowSchema schema {"svv_columns",
	                               {"table_catalog",
	                                "table_schema",
	                                "table_name",
	                                "column_name",
	                                "ordinal_position",
	                                "column_default",
	                                "is_nullable",
	                                "data_type",
	                                "character_maximum_length",
	                                "numeric_precision",
	                                "numeric_precision_radix",
	                                "numeric_scale",
	                                "datetime_precision",
	                                "interval_type",
	                                "interval_precision",
	                                "character_set_catalog",
	                                "character_set_schema",
	                                "character_set_name",
	                                "collation_catalog",
	                                "collation_schema",
	                                "collation_name",
	                                "domain_name",
	                                "remarks"}};
	return schema;
}

SvvColumnsRow::Values SvvColumnsRow::Read(const RowReader &reader) {
	Values v;
	v.table_catalog = reader.RequiredString(TABLE_CATALOG);
	v.table_schema = reader.RequiredString(TABLE_SCHEMA);
	v.table_name = reader.RequiredString(TABLE_NAME);
	v.column_name = reader.RequiredString(COLUMN_NAME);
	v.ordinal_position = reader.RequiredInteger(ORDINAL_POSITION);
	v.column_default = reader.StringOrEmpty(COLUMN_DEFAULT);
	v.is_nullable = reader.RequiredString(IS_NULLABLE);
	v.data_type = reader.RequiredString(DATA_TYPE);
	v.character_maximum_length = reader.IntegerOrZero(CHARACTER_MAXIMUM_LENGTH);
	v.numeric_precision = reader.IntegerOrZero(NUMERIC_PRECISION);
	v.numeric_precision_radix = reader.IntegerOrZero(NUMERIC_PRECISION_RADIX);
	v.numeric_scale = reader.IntegerOrZero(NUMERIC_SCALE);
	v.datetime_precision = reader.IntegerOrZero(DATETIME_PRECISION);
	v.interval_type = reader.StringOrEmpty(INTERVAL_TYPE);
	v.interval_precision = reader.StringOrEmpty(INTERVAL_PRECISION);
	v.character_set_catalog = reader.StringOrEmpty(CHARACTER_SET_CATALOG);
	v.character_set_schema = reader.StringOrEmpty(CHARACTER_SET_SCHEMA);
	v.character_set_name = reader.StringOrEmpty(CHARACTER_SET_NAME);
	v.collation_catalog = reader.StringOrEmpty(COLLATION_CATALOG);
	v.collation_schema = reader.StringOrEmpty(COLLATION_SCHEMA);
	v.collation_name = reader.StringOrEmpty(COLLATION_NAME);
	v.domain_name = reader.StringOrEmpty(DOMAIN_NAME);
	v.remarks = reader.StringOrEmpty(REMARKS);
	return v;
}

std::vector<Cell> SvvColumnsRow::Cells() const {
	return {values_.table_catalog,
	        values_.table_schema,
	        values_.table_name,
	        values_.column_name,
	        IntegerCell(values_.ordinal_position),
	        values_.column_default,
	        values_.is_nullable,
	        values_.data_type,
	        IntegerCell(values_.character_maximum_length),
	        IntegerCell(values_.numeric_precision),
	        IntegerCell(values_.numeric_precision_radix),
	        IntegerCell(values_.numeric_scale),
	        IntegerCell(values_.datetime_precision),
	        values_.interval_type,
	        values_.interval_precision,
	        values_.character_set_catalog,
	        values_.character_set_schema,
	        values_.character_set_name,
	        values_.collation_catalog,
	        values_.collation_schema,
	        values_.collation_name,
	        values_.domain_name,
	        values_.remarks};
}

} // namespace dumper
