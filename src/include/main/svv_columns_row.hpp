#pragma once

#include "main/canonical_row.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// SvvColumnsRow — column descriptor of a SQL-queryable catalog
//
// Same shape whether read from a query cursor over SVV_COLUMNS or from a
// previously exported delimited file. Identity attributes are required
// strings; descriptive strings default to "" and numeric details to 0 when
// the source has no value.
//===--------------------------------------------------------------------===//
class SvvColumnsRow : public CanonicalRow<SvvColumnsRow> {
public:
	struct Values {
		std::string table_catalog;
		std::string table_schema;
		std::string table_name;
		std::string column_name;
		int64_t ordinal_position = 0;
		std::string column_default;
		std::string is_nullable;
		std::string data_type;
		int64_t character_maximum_length = 0;
		int64_t numeric_precision = 0;
		int64_t numeric_precision_radix = 0;
		int64_t numeric_scale = 0;
		int64_t datetime_precision = 0;
		std::string interval_type;
		std::string interval_precision;
		std::string character_set_catalog;
		std::string character_set_schema;
		std::string character_set_name;
		std::string collation_catalog;
		std::string collation_schema;
		std::string collation_name;
		std::string domain_name;
		std::string remarks;
	};

	explicit SvvColumnsRow(Values values);

	static const RowSchema &Schema();
	static Values Read(const RowReader &reader);
	std::vector<Cell> Cells() const;

	const std::string &TableCatalog() const {
		return values_.table_catalog;
	}
	const std::string &TableSchema() const {
		return values_.table_schema;
	}
	const std::string &TableName() const {
		return values_.table_name;
	}
	const std::string &ColumnName() const {
		return values_.column_name;
	}
	int64_t OrdinalPosition() const {
		return values_.ordinal_position;
	}
	const std::string &ColumnDefault() const {
		return values_.column_default;
	}
	const std::string &IsNullable() const {
		return values_.is_nullable;
	}
	const std::string &DataType() const {
		return values_.data_type;
	}
	int64_t CharacterMaximumLength() const {
		return values_.character_maximum_length;
	}
	int64_t NumericPrecision() const {
		return values_.numeric_precision;
	}
	int64_t NumericPrecisionRadix() const {
		return values_.numeric_precision_radix;
	}
	int64_t NumericScale() const {
		return values_.numeric_scale;
	}
	int64_t DatetimePrecision() const {
		return values_.datetime_precision;
	}
	const std::string &IntervalType() const {
		return values_.interval_type;
	}
	const std::string &IntervalPrecision() const {
		return values_.interval_precision;
	}
	const std::string &CharacterSetCatalog() const {
		return values_.character_set_catalog;
	}
	const std::string &CharacterSetSchema() const {
		return values_.character_set_schema;
	}
	const std::string &CharacterSetName() const {
		return values_.character_set_name;
	}
	const std::string &CollationCatalog() const {
		return values_.collation_catalog;
	}
	const std::string &CollationSchema() const {
		return values_.collation_schema;
	}
	const std::string &CollationName() const {
		return values_.collation_name;
	}
	const std::string &DomainName() const {
		return values_.domain_name;
	}
	const std::string &Remarks() const {
		return values_.remarks;
	}

private:
	Values values_;
};

} // namespace dumper
