#pragma once

#include "main/canonical_row.hpp"
#include "main/metastore_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// Canonical rows of the Hive metadata kinds
//
// Each row is built from a metastore entity view (FromView / FromTable), or
// read back from a delimited export or a query over an exported catalog
// through the shared CanonicalRow paths. Attributes the metastore may leave
// unset are nullable; std::nullopt renders as \N.
//===--------------------------------------------------------------------===//

class HiveDatabaseRow : public CanonicalRow<HiveDatabaseRow> {
public:
	struct Values {
		std::string database_name;
		std::optional<std::string> description;
		std::optional<std::string> location;
		std::optional<std::string> owner_name;
		std::optional<std::string> catalog_name;
	};

	explicit HiveDatabaseRow(Values values);

	static const RowSchema &Schema();
	static Values Read(const RowReader &reader);
	static HiveDatabaseRow FromView(const MetastoreDatabaseView &view);
	std::vector<Cell> Cells() const;

	const std::string &DatabaseName() const {
		return values_.database_name;
	}
	const std::optional<std::string> &Description() const {
		return values_.description;
	}
	const std::optional<std::string> &Location() const {
		return values_.location;
	}
	const std::optional<std::string> &OwnerName() const {
		return values_.owner_name;
	}
	const std::optional<std::string> &CatalogName() const {
		return values_.catalog_name;
	}

private:
	Values values_;
};

class HiveTableRow : public CanonicalRow<HiveTableRow> {
public:
	struct Values {
		std::string database_name;
		std::string table_name;
		std::optional<std::string> table_type;
		std::optional<std::string> owner;
		std::optional<int64_t> create_time;
		std::optional<int64_t> last_access_time;
		std::optional<std::string> location;
		std::optional<std::string> view_original_text;
		std::optional<std::string> view_expanded_text;
		std::optional<std::string> catalog_name;
	};

	explicit HiveTableRow(Values values);

	static const RowSchema &Schema();
	static Values Read(const RowReader &reader);
	static HiveTableRow FromView(const MetastoreTableView &view);
	std::vector<Cell> Cells() const;

	const std::string &DatabaseName() const {
		return values_.database_name;
	}
	const std::string &TableName() const {
		return values_.table_name;
	}
	const std::optional<std::string> &TableType() const {
		return values_.table_type;
	}
	const std::optional<std::string> &Owner() const {
		return values_.owner;
	}
	const std::optional<int64_t> &CreateTime() const {
		return values_.create_time;
	}
	const std::optional<int64_t> &LastAccessTime() const {
		return values_.last_access_time;
	}
	const std::optional<std::string> &Location() const {
		return values_.location;
	}
	const std::optional<std::string> &ViewOriginalText() const {
		return values_.view_original_text;
	}
	const std::optional<std::string> &ViewExpandedText() const {
		return values_.view_expanded_text;
	}
	const std::optional<std::string> &CatalogName() const {
		return values_.catalog_name;
	}

private:
	Values values_;
};

//! One column of a table: regular fields first, then partition keys, with a
//! single 1-based ordinal across both.
class HiveColumnRow : public CanonicalRow<HiveColumnRow> {
public:
	struct Values {
		std::string database_name;
		std::string table_name;
		int64_t ordinal_position = 0;
		std::string column_name;
		std::optional<std::string> data_type;
		std::optional<std::string> comment;
		//! "YES" or "NO"
		std::string is_partition_key;
	};

	explicit HiveColumnRow(Values values);

	static const RowSchema &Schema();
	static Values Read(const RowReader &reader);
	static std::vector<HiveColumnRow> FromTable(const MetastoreTableView &view);
	std::vector<Cell> Cells() const;

	const std::string &DatabaseName() const {
		return values_.database_name;
	}
	const std::string &TableName() const {
		return values_.table_name;
	}
	int64_t OrdinalPosition() const {
		return values_.ordinal_position;
	}
	const std::string &ColumnName() const {
		return values_.column_name;
	}
	const std::optional<std::string> &DataType() const {
		return values_.data_type;
	}
	const std::optional<std::string> &Comment() const {
		return values_.comment;
	}
	const std::string &IsPartitionKey() const {
		return values_.is_partition_key;
	}

private:
	Values values_;
};

class HivePartitionRow : public CanonicalRow<HivePartitionRow> {
public:
	struct Values {
		std::string database_name;
		std::string table_name;
		std::string partition_name;
		std::optional<std::string> location;
		std::optional<int64_t> create_time;
	};

	explicit HivePartitionRow(Values values);

	static const RowSchema &Schema();
	static Values Read(const RowReader &reader);
	static std::vector<HivePartitionRow> FromTable(const MetastoreTableView &view);
	std::vector<Cell> Cells() const;

	const std::string &DatabaseName() const {
		return values_.database_name;
	}
	const std::string &TableName() const {
		return values_.table_name;
	}
	const std::string &PartitionName() const {
		return values_.partition_name;
	}
	const std::optional<std::string> &Location() const {
		return values_.location;
	}
	const std::optional<int64_t> &CreateTime() const {
		return values_.create_time;
	}

private:
	Values values_;
};

//! Functions carry no required attribute: old servers may leave any unset.
class HiveFunctionRow : public CanonicalRow<HiveFunctionRow> {
public:
	struct Values {
		std::optional<std::string> database_name;
		std::optional<std::string> function_name;
		std::optional<std::string> function_type;
		std::optional<std::string> class_name;
		std::optional<std::string> owner_name;
		std::optional<int64_t> create_time;
		std::optional<std::string> catalog_name;
	};

	explicit HiveFunctionRow(Values values);

	static const RowSchema &Schema();
	static Values Read(const RowReader &reader);
	static HiveFunctionRow FromView(const MetastoreFunctionView &view);
	std::vector<Cell> Cells() const;

	const std::optional<std::string> &DatabaseName() const {
		return values_.database_name;
	}
	const std::optional<std::string> &FunctionName() const {
		return values_.function_name;
	}
	const std::optional<std::string> &FunctionType() const {
		return values_.function_type;
	}
	const std::optional<std::string> &ClassName() const {
		return values_.class_name;
	}
	const std::optional<std::string> &OwnerName() const {
		return values_.owner_name;
	}
	const std::optional<int64_t> &CreateTime() const {
		return values_.create_time;
	}
	const std::optional<std::string> &CatalogName() const {
		return values_.catalog_name;
	}

private:
	Values values_;
};

} // namespace dumper
