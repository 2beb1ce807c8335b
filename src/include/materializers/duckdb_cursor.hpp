#pragma once

#include "materializers/row_cursor.hpp"
#include "duckdb.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// DuckDBCursor — RowCursor over a materialized DuckDB query result
//
// Cells are the text rendering of each value (DuckDB's Value::ToString), so
// INTEGER 255 and VARCHAR '255' read identically. NULL is an absent cell.
//===--------------------------------------------------------------------===//
class DuckDBCursor : public RowCursor {
public:
	explicit DuckDBCursor(duckdb::unique_ptr<duckdb::MaterializedQueryResult> result);

	bool Next() override;
	idx_t RowIndex() const override;
	std::optional<idx_t> FindColumn(const std::string &name) const override;
	std::vector<std::string> ColumnNames() const override;
	Cell GetCell(idx_t column) const override;

private:
	duckdb::unique_ptr<duckdb::MaterializedQueryResult> result_;
	std::unordered_map<std::string, idx_t> columns_by_name_;
	//! Number of records consumed so far; the current record is row_ - 1
	idx_t row_ = 0;
};

//! Run a query on an open connection and return a cursor over its result.
//! Throws MetastoreException(TransportFailure) carrying the driver error.
std::unique_ptr<RowCursor> ExecuteCursorQuery(duckdb::Connection &connection, const std::string &query);

} // namespace dumper
