#include "materializers/duckdb_cursor.hpp"
#include "metastore_errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace dumper {

namespace {

std::string ToLower(std::string value) {
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return value;
}

} // namespace

DuckDBCursor::DuckDBCursor(duckdb::unique_ptr<duckdb::MaterializedQueryResult> result) : result_(std::move(result)) {
	for (idx_t i = 0; i < result_->names.size(); i++) {
		// First occurrence wins for duplicated names
		columns_by_name_.emplace(ToLower(result_->names[i]), i);
	}
}

bool DuckDBCursor::Next() {
	if (row_ >= result_->RowCount()) {
		return false;
	}
	row_++;
	return true;
}

idx_t DuckDBCursor::RowIndex() const {
	return row_;
}

std::optional<idx_t> DuckDBCursor::FindColumn(const std::string &name) const {
	auto it = columns_by_name_.find(ToLower(name));
	if (it == columns_by_name_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<std::string> DuckDBCursor::ColumnNames() const {
	return result_->names;
}

Cell DuckDBCursor::GetCell(idx_t column) const {
	if (row_ == 0) {
		throw MetastoreException(MetastoreErrorCode::InvalidConfig, MetastoreErrorTag {"cursor", "GetCell", false},
		                         "cursor is not positioned on a record; call Next() first");
	}
	auto value = result_->GetValue(column, row_ - 1);
	if (value.IsNull()) {
		return std::nullopt;
	}
	return value.ToString();
}

std::unique_ptr<RowCursor> ExecuteCursorQuery(duckdb::Connection &connection, const std::string &query) {
	auto result = connection.Query(query);
	if (result->HasError()) {
		MetastoreErrorTag tag {"cursor", "ExecuteCursorQuery", false};
		throw MetastoreException(MetastoreErrorCode::TransportFailure, tag,
		                         "Catalog query failed: " + result->GetError());
	}
	return std::make_unique<DuckDBCursor>(std::move(result));
}

} // namespace dumper
