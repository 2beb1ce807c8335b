#pragma once

#include "main/field_coercion.hpp"
#include "main/metastore_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dumper {

/*
  Forward-only cursor over a query result.

  Driver backends wrap their result set here so that driver types never leak
  into row materialization. Columns are addressed by name; ordering of the
  result columns is irrelevant to callers.
*/
class RowCursor {
public:
	virtual ~RowCursor() = default;

	//! Advance to the next record. Returns false once the result is exhausted.
	virtual bool Next() = 0;
	//! 1-based ordinal of the current record
	virtual idx_t RowIndex() const = 0;

	//! Index of the column with the given name (case-insensitive)
	virtual std::optional<idx_t> FindColumn(const std::string &name) const = 0;
	virtual std::vector<std::string> ColumnNames() const = 0;
	//! Text of a cell of the current record; SQL NULL is std::nullopt
	virtual Cell GetCell(idx_t column) const = 0;
};

} // namespace dumper
