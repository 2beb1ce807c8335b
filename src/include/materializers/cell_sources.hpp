#pragma once

#include "main/row_schema.hpp"
#include "materializers/row_cursor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// CursorCellSource — current record of a RowCursor, addressed by column name
//===--------------------------------------------------------------------===//
class CursorCellSource : public CellSource {
public:
	explicit CursorCellSource(const RowCursor &cursor);

	const char *SourceName() const override;
	std::optional<idx_t> RowIndex() const override;
	//! Throws MissingRequiredField if the cursor has no column of that name
	Cell GetCell(const RowSchema &schema, idx_t position) const override;

private:
	const RowCursor &cursor_;
};

//===--------------------------------------------------------------------===//
// DelimitedCellSource — one parsed line of a delimited file, by position
//
// The cell \N is absent; an empty cell is the empty string. Lines are fixed
// width: a line with more cells than the schema is malformed.
//===--------------------------------------------------------------------===//
class DelimitedCellSource : public CellSource {
public:
	DelimitedCellSource(const std::vector<std::string> &cells, std::optional<idx_t> row_index);

	const char *SourceName() const override;
	std::optional<idx_t> RowIndex() const override;
	//! Throws MissingRequiredField if the line is shorter than `position`
	Cell GetCell(const RowSchema &schema, idx_t position) const override;
	//! Throws InvalidConfig if the line has more cells than `schema`
	void RequireWidth(const RowSchema &schema) const;

private:
	const std::vector<std::string> &cells_;
	std::optional<idx_t> row_index_;
};

//===--------------------------------------------------------------------===//
// RenderedCellSource — a line produced by RenderRow, parsed back by key
//===--------------------------------------------------------------------===//
class RenderedCellSource : public CellSource {
public:
	RenderedCellSource(const RowSchema &schema, const std::string &line);

	const char *SourceName() const override;
	std::optional<idx_t> RowIndex() const override;
	Cell GetCell(const RowSchema &schema, idx_t position) const override;

private:
	//! Parsed cells; a key that could not be located leaves its slot missing
	std::vector<std::optional<Cell>> cells_;
};

} // namespace dumper
