#pragma once

#include "main/row_schema.hpp"
#include "materializers/cell_sources.hpp"
#include "materializers/row_cursor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// CanonicalRow<ROW> — shared construction paths and structural behaviour
//
// A row kind provides:
//   struct Values;                               the flat attribute set
//   static const RowSchema &Schema();             ordered attribute names
//   static Values Read(const RowReader &reader);  coercion per attribute
//   std::vector<Cell> Cells() const;              attribute cells in order
// and is immutable once constructed. Equality, rendering and delimited output
// all derive from Cells(), so two rows are equal iff every attribute is.
//===--------------------------------------------------------------------===//
template <class ROW>
class CanonicalRow {
public:
	//! Cursor materializer: the cursor's current record, by column name
	static ROW FromCursor(const RowCursor &cursor) {
		CursorCellSource source(cursor);
		return FromSource(source);
	}

	//! Delimited-file materializer: one parsed line, by position
	static ROW FromDelimited(const std::vector<std::string> &cells, std::optional<idx_t> row_index = std::nullopt) {
		DelimitedCellSource source(cells, row_index);
		source.RequireWidth(ROW::Schema());
		return FromSource(source);
	}

	//! Re-parse a line produced by ToString()
	static ROW FromRendered(const std::string &line) {
		RenderedCellSource source(ROW::Schema(), line);
		return FromSource(source);
	}

	static ROW FromSource(const CellSource &source) {
		RowReader reader(ROW::Schema(), source);
		return ROW(ROW::Read(reader));
	}

	//! Human-readable line with a trailing line terminator
	std::string ToString() const {
		return RenderRow(ROW::Schema(), Self().Cells());
	}

	std::vector<std::string> ToDelimitedCells() const {
		return dumper::ToDelimitedCells(Self().Cells());
	}

	bool operator==(const CanonicalRow &other) const {
		return Self().Cells() == other.Self().Cells();
	}

	bool operator!=(const CanonicalRow &other) const {
		return !(*this == other);
	}

protected:
	const ROW &Self() const {
		return static_cast<const ROW &>(*this);
	}
};

} // namespace dumper
