#include "materializers/cell_sources.hpp"
#include "metastore_errors.hpp"

namespace dumper {

namespace {

Cell CellFromText(const std::string &text) {
	if (text == NULL_MARKER) {
		return std::nullopt;
	}
	return text;
}

FieldIdentity IdentifyField(const CellSource &source, const RowSchema &schema, idx_t position) {
	FieldIdentity id;
	id.source = source.SourceName();
	id.row_kind = schema.kind;
	id.field = schema.attributes[position];
	id.position = position;
	id.row_index = source.RowIndex();
	return id;
}

} // namespace

//===--------------------------------------------------------------------===//
// CursorCellSource
//===--------------------------------------------------------------------===//
CursorCellSource::CursorCellSource(const RowCursor &cursor) : cursor_(cursor) {
}

const char *CursorCellSource::SourceName() const {
	return "cursor";
}

std::optional<idx_t> CursorCellSource::RowIndex() const {
	return cursor_.RowIndex();
}

Cell CursorCellSource::GetCell(const RowSchema &schema, idx_t position) const {
	auto column = cursor_.FindColumn(schema.attributes[position]);
	if (!column.has_value()) {
		ThrowMissingRequiredField(IdentifyField(*this, schema, position), "column is absent from the query result");
	}
	return cursor_.GetCell(*column);
}

//===--------------------------------------------------------------------===//
// DelimitedCellSource
//===--------------------------------------------------------------------===//
DelimitedCellSource::DelimitedCellSource(const std::vector<std::string> &cells, std::optional<idx_t> row_index)
    : cells_(cells), row_index_(row_index) {
}

const char *DelimitedCellSource::SourceName() const {
	return "delimited";
}

std::optional<idx_t> DelimitedCellSource::RowIndex() const {
	return row_index_;
}

Cell DelimitedCellSource::GetCell(const RowSchema &schema, idx_t position) const {
	if (position >= cells_.size()) {
		ThrowMissingRequiredField(IdentifyField(*this, schema, position),
		                          "line has " + std::to_string(cells_.size()) + " cells, schema requires " +
		                              std::to_string(schema.Size()));
	}
	return CellFromText(cells_[position]);
}

void DelimitedCellSource::RequireWidth(const RowSchema &schema) const {
	if (cells_.size() <= schema.Size()) {
		return;
	}
	MetastoreErrorTag tag {"delimited", "Materialize", false};
	tag.entity = schema.kind;
	tag.position = schema.Size();
	tag.row_index = row_index_;
	throw MetastoreException(MetastoreErrorCode::InvalidConfig, tag,
	                         "line has " + std::to_string(cells_.size()) + " cells, " + schema.kind + " has " +
	                             std::to_string(schema.Size()) + " attributes");
}

//===--------------------------------------------------------------------===//
// RenderedCellSource
//===--------------------------------------------------------------------===//
RenderedCellSource::RenderedCellSource(const RowSchema &schema, const std::string &line)
    : cells_(schema.attributes.size()) {
	// Only the terminator RenderRow appends; a value may itself end in CR or LF
	std::string body = line;
	if (!body.empty() && body.back() == '\n') {
		body.pop_back();
	}
	if (schema.attributes.empty()) {
		return;
	}
	auto first_key = schema.attributes[0] + "=";
	if (body.compare(0, first_key.size(), first_key) != 0) {
		return;
	}

	// Values are located by the next expected key, so a value may itself
	// contain ", " as long as it does not contain ", <next key>=".
	idx_t value_start = first_key.size();
	for (idx_t i = 0; i < schema.attributes.size(); i++) {
		if (i + 1 == schema.attributes.size()) {
			cells_[i].emplace(CellFromText(body.substr(value_start)));
			break;
		}
		auto separator = ", " + schema.attributes[i + 1] + "=";
		auto next = body.find(separator, value_start);
		if (next == std::string::npos) {
			cells_[i].emplace(CellFromText(body.substr(value_start)));
			break;
		}
		cells_[i].emplace(CellFromText(body.substr(value_start, next - value_start)));
		value_start = next + separator.size();
	}
}

const char *RenderedCellSource::SourceName() const {
	return "rendered";
}

std::optional<idx_t> RenderedCellSource::RowIndex() const {
	return std::nullopt;
}

Cell RenderedCellSource::GetCell(const RowSchema &schema, idx_t position) const {
	if (position >= cells_.size() || !cells_[position].has_value()) {
		ThrowMissingRequiredField(IdentifyField(*this, schema, position),
		                          "key '" + schema.attributes[position] + "=' not found in rendered line");
	}
	return *cells_[position];
}

} // namespace dumper
