#include "main/row_schema.hpp"

#include <utility>

namespace dumper {

RecordCellSource::RecordCellSource(const char *source_name, std::vector<Cell> cells, std::optional<idx_t> row_index)
    : source_name_(source_name), cells_(std::move(cells)), row_index_(row_index) {
}

const char *RecordCellSource::SourceName() const {
	return source_name_;
}

std::optional<idx_t> RecordCellSource::RowIndex() const {
	return row_index_;
}

Cell RecordCellSource::GetCell(const RowSchema &schema, idx_t position) const {
	if (position >= cells_.size()) {
		FieldIdentity id {source_name_, schema.kind, schema.attributes[position], position, row_index_};
		ThrowMissingRequiredField(id, "record carries only " + std::to_string(cells_.size()) + " cells");
	}
	return cells_[position];
}

RowReader::RowReader(const RowSchema &schema, const CellSource &source) : schema_(schema), source_(source) {
}

FieldIdentity RowReader::Identify(idx_t position) const {
	FieldIdentity id;
	id.source = source_.SourceName();
	id.row_kind = schema_.kind;
	id.field = schema_.attributes[position];
	id.position = position;
	id.row_index = source_.RowIndex();
	return id;
}

std::string RowReader::RequiredString(idx_t position) const {
	return CoerceRequiredString(source_.GetCell(schema_, position), Identify(position));
}

std::string RowReader::StringOrEmpty(idx_t position) const {
	return CoerceStringOrEmpty(source_.GetCell(schema_, position));
}

std::optional<std::string> RowReader::NullableString(idx_t position) const {
	return CoerceNullableString(source_.GetCell(schema_, position));
}

int64_t RowReader::RequiredInteger(idx_t position) const {
	return CoerceRequiredInteger(source_.GetCell(schema_, position), Identify(position));
}

int64_t RowReader::IntegerOrZero(idx_t position) const {
	return CoerceIntegerOr(source_.GetCell(schema_, position), 0, Identify(position));
}

std::optional<int64_t> RowReader::NullableInteger(idx_t position) const {
	return CoerceNullableInteger(source_.GetCell(schema_, position), Identify(position));
}

std::string RenderRow(const RowSchema &schema, const std::vector<Cell> &cells) {
	std::string out;
	for (idx_t i = 0; i < schema.attributes.size(); i++) {
		if (i > 0) {
			out += ", ";
		}
		out += schema.attributes[i];
		out += '=';
		if (i < cells.size() && cells[i].has_value()) {
			out += *cells[i];
		} else {
			out += NULL_MARKER;
		}
	}
	out += '\n';
	return out;
}

std::vector<std::string> ToDelimitedCells(const std::vector<Cell> &cells) {
	std::vector<std::string> out;
	out.reserve(cells.size());
	for (const auto &cell : cells) {
		out.push_back(cell.has_value() ? *cell : std::string(NULL_MARKER));
	}
	return out;
}

} // namespace dumper
