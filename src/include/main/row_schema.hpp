#pragma once

#include "main/field_coercion.hpp"
#include "main/metastore_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// RowSchema — ordered attribute list of one canonical row kind
//===--------------------------------------------------------------------===//
struct RowSchema {
	//! Kind name, also the stem of the delimited output file ("svv_columns")
	std::string kind;
	std::vector<std::string> attributes;

	idx_t Size() const {
		return attributes.size();
	}
};

//===--------------------------------------------------------------------===//
// CellSource — one raw record as seen by a row materializer
//
// Implementations decide how an attribute is located (by column name, by
// position, by rendered key) and throw MissingRequiredField when the record
// structurally lacks it. A present cell may still be std::nullopt (SQL NULL,
// \N, unset RPC field); coercion decides what that means.
//===--------------------------------------------------------------------===//
class CellSource {
public:
	virtual ~CellSource() = default;

	//! Source tag used in error reports ("cursor", "delimited", ...)
	virtual const char *SourceName() const = 0;
	//! 1-based ordinal of the record within its source, if known
	virtual std::optional<idx_t> RowIndex() const = 0;
	//! Cell of attribute `position` of `schema`
	virtual Cell GetCell(const RowSchema &schema, idx_t position) const = 0;
};

//! Cells of one already-assembled record (RPC views are flattened into this)
class RecordCellSource : public CellSource {
public:
	RecordCellSource(const char *source_name, std::vector<Cell> cells, std::optional<idx_t> row_index = std::nullopt);

	const char *SourceName() const override;
	std::optional<idx_t> RowIndex() const override;
	Cell GetCell(const RowSchema &schema, idx_t position) const override;

private:
	const char *source_name_;
	std::vector<Cell> cells_;
	std::optional<idx_t> row_index_;
};

//===--------------------------------------------------------------------===//
// RowReader — applies field coercion to the cells of one source
//===--------------------------------------------------------------------===//
class RowReader {
public:
	RowReader(const RowSchema &schema, const CellSource &source);

	std::string RequiredString(idx_t position) const;
	std::string StringOrEmpty(idx_t position) const;
	std::optional<std::string> NullableString(idx_t position) const;
	int64_t RequiredInteger(idx_t position) const;
	int64_t IntegerOrZero(idx_t position) const;
	std::optional<int64_t> NullableInteger(idx_t position) const;

	FieldIdentity Identify(idx_t position) const;

private:
	const RowSchema &schema_;
	const CellSource &source_;
};

//! Text cell of an integer attribute
inline Cell IntegerCell(int64_t value) {
	return std::to_string(value);
}

inline Cell IntegerCell(const std::optional<int64_t> &value) {
	if (!value.has_value()) {
		return std::nullopt;
	}
	return std::to_string(*value);
}

inline Cell IntegerCell(const std::optional<int32_t> &value) {
	if (!value.has_value()) {
		return std::nullopt;
	}
	return std::to_string(*value);
}

//! "name=value, name=value\n" in schema order; absent cells render as \N
std::string RenderRow(const RowSchema &schema, const std::vector<Cell> &cells);

//! Cells for delimited output; absent cells become \N
std::vector<std::string> ToDelimitedCells(const std::vector<Cell> &cells);

} // namespace dumper
