#pragma once

#include "main/metastore_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dumper {

//! One raw cell: std::nullopt is an absent value (SQL NULL, the \N marker,
//! an RPC field that is not set), a string is the cell text, possibly empty.
using Cell = std::optional<std::string>;

//! Text form of an absent cell in delimited and rendered output
extern const char *const NULL_MARKER;

//===--------------------------------------------------------------------===//
// FieldIdentity — names one attribute of one record for error reporting
//===--------------------------------------------------------------------===//
struct FieldIdentity {
	//! Source tag: "cursor", "delimited", "rendered", "view"
	std::string source;
	//! Canonical row kind, e.g. "svv_columns"
	std::string row_kind;
	//! Attribute name
	std::string field;
	//! Position of the attribute within the row schema
	idx_t position = 0;
	//! Index of the record within its source, when the source has one
	std::optional<idx_t> row_index;
};

//===--------------------------------------------------------------------===//
// Field coercion
//
// Every function either returns the typed value or throws
// MetastoreException(MissingRequiredField) naming the field, its position and
// the row index. Defaults are only produced by the functions that say so in
// their name; nothing here guesses.
//===--------------------------------------------------------------------===//

//! Present and non-empty after trimming. Returns the untrimmed text.
std::string CoerceRequiredString(const Cell &cell, const FieldIdentity &id);

//! Absent becomes "", anything present is kept verbatim.
std::string CoerceStringOrEmpty(const Cell &cell);

//! Absent stays absent, "" stays "".
std::optional<std::string> CoerceNullableString(const Cell &cell);

//! Present and parseable as a base-10 integer.
int64_t CoerceRequiredInteger(const Cell &cell, const FieldIdentity &id);

//! Absent or empty becomes default_value; non-numeric text still fails.
int64_t CoerceIntegerOr(const Cell &cell, int64_t default_value, const FieldIdentity &id);

//! Absent or empty becomes std::nullopt; non-numeric text still fails.
std::optional<int64_t> CoerceNullableInteger(const Cell &cell, const FieldIdentity &id);

//! Typed RPC field forms
int64_t CoerceRequiredInteger(const std::optional<int32_t> &value, const FieldIdentity &id);
std::optional<int64_t> CoerceNullableInteger(const std::optional<int32_t> &value);

//! Parse a base-10 integer, allowing surrounding whitespace and a leading sign.
bool TryParseInteger(const std::string &text, int64_t &result);

//! Throw MissingRequiredField for the given field.
void ThrowMissingRequiredField(const FieldIdentity &id, const std::string &reason);

} // namespace dumper
