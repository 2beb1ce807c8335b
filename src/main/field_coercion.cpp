#include "main/field_coercion.hpp"
#include "metastore_errors.hpp"

#include <charconv>

namespace dumper {

const char *const NULL_MARKER = "\\N";

namespace {

const char *const WHITESPACE = " \t\r\n";

bool IsBlank(const std::string &text) {
	return text.find_first_not_of(WHITESPACE) == std::string::npos;
}

} // namespace

void ThrowMissingRequiredField(const FieldIdentity &id, const std::string &reason) {
	MetastoreErrorTag tag;
	tag.provider = id.source;
	tag.operation = "Materialize";
	tag.retryable = false;
	tag.entity = id.field;
	tag.position = id.position;
	tag.row_index = id.row_index;

	std::string message = "Missing required field '" + id.field + "' (position " + std::to_string(id.position) +
	                      ") of " + id.row_kind + " row";
	if (id.row_index.has_value()) {
		message += " " + std::to_string(*id.row_index);
	}
	message += " from " + id.source + ": " + reason;
	throw MetastoreException(MetastoreErrorCode::MissingRequiredField, tag, message);
}

bool TryParseInteger(const std::string &text, int64_t &result) {
	auto begin = text.find_first_not_of(WHITESPACE);
	if (begin == std::string::npos) {
		return false;
	}
	auto end = text.find_last_not_of(WHITESPACE) + 1;
	const char *first = text.data() + begin;
	const char *last = text.data() + end;
	if (*first == '+') {
		first++;
		if (first == last || *first == '-') {
			return false;
		}
	}
	int64_t value = 0;
	auto parsed = std::from_chars(first, last, value, 10);
	if (parsed.ec != std::errc() || parsed.ptr != last) {
		return false;
	}
	result = value;
	return true;
}

std::string CoerceRequiredString(const Cell &cell, const FieldIdentity &id) {
	if (!cell.has_value()) {
		ThrowMissingRequiredField(id, "value is absent");
	}
	if (IsBlank(*cell)) {
		ThrowMissingRequiredField(id, "value is empty");
	}
	return *cell;
}

std::string CoerceStringOrEmpty(const Cell &cell) {
	return cell.value_or(std::string());
}

std::optional<std::string> CoerceNullableString(const Cell &cell) {
	return cell;
}

int64_t CoerceRequiredInteger(const Cell &cell, const FieldIdentity &id) {
	if (!cell.has_value()) {
		ThrowMissingRequiredField(id, "value is absent");
	}
	if (IsBlank(*cell)) {
		ThrowMissingRequiredField(id, "value is empty");
	}
	int64_t result = 0;
	if (!TryParseInteger(*cell, result)) {
		ThrowMissingRequiredField(id, "'" + *cell + "' is not a base-10 integer");
	}
	return result;
}

int64_t CoerceIntegerOr(const Cell &cell, int64_t default_value, const FieldIdentity &id) {
	if (!cell.has_value() || IsBlank(*cell)) {
		return default_value;
	}
	int64_t result = 0;
	if (!TryParseInteger(*cell, result)) {
		ThrowMissingRequiredField(id, "'" + *cell + "' is not a base-10 integer");
	}
	return result;
}

std::optional<int64_t> CoerceNullableInteger(const Cell &cell, const FieldIdentity &id) {
	if (!cell.has_value() || IsBlank(*cell)) {
		return std::nullopt;
	}
	int64_t result = 0;
	if (!TryParseInteger(*cell, result)) {
		ThrowMissingRequiredField(id, "'" + *cell + "' is not a base-10 integer");
	}
	return result;
}

int64_t CoerceRequiredInteger(const std::optional<int32_t> &value, const FieldIdentity &id) {
	if (!value.has_value()) {
		ThrowMissingRequiredField(id, "value is not set");
	}
	return *value;
}

std::optional<int64_t> CoerceNullableInteger(const std::optional<int32_t> &value) {
	if (!value.has_value()) {
		return std::nullopt;
	}
	return static_cast<int64_t>(*value);
}

} // namespace dumper
