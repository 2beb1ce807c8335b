#include "main/field_coercion.hpp"
#include "metastore_errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

namespace {

using namespace dumper;

void Assert(bool condition, const std::string &message) {
	if (!condition) {
		std::cerr << "[FAIL] " << message << std::endl;
		std::exit(1);
	}
}

FieldIdentity Id(const std::string &field, idx_t position) {
	return FieldIdentity {"delimited", "svv_columns", field, position, 7};
}

//! Runs `fn` and returns the MissingRequiredField exception it raised
bool RaisesMissing(const std::function<void()> &fn, std::string *message = nullptr) {
	try {
		fn();
	} catch (const MetastoreException &ex) {
		if (message) {
			*message = ex.what();
		}
		return ex.GetErrorCode() == MetastoreErrorCode::MissingRequiredField;
	}
	return false;
}

void TestRequiredString() {
	Assert(CoerceRequiredString(Cell("tableA"), Id("table_name", 2)) == "tableA", "plain value should pass");
	Assert(CoerceRequiredString(Cell(" padded "), Id("table_name", 2)) == " padded ",
	       "value should be returned untrimmed");

	std::string message;
	Assert(RaisesMissing([] { CoerceRequiredString(std::nullopt, Id("table_name", 2)); }, &message),
	       "absent required string must fail");
	Assert(message.find("table_name") != std::string::npos, "error should name the field");
	Assert(message.find("position 2") != std::string::npos, "error should name the position");
	Assert(message.find("row 7") != std::string::npos, "error should name the row index");
	Assert(RaisesMissing([] { CoerceRequiredString(Cell(""), Id("table_name", 2)); }),
	       "empty required string must fail");
	Assert(RaisesMissing([] { CoerceRequiredString(Cell("  \t"), Id("table_name", 2)); }),
	       "blank required string must fail");
}

void TestRequiredInteger() {
	Assert(CoerceRequiredInteger(Cell("42"), Id("ordinal_position", 4)) == 42, "integer should parse");
	Assert(CoerceRequiredInteger(Cell(" -7 "), Id("ordinal_position", 4)) == -7,
	       "surrounding whitespace should be allowed");
	Assert(CoerceRequiredInteger(Cell("+3"), Id("ordinal_position", 4)) == 3, "leading plus should be allowed");
	Assert(RaisesMissing([] { CoerceRequiredInteger(Cell("abc"), Id("ordinal_position", 4)); }),
	       "non-numeric integer must fail");
	Assert(RaisesMissing([] { CoerceRequiredInteger(Cell("1.5"), Id("ordinal_position", 4)); }),
	       "decimal text must fail");
	Assert(RaisesMissing([] { CoerceRequiredInteger(Cell(""), Id("ordinal_position", 4)); }),
	       "empty integer must fail");
	Assert(RaisesMissing([] { CoerceRequiredInteger(Cell(std::nullopt), Id("ordinal_position", 4)); }),
	       "absent integer must fail");
	Assert(RaisesMissing([] { CoerceRequiredInteger(Cell("99999999999999999999"), Id("ordinal_position", 4)); }),
	       "out-of-range integer must fail");

	Assert(CoerceRequiredInteger(std::optional<int32_t>(12), Id("create_time", 4)) == 12,
	       "set RPC integer should pass");
	Assert(RaisesMissing([] { CoerceRequiredInteger(std::optional<int32_t>(), Id("create_time", 4)); }),
	       "unset RPC integer must fail");
}

void TestDefaultingForms() {
	Assert(CoerceStringOrEmpty(std::nullopt).empty(), "absent string-or-empty should be empty");
	Assert(CoerceStringOrEmpty(Cell("x")) == "x", "present string-or-empty should be kept");

	Assert(!CoerceNullableString(std::nullopt).has_value(), "absent nullable string should stay absent");
	auto empty = CoerceNullableString(Cell(""));
	Assert(empty.has_value() && empty->empty(), "empty nullable string should stay empty, not absent");

	Assert(CoerceIntegerOr(std::nullopt, 0, Id("numeric_scale", 11)) == 0, "absent integer-or-zero should be 0");
	Assert(CoerceIntegerOr(Cell(""), 0, Id("numeric_scale", 11)) == 0, "empty integer-or-zero should be 0");
	Assert(CoerceIntegerOr(Cell("255"), 0, Id("numeric_scale", 11)) == 255, "integer-or-zero should parse");
	Assert(RaisesMissing([] { CoerceIntegerOr(Cell("n/a"), 0, Id("numeric_scale", 11)); }),
	       "non-numeric integer-or-zero must still fail");

	Assert(!CoerceNullableInteger(Cell(""), Id("create_time", 4)).has_value(),
	       "empty nullable integer should be absent");
	Assert(CoerceNullableInteger(Cell("5"), Id("create_time", 4)) == std::optional<int64_t>(5),
	       "nullable integer should parse");
	Assert(!CoerceNullableInteger(std::optional<int32_t>()).has_value(), "unset RPC integer should be absent");
}

void TestTryParseInteger() {
	int64_t value = 0;
	Assert(TryParseInteger("9223372036854775807", value) && value == INT64_MAX, "int64 max should parse");
	Assert(!TryParseInteger("+-1", value), "sign pair must fail");
	Assert(!TryParseInteger("+", value), "lone sign must fail");
	Assert(!TryParseInteger("1 2", value), "inner whitespace must fail");
	Assert(!TryParseInteger("0x10", value), "hex must fail");
}

} // namespace

int main() {
	TestRequiredString();
	TestRequiredInteger();
	TestDefaultingForms();
	TestTryParseInteger();
	std::cout << "[PASS] field coercion harness checks completed" << std::endl;
	return 0;
}
