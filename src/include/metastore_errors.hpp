#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace dumper {

//===--------------------------------------------------------------------===//
// MetastoreErrorCode — error classification for extraction operations
//===--------------------------------------------------------------------===//
enum class MetastoreErrorCode : int32_t {
	Ok = 0,
	NotFound = 1,
	InvalidConfig = 2,
	Unsupported = 3,
	//! A contractually mandatory attribute was absent or unparseable
	MissingRequiredField = 4,
	//! The connected server speaks a protocol revision no adapter handles
	UnsupportedProtocolVersion = 5,
	//! RPC, driver or I/O failure (including session shutdown)
	TransportFailure = 6,
	//! A protocol-level per-call bound was reached; the result would be truncated
	CapacityExceeded = 7
};

inline const char *MetastoreErrorCodeToString(MetastoreErrorCode code) {
	switch (code) {
	case MetastoreErrorCode::Ok:
		return "Ok";
	case MetastoreErrorCode::NotFound:
		return "NotFound";
	case MetastoreErrorCode::InvalidConfig:
		return "InvalidConfig";
	case MetastoreErrorCode::Unsupported:
		return "Unsupported";
	case MetastoreErrorCode::MissingRequiredField:
		return "MissingRequiredField";
	case MetastoreErrorCode::UnsupportedProtocolVersion:
		return "UnsupportedProtocolVersion";
	case MetastoreErrorCode::TransportFailure:
		return "TransportFailure";
	case MetastoreErrorCode::CapacityExceeded:
		return "CapacityExceeded";
	default:
		return "Unknown";
	}
}

//===--------------------------------------------------------------------===//
// MetastoreResult<T> — result-or-error envelope for adapter operations
//===--------------------------------------------------------------------===//
struct MetastoreError {
	MetastoreErrorCode code;
	std::string message;
	//! Identification of the failing entity (e.g. "sales.orders") or the
	//! underlying driver message
	std::string detail;
	bool retryable;

	MetastoreError() : code(MetastoreErrorCode::Ok), retryable(false) {
	}
	MetastoreError(MetastoreErrorCode code_p, std::string message_p, std::string detail_p = "",
	               bool retryable_p = false)
	    : code(code_p), message(std::move(message_p)), detail(std::move(detail_p)), retryable(retryable_p) {
	}

	bool IsOk() const {
		return code == MetastoreErrorCode::Ok;
	}

	//! "<Code>: <message> (<detail>)", for logs and reports
	std::string ToString() const {
		std::string out = MetastoreErrorCodeToString(code);
		out += ": " + message;
		if (!detail.empty()) {
			out += " (" + detail + ")";
		}
		return out;
	}
};

template <typename T>
struct MetastoreResult {
	T value;
	MetastoreError error;

	//! Check whether the operation succeeded
	bool IsOk() const {
		return error.IsOk();
	}

	//! Construct a success result
	static MetastoreResult Success(T val) {
		MetastoreResult r;
		r.value = std::move(val);
		return r;
	}

	//! Construct an error result
	static MetastoreResult Error(MetastoreErrorCode code, std::string message, std::string detail = "",
	                             bool retryable = false) {
		MetastoreResult r;
		r.error = MetastoreError(code, std::move(message), std::move(detail), retryable);
		return r;
	}

	//! Forward an existing error into a result of another value type
	static MetastoreResult Error(MetastoreError error) {
		MetastoreResult r;
		r.error = std::move(error);
		return r;
	}
};

//! Structured error tag for context
struct MetastoreErrorTag {
	//! Which source: "hms", "cursor", "delimited", "rendered", "view", "config"
	std::string provider;
	//! Which operation: "Materialize", "GetTable", "LoadExtractionConfig", etc.
	std::string operation;
	//! Whether the error is potentially transient and safe to retry
	bool retryable = false;
	//! Failing entity: a field name for row errors, "db.table" for adapter errors
	std::string entity;
	//! Positional index of the failing field within its row schema
	std::optional<uint64_t> position;
	//! Index of the failing record within its source (cursor row or file line)
	std::optional<uint64_t> row_index;
};

//! Exception class for metastore operations
class MetastoreException : public std::runtime_error {
public:
	MetastoreException(MetastoreErrorCode code, const MetastoreErrorTag &tag, const std::string &message)
	    : std::runtime_error(message), error_code_(code), error_tag_(tag) {
	}

	MetastoreErrorCode GetErrorCode() const {
		return error_code_;
	}

	const MetastoreErrorTag &GetErrorTag() const {
		return error_tag_;
	}

	//! Convert into the envelope form used by adapter results and reports
	MetastoreError ToError() const {
		return MetastoreError(error_code_, what(), error_tag_.entity, error_tag_.retryable);
	}

private:
	MetastoreErrorCode error_code_;
	MetastoreErrorTag error_tag_;
};

//! Helper function to throw a metastore error
inline void throw_metastore_error(MetastoreErrorCode code, const MetastoreErrorTag &tag,
                                  const std::string &message) {
	throw MetastoreException(code, tag, message);
}

} // namespace dumper
