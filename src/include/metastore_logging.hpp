#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace dumper {

struct LogField {
	std::string key;
	std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

//! Logging section of the extraction configuration
struct LoggingConfig {
	//! spdlog level name: trace, debug, info, warn, error, critical, off
	std::string level = "info";
	std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

//! Level for a spdlog level name, short forms "warn" and "err" included;
//! nullopt for anything else
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

//! Install the "metastore-dumper" stdout logger as spdlog's default.
//! DUMPER_LOG_LEVEL and DUMPER_LOG_PATTERN override the config values; an
//! unknown DUMPER_LOG_LEVEL is reported and ignored.
void InitializeLogging(const LoggingConfig &config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
	Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
	Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
	Log(spdlog::level::err, message, fields);
}

} // namespace dumper

#define DUMPER_LOG_INFO(message, ...)  ::dumper::LogInfo((message), ##__VA_ARGS__)
#define DUMPER_LOG_WARN(message, ...)  ::dumper::LogWarn((message), ##__VA_ARGS__)
#define DUMPER_LOG_ERROR(message, ...) ::dumper::LogError((message), ##__VA_ARGS__)
