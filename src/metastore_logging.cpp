#include "metastore_logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>

namespace dumper {

namespace {

const char *const LOGGER_NAME = "metastore-dumper";

spdlog::level::level_enum ResolveLevel(const LoggingConfig &config, std::string &rejected_env) {
	if (const char *level = std::getenv("DUMPER_LOG_LEVEL")) {
		if (auto parsed = ParseLogLevel(level)) {
			return *parsed;
		}
		rejected_env = level;
	}
	if (auto parsed = ParseLogLevel(config.level)) {
		return *parsed;
	}
	return spdlog::level::info;
}

std::string ResolvePattern(const LoggingConfig &config) {
	if (const char *pattern = std::getenv("DUMPER_LOG_PATTERN")) {
		return pattern;
	}
	if (!config.pattern.empty()) {
		return config.pattern;
	}
	return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
	std::ostringstream out;
	bool first = true;
	for (const auto &field : fields) {
		if (!first) {
			out << ' ';
		}
		first = false;
		out << field.key << '=' << field.value;
	}
	return out.str();
}

} // namespace

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
	// spdlog names these "warning" and "error" but from_str also takes the
	// short forms
	if (name == "warn" || name == "warning") {
		return spdlog::level::warn;
	}
	if (name == "err" || name == "error") {
		return spdlog::level::err;
	}
	for (int level = spdlog::level::trace; level < spdlog::level::n_levels; level++) {
		auto level_enum = static_cast<spdlog::level::level_enum>(level);
		auto level_name = spdlog::level::to_string_view(level_enum);
		if (name == std::string_view(level_name.data(), level_name.size())) {
			return level_enum;
		}
	}
	return std::nullopt;
}

LogField StringField(std::string_view key, std::string_view value) {
	return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
	return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
	return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const LoggingConfig &config) {
	auto logger = spdlog::get(LOGGER_NAME);
	if (!logger) {
		logger = spdlog::stdout_color_mt(LOGGER_NAME);
	}
	std::string rejected_env;
	logger->set_pattern(ResolvePattern(config));
	logger->set_level(ResolveLevel(config, rejected_env));
	spdlog::set_default_logger(std::move(logger));
	spdlog::flush_on(spdlog::level::warn);
	if (!rejected_env.empty()) {
		LogWarn("Ignoring unknown DUMPER_LOG_LEVEL", {StringField("value", rejected_env),
		                                              StringField("level", config.level)});
	}
}

void ShutdownLogging() {
	spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
	auto serialized_fields = SerializeFields(fields);
	if (!serialized_fields.empty()) {
		spdlog::log(level, "{} {}", message, serialized_fields);
		return;
	}
	spdlog::log(level, "{}", message);
}

} // namespace dumper
