#include "extraction/extraction_config.hpp"

#include <yaml-cpp/yaml.h>

namespace dumper {

namespace {

[[noreturn]] void ThrowInvalid(const std::string &key, const std::string &message) {
	MetastoreErrorTag tag {"config", "LoadExtractionConfig", false};
	tag.entity = key;
	throw MetastoreException(MetastoreErrorCode::InvalidConfig, tag, message);
}

YAML::Node Section(const YAML::Node &root, const std::string &key, bool required) {
	auto node = root[key];
	if (!node || node.IsNull()) {
		if (required) {
			ThrowInvalid(key, "Missing required section '" + key + "'");
		}
		return YAML::Node(YAML::NodeType::Map);
	}
	if (!node.IsMap()) {
		ThrowInvalid(key, "Section '" + key + "' must be a mapping");
	}
	return node;
}

std::string Scalar(const YAML::Node &section, const std::string &prefix, const std::string &key, bool required,
                   const std::string &fallback = "") {
	auto node = section[key];
	if (!node || node.IsNull()) {
		if (required) {
			ThrowInvalid(prefix + "." + key, "Missing required key '" + prefix + "." + key + "'");
		}
		return fallback;
	}
	if (!node.IsScalar()) {
		ThrowInvalid(prefix + "." + key, "Key '" + prefix + "." + key + "' must be a scalar");
	}
	auto value = node.Scalar();
	if (required && value.empty()) {
		ThrowInvalid(prefix + "." + key, "Key '" + prefix + "." + key + "' must not be empty");
	}
	return value;
}

template <class T>
T Number(const YAML::Node &section, const std::string &prefix, const std::string &key, T fallback) {
	auto node = section[key];
	if (!node || node.IsNull()) {
		return fallback;
	}
	try {
		return node.as<T>();
	} catch (const YAML::BadConversion &) {
		ThrowInvalid(prefix + "." + key, "Key '" + prefix + "." + key + "' must be a non-negative integer");
	}
}

bool Flag(const YAML::Node &section, const std::string &prefix, const std::string &key, bool fallback) {
	auto node = section[key];
	if (!node || node.IsNull()) {
		return fallback;
	}
	try {
		return node.as<bool>();
	} catch (const YAML::BadConversion &) {
		ThrowInvalid(prefix + "." + key, "Key '" + prefix + "." + key + "' must be true or false");
	}
}

SourceType ParseSourceType(const std::string &value) {
	if (value == "hive_metastore") {
		return SourceType::HiveMetastore;
	}
	if (value == "sql_query") {
		return SourceType::SqlQuery;
	}
	if (value == "delimited_file") {
		return SourceType::DelimitedFile;
	}
	ThrowInvalid("source.type",
	             "Unknown source type '" + value + "', expected hive_metastore, sql_query or delimited_file");
}

void ReadHiveMetastore(const YAML::Node &source, SourceConfig &config) {
	try {
		config.hms = ParseHmsEndpoint(Scalar(source, "source", "endpoint", true));
	} catch (const MetastoreException &e) {
		if (e.GetErrorTag().provider != "hms") {
			throw;
		}
		ThrowInvalid("source.endpoint", e.what());
	}
	config.hms.protocol_version = Scalar(source, "source", "protocol_version", false, "auto");
	config.hms.connection_timeout_ms =
	    Number<uint32_t>(source, "source", "connection_timeout_ms", config.hms.connection_timeout_ms);
	config.hms.tls_ca_file = Scalar(source, "source", "tls_ca_file", false);
	config.hms.connect_retry.max_attempts =
	    Number<uint32_t>(source, "source", "connect_attempts", config.hms.connect_retry.max_attempts);
	if (config.hms.connect_retry.max_attempts == 0) {
		ThrowInvalid("source.connect_attempts", "Key 'source.connect_attempts' must be at least 1");
	}

	auto databases = source["databases"];
	if (databases && !databases.IsNull()) {
		if (!databases.IsSequence()) {
			ThrowInvalid("source.databases", "Key 'source.databases' must be a list of names");
		}
		for (const auto &database : databases) {
			if (!database.IsScalar() || database.Scalar().empty()) {
				ThrowInvalid("source.databases", "Key 'source.databases' must hold non-empty names");
			}
			config.databases.push_back(database.Scalar());
		}
	}
}

ExtractionConfig FromYaml(const YAML::Node &root) {
	if (!root.IsMap()) {
		ThrowInvalid("", "Configuration must be a YAML mapping");
	}
	ExtractionConfig config;

	auto source = Section(root, "source", true);
	config.source.type = ParseSourceType(Scalar(source, "source", "type", true));
	switch (config.source.type) {
	case SourceType::HiveMetastore:
		ReadHiveMetastore(source, config.source);
		break;
	case SourceType::SqlQuery:
		config.source.database_path = Scalar(source, "source", "database_path", false, ":memory:");
		config.source.query = Scalar(source, "source", "query", true);
		break;
	case SourceType::DelimitedFile: {
		config.source.input_file = Scalar(source, "source", "input_file", true);
		auto delimiter = Scalar(source, "source", "delimiter", false, ",");
		if (delimiter.size() != 1 || delimiter[0] == '"' || delimiter[0] == '\n' || delimiter[0] == '\r') {
			ThrowInvalid("source.delimiter", "Key 'source.delimiter' must be a single character other than a quote "
			                                 "or line break");
		}
		config.source.delimiter = delimiter[0];
		break;
	}
	}

	auto output = Section(root, "output", true);
	config.output.directory = Scalar(output, "output", "directory", true);
	config.output.clean_up_tmp_files = Flag(output, "output", "clean_up_tmp_files", true);

	auto logging = Section(root, "logging", false);
	config.logging.level = Scalar(logging, "logging", "level", false, config.logging.level);
	if (!ParseLogLevel(config.logging.level)) {
		ThrowInvalid("logging.level", "Key 'logging.level' must be one of trace, debug, info, warn, error, "
		                              "critical, off; got '" + config.logging.level + "'");
	}
	config.logging.pattern = Scalar(logging, "logging", "pattern", false, config.logging.pattern);
	return config;
}

} // namespace

const char *SourceTypeToString(SourceType type) {
	switch (type) {
	case SourceType::HiveMetastore:
		return "hive_metastore";
	case SourceType::SqlQuery:
		return "sql_query";
	case SourceType::DelimitedFile:
		return "delimited_file";
	default:
		return "unknown";
	}
}

ExtractionConfig LoadExtractionConfig(const std::string &path) {
	YAML::Node root;
	try {
		root = YAML::LoadFile(path);
	} catch (const YAML::Exception &e) {
		ThrowInvalid(path, "Failed to load YAML config: " + std::string(e.what()));
	}
	return FromYaml(root);
}

ExtractionConfig ParseExtractionConfig(const std::string &yaml_text) {
	YAML::Node root;
	try {
		root = YAML::Load(yaml_text);
	} catch (const YAML::Exception &e) {
		ThrowInvalid("", "Failed to parse YAML config: " + std::string(e.what()));
	}
	return FromYaml(root);
}

} // namespace dumper
