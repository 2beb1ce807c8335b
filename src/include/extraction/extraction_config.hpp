#pragma once

#include "metastore_logging.hpp"
#include "providers/hms/hms_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dumper {

enum class SourceType : uint8_t {
	HiveMetastore = 0, //! Live HMS over Thrift
	SqlQuery = 1,      //! Catalog query through DuckDB
	DelimitedFile = 2  //! Previously exported svv_columns file
};

const char *SourceTypeToString(SourceType type);

struct SourceConfig {
	SourceType type = SourceType::HiveMetastore;

	//! hive_metastore: parsed endpoint plus protocol and connect settings
	HmsConfig hms;
	//! hive_metastore: restrict extraction to these databases (empty = all)
	std::vector<std::string> databases;

	//! sql_query: DuckDB database file, ":memory:" for an in-memory database
	std::string database_path = ":memory:";
	std::string query;

	//! delimited_file
	std::string input_file;
	char delimiter = ',';
};

struct OutputConfig {
	std::string directory;
	//! Remove <directory>/.tmp_processed once the run finished
	bool clean_up_tmp_files = true;
};

struct ExtractionConfig {
	SourceConfig source;
	OutputConfig output;
	LoggingConfig logging;
};

//! Load and validate a YAML configuration file.
//! Throws MetastoreException(InvalidConfig) naming the offending key.
ExtractionConfig LoadExtractionConfig(const std::string &path);

//! Same as LoadExtractionConfig, from YAML text
ExtractionConfig ParseExtractionConfig(const std::string &yaml_text);

} // namespace dumper
