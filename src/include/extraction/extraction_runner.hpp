#pragma once

#include "extraction/extraction_config.hpp"
#include "metastore_errors.hpp"
#include "metastore_source.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dumper {

struct ExtractionFailure {
	//! What failed: "sales.orders", "functions", "hive_metastore", ...
	std::string entity;
	MetastoreError error;
};

struct ExtractionReport {
	//! Rows written per canonical kind, for every published file
	std::map<std::string, idx_t> rows_per_kind;
	std::vector<ExtractionFailure> failures;

	bool HasFailures() const {
		return !failures.empty();
	}
	//! One line per kind and per failure
	std::string Summary() const;
};

//===--------------------------------------------------------------------===//
// ExtractionRunner — drives one configured source to delimited output files
//
// Files are produced under <output>/.tmp_processed and moved to <output>
// once their source finished. A failing table is recorded and skipped; a
// failure of the source itself abandons the run without publishing.
//===--------------------------------------------------------------------===//
class ExtractionRunner {
public:
	//! `metadata_source` replaces the HMS connection for hive_metastore runs
	explicit ExtractionRunner(ExtractionConfig config,
	                          std::unique_ptr<IDatabaseMetadataSource> metadata_source = nullptr);

	ExtractionReport Run();

	static constexpr const char *TMP_DIR_NAME = ".tmp_processed";

private:
	std::vector<std::string> RunHiveMetastore(const std::filesystem::path &tmp_dir, ExtractionReport &report);
	std::vector<std::string> RunSqlQuery(const std::filesystem::path &tmp_dir, ExtractionReport &report);
	std::vector<std::string> RunDelimitedFile(const std::filesystem::path &tmp_dir, ExtractionReport &report);
	void ExtractHive(IDatabaseMetadataSource &source, const std::filesystem::path &tmp_dir,
	                 ExtractionReport &report);
	void Publish(const std::vector<std::string> &kinds, const std::filesystem::path &tmp_dir,
	             ExtractionReport &report);

	ExtractionConfig config_;
	std::unique_ptr<IDatabaseMetadataSource> metadata_source_;
};

} // namespace dumper
