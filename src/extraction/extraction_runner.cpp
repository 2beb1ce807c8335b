#include "extraction/extraction_runner.hpp"
#include "main/hive_rows.hpp"
#include "main/svv_columns_row.hpp"
#include "materializers/delimited_file.hpp"
#include "materializers/duckdb_cursor.hpp"
#include "metastore_logging.hpp"
#include "providers/hms/hms_selector.hpp"

#include "duckdb.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

namespace dumper {

namespace fs = std::filesystem;

namespace {

const char OUTPUT_DELIMITER = ',';

std::string KindFile(const std::string &kind) {
	return kind + ".csv";
}

void RecordFailure(ExtractionReport &report, std::string entity, MetastoreError error) {
	DUMPER_LOG_ERROR("Extraction failure", {StringField("entity", entity), StringField("error", error.ToString())});
	report.failures.push_back({std::move(entity), std::move(error)});
}

//! Record a per-entity failure, or abandon the source when the failure left
//! its connection unusable
void RecordOrAbandon(ExtractionReport &report, const IDatabaseMetadataSource &source, const char *operation,
                     std::string entity, MetastoreError error) {
	if (!source.IsUsable()) {
		MetastoreErrorTag tag {"hms", operation, error.retryable};
		tag.entity = entity;
		throw MetastoreException(error.code, tag, error.ToString());
	}
	RecordFailure(report, std::move(entity), std::move(error));
}

//! Writers of the five Hive kinds, in output order
struct HiveWriters {
	explicit HiveWriters(const fs::path &tmp_dir)
	    : databases((tmp_dir / KindFile(HiveDatabaseRow::Schema().kind)).string(), OUTPUT_DELIMITER),
	      tables((tmp_dir / KindFile(HiveTableRow::Schema().kind)).string(), OUTPUT_DELIMITER),
	      columns((tmp_dir / KindFile(HiveColumnRow::Schema().kind)).string(), OUTPUT_DELIMITER),
	      partitions((tmp_dir / KindFile(HivePartitionRow::Schema().kind)).string(), OUTPUT_DELIMITER),
	      functions((tmp_dir / KindFile(HiveFunctionRow::Schema().kind)).string(), OUTPUT_DELIMITER) {
	}

	void Close(ExtractionReport &report) {
		databases.Close();
		tables.Close();
		columns.Close();
		partitions.Close();
		functions.Close();
		report.rows_per_kind[HiveDatabaseRow::Schema().kind] = databases.RowsWritten();
		report.rows_per_kind[HiveTableRow::Schema().kind] = tables.RowsWritten();
		report.rows_per_kind[HiveColumnRow::Schema().kind] = columns.RowsWritten();
		report.rows_per_kind[HivePartitionRow::Schema().kind] = partitions.RowsWritten();
		report.rows_per_kind[HiveFunctionRow::Schema().kind] = functions.RowsWritten();
	}

	static std::vector<std::string> Kinds() {
		return {HiveDatabaseRow::Schema().kind, HiveTableRow::Schema().kind, HiveColumnRow::Schema().kind,
		        HivePartitionRow::Schema().kind, HiveFunctionRow::Schema().kind};
	}

	DelimitedFileWriter databases;
	DelimitedFileWriter tables;
	DelimitedFileWriter columns;
	DelimitedFileWriter partitions;
	DelimitedFileWriter functions;
};

//! All rows of one table, built before any of them is written
struct TableRows {
	std::vector<HiveTableRow> table;
	std::vector<HiveColumnRow> columns;
	std::vector<HivePartitionRow> partitions;
};

TableRows MaterializeTable(const MetastoreTableView &view) {
	TableRows rows;
	rows.table.push_back(HiveTableRow::FromView(view));
	rows.columns = HiveColumnRow::FromTable(view);
	rows.partitions = HivePartitionRow::FromTable(view);
	return rows;
}

} // namespace

std::string ExtractionReport::Summary() const {
	std::ostringstream out;
	for (const auto &entry : rows_per_kind) {
		out << entry.first << ": " << entry.second << " rows\n";
	}
	for (const auto &failure : failures) {
		out << "FAILED " << failure.entity << ": " << failure.error.ToString() << "\n";
	}
	return out.str();
}

ExtractionRunner::ExtractionRunner(ExtractionConfig config, std::unique_ptr<IDatabaseMetadataSource> metadata_source)
    : config_(std::move(config)), metadata_source_(std::move(metadata_source)) {
}

ExtractionReport ExtractionRunner::Run() {
	ExtractionReport report;
	fs::path tmp_dir = fs::path(config_.output.directory) / TMP_DIR_NAME;

	std::error_code ec;
	fs::create_directories(tmp_dir, ec);
	if (ec) {
		RecordFailure(report, "output",
		              MetastoreError(MetastoreErrorCode::TransportFailure, "Unable to create temporary directory",
		                             tmp_dir.string() + ": " + ec.message()));
		return report;
	}

	auto source_type = SourceTypeToString(config_.source.type);
	DUMPER_LOG_INFO("Extraction started",
	                {StringField("source", source_type), StringField("output", config_.output.directory)});

	std::vector<std::string> kinds;
	bool completed = false;
	try {
		switch (config_.source.type) {
		case SourceType::HiveMetastore:
			kinds = RunHiveMetastore(tmp_dir, report);
			break;
		case SourceType::SqlQuery:
			kinds = RunSqlQuery(tmp_dir, report);
			break;
		case SourceType::DelimitedFile:
			kinds = RunDelimitedFile(tmp_dir, report);
			break;
		}
		completed = true;
	} catch (const MetastoreException &e) {
		RecordFailure(report, source_type, e.ToError());
	}

	if (completed) {
		Publish(kinds, tmp_dir, report);
	}

	if (config_.output.clean_up_tmp_files) {
		fs::remove_all(tmp_dir, ec);
		if (ec) {
			DUMPER_LOG_WARN("Unable to remove temporary directory",
			                {StringField("path", tmp_dir.string()), StringField("error", ec.message())});
		}
	}

	DUMPER_LOG_INFO("Extraction finished", {StringField("source", source_type), BoolField("completed", completed),
	                                        IntField("failures", static_cast<int64_t>(report.failures.size()))});
	return report;
}

std::vector<std::string> ExtractionRunner::RunHiveMetastore(const fs::path &tmp_dir, ExtractionReport &report) {
	std::unique_ptr<IDatabaseMetadataSource> source = std::move(metadata_source_);
	if (!source) {
		auto opened = OpenMetadataSource(config_.source.hms);
		if (!opened.IsOk()) {
			MetastoreErrorTag tag {"hms", "OpenMetadataSource", opened.error.retryable};
			tag.entity = config_.source.hms.Address();
			throw MetastoreException(opened.error.code, tag, opened.error.ToString());
		}
		source = std::move(opened.value);
	}

	try {
		ExtractHive(*source, tmp_dir, report);
	} catch (const MetastoreException &) {
		auto close_error = source->Close();
		if (!close_error.IsOk()) {
			RecordFailure(report, "hms session", std::move(close_error));
		}
		throw;
	}
	auto close_error = source->Close();
	if (!close_error.IsOk()) {
		RecordFailure(report, "hms session", std::move(close_error));
	}
	return HiveWriters::Kinds();
}

void ExtractionRunner::ExtractHive(IDatabaseMetadataSource &source, const fs::path &tmp_dir,
                                   ExtractionReport &report) {
	HiveWriters writers(tmp_dir);

	std::vector<std::string> database_names = config_.source.databases;
	if (database_names.empty()) {
		auto listed = source.ListDatabases();
		if (!listed.IsOk()) {
			MetastoreErrorTag tag {"hms", "ListDatabases", listed.error.retryable};
			throw MetastoreException(listed.error.code, tag, listed.error.ToString());
		}
		database_names = std::move(listed.value);
	}

	for (const auto &database_name : database_names) {
		auto database = source.GetDatabase(database_name);
		if (!database.IsOk()) {
			RecordOrAbandon(report, source, "GetDatabase", database_name, std::move(database.error));
			continue;
		}
		try {
			writers.databases.Write(HiveDatabaseRow::FromView(database.value));
		} catch (const MetastoreException &e) {
			if (e.GetErrorCode() != MetastoreErrorCode::MissingRequiredField) {
				throw;
			}
			RecordFailure(report, database_name, e.ToError());
			continue;
		}

		auto tables = source.ListTables(database_name);
		if (!tables.IsOk()) {
			RecordOrAbandon(report, source, "ListTables", database_name, std::move(tables.error));
			continue;
		}
		for (const auto &table_name : tables.value) {
			auto entity = database_name + "." + table_name;
			auto table = source.GetTable(database_name, table_name);
			if (!table.IsOk()) {
				RecordOrAbandon(report, source, "GetTable", entity, std::move(table.error));
				continue;
			}
			TableRows rows;
			try {
				rows = MaterializeTable(table.value);
			} catch (const MetastoreException &e) {
				if (e.GetErrorCode() != MetastoreErrorCode::MissingRequiredField) {
					throw;
				}
				RecordFailure(report, entity, e.ToError());
				continue;
			}
			for (const auto &row : rows.table) {
				writers.tables.Write(row);
			}
			for (const auto &row : rows.columns) {
				writers.columns.Write(row);
			}
			for (const auto &row : rows.partitions) {
				writers.partitions.Write(row);
			}
		}
	}

	auto functions = source.GetFunctions();
	if (!functions.IsOk()) {
		RecordOrAbandon(report, source, "GetFunctions", "functions", std::move(functions.error));
	} else {
		const auto &filter = config_.source.databases;
		for (const auto &function : functions.value) {
			if (!filter.empty() && (!function.database_name ||
			                        std::find(filter.begin(), filter.end(), *function.database_name) == filter.end())) {
				continue;
			}
			writers.functions.Write(HiveFunctionRow::FromView(function));
		}
	}

	writers.Close(report);
}

std::vector<std::string> ExtractionRunner::RunSqlQuery(const fs::path &tmp_dir, ExtractionReport &report) {
	const auto &kind = SvvColumnsRow::Schema().kind;
	std::unique_ptr<duckdb::DuckDB> database;
	std::unique_ptr<duckdb::Connection> connection;
	try {
		database = std::make_unique<duckdb::DuckDB>(config_.source.database_path);
		connection = std::make_unique<duckdb::Connection>(*database);
	} catch (const std::exception &e) {
		MetastoreErrorTag tag {"cursor", "OpenDatabase", false};
		tag.entity = config_.source.database_path;
		throw MetastoreException(MetastoreErrorCode::TransportFailure, tag,
		                         "Unable to open DuckDB database: " + std::string(e.what()));
	}

	auto cursor = ExecuteCursorQuery(*connection, config_.source.query);
	DelimitedFileWriter writer((tmp_dir / KindFile(kind)).string(), OUTPUT_DELIMITER);
	while (cursor->Next()) {
		writer.Write(SvvColumnsRow::FromCursor(*cursor));
	}
	writer.Close();
	report.rows_per_kind[kind] = writer.RowsWritten();
	return {kind};
}

std::vector<std::string> ExtractionRunner::RunDelimitedFile(const fs::path &tmp_dir, ExtractionReport &report) {
	const auto &kind = SvvColumnsRow::Schema().kind;
	DelimitedFileReader reader(config_.source.input_file, config_.source.delimiter);
	DelimitedFileWriter writer((tmp_dir / KindFile(kind)).string(), OUTPUT_DELIMITER);
	std::vector<std::string> cells;
	while (reader.Next(cells)) {
		writer.Write(SvvColumnsRow::FromDelimited(cells, reader.RecordLine()));
	}
	writer.Close();
	report.rows_per_kind[kind] = writer.RowsWritten();
	return {kind};
}

void ExtractionRunner::Publish(const std::vector<std::string> &kinds, const fs::path &tmp_dir,
                               ExtractionReport &report) {
	fs::path output_dir(config_.output.directory);
	for (const auto &kind : kinds) {
		auto from = tmp_dir / KindFile(kind);
		auto to = output_dir / KindFile(kind);
		std::error_code ec;
		fs::rename(from, to, ec);
		if (ec) {
			RecordFailure(report, kind,
			              MetastoreError(MetastoreErrorCode::TransportFailure, "Unable to publish output file",
			                             to.string() + ": " + ec.message()));
			report.rows_per_kind.erase(kind);
			continue;
		}
		DUMPER_LOG_INFO("Published", {StringField("kind", kind), StringField("path", to.string()),
		                              IntField("rows", static_cast<int64_t>(report.rows_per_kind[kind]))});
	}
}

} // namespace dumper
