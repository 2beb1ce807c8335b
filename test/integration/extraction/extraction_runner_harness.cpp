#include "extraction/extraction_runner.hpp"
#include "fake_hms_client.hpp"
#include "main/hive_rows.hpp"
#include "materializers/delimited_file.hpp"
#include "metastore_logging.hpp"
#include "providers/hms/hms_metadata_source.hpp"

#include "duckdb.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace dumper;
using dumper::testing::FakeHmsClient;
namespace fs = std::filesystem;

void Assert(bool condition, const std::string &message) {
	if (!condition) {
		std::cerr << "[FAIL] " << message << std::endl;
		std::exit(1);
	}
}

fs::path ScratchDir(const std::string &name) {
	auto dir = fs::temp_directory_path() / ("metastore_dumper_runner_" + name);
	fs::remove_all(dir);
	fs::create_directories(dir);
	return dir;
}

std::vector<std::vector<std::string>> ReadRecords(const fs::path &path) {
	std::vector<std::vector<std::string>> records;
	DelimitedFileReader reader(path.string(), ',');
	std::vector<std::string> cells;
	while (reader.Next(cells)) {
		records.push_back(cells);
	}
	return records;
}

std::shared_ptr<FakeHmsClient> WarehouseFixture() {
	auto client = std::make_shared<FakeHmsClient>();
	client->AddDatabase("sales", "hdfs://warehouse/sales.db");
	client->AddDatabase("hr", "hdfs://warehouse/hr.db");
	client->AddTable("sales", "orders", {{"id", "bigint"}, {"amount", "decimal(10,2)"}});
	auto &events = client->AddTable("sales", "events", {{"payload", "string"}});
	events.__set_partitionKeys({FakeHmsClient::Field("dt", "string")});
	client->AddPartition("sales", "events", "dt=2024-01-01", {"2024-01-01"});
	client->AddPartition("sales", "events", "dt=2024-01-02", {"2024-01-02"});
	client->AddTable("hr", "people", {{"name", "string"}});
	client->AddFunction("sales", "mask_card", "com.example.udf.MaskCard");
	client->AddFunction("hr", "hash_ssn", "com.example.udf.HashSsn");
	return client;
}

std::unique_ptr<IDatabaseMetadataSource> FakeSource(const std::shared_ptr<FakeHmsClient> &client,
                                                    HmsProtocolVersion version = HmsProtocolVersion::V3) {
	auto session = std::make_unique<HmsSession>(client, nullptr, "fake-hms:9083");
	if (version == HmsProtocolVersion::V1) {
		return std::make_unique<HmsLegacyMetadataSource>(std::move(session), CapabilitiesFor(version));
	}
	return std::make_unique<HmsMetadataSource>(std::move(session), CapabilitiesFor(version));
}

ExtractionConfig HiveConfig(const fs::path &output) {
	ExtractionConfig config;
	config.source.type = SourceType::HiveMetastore;
	config.output.directory = output.string();
	return config;
}

void TestHiveExtraction() {
	auto output = ScratchDir("hive");
	auto client = WarehouseFixture();
	ExtractionRunner runner(HiveConfig(output), FakeSource(client));
	auto report = runner.Run();

	Assert(!report.HasFailures(), "clean extraction should not fail:\n" + report.Summary());
	for (const char *kind : {"hive_databases", "hive_tables", "hive_columns", "hive_partitions", "hive_functions"}) {
		Assert(fs::exists(output / (std::string(kind) + ".csv")), std::string("output file expected: ") + kind);
	}
	Assert(report.rows_per_kind["hive_databases"] == 2, "two databases expected");
	Assert(report.rows_per_kind["hive_tables"] == 3, "three tables expected");
	Assert(report.rows_per_kind["hive_columns"] == 5, "five columns expected, partition key included");
	Assert(report.rows_per_kind["hive_partitions"] == 2, "two partitions expected");
	Assert(report.rows_per_kind["hive_functions"] == 2, "two functions expected");
	Assert(!fs::exists(output / ExtractionRunner::TMP_DIR_NAME), "temporary directory should be cleaned up");
	Assert(client->shutdown_calls == 1, "session should be closed once");

	auto tables = ReadRecords(output / "hive_tables.csv");
	Assert(tables.size() == 3, "hive_tables.csv should hold three records");
	auto table = HiveTableRow::FromDelimited(tables[0], 1);
	Assert(!table.ViewOriginalText().has_value(), "not-set view text should survive the file");

	fs::remove_all(output);
}

void TestTableFailureIsRecordedAndSkipped() {
	auto output = ScratchDir("failure");
	auto client = WarehouseFixture();
	client->failing_partition = "dt=2024-01-02";
	auto config = HiveConfig(output);
	config.output.clean_up_tmp_files = false;
	ExtractionRunner runner(config, FakeSource(client));
	auto report = runner.Run();

	Assert(report.failures.size() == 1, "one failure expected:\n" + report.Summary());
	Assert(report.failures[0].entity == "sales.events", "failure should name the table");
	Assert(report.failures[0].error.detail.find("dt=2024-01-02") != std::string::npos,
	       "failure should name the partition");
	Assert(report.rows_per_kind["hive_tables"] == 2, "other tables should still be written");
	Assert(report.rows_per_kind["hive_partitions"] == 0, "no partial partitions for the failed table");
	Assert(fs::exists(output / ExtractionRunner::TMP_DIR_NAME), "temporary directory should be kept");

	fs::remove_all(output);
}

void TestTimedOutTableAbandonsSource() {
	auto output = ScratchDir("timeout");
	auto client = WarehouseFixture();
	client->timed_out_table = "events";
	ExtractionRunner runner(HiveConfig(output), FakeSource(client));
	auto report = runner.Run();

	Assert(report.failures.size() == 1, "one source failure expected:\n" + report.Summary());
	Assert(report.failures[0].entity == "hive_metastore", "failure should be charged to the source");
	Assert(report.failures[0].error.code == MetastoreErrorCode::TransportFailure,
	       "timeout should surface as TransportFailure");
	Assert(client->get_table_calls == 2, "no table may be requested after the timeout");
	Assert(client->shutdown_calls == 0, "shutdown must not be sent over the timed out connection");
	Assert(!fs::exists(output / "hive_tables.csv"), "an abandoned source must not publish files");

	fs::remove_all(output);
}

void TestDatabaseFilterAndLegacyFunctions() {
	auto output = ScratchDir("filter");
	auto client = WarehouseFixture();
	client->legacy_server = true;
	auto config = HiveConfig(output);
	config.source.databases = {"hr"};
	ExtractionRunner runner(config, FakeSource(client, HmsProtocolVersion::V1));
	auto report = runner.Run();

	Assert(!report.HasFailures(), "filtered extraction should not fail:\n" + report.Summary());
	Assert(report.rows_per_kind["hive_databases"] == 1, "only hr expected");
	Assert(report.rows_per_kind["hive_tables"] == 1, "only hr.people expected");
	Assert(report.rows_per_kind["hive_functions"] == 1, "only hr functions expected");
	Assert(client->get_all_functions_calls == 0, "legacy adapter must not call get_all_functions");

	fs::remove_all(output);
}

void TestCloseFailureIsReported() {
	auto output = ScratchDir("close");
	auto client = WarehouseFixture();
	client->fail_shutdown = true;
	ExtractionRunner runner(HiveConfig(output), FakeSource(client));
	auto report = runner.Run();

	Assert(report.failures.size() == 1, "close failure should be reported");
	Assert(report.failures[0].error.code == MetastoreErrorCode::TransportFailure,
	       "close failure should be TransportFailure");
	Assert(fs::exists(output / "hive_tables.csv"), "files should still be published");

	fs::remove_all(output);
}

void TestSqlQueryExtraction() {
	auto output = ScratchDir("sql");
	auto database_path = (output / "catalog.duckdb").string();
	{
		duckdb::DuckDB database(database_path);
		duckdb::Connection connection(database);
		Assert(!connection
		            .Query("CREATE TABLE svv_columns AS SELECT 'catalog1' AS table_catalog, 'schema1' AS "
		                   "table_schema, 'tableA' AS table_name, 'col' || i AS column_name, i AS "
		                   "ordinal_position, NULL::VARCHAR AS column_default, 'YES' AS is_nullable, 'varchar' AS data_type, "
		                   "255 AS character_maximum_length, 0 AS numeric_precision, 0 AS numeric_precision_radix, "
		                   "0 AS numeric_scale, 0 AS datetime_precision, '' AS interval_type, '' AS "
		                   "interval_precision, '' AS character_set_catalog, '' AS character_set_schema, '' AS "
		                   "character_set_name, '' AS collation_catalog, '' AS collation_schema, '' AS "
		                   "collation_name, '' AS domain_name, '' AS remarks FROM range(1, 4) t(i)")
		            ->HasError(),
		       "fixture catalog should be created");
	}

	ExtractionConfig config;
	config.source.type = SourceType::SqlQuery;
	config.source.database_path = database_path;
	config.source.query = "SELECT * FROM svv_columns ORDER BY ordinal_position";
	config.output.directory = output.string();
	ExtractionRunner runner(config);
	auto report = runner.Run();

	Assert(!report.HasFailures(), "sql extraction should not fail:\n" + report.Summary());
	Assert(report.rows_per_kind["svv_columns"] == 3, "three column rows expected");
	auto records = ReadRecords(output / "svv_columns.csv");
	Assert(records.size() == 3 && records[2][3] == "col3", "records should be written in query order");

	config.source.query = "SELECT * FROM no_such_table";
	ExtractionRunner failing(config);
	auto failed = failing.Run();
	Assert(failed.failures.size() == 1 && failed.failures[0].error.code == MetastoreErrorCode::TransportFailure,
	       "failing query should be reported as TransportFailure");

	fs::remove_all(output);
}

void TestDelimitedFileExtraction() {
	auto output = ScratchDir("file");
	auto input = output / "input.csv";
	{
		std::ofstream out(input);
		out << "catalog1,schema1,tableA,col1,1,,YES,varchar,255,0,0,0,0,,,,,,,,,,\n";
		out << "catalog1,schema1,tableA,col2,2,\\N,NO,int4,\\N,32,2,0,\\N,,,,,,,,,,\"pk, not null\"\n";
	}

	ExtractionConfig config;
	config.source.type = SourceType::DelimitedFile;
	config.source.input_file = input.string();
	config.output.directory = output.string();
	auto report = ExtractionRunner(config).Run();
	Assert(!report.HasFailures(), "file extraction should not fail:\n" + report.Summary());
	Assert(report.rows_per_kind["svv_columns"] == 2, "two rows expected");

	{
		std::ofstream out(input, std::ios::app);
		out << "catalog1,schema1,tableA\n";
	}
	auto short_report = ExtractionRunner(config).Run();
	Assert(short_report.failures.size() == 1, "short line should fail the run");
	Assert(short_report.failures[0].error.code == MetastoreErrorCode::MissingRequiredField,
	       "short line should be MissingRequiredField");
	Assert(short_report.failures[0].error.message.find("row 3") != std::string::npos,
	       "failure should name the line");

	fs::remove_all(output);
}

} // namespace

int main() {
	LoggingConfig logging;
	logging.level = "warn";
	InitializeLogging(logging);

	TestHiveExtraction();
	TestTableFailureIsRecordedAndSkipped();
	TestTimedOutTableAbandonsSource();
	TestDatabaseFilterAndLegacyFunctions();
	TestCloseFailureIsReported();
	TestSqlQueryExtraction();
	TestDelimitedFileExtraction();
	std::cout << "[PASS] extraction runner harness checks completed" << std::endl;
	return 0;
}
