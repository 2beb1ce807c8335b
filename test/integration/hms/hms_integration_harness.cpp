#include "fake_hms_client.hpp"
#include "main/hive_rows.hpp"
#include "metastore_logging.hpp"
#include "providers/hms/hms_capabilities.hpp"
#include "providers/hms/hms_config.hpp"
#include "providers/hms/hms_metadata_source.hpp"
#include "providers/hms/hms_session.hpp"
#include "providers/hms/hms_selector.hpp"
#include "providers/hms/hms_view_mapper.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace {

using namespace dumper;
using dumper::testing::FakeHmsClient;

void Assert(bool condition, const std::string &message) {
	if (!condition) {
		std::cerr << "[FAIL] " << message << std::endl;
		std::exit(1);
	}
}

std::unique_ptr<HmsSession> FakeSession(const std::shared_ptr<FakeHmsClient> &client) {
	return std::make_unique<HmsSession>(client, nullptr, "fake-hms:9083");
}

std::unique_ptr<IDatabaseMetadataSource> Select(const std::shared_ptr<FakeHmsClient> &client,
                                                const std::string &protocol_version = "auto") {
	auto selected = SelectMetadataSource(FakeSession(client), protocol_version);
	Assert(selected.IsOk(), "adapter selection should succeed: " + selected.error.ToString());
	return std::move(selected.value);
}

std::shared_ptr<FakeHmsClient> SalesFixture() {
	auto client = std::make_shared<FakeHmsClient>();
	client->AddDatabase("sales", "hdfs://warehouse/sales.db");
	client->AddTable("sales", "orders", {{"id", "bigint"}, {"amount", "decimal(10,2)"}});
	auto &events = client->AddTable("sales", "events", {{"payload", "string"}});
	events.__set_partitionKeys({FakeHmsClient::Field("dt", "string"), FakeHmsClient::Field("region", "string")});
	client->AddPartition("sales", "events", "dt=2024-01-01/region=eu", {"2024-01-01", "eu"});
	client->AddPartition("sales", "events", "dt=2024-01-01/region=us", {"2024-01-01", "us"});
	client->AddFunction("sales", "mask_card", "com.example.udf.MaskCard");
	return client;
}

void TestEndpointParsing() {
	auto config = ParseHmsEndpoint("thrift://localhost:9083");
	Assert(config.endpoint == "localhost", "endpoint host should parse");
	Assert(config.port == 9083, "endpoint port should parse");
	Assert(config.transport == HmsTransport::Thrift, "endpoint transport should parse");

	auto tls_config = ParseHmsEndpoint("thrift+ssl://hms.example.com:10000");
	Assert(tls_config.endpoint == "hms.example.com", "tls endpoint host should parse");
	Assert(tls_config.port == 10000, "tls endpoint port should parse");
	Assert(tls_config.transport == HmsTransport::ThriftTLS, "tls endpoint transport should parse");

	auto bare = ParseHmsEndpoint("metastore");
	Assert(bare.endpoint == "metastore" && bare.port == 9083, "bare host should default to port 9083");
	Assert(bare.protocol_version == "auto", "protocol version should default to auto");

	auto slashed = ParseHmsEndpoint("thrift://hms.example.com:9084//");
	Assert(slashed.endpoint == "hms.example.com" && slashed.port == 9084, "trailing slashes should be ignored");

	for (const char *invalid : {"thrift://:9083", "thrift://host:99999", "thrift://host:abc", "http://host:9083", "",
	                            "thrift://host:", "thrift://", "thrift://host:+80", "thrift://::1"}) {
		bool invalid_error = false;
		try {
			(void)ParseHmsEndpoint(invalid);
		} catch (const MetastoreException &ex) {
			invalid_error = ex.GetErrorCode() == MetastoreErrorCode::InvalidConfig;
		}
		Assert(invalid_error, std::string("invalid endpoint must raise InvalidConfig: ") + invalid);
	}
}

void TestConnectRetry() {
	HmsConnectRetry retry;
	retry.max_attempts = 5;
	retry.initial_delay_ms = 100;
	retry.max_delay_ms = 300;

	Assert(retry.DelayAfter(0).count() == 0, "attempt zero has no delay");
	Assert(retry.DelayAfter(1).count() == 100, "first retry delay mismatch");
	Assert(retry.DelayAfter(2).count() == 200, "second retry delay mismatch");
	Assert(retry.DelayAfter(3).count() == 300, "third retry should hit the cap");
	Assert(retry.DelayAfter(4).count() == 300, "fourth retry stays capped");
	Assert(retry.DelayAfter(5).count() == 0, "spent budget has no delay");
	Assert(retry.HasAttemptsLeft(4), "fifth attempt is allowed");
	Assert(!retry.HasAttemptsLeft(5), "sixth attempt is not allowed");

	auto config = ParseHmsEndpoint("thrift://127.0.0.1:1");
	config.connection_timeout_ms = 500;
	config.connect_retry.max_attempts = 2;
	config.connect_retry.initial_delay_ms = 1;
	auto session = HmsSession::Connect(config);
	Assert(!session.IsOk(), "connect to a closed port should fail");
	Assert(session.error.code == MetastoreErrorCode::TransportFailure, "connect failure should be TransportFailure");
	Assert(session.error.retryable, "connect failure should be retryable");
	Assert(session.error.detail.find("127.0.0.1:1") != std::string::npos, "connect failure should name the address");
}

void TestCapabilityResolution() {
	struct Case {
		const char *version;
		HmsProtocolVersion expected;
	};
	for (const auto &c : {Case {"0.13.1", HmsProtocolVersion::V1}, Case {"1.2.2", HmsProtocolVersion::V1},
	                      Case {"2.3.9", HmsProtocolVersion::V2}, Case {"3.1.3-amzn-1", HmsProtocolVersion::V3},
	                      Case {"4.0.0-beta-1", HmsProtocolVersion::V3}, Case {"Hive 2.1.0", HmsProtocolVersion::V2}}) {
		auto resolved = ProtocolVersionFromServer(c.version);
		Assert(resolved.IsOk(), std::string("version should resolve: ") + c.version);
		Assert(resolved.value == c.expected, std::string("version resolved to the wrong revision: ") + c.version);
	}
	for (const char *unsupported : {"0.12.0", "5.0.0", "unknown", "", "3"}) {
		auto resolved = ProtocolVersionFromServer(unsupported);
		Assert(!resolved.IsOk(), std::string("version should be rejected: ") + unsupported);
		Assert(resolved.error.code == MetastoreErrorCode::UnsupportedProtocolVersion,
		       "rejected version must return UnsupportedProtocolVersion");
	}

	auto v1 = CapabilitiesFor(HmsProtocolVersion::V1);
	Assert(!v1.bulk_function_listing && !v1.catalog_names, "V1 carries no catalogs and no bulk functions");
	auto v3 = CapabilitiesFor(HmsProtocolVersion::V3);
	Assert(v3.bulk_function_listing && v3.catalog_names && v3.table_owner_type, "V3 carries catalogs and owner type");
	Assert(v1.max_partition_names_per_call == 32767 && v3.max_partition_names_per_call == 32767,
	       "every revision caps partition names at the i16 maximum");

	Assert(ParseProtocolVersionOption("v2").value == HmsProtocolVersion::V2, "v2 option should parse");
	Assert(ParseProtocolVersionOption("9").error.code == MetastoreErrorCode::UnsupportedProtocolVersion,
	       "unknown pinned revision must return UnsupportedProtocolVersion");
}

void TestSelector() {
	auto client = SalesFixture();
	client->server_version = "1.2.1";
	auto legacy = Select(client);
	Assert(legacy->GetCapabilities().version == HmsProtocolVersion::V1, "1.x server should select the V1 adapter");
	Assert(legacy->GetCapabilities().server_version == "1.2.1", "probed version should be recorded");
	Assert(dynamic_cast<HmsLegacyMetadataSource *>(legacy.get()) != nullptr, "V1 should use the legacy adapter");

	auto pinned_client = SalesFixture();
	pinned_client->fail_version = true;
	auto pinned = Select(pinned_client, "2");
	Assert(pinned->GetCapabilities().version == HmsProtocolVersion::V2, "pinned revision should bypass the probe");

	auto unsupported_client = SalesFixture();
	unsupported_client->server_version = "7.0.0";
	auto unsupported = SelectMetadataSource(FakeSession(unsupported_client));
	Assert(!unsupported.IsOk(), "unknown server version should fail selection");
	Assert(unsupported.error.code == MetastoreErrorCode::UnsupportedProtocolVersion,
	       "unknown server version must return UnsupportedProtocolVersion");

	auto failing_client = SalesFixture();
	failing_client->fail_version = true;
	auto failing = SelectMetadataSource(FakeSession(failing_client));
	Assert(!failing.IsOk() && failing.error.code == MetastoreErrorCode::TransportFailure,
	       "failing version probe must return TransportFailure");
	Assert(failing.error.retryable, "failing version probe should be retryable");
}

void TestNotSetViewText() {
	auto client = SalesFixture();
	auto &view = client->AddTable("sales", "orders_view", {{"id", "bigint"}});
	view.__set_tableType("VIRTUAL_VIEW");
	view.__set_viewOriginalText("");
	auto source = Select(client);

	auto plain = source->GetTable("sales", "orders");
	Assert(plain.IsOk(), "GetTable should succeed");
	Assert(!plain.value.view_original_text.has_value(), "unset viewOriginalText must be not-set");

	auto empty = source->GetTable("sales", "orders_view");
	Assert(empty.IsOk(), "GetTable should succeed for the view");
	Assert(empty.value.view_original_text.has_value() && empty.value.view_original_text->empty(),
	       "viewOriginalText set to empty must stay an empty string");

	auto plain_row = HiveTableRow::FromView(plain.value);
	auto empty_row = HiveTableRow::FromView(empty.value);
	Assert(!plain_row.ViewOriginalText().has_value(), "row should keep the not-set marker");
	Assert(empty_row.ViewOriginalText() == std::optional<std::string>(""), "row should keep the empty string");
	Assert(plain_row.ToString().find("view_original_text=\\N") != std::string::npos,
	       "not-set text should render as \\N");
}

void TestCapabilityGatesFields() {
	auto client = SalesFixture();
	auto &orders = client->tables[{"sales", "orders"}];
	orders.__set_catName("hive");
	orders.__set_ownerType(hms::api::PrincipalType::ROLE);

	client->server_version = "3.1.2";
	auto v3 = Select(client);
	auto v3_table = v3->GetTable("sales", "orders");
	Assert(v3_table.IsOk(), "V3 GetTable should succeed");
	Assert(v3_table.value.catalog_name == std::optional<std::string>("hive"), "V3 should carry catName");
	Assert(v3_table.value.owner_type == std::optional<std::string>("ROLE"), "V3 should carry ownerType");

	client->server_version = "2.3.9";
	auto v2 = Select(client);
	auto v2_table = v2->GetTable("sales", "orders");
	Assert(v2_table.IsOk(), "V2 GetTable should succeed");
	Assert(!v2_table.value.catalog_name.has_value(), "V2 does not carry catName");
	Assert(!v2_table.value.owner_type.has_value(), "V2 does not carry ownerType");
}

void TestEagerTableLoad() {
	auto client = SalesFixture();
	auto source = Select(client);

	auto events = source->GetTable("sales", "events");
	Assert(events.IsOk(), "partitioned GetTable should succeed");
	Assert(events.value.fields.size() == 1, "fields should be loaded");
	Assert(events.value.partition_keys.size() == 2, "partition keys should be loaded");
	Assert(events.value.partitions.size() == 2, "partitions should be loaded eagerly");
	Assert(events.value.partitions[1].values.size() == 2 && events.value.partitions[1].values[1] == "us",
	       "partition values should be mapped");
	Assert(client->last_max_parts == 32767, "partition names should be requested with the revision bound");

	auto columns = HiveColumnRow::FromTable(events.value);
	Assert(columns.size() == 3, "columns should include partition keys");
	Assert(columns[2].OrdinalPosition() == 3 && columns[2].IsPartitionKey() == "YES",
	       "partition keys should follow regular fields");

	auto missing = source->GetTable("sales", "nope");
	Assert(!missing.IsOk() && missing.error.code == MetastoreErrorCode::NotFound, "missing table must be NotFound");
	Assert(missing.error.detail.find("sales.nope") != std::string::npos, "error should name the table");

	auto missing_db = source->ListTables("nope");
	Assert(!missing_db.IsOk() && missing_db.error.code == MetastoreErrorCode::TransportFailure,
	       "MetaException must map to TransportFailure");
}

void TestPartitionFailureAbortsTable() {
	auto client = SalesFixture();
	client->failing_partition = "dt=2024-01-01/region=us";
	auto source = Select(client);

	auto events = source->GetTable("sales", "events");
	Assert(!events.IsOk(), "a failing partition must fail the table");
	Assert(events.error.detail.find("sales.events/dt=2024-01-01/region=us") != std::string::npos,
	       "error should name database, table and partition");

	auto orders = source->GetTable("sales", "orders");
	Assert(orders.IsOk(), "other tables should still load");
}

void TestPartitionCapacity() {
	auto client = SalesFixture();
	HmsCapabilities caps = CapabilitiesFor(HmsProtocolVersion::V3);
	caps.max_partition_names_per_call = 2;
	HmsMetadataSource source(FakeSession(client), caps);

	auto events = source.ListPartitions("sales", "events");
	Assert(!events.IsOk(), "a full page of partition names must not be truncated silently");
	Assert(events.error.code == MetastoreErrorCode::CapacityExceeded, "full page must return CapacityExceeded");
	Assert(client->last_max_parts == 2, "bound should be passed to the server");

	client->AddPartition("sales", "small", "dt=1", {"1"});
	auto small = source.ListPartitions("sales", "small");
	Assert(small.IsOk() && small.value.size() == 1, "listing below the bound should succeed");
}

void TestFunctionListing() {
	auto client = SalesFixture();
	auto modern = Select(client);
	auto functions = modern->GetFunctions();
	Assert(functions.IsOk() && functions.value.size() == 1, "bulk function listing should succeed");
	Assert(client->get_all_functions_calls == 1, "V3 should use get_all_functions");
	Assert(functions.value[0].function_type == std::optional<std::string>("JAVA"), "function type should render");
	Assert(!functions.value[0].owner_name.has_value(), "unset owner must be not-set");

	auto legacy_client = SalesFixture();
	legacy_client->legacy_server = true;
	legacy_client->server_version = "1.1.0";
	auto legacy = Select(legacy_client);
	auto legacy_functions = legacy->GetFunctions();
	Assert(legacy_functions.IsOk() && legacy_functions.value.size() == 1, "legacy function listing should succeed");
	Assert(legacy_client->get_all_functions_calls == 0, "V1 must not call get_all_functions");
	Assert(legacy_client->get_function_calls == 1, "V1 should fetch each function by name");
	Assert(legacy_functions.value[0].class_name == std::optional<std::string>("com.example.udf.MaskCard"),
	       "legacy function should be mapped");

	auto mislabeled = Select(legacy_client, "3");
	auto unsupported = mislabeled->GetFunctions();
	Assert(!unsupported.IsOk() && unsupported.error.code == MetastoreErrorCode::Unsupported,
	       "unknown method must return Unsupported");
}

void TestTimedOutCallRetiresSession() {
	auto client = SalesFixture();
	client->timed_out_table = "events";
	auto source = Select(client);

	auto missing = source->GetTable("sales", "nope");
	Assert(!missing.IsOk() && source->IsUsable(), "a server-side error should leave the session usable");

	auto events = source->GetTable("sales", "events");
	Assert(!events.IsOk() && events.error.code == MetastoreErrorCode::TransportFailure,
	       "a socket timeout must be TransportFailure");
	Assert(events.error.retryable, "a socket timeout should be retryable on a new session");
	Assert(!source->IsUsable(), "a socket timeout must retire the session");

	auto calls_before = client->get_table_calls;
	auto orders = source->GetTable("sales", "orders");
	Assert(!orders.IsOk() && orders.error.code == MetastoreErrorCode::TransportFailure,
	       "calls after a timeout must fail");
	Assert(orders.error.message == "HMS session unusable after transport failure",
	       "refused call should say why: " + orders.error.message);
	Assert(client->get_table_calls == calls_before, "refused call must not reach the client");
	Assert(!source->ListDatabases().IsOk(), "every operation should be refused");

	Assert(source->Close().IsOk(), "closing a retired session should only drop the transport");
	Assert(client->shutdown_calls == 0, "shutdown must not be sent over a retired connection");
}

void TestClose() {
	auto client = SalesFixture();
	auto source = Select(client);
	Assert(source->Close().IsOk(), "clean close should succeed");
	Assert(source->Close().IsOk(), "second close should be a no-op");
	Assert(client->shutdown_calls == 1, "shutdown should be sent once");

	auto after_close = source->ListDatabases();
	Assert(!after_close.IsOk() && after_close.error.code == MetastoreErrorCode::TransportFailure,
	       "calls after close must fail");

	auto failing_client = SalesFixture();
	failing_client->fail_shutdown = true;
	auto failing = Select(failing_client);
	auto close_error = failing->Close();
	Assert(!close_error.IsOk(), "failing shutdown must be reported");
	Assert(close_error.code == MetastoreErrorCode::TransportFailure, "failing shutdown must be TransportFailure");
	Assert(failing->Close().IsOk(), "close after a failed close should be a no-op");
}

} // namespace

int main() {
	LoggingConfig logging;
	logging.level = "warn";
	InitializeLogging(logging);

	TestEndpointParsing();
	TestConnectRetry();
	TestCapabilityResolution();
	TestSelector();
	TestNotSetViewText();
	TestCapabilityGatesFields();
	TestEagerTableLoad();
	TestPartitionFailureAbortsTable();
	TestPartitionCapacity();
	TestFunctionListing();
	TestTimedOutCallRetiresSession();
	TestClose();
	std::cout << "[PASS] HMS integration harness checks completed" << std::endl;
	return 0;
}
