#include "providers/hms/hms_metadata_source.hpp"
#include "providers/hms/hms_view_mapper.hpp"
#include "metastore_logging.hpp"

#include <thrift/TApplicationException.h>
#include <thrift/protocol/TProtocolException.h>
#include <thrift/transport/TTransportException.h>

#include <utility>

namespace dumper {

namespace {

using apache::thrift::TApplicationException;
using apache::thrift::TException;
using apache::thrift::protocol::TProtocolException;
using apache::thrift::transport::TTransportException;
using hms::api::MetaException;
using hms::api::NoSuchObjectException;
using hms::api::UnknownDBException;
using hms::api::UnknownTableException;

std::string Detail(const std::string &entity, const std::string &message) {
	if (entity.empty()) {
		return message;
	}
	return entity + ": " + message;
}

//! True when the reply stream may no longer line up with the requests
bool LosesReplyOrder(const TApplicationException &e) {
	switch (e.getType()) {
	case TApplicationException::BAD_SEQUENCE_ID:
	case TApplicationException::WRONG_METHOD_NAME:
	case TApplicationException::INVALID_MESSAGE_TYPE:
	case TApplicationException::PROTOCOL_ERROR:
		return true;
	default:
		return false;
	}
}

//! Run one RPC and map its exceptions onto the error envelope. Failures that
//! leave a reply unread mark the session broken.
template <class T, class CALL>
MetastoreResult<T> CallHms(HmsSession &session, const char *operation, const std::string &entity, CALL &&call) {
	using Result = MetastoreResult<T>;
	auto network_error = [&](const char *what) {
		session.MarkBroken(std::string(operation) + ": " + what);
		return Result::Error(MetastoreErrorCode::TransportFailure, std::string("HMS network error in ") + operation,
		                     Detail(entity, what), true);
	};
	try {
		T out;
		call(out);
		return Result::Success(std::move(out));
	} catch (const NoSuchObjectException &e) {
		return Result::Error(MetastoreErrorCode::NotFound, std::string("HMS object not found in ") + operation,
		                     Detail(entity, e.message));
	} catch (const MetaException &e) {
		return Result::Error(MetastoreErrorCode::TransportFailure, std::string("HMS retrieve error in ") + operation,
		                     Detail(entity, e.message));
	} catch (const UnknownTableException &e) {
		return Result::Error(MetastoreErrorCode::TransportFailure, std::string("HMS retrieve error in ") + operation,
		                     Detail(entity, e.message));
	} catch (const UnknownDBException &e) {
		return Result::Error(MetastoreErrorCode::TransportFailure, std::string("HMS retrieve error in ") + operation,
		                     Detail(entity, e.message));
	} catch (const TApplicationException &e) {
		if (e.getType() == TApplicationException::UNKNOWN_METHOD) {
			return Result::Error(MetastoreErrorCode::Unsupported,
			                     std::string("HMS server does not implement ") + operation, Detail(entity, e.what()));
		}
		if (LosesReplyOrder(e)) {
			return network_error(e.what());
		}
		return Result::Error(MetastoreErrorCode::TransportFailure, std::string("HMS network error in ") + operation,
		                     Detail(entity, e.what()), true);
	} catch (const TTransportException &e) {
		return network_error(e.what());
	} catch (const TProtocolException &e) {
		return network_error(e.what());
	} catch (const TException &e) {
		return network_error(e.what());
	}
}

std::string TableEntity(const std::string &database_name, const std::string &table_name) {
	return database_name + "." + table_name;
}

} // namespace

HmsMetadataSource::HmsMetadataSource(std::unique_ptr<HmsSession> session, HmsCapabilities capabilities)
    : session_(std::move(session)), capabilities_(std::move(capabilities)) {
}

HmsMetadataSource::~HmsMetadataSource() = default;

hms::api::ThriftHiveMetastoreIf *HmsMetadataSource::Client() {
	if (!IsUsable()) {
		return nullptr;
	}
	return &session_->Client();
}

bool HmsMetadataSource::IsUsable() const {
	return session_ && !session_->IsClosed() && !session_->IsBroken();
}

MetastoreError HmsMetadataSource::UnavailableError(const std::string &entity) const {
	if (session_ && !session_->IsClosed() && session_->IsBroken()) {
		return MetastoreError(MetastoreErrorCode::TransportFailure, "HMS session unusable after transport failure",
		                      Detail(entity, session_->BrokenReason()), true);
	}
	return MetastoreError(MetastoreErrorCode::TransportFailure, "HMS session is closed", entity);
}

MetastoreResult<std::vector<std::string>> HmsMetadataSource::ListDatabases() {
	using Result = MetastoreResult<std::vector<std::string>>;
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(""));
	}
	return CallHms<std::vector<std::string>>(*session_, "get_all_databases", "",
	                                         [&](std::vector<std::string> &out) { client->get_all_databases(out); });
}

MetastoreResult<MetastoreDatabaseView> HmsMetadataSource::GetDatabase(const std::string &database_name) {
	using Result = MetastoreResult<MetastoreDatabaseView>;
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(database_name));
	}
	auto database = CallHms<hms::api::Database>(*session_, "get_database", database_name,
	                                            [&](hms::api::Database &out) { client->get_database(out, database_name); });
	if (!database.IsOk()) {
		return Result::Error(std::move(database.error));
	}
	return Result::Success(HmsViewMapper::MapDatabase(database.value, capabilities_));
}

MetastoreResult<std::vector<std::string>> HmsMetadataSource::ListTables(const std::string &database_name) {
	using Result = MetastoreResult<std::vector<std::string>>;
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(database_name));
	}
	return CallHms<std::vector<std::string>>(
	    *session_, "get_all_tables", database_name,
	    [&](std::vector<std::string> &out) { client->get_all_tables(out, database_name); });
}

MetastoreResult<MetastoreTableView> HmsMetadataSource::GetTable(const std::string &database_name,
                                                                const std::string &table_name) {
	using Result = MetastoreResult<MetastoreTableView>;
	auto entity = TableEntity(database_name, table_name);
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(entity));
	}

	auto table = CallHms<hms::api::Table>(*session_, "get_table", entity, [&](hms::api::Table &out) {
		client->get_table(out, database_name, table_name);
	});
	if (!table.IsOk()) {
		return Result::Error(std::move(table.error));
	}
	auto view = HmsViewMapper::MapTable(table.value, capabilities_);

	auto fields = CallHms<std::vector<hms::api::FieldSchema>>(
	    *session_, "get_fields", entity,
	    [&](std::vector<hms::api::FieldSchema> &out) { client->get_fields(out, database_name, table_name); });
	if (!fields.IsOk()) {
		return Result::Error(std::move(fields.error));
	}
	view.fields.reserve(fields.value.size());
	for (const auto &field : fields.value) {
		view.fields.push_back(HmsViewMapper::MapField(field));
	}

	if (view.IsPartitioned()) {
		auto partitions = ListPartitions(database_name, table_name);
		if (!partitions.IsOk()) {
			return Result::Error(std::move(partitions.error));
		}
		view.partitions = std::move(partitions.value);
	}
	return Result::Success(std::move(view));
}

MetastoreResult<std::vector<MetastorePartitionView>> HmsMetadataSource::ListPartitions(const std::string &database_name,
                                                                                      const std::string &table_name) {
	using Result = MetastoreResult<std::vector<MetastorePartitionView>>;
	auto entity = TableEntity(database_name, table_name);
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(entity));
	}

	auto limit = capabilities_.max_partition_names_per_call;
	auto names = CallHms<std::vector<std::string>>(
	    *session_, "get_partition_names", entity,
	    [&](std::vector<std::string> &out) { client->get_partition_names(out, database_name, table_name, limit); });
	if (!names.IsOk()) {
		return Result::Error(std::move(names.error));
	}
	// No pagination on the wire: a full page means the listing may be truncated
	if (names.value.size() >= static_cast<size_t>(limit)) {
		DUMPER_LOG_ERROR("HMS partition listing reached the per-call bound",
		                 {StringField("table", entity), IntField("limit", limit)});
		return Result::Error(MetastoreErrorCode::CapacityExceeded,
		                     "Partition listing reached the per-call bound of " + std::to_string(limit) + " names",
		                     entity);
	}

	std::vector<MetastorePartitionView> partitions;
	partitions.reserve(names.value.size());
	for (const auto &name : names.value) {
		auto partition = CallHms<hms::api::Partition>(
		    *session_, "get_partition_by_name", entity + "/" + name,
		    [&](hms::api::Partition &out) { client->get_partition_by_name(out, database_name, table_name, name); });
		if (!partition.IsOk()) {
			DUMPER_LOG_ERROR("HMS partition fetch failed, abandoning table",
			                 {StringField("table", entity), StringField("partition", name),
			                  StringField("error", partition.error.ToString())});
			return Result::Error(std::move(partition.error));
		}
		partitions.push_back(HmsViewMapper::MapPartition(name, partition.value));
	}
	return Result::Success(std::move(partitions));
}

MetastoreResult<std::vector<MetastoreFunctionView>> HmsMetadataSource::GetFunctions() {
	using Result = MetastoreResult<std::vector<MetastoreFunctionView>>;
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(""));
	}
	auto response = CallHms<hms::api::GetAllFunctionsResponse>(
	    *session_, "get_all_functions", "",
	    [&](hms::api::GetAllFunctionsResponse &out) { client->get_all_functions(out); });
	if (!response.IsOk()) {
		return Result::Error(std::move(response.error));
	}

	std::vector<MetastoreFunctionView> functions;
	if (!response.value.__isset.functions) {
		return Result::Success(std::move(functions));
	}
	functions.reserve(response.value.functions.size());
	for (const auto &function : response.value.functions) {
		functions.push_back(HmsViewMapper::MapFunction(function, capabilities_));
	}
	return Result::Success(std::move(functions));
}

MetastoreError HmsMetadataSource::Close() {
	if (!session_ || session_->IsClosed()) {
		return MetastoreError();
	}
	auto error = session_->Close();
	if (!error.IsOk()) {
		DUMPER_LOG_ERROR("HMS session close failed",
		                 {StringField("address", session_->Address()), StringField("error", error.ToString())});
	}
	return error;
}

//===--------------------------------------------------------------------===//
// HmsLegacyMetadataSource
//===--------------------------------------------------------------------===//
MetastoreResult<std::vector<MetastoreFunctionView>> HmsLegacyMetadataSource::GetFunctions() {
	using Result = MetastoreResult<std::vector<MetastoreFunctionView>>;
	auto databases = ListDatabases();
	if (!databases.IsOk()) {
		return Result::Error(std::move(databases.error));
	}
	auto *client = Client();
	if (!client) {
		return Result::Error(UnavailableError(""));
	}

	std::vector<MetastoreFunctionView> functions;
	for (const auto &database_name : databases.value) {
		auto names = CallHms<std::vector<std::string>>(
		    *session_, "get_functions", database_name,
		    [&](std::vector<std::string> &out) { client->get_functions(out, database_name, "*"); });
		if (!names.IsOk()) {
			return Result::Error(std::move(names.error));
		}
		for (const auto &name : names.value) {
			auto function = CallHms<hms::api::Function>(
			    *session_, "get_function", TableEntity(database_name, name),
			    [&](hms::api::Function &out) { client->get_function(out, database_name, name); });
			if (!function.IsOk()) {
				return Result::Error(std::move(function.error));
			}
			functions.push_back(HmsViewMapper::MapFunction(function.value, capabilities_));
		}
	}
	return Result::Success(std::move(functions));
}

} // namespace dumper
