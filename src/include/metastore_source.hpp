#pragma once

#include "main/metastore_types.hpp"
#include "metastore_errors.hpp"
#include "providers/hms/hms_capabilities.hpp"

#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// IDatabaseMetadataSource — version-independent metastore operations
//
// Each implementation wraps one exclusively owned connection and one
// negotiated protocol revision. Calls are blocking and not safe for
// concurrent use. Every attribute of a returned view is either a value
// received from the server or std::nullopt.
//===--------------------------------------------------------------------===//
class IDatabaseMetadataSource {
public:
	virtual ~IDatabaseMetadataSource() = default;

	//! Names of all databases in the metastore.
	virtual MetastoreResult<std::vector<std::string>> ListDatabases() = 0;

	virtual MetastoreResult<MetastoreDatabaseView> GetDatabase(const std::string &database_name) = 0;

	//! Names of all tables within a database.
	virtual MetastoreResult<std::vector<std::string>> ListTables(const std::string &database_name) = 0;

	//! Full table metadata. Fields, partition keys and partitions are loaded
	//! before returning; a failure on any of them fails the call.
	virtual MetastoreResult<MetastoreTableView> GetTable(const std::string &database_name,
	                                                     const std::string &table_name) = 0;

	//! Every partition of a table, fetched one by one after listing names.
	//! CapacityExceeded when the name listing hits the per-call bound.
	virtual MetastoreResult<std::vector<MetastorePartitionView>> ListPartitions(const std::string &database_name,
	                                                                           const std::string &table_name) = 0;

	//! Every function across all databases.
	virtual MetastoreResult<std::vector<MetastoreFunctionView>> GetFunctions() = 0;

	virtual const HmsCapabilities &GetCapabilities() const = 0;

	//! False once the connection can no longer be trusted to pair replies
	//! with requests, or is closed. Every later call fails without reaching
	//! the server, so callers should abandon the source.
	virtual bool IsUsable() const = 0;

	//! Tear down the session. TransportFailure if shutdown fails; calling it
	//! again is a no-op.
	virtual MetastoreError Close() = 0;
};

} // namespace dumper
