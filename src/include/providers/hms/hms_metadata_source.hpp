#pragma once

#include "metastore_source.hpp"
#include "providers/hms/hms_capabilities.hpp"
#include "providers/hms/hms_session.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// HmsMetadataSource — adapter for revisions with bulk function listing
// (Hive 2.x and later)
//===--------------------------------------------------------------------===//
class HmsMetadataSource : public IDatabaseMetadataSource {
public:
	HmsMetadataSource(std::unique_ptr<HmsSession> session, HmsCapabilities capabilities);
	~HmsMetadataSource() override;

	MetastoreResult<std::vector<std::string>> ListDatabases() override;
	MetastoreResult<MetastoreDatabaseView> GetDatabase(const std::string &database_name) override;
	MetastoreResult<std::vector<std::string>> ListTables(const std::string &database_name) override;
	MetastoreResult<MetastoreTableView> GetTable(const std::string &database_name,
	                                             const std::string &table_name) override;
	MetastoreResult<std::vector<MetastorePartitionView>> ListPartitions(const std::string &database_name,
	                                                                   const std::string &table_name) override;
	MetastoreResult<std::vector<MetastoreFunctionView>> GetFunctions() override;

	const HmsCapabilities &GetCapabilities() const override {
		return capabilities_;
	}

	bool IsUsable() const override;

	MetastoreError Close() override;

protected:
	//! Null once the session is closed or broken
	hms::api::ThriftHiveMetastoreIf *Client();
	//! Error for a call refused because Client() is null
	MetastoreError UnavailableError(const std::string &entity) const;

	std::unique_ptr<HmsSession> session_;
	const HmsCapabilities capabilities_;
};

//===--------------------------------------------------------------------===//
// HmsLegacyMetadataSource — Hive 0.13 - 1.x
//
// The server has no get_all_functions; functions are enumerated per
// database with get_functions and fetched with get_function.
//===--------------------------------------------------------------------===//
class HmsLegacyMetadataSource final : public HmsMetadataSource {
public:
	using HmsMetadataSource::HmsMetadataSource;

	MetastoreResult<std::vector<MetastoreFunctionView>> GetFunctions() override;
};

} // namespace dumper
