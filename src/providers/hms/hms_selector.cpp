#include "providers/hms/hms_selector.hpp"
#include "providers/hms/hms_metadata_source.hpp"
#include "metastore_logging.hpp"

namespace dumper {

namespace {

using Selected = MetastoreResult<std::unique_ptr<IDatabaseMetadataSource>>;

MetastoreResult<std::string> ProbeServerVersion(HmsSession &session) {
	using Result = MetastoreResult<std::string>;
	try {
		std::string version;
		session.Client().getVersion(version);
		return Result::Success(std::move(version));
	} catch (const apache::thrift::TException &tx) {
		return Result::Error(MetastoreErrorCode::TransportFailure, "HMS version probe failed",
		                     session.Address() + ": " + tx.what(), true);
	}
}

} // namespace

Selected SelectMetadataSource(std::unique_ptr<HmsSession> session, const std::string &protocol_version) {
	if (!session) {
		return Selected::Error(MetastoreErrorCode::InvalidConfig, "No HMS session to select an adapter for");
	}

	std::string server_version;
	MetastoreResult<HmsProtocolVersion> version;
	if (protocol_version.empty() || protocol_version == "auto") {
		auto probed = ProbeServerVersion(*session);
		if (!probed.IsOk()) {
			return Selected::Error(std::move(probed.error));
		}
		server_version = std::move(probed.value);
		version = ProtocolVersionFromServer(server_version);
	} else {
		version = ParseProtocolVersionOption(protocol_version);
	}
	if (!version.IsOk()) {
		DUMPER_LOG_ERROR("No HMS adapter for server", {StringField("address", session->Address()),
		                                               StringField("server_version", server_version),
		                                               StringField("protocol_version", protocol_version)});
		return Selected::Error(std::move(version.error));
	}

	auto capabilities = CapabilitiesFor(version.value);
	capabilities.server_version = server_version;
	DUMPER_LOG_INFO("Selected HMS adapter",
	                {StringField("address", session->Address()), StringField("server_version", server_version),
	                 StringField("revision", HmsProtocolVersionToString(capabilities.version))});

	std::unique_ptr<IDatabaseMetadataSource> source;
	if (capabilities.bulk_function_listing) {
		source = std::make_unique<HmsMetadataSource>(std::move(session), std::move(capabilities));
	} else {
		source = std::make_unique<HmsLegacyMetadataSource>(std::move(session), std::move(capabilities));
	}
	return Selected::Success(std::move(source));
}

Selected OpenMetadataSource(const HmsConfig &config) {
	auto session = HmsSession::Connect(config);
	if (!session.IsOk()) {
		return Selected::Error(std::move(session.error));
	}
	return SelectMetadataSource(std::move(session.value), config.protocol_version);
}

} // namespace dumper
