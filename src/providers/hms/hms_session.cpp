#include "providers/hms/hms_session.hpp"
#include "metastore_logging.hpp"

#include <thrift/protocol/TBinaryProtocol.h>
#include <thrift/transport/TBufferTransports.h>
#include <thrift/transport/TSSLSocket.h>
#include <thrift/transport/TSocket.h>

#include <chrono>
#include <thread>

namespace dumper {

namespace {

using apache::thrift::TException;
using apache::thrift::protocol::TBinaryProtocol;
using apache::thrift::protocol::TProtocol;
using apache::thrift::transport::TBufferedTransport;
using apache::thrift::transport::TSocket;
using apache::thrift::transport::TSSLSocketFactory;
using apache::thrift::transport::TTransport;

} // namespace

HmsSession::HmsSession(std::shared_ptr<hms::api::ThriftHiveMetastoreIf> client, std::shared_ptr<TTransport> transport,
                       std::string address)
    : client_(std::move(client)), transport_(std::move(transport)), address_(std::move(address)) {
}

HmsSession::~HmsSession() {
	if (closed_ || !transport_) {
		return;
	}
	try {
		if (transport_->isOpen()) {
			transport_->close();
		}
	} catch (const TException &tx) {
		DUMPER_LOG_WARN("HMS transport close failed during teardown",
		                {StringField("address", address_), StringField("error", tx.what())});
	}
}

MetastoreResult<std::unique_ptr<HmsSession>> HmsSession::Connect(const HmsConfig &config) {
	using Result = MetastoreResult<std::unique_ptr<HmsSession>>;
	auto address = config.Address();

	std::string last_error;
	uint32_t attempts = 0;
	while (config.connect_retry.HasAttemptsLeft(attempts)) {
		attempts++;
		try {
			std::shared_ptr<TSSLSocketFactory> ssl_factory;
			std::shared_ptr<TSocket> socket;
			if (config.transport == HmsTransport::ThriftTLS) {
				ssl_factory = std::make_shared<TSSLSocketFactory>();
				if (!config.tls_ca_file.empty()) {
					ssl_factory->authenticate(true);
					ssl_factory->loadTrustedCertificates(config.tls_ca_file.c_str());
				} else {
					ssl_factory->authenticate(false);
				}
				socket = ssl_factory->createSocket(config.endpoint, config.port);
			} else {
				socket = std::make_shared<TSocket>(config.endpoint, config.port);
			}
			auto timeout = static_cast<int>(config.connection_timeout_ms);
			socket->setConnTimeout(timeout);
			socket->setRecvTimeout(timeout);
			socket->setSendTimeout(timeout);

			std::shared_ptr<TTransport> transport = std::make_shared<TBufferedTransport>(socket);
			std::shared_ptr<TProtocol> protocol = std::make_shared<TBinaryProtocol>(transport);
			transport->open();

			auto client = std::make_shared<hms::api::ThriftHiveMetastoreClient>(protocol);
			auto session = std::make_unique<HmsSession>(std::move(client), std::move(transport), address);
			session->ssl_factory_ = std::move(ssl_factory);
			DUMPER_LOG_INFO("Connected to HMS", {StringField("address", address),
			                                     StringField("transport", HmsTransportToString(config.transport)),
			                                     IntField("attempt", attempts)});
			return Result::Success(std::move(session));
		} catch (const TException &tx) {
			last_error = tx.what();
		}

		auto delay = config.connect_retry.DelayAfter(attempts);
		if (delay.count() == 0) {
			break;
		}
		DUMPER_LOG_WARN("HMS connect failed, retrying",
		                {StringField("address", address), IntField("attempt", attempts),
		                 IntField("delay_ms", delay.count()), StringField("error", last_error)});
		std::this_thread::sleep_for(delay);
	}
	return Result::Error(MetastoreErrorCode::TransportFailure, "HMS socket connect failed",
	                     address + ": " + last_error, true);
}

hms::api::ThriftHiveMetastoreIf &HmsSession::Client() {
	return *client_;
}

void HmsSession::MarkBroken(std::string reason) {
	if (IsBroken()) {
		return;
	}
	DUMPER_LOG_WARN("HMS session unusable after transport failure",
	                {StringField("address", address_), StringField("error", reason)});
	broken_reason_ = reason.empty() ? "transport failure" : std::move(reason);
}

MetastoreError HmsSession::Close() {
	if (closed_) {
		return MetastoreError();
	}
	closed_ = true;

	MetastoreError error;
	if (!IsBroken()) {
		try {
			client_->shutdown();
		} catch (const TException &tx) {
			error = MetastoreError(MetastoreErrorCode::TransportFailure, "HMS session shutdown failed",
			                       address_ + ": " + tx.what());
		}
	}
	try {
		if (transport_ && transport_->isOpen()) {
			transport_->close();
		}
	} catch (const TException &tx) {
		if (error.IsOk()) {
			error = MetastoreError(MetastoreErrorCode::TransportFailure, "HMS transport close failed",
			                       address_ + ": " + tx.what());
		}
	}
	return error;
}

} // namespace dumper
