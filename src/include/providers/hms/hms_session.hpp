#pragma once

#include "metastore_errors.hpp"
#include "providers/hms/hms_config.hpp"
#include "ThriftHiveMetastore.h"

#include <memory>
#include <string>

namespace apache {
namespace thrift {
namespace transport {
class TTransport;
class TSSLSocketFactory;
} // namespace transport
} // namespace thrift
} // namespace apache

namespace dumper {

//===--------------------------------------------------------------------===//
// HmsSession — one open connection to a metastore server
//
// Owns the transport and the generated client. Close() must be called
// exactly once by the owner to learn whether shutdown succeeded; the
// destructor only releases the socket.
//===--------------------------------------------------------------------===//
class HmsSession {
public:
	//! Wrap an already connected client. `transport` may be null for
	//! in-process clients.
	HmsSession(std::shared_ptr<hms::api::ThriftHiveMetastoreIf> client,
	           std::shared_ptr<apache::thrift::transport::TTransport> transport, std::string address);
	~HmsSession();

	HmsSession(const HmsSession &) = delete;
	HmsSession &operator=(const HmsSession &) = delete;

	//! Open a socket (TLS when configured), retrying the connect with backoff.
	//! TransportFailure once every attempt failed.
	static MetastoreResult<std::unique_ptr<HmsSession>> Connect(const HmsConfig &config);

	hms::api::ThriftHiveMetastoreIf &Client();
	const std::string &Address() const {
		return address_;
	}
	bool IsClosed() const {
		return closed_;
	}

	//! Called after a call was abandoned mid-flight (timeout, protocol
	//! error). The generated client does not check sequence ids, so a late
	//! reply would be read as the answer to the next request; the connection
	//! must not carry another call.
	void MarkBroken(std::string reason);
	bool IsBroken() const {
		return !broken_reason_.empty();
	}
	const std::string &BrokenReason() const {
		return broken_reason_;
	}

	//! Send the shutdown call and close the transport. TransportFailure if
	//! either step fails; the session counts as closed in both cases. A second
	//! call is a no-op returning Ok. A broken session skips the shutdown call
	//! and only closes the transport.
	MetastoreError Close();

private:
	//! Kept alive for the lifetime of the TLS socket it created
	std::shared_ptr<apache::thrift::transport::TSSLSocketFactory> ssl_factory_;
	std::shared_ptr<hms::api::ThriftHiveMetastoreIf> client_;
	std::shared_ptr<apache::thrift::transport::TTransport> transport_;
	std::string address_;
	bool closed_ = false;
	std::string broken_reason_;
};

} // namespace dumper
