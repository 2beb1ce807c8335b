#pragma once

#include "metastore_errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

namespace dumper {

//===--------------------------------------------------------------------===//
// HmsTransport — wire transport for the Thrift connection
//===--------------------------------------------------------------------===//
enum class HmsTransport : uint8_t {
	Thrift = 0,    //! Plain Thrift (no TLS)
	ThriftTLS = 1  //! Thrift over TLS
};

inline const char *HmsTransportToString(HmsTransport transport) {
	switch (transport) {
	case HmsTransport::Thrift:
		return "thrift";
	case HmsTransport::ThriftTLS:
		return "thrift+ssl";
	default:
		return "unknown";
	}
}

//===--------------------------------------------------------------------===//
// HmsConnectRetry — bounded exponential backoff for opening the HMS socket
//===--------------------------------------------------------------------===//
struct HmsConnectRetry {
	//! Connect attempts, the first one included
	uint32_t max_attempts = 3;
	uint32_t initial_delay_ms = 100;
	uint32_t max_delay_ms = 5000;
	double backoff_multiplier = 2.0;

	bool HasAttemptsLeft(uint32_t attempts_made) const {
		return attempts_made < max_attempts;
	}

	//! Sleep after failed attempt number `attempt` (1-indexed). Zero once the
	//! attempt budget is spent, so the caller stops.
	std::chrono::milliseconds DelayAfter(uint32_t attempt) const {
		if (attempt == 0 || !HasAttemptsLeft(attempt)) {
			return std::chrono::milliseconds(0);
		}
		double delay = initial_delay_ms * std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
		delay = std::min(delay, static_cast<double>(max_delay_ms));
		return std::chrono::milliseconds(static_cast<int64_t>(delay));
	}
};

//===--------------------------------------------------------------------===//
// HmsConfig — parsed HMS endpoint configuration
//===--------------------------------------------------------------------===//
struct HmsConfig {
	//! Hostname or IP of the HMS Thrift server
	std::string endpoint;
	//! Wire transport (plain Thrift or TLS)
	HmsTransport transport = HmsTransport::Thrift;
	//! Applied to connect, send and receive on the socket
	uint32_t connection_timeout_ms = 30000;
	//! HMS Thrift port (default: 9083)
	uint16_t port = 9083;
	//! PEM bundle used to verify the server certificate; empty disables
	//! peer verification on thrift+ssl
	std::string tls_ca_file;
	//! "auto" probes the server version; "1", "2" or "3" pins the revision
	std::string protocol_version = "auto";
	//! Backoff for the initial socket connect only; RPCs are never retried
	HmsConnectRetry connect_retry;

	//! "host:port", for logs and error details
	std::string Address() const {
		return endpoint + ":" + std::to_string(port);
	}
};

//===--------------------------------------------------------------------===//
// ParseHmsEndpoint — parse an HMS URI into HmsConfig
//
// Supported URI forms:
//   thrift://hostname:9083       -> Thrift transport
//   thrift+ssl://hostname:9083   -> ThriftTLS transport
//   hostname:9083                -> bare host:port, defaults to Thrift
//   hostname                     -> bare host, defaults to Thrift + port 9083
//
// Throws MetastoreException with InvalidConfig on malformed URI.
//===--------------------------------------------------------------------===//
HmsConfig ParseHmsEndpoint(const std::string &endpoint);

} // namespace dumper
