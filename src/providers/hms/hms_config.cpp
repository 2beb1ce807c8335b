#include "providers/hms/hms_config.hpp"

#include <charconv>

namespace dumper {

namespace {

struct SchemeTransport {
	const char *prefix;
	HmsTransport transport;
};

// Longest prefix first: "thrift+ssl://" must win over "thrift://"
const SchemeTransport SCHEMES[] = {
    {"thrift+ssl://", HmsTransport::ThriftTLS},
    {"thrift://", HmsTransport::Thrift},
};

const uint16_t DEFAULT_HMS_PORT = 9083;

} // namespace

HmsConfig ParseHmsEndpoint(const std::string &endpoint) {
	auto reject = [&endpoint](const std::string &reason) {
		MetastoreErrorTag tag {"hms", "ParseHmsEndpoint", false};
		tag.entity = endpoint;
		return MetastoreException(MetastoreErrorCode::InvalidConfig, tag,
		                          "Invalid HMS endpoint '" + endpoint + "': " + reason);
	};

	HmsConfig config;
	std::string authority = endpoint;
	bool has_scheme = false;
	for (const auto &scheme : SCHEMES) {
		if (endpoint.rfind(scheme.prefix, 0) == 0) {
			config.transport = scheme.transport;
			authority = endpoint.substr(std::char_traits<char>::length(scheme.prefix));
			has_scheme = true;
			break;
		}
	}
	if (!has_scheme && endpoint.find("://") != std::string::npos) {
		throw reject("scheme must be thrift:// or thrift+ssl://");
	}

	auto path_start = authority.find_last_not_of('/');
	authority.erase(path_start == std::string::npos ? 0 : path_start + 1);

	auto colon = authority.rfind(':');
	config.endpoint = authority.substr(0, colon);
	config.port = DEFAULT_HMS_PORT;
	if (colon != std::string::npos) {
		auto port_text = authority.substr(colon + 1);
		unsigned port = 0;
		auto parsed = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
		if (port_text.empty() || parsed.ec != std::errc() || parsed.ptr != port_text.data() + port_text.size() ||
		    port == 0 || port > 65535) {
			throw reject("port must be a number between 1 and 65535");
		}
		config.port = static_cast<uint16_t>(port);
	}
	if (config.endpoint.empty() || config.endpoint.find(':') != std::string::npos) {
		throw reject("host is missing");
	}
	return config;
}

} // namespace dumper
