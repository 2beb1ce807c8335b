#pragma once

#include "metastore_source.hpp"
#include "providers/hms/hms_config.hpp"
#include "providers/hms/hms_session.hpp"

#include <memory>
#include <string>

namespace dumper {

//===--------------------------------------------------------------------===//
// Adapter selection
//
// With protocol_version "auto" the server is asked for its version and the
// leading major.minor picks the adapter; otherwise the pinned revision is
// used without a probe. UnsupportedProtocolVersion when no adapter fits.
// The session is consumed either way; on error it is released.
//===--------------------------------------------------------------------===//
MetastoreResult<std::unique_ptr<IDatabaseMetadataSource>>
SelectMetadataSource(std::unique_ptr<HmsSession> session, const std::string &protocol_version = "auto");

//! Connect to config.endpoint and select the adapter per config.protocol_version
MetastoreResult<std::unique_ptr<IDatabaseMetadataSource>> OpenMetadataSource(const HmsConfig &config);

} // namespace dumper
