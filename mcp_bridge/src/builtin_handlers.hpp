#pragma once

#include "bridge_server.hpp"

namespace bridge::builtin {

constexpr const char* STATUS_RESOURCE_URI = "bridge://server/status";
constexpr const char* TOOLS_RESOURCE_PATTERN = "bridge://tools/*";

/// Registers the echo and server_status tools and the bridge:// resources.
void register_builtin_handlers(BridgeServer& server);

} // namespace bridge::builtin
