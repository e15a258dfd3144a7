#pragma once

#include "services.hpp"

#include <nlohmann/json.hpp>

namespace deskbridge {

// Lock owner, channel directories, in-flight / abandoned counts and the
// desktop probe. Also served by GET /health.
nlohmann::json BridgeStatus(const GatewayServices& services);

// bridge_status, convert_path, open_conversation, switch_model,
// execute_from_code. Returns the number registered.
int RegisterBuiltinTools(const GatewayServices& services, ToolRegistry* registry);

}  // namespace deskbridge
