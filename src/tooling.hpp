#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace deskbridge {

struct ToolResult {
  nlohmann::json result;
  bool ok = true;
  std::string error;
  ErrorCode code = ErrorCode::kExecutionError;  // when !ok
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// Runs in-process.
struct LocalInvoke {
  ToolHandler handler;
};

// Published as a mailbox item to the desktop side and answered there.
struct MailboxInvoke {
  std::string action;
  int timeout_ms = 0;  // 0: use the bridge default
  std::vector<std::string> path_arguments;
  // Takes the action from the "action" argument and the params from
  // "params" instead of sending the arguments under `action`.
  bool forwards_action = false;
};

using ToolInvoker = std::variant<LocalInvoke, MailboxInvoke>;

struct ToolDefinition {
  std::string name;
  std::string description;
  nlohmann::json parameter_schema;
  ToolInvoker invoke;
  std::string origin = "builtin";
};

bool RoutesThroughMailbox(const ToolDefinition& def);

// Tools keyed by name. Registration order is preserved for listing, and a
// name can be registered only once: the first registration wins and later
// ones are rejected.
class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Rejects the tool (returns false) when the name is empty or taken, the
  // schema fails sanitation, or a LocalInvoke has no handler.
  bool RegisterTool(ToolDefinition def, std::string* err);
  bool HasTool(const std::string& name) const;
  std::optional<ToolDefinition> GetTool(const std::string& name) const;
  std::vector<ToolDefinition> ListTools() const;
  size_t size() const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolDefinition> tools_;
  std::vector<std::string> order_;
};

// {name, description, inputSchema} as sent in tools/list.
nlohmann::json ToolDescriptor(const ToolDefinition& def);

}  // namespace deskbridge
