#include "tooling.hpp"

#include "json_schema.hpp"
#include "log.hpp"

#include <mutex>
#include <utility>

namespace deskbridge {

bool RoutesThroughMailbox(const ToolDefinition& def) {
  return std::holds_alternative<MailboxInvoke>(def.invoke);
}

bool ToolRegistry::RegisterTool(ToolDefinition def, std::string* err) {
  if (def.name.empty()) {
    if (err) *err = "tool name is empty";
    return false;
  }
  if (const auto* local = std::get_if<LocalInvoke>(&def.invoke); local && !local->handler) {
    if (err) *err = "tool " + def.name + " has no handler";
    return false;
  }
  if (const auto* mbx = std::get_if<MailboxInvoke>(&def.invoke); mbx && mbx->action.empty()) {
    if (err) *err = "tool " + def.name + " has no mailbox action";
    return false;
  }
  std::string schema_err;
  auto schema = SanitizeParameterSchema(def.parameter_schema, &schema_err);
  if (!schema) {
    if (err) *err = "tool " + def.name + ": invalid parameter schema: " + schema_err;
    return false;
  }
  def.parameter_schema = std::move(*schema);

  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = tools_.find(def.name);
  if (it != tools_.end()) {
    if (err) *err = "tool " + def.name + " already registered by " + it->second.origin;
    return false;
  }
  const auto name = def.name;
  order_.push_back(name);
  tools_.emplace(name, std::move(def));
  return true;
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_.find(name) != tools_.end();
}

std::optional<ToolDefinition> ToolRegistry::GetTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = tools_.find(name);
  if (it == tools_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolDefinition> ToolRegistry::ListTools() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolDefinition> out;
  out.reserve(order_.size());
  for (const auto& name : order_) out.push_back(tools_.at(name));
  return out;
}

size_t ToolRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_.size();
}

nlohmann::json ToolDescriptor(const ToolDefinition& def) {
  return {{"name", def.name}, {"description", def.description}, {"inputSchema", def.parameter_schema}};
}

}  // namespace deskbridge
