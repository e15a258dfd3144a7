#include "builtin_tools.hpp"

#include "log.hpp"

#include <unistd.h>

#include <string>
#include <utility>

namespace deskbridge {

nlohmann::json BridgeStatus(const GatewayServices& s) {
  nlohmann::json out;
  out["pid"] = static_cast<long>(::getpid());
  out["local_path_syntax"] = PathSyntaxName(s.local_syntax);
  out["peer_path_syntax"] = PathSyntaxName(s.peer_syntax);
  if (s.registry) out["tools"] = s.registry->size();

  nlohmann::json lock = {{"held", false}};
  if (s.lock && s.lock->held()) {
    lock["held"] = true;
    lock["resource"] = s.lock->resource();
    if (auto owner = s.lock->CurrentOwner(s.lock->resource())) {
      lock["owner_pid"] = owner->pid;
      lock["since"] = owner->timestamp;
    }
  }
  out["lock"] = lock;

  if (s.bridge) {
    const auto& layout = s.bridge->options().layout;
    out["mailbox"] = {
        {"channel", layout.channel},
        {"outbox", layout.outbox().string()},
        {"inbox", layout.inbox().string()},
        {"in_flight", s.bridge->InFlightCount()},
        {"abandoned", s.bridge->AbandonedCount()},
        {"reaper_restarts", s.bridge->reaper_restarts()},
    };
  } else {
    out["mailbox"] = nullptr;
  }

  nlohmann::json desktop = {{"probe", ProbeResultName(ProbeResult::kUnknown)}};
  if (s.config && !s.config->desktop_process_name.empty()) {
    desktop["process"] = s.config->desktop_process_name;
    if (s.probe) desktop["probe"] = ProbeResultName(s.probe->ProbeName(s.config->desktop_process_name));
  }
  out["desktop"] = desktop;
  return out;
}

namespace {

nlohmann::json ObjectSchema(nlohmann::json properties, nlohmann::json required) {
  return {{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

ToolResult ConvertPath(const GatewayServices& s, const nlohmann::json& args) {
  ToolResult r;
  const auto path = args.value("path", std::string());
  const auto direction = args.value("direction", std::string());
  if (!s.translator) {
    r.ok = false;
    r.error = "path translation unavailable";
    return r;
  }
  GatewayError err;
  std::optional<std::string> converted;
  if (direction == "to_guest") {
    converted = s.translator->ToGuest(path, &err);
  } else {
    converted = s.translator->ToHost(path, &err);
  }
  if (!converted) {
    r.ok = false;
    r.error = err.message;
    r.code = err.code;
    return r;
  }
  r.result = {{"path", path}, {"direction", direction}, {"translated", *converted}};
  return r;
}

}  // namespace

int RegisterBuiltinTools(const GatewayServices& services, ToolRegistry* registry) {
  std::vector<ToolDefinition> defs;

  {
    ToolDefinition d;
    d.name = "bridge_status";
    d.description = "Reports the gateway's lock, mailbox channel and desktop application state.";
    d.parameter_schema = ObjectSchema(nlohmann::json::object(), nlohmann::json::array());
    d.invoke = LocalInvoke{[services](const nlohmann::json&) {
      ToolResult r;
      r.result = BridgeStatus(services);
      return r;
    }};
    defs.push_back(std::move(d));
  }
  {
    ToolDefinition d;
    d.name = "convert_path";
    d.description = "Converts an absolute path between host (C:\\...) and guest (/mnt/c/...) syntax.";
    d.parameter_schema = ObjectSchema(
        {{"path", {{"type", "string"}, {"minLength", 1}}},
         {"direction", {{"type", "string"}, {"enum", nlohmann::json::array({"to_guest", "to_host"})}}}},
        nlohmann::json::array({"path", "direction"}));
    d.invoke = LocalInvoke{[services](const nlohmann::json& args) { return ConvertPath(services, args); }};
    defs.push_back(std::move(d));
  }
  {
    ToolDefinition d;
    d.name = "open_conversation";
    d.description = "Asks the desktop application to open a conversation.";
    d.parameter_schema =
        ObjectSchema({{"conversation_id", {{"type", "string"}, {"minLength", 1}}}},
                     nlohmann::json::array({"conversation_id"}));
    d.invoke = MailboxInvoke{"open_conversation", 0, {}, false};
    defs.push_back(std::move(d));
  }
  {
    ToolDefinition d;
    d.name = "switch_model";
    d.description = "Changes the desktop application's default model.";
    d.parameter_schema =
        ObjectSchema({{"model", {{"type", "string"}, {"minLength", 1}}}}, nlohmann::json::array({"model"}));
    d.invoke = MailboxInvoke{"switch_model", 0, {}, false};
    defs.push_back(std::move(d));
  }
  {
    ToolDefinition d;
    d.name = "execute_from_code";
    d.description = "Forwards an arbitrary action with its params to the desktop application.";
    d.parameter_schema = ObjectSchema(
        {{"action", {{"type", "string"}, {"minLength", 1}}}, {"params", {{"type", "object"}}}},
        nlohmann::json::array({"action"}));
    d.invoke = MailboxInvoke{"execute_from_code", 0, {}, true};
    defs.push_back(std::move(d));
  }
  {
    ToolDefinition d;
    d.name = "restart_desktop";
    d.description = "Stops the desktop application if it is running and starts it again.";
    d.parameter_schema = ObjectSchema(nlohmann::json::object(), nlohmann::json::array());
    // Covers the wait for the old process to exit plus the launch.
    d.invoke = MailboxInvoke{"restart_desktop", 15000, {}, false};
    defs.push_back(std::move(d));
  }

  int registered = 0;
  for (auto& d : defs) {
    std::string err;
    const auto name = d.name;
    if (registry->RegisterTool(std::move(d), &err)) {
      ++registered;
    } else {
      LogWarn("tools") << "built-in " << name << " not registered: " << err;
    }
  }
  return registered;
}

}  // namespace deskbridge
