#include "dispatcher.hpp"

#include "json_schema.hpp"
#include "log.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace deskbridge {

namespace {

const char* const kSupportedProtocolVersions[] = {"2024-11-05", "2025-03-26", "2025-06-18"};

class RequestScope {
 public:
  RequestScope(ClientContext* ctx, std::string key) : ctx_(ctx), key_(std::move(key)) {}
  ~RequestScope() { ctx_->EndRequest(key_); }

 private:
  ClientContext* ctx_;
  std::string key_;
};

void StripCredentials(nlohmann::json* arguments) {
  if (!arguments->is_object()) return;
  arguments->erase("session_id");
  arguments->erase("session_token");
}

bool ReadStringPair(const nlohmann::json& obj, const char* a, const char* b, std::string* va, std::string* vb) {
  if (!obj.is_object()) return false;
  if (!obj.contains(a) || !obj[a].is_string() || !obj.contains(b) || !obj[b].is_string()) return false;
  *va = obj[a].get<std::string>();
  *vb = obj[b].get<std::string>();
  return !va->empty() && !vb->empty();
}

}  // namespace

// ---- ClientContext ----------------------------------------------------------

std::string ClientContext::client_name() const {
  std::lock_guard<std::mutex> lock(mu_);
  return client_name_;
}

void ClientContext::set_client_name(std::string name) {
  std::lock_guard<std::mutex> lock(mu_);
  client_name_ = std::move(name);
}

std::optional<SessionToken> ClientContext::session() const {
  std::lock_guard<std::mutex> lock(mu_);
  return session_;
}

void ClientContext::set_session(SessionToken token) {
  std::lock_guard<std::mutex> lock(mu_);
  session_ = std::move(token);
}

bool ClientContext::BeginRequest(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_.insert(key).second;
}

void ClientContext::EndRequest(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  in_flight_.erase(key);
}

// ---- envelopes --------------------------------------------------------------

nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json MakeError(const nlohmann::json& id, const GatewayError& err) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", ErrorToJson(err)}};
}

std::string SerializeEnvelope(const nlohmann::json& envelope) {
  std::string err;
  auto canonical = CanonicalRoundTrip(envelope, &err);
  if (canonical) return canonical->dump();

  LogError("mcp") << "outbound envelope not serializable: " << err;
  nlohmann::json id = nullptr;
  if (envelope.is_object() && envelope.contains("id")) {
    const auto& raw_id = envelope["id"];
    if (raw_id.is_number() || raw_id.is_null()) {
      id = raw_id;
    } else if (raw_id.is_string()) {
      // The id itself may hold the bad bytes; only reuse it if it survives.
      std::string id_err;
      if (auto checked = CanonicalRoundTrip(raw_id, &id_err)) id = *checked;
    }
  }
  GatewayError internal;
  Fail(&internal, ErrorCode::kInternalError, "response could not be serialized", {{"reason", err}});
  return MakeError(id, internal).dump();
}

// ---- Dispatcher -------------------------------------------------------------

Dispatcher::Dispatcher(GatewayServices services) : services_(services) {}

std::optional<std::string> Dispatcher::HandleRaw(const std::string& raw, ClientContext* ctx) {
  auto envelope = nlohmann::json::parse(raw, nullptr, false);
  if (envelope.is_discarded()) {
    GatewayError err;
    Fail(&err, ErrorCode::kParseError, "Parse error");
    LogWarn("mcp") << "unparseable input: " << TruncateForLog(raw, 200);
    return SerializeEnvelope(MakeError(nullptr, err));
  }

  if (envelope.is_object() && envelope.contains("id") && envelope.contains("method")) {
    const std::string key = envelope["id"].dump();
    if (!ctx->BeginRequest(key)) {
      LogWarn("mcp") << "dropping duplicate request id " << key << " still in flight";
      return std::nullopt;
    }
    RequestScope scope(ctx, key);
    auto response = Handle(envelope, ctx);
    if (!response) return std::nullopt;
    return SerializeEnvelope(*response);
  }

  auto response = Handle(envelope, ctx);
  if (!response) return std::nullopt;
  return SerializeEnvelope(*response);
}

std::optional<nlohmann::json> Dispatcher::Handle(const nlohmann::json& envelope, ClientContext* ctx) {
  GatewayError err;
  if (!envelope.is_object()) {
    Fail(&err, ErrorCode::kInvalidRequest, "Invalid Request: envelope must be an object");
    return MakeError(nullptr, err);
  }

  const bool is_notification = !envelope.contains("id");
  nlohmann::json id = is_notification ? nlohmann::json(nullptr) : envelope["id"];
  if (!(id.is_string() || id.is_number() || id.is_null())) {
    Fail(&err, ErrorCode::kInvalidRequest, "Invalid Request: id must be a string, number or null");
    return MakeError(nullptr, err);
  }

  if (!envelope.contains("method") || !envelope["method"].is_string()) {
    // A response to our heartbeat ping carries no method.
    if (envelope.contains("result") || envelope.contains("error")) return std::nullopt;
    Fail(&err, ErrorCode::kInvalidRequest, "Invalid Request: missing method");
    return MakeError(id, err);
  }

  const std::string method = envelope["method"].get<std::string>();
  const nlohmann::json params = envelope.contains("params") ? envelope["params"] : nlohmann::json::object();

  if (is_notification) {
    LogDebug("mcp") << "notification " << method;
    return std::nullopt;
  }

  try {
    if (method == "initialize") return MakeResult(id, Initialize(params, ctx));
    if (method == "ping") return MakeResult(id, nlohmann::json::object());
    if (method == "tools/list") return MakeResult(id, ListTools());
    if (method == "resources/list") return MakeResult(id, {{"resources", nlohmann::json::array()}});
    if (method == "prompts/list") return MakeResult(id, {{"prompts", nlohmann::json::array()}});
    if (method == "tools/call") {
      auto result = ToolsCall(params, ctx, &err);
      if (!result) return MakeError(id, err);
      return MakeResult(id, std::move(*result));
    }
  } catch (const std::exception& e) {
    LogError("mcp") << method << " failed: " << e.what();
    Fail(&err, ErrorCode::kInternalError, std::string("Internal error: ") + e.what());
    return MakeError(id, err);
  }

  Fail(&err, ErrorCode::kMethodNotFound, "Method not found: " + method, {{"method", method}});
  return MakeError(id, err);
}

nlohmann::json Dispatcher::Initialize(const nlohmann::json& params, ClientContext* ctx) {
  std::string version = kDefaultProtocolVersion;
  if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
    const auto requested = params["protocolVersion"].get<std::string>();
    for (const char* v : kSupportedProtocolVersions) {
      if (requested == v) version = requested;
    }
  }

  std::string client = "unknown";
  if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
    client = params["clientInfo"].value("name", client);
  }
  ctx->set_client_name(client);

  nlohmann::json result = {
      {"protocolVersion", version},
      {"capabilities", {{"tools", {{"listChanged", false}}}}},
      {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
  };

  if (services_.config && services_.config->issue_session_on_initialize && services_.sessions) {
    GatewayError err;
    if (auto token = services_.sessions->Issue(client, &err)) {
      ctx->set_session(*token);
      result["_meta"]["session"] = {
          {"sessionId", token->id}, {"sessionToken", token->secret}, {"expiresAt", token->expires_at_ms}};
    } else {
      LogWarn("mcp") << "could not issue a session for " << client << ": " << err.message;
    }
  }
  LogInfo("mcp") << "initialize client=" << client << " protocol=" << version;
  return result;
}

nlohmann::json Dispatcher::ListTools() const {
  nlohmann::json tools = nlohmann::json::array();
  if (services_.registry) {
    for (const auto& def : services_.registry->ListTools()) tools.push_back(ToolDescriptor(def));
  }
  return {{"tools", tools}};
}

std::optional<nlohmann::json> Dispatcher::ToolsCall(const nlohmann::json& params, ClientContext* ctx,
                                                    GatewayError* err) {
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    Fail(err, ErrorCode::kValidationError, "tools/call requires a string name");
    return std::nullopt;
  }
  nlohmann::json arguments = nlohmann::json::object();
  if (params.contains("arguments") && !params["arguments"].is_null()) {
    if (!params["arguments"].is_object()) {
      Fail(err, ErrorCode::kValidationError, "tools/call arguments must be an object");
      return std::nullopt;
    }
    arguments = params["arguments"];
  }
  const nlohmann::json meta = params.contains("_meta") ? params["_meta"] : nlohmann::json(nullptr);

  auto result = CallTool(params["name"].get<std::string>(), std::move(arguments), meta, ctx, err);
  if (!result) return std::nullopt;
  return nlohmann::json{
      {"content", nlohmann::json::array({{{"type", "text"}, {"text", result->dump(2)}}})},
      {"isError", false},
  };
}

std::optional<nlohmann::json> Dispatcher::CallTool(const std::string& name, nlohmann::json arguments,
                                                   const nlohmann::json& meta, ClientContext* ctx,
                                                   GatewayError* err) {
  auto def = services_.registry ? services_.registry->GetTool(name) : std::nullopt;
  if (!def) {
    Fail(err, ErrorCode::kToolNotFound, "Tool not found: " + name, {{"name", name}});
    return std::nullopt;
  }

  if (RoutesThroughMailbox(*def)) {
    if (!Authorize(meta, &arguments, ctx, err)) return std::nullopt;
  } else {
    StripCredentials(&arguments);
  }

  std::vector<std::string> violations;
  if (!ValidateAgainstSchema(def->parameter_schema, arguments, &violations)) {
    Fail(err, ErrorCode::kValidationError, "Invalid arguments for " + name,
         {{"tool", name}, {"errors", violations}});
    return std::nullopt;
  }

  if (const auto* mailbox = std::get_if<MailboxInvoke>(&def->invoke)) {
    return InvokeMailbox(*def, *mailbox, std::move(arguments), err);
  }

  const auto& local = std::get<LocalInvoke>(def->invoke);
  ToolResult r;
  try {
    r = local.handler(arguments);
  } catch (const std::exception& e) {
    LogError("tools") << name << " threw: " << e.what();
    Fail(err, ErrorCode::kExecutionError, e.what(), {{"tool", name}});
    return std::nullopt;
  }
  if (!r.ok) {
    Fail(err, r.code, r.error.empty() ? "tool failed" : r.error, {{"tool", name}});
    return std::nullopt;
  }
  return r.result;
}

bool Dispatcher::Authorize(const nlohmann::json& meta, nlohmann::json* arguments, ClientContext* ctx,
                           GatewayError* err) {
  std::string session_id;
  std::string secret;
  bool found = ReadStringPair(meta, "sessionId", "sessionToken", &session_id, &secret);
  if (!found) found = ReadStringPair(*arguments, "session_id", "session_token", &session_id, &secret);
  StripCredentials(arguments);
  if (!found) {
    if (auto token = ctx->session()) {
      session_id = token->id;
      secret = token->secret;
      found = true;
    }
  }
  if (!found) return Fail(err, ErrorCode::kSessionInvalid, "missing session credentials");
  if (!services_.sessions) return Fail(err, ErrorCode::kSessionInvalid, "no session authority configured");
  return services_.sessions->Verify(session_id, secret, err).has_value();
}

bool Dispatcher::TranslatePathArguments(const MailboxInvoke& invoke, nlohmann::json* arguments,
                                        GatewayError* err) const {
  const PathSyntax peer = services_.peer_syntax;
  auto translate = [&](const std::string& arg, nlohmann::json* value) {
    const auto path = value->get<std::string>();
    const PathSyntax from = DetectSyntax(path);
    if (from == peer) return true;
    if (from == PathSyntax::kUnknown) {
      return Fail(err, ErrorCode::kPathTranslationError, "not an absolute path: " + path,
                  {{"argument", arg}, {"path", path}});
    }
    if (!services_.translator) {
      return Fail(err, ErrorCode::kPathTranslationError, "path translation unavailable",
                  {{"argument", arg}, {"path", path}});
    }
    auto converted = services_.translator->Convert(path, from, peer, err);
    if (!converted) {
      if (err) err->data["argument"] = arg;
      return false;
    }
    *value = *converted;
    return true;
  };

  for (const auto& arg : invoke.path_arguments) {
    if (!arguments->contains(arg)) continue;
    auto& value = (*arguments)[arg];
    if (value.is_string()) {
      if (!translate(arg, &value)) return false;
    } else if (value.is_array()) {
      for (auto& element : value) {
        if (element.is_string() && !translate(arg, &element)) return false;
      }
    }
  }
  return true;
}

std::optional<nlohmann::json> Dispatcher::InvokeMailbox(const ToolDefinition& def, const MailboxInvoke& invoke,
                                                        nlohmann::json arguments, GatewayError* err) {
  if (!services_.bridge) {
    Fail(err, ErrorCode::kExecutionError, "mailbox bridge unavailable", {{"tool", def.name}});
    return std::nullopt;
  }
  const auto* cfg = services_.config;
  if (cfg && cfg->require_desktop_running && services_.probe && !cfg->desktop_process_name.empty() &&
      services_.probe->ProbeName(cfg->desktop_process_name) == ProbeResult::kNotRunning) {
    Fail(err, ErrorCode::kExecutionError, "desktop application is not running",
         {{"tool", def.name}, {"process", cfg->desktop_process_name}});
    return std::nullopt;
  }
  if (!TranslatePathArguments(invoke, &arguments, err)) return std::nullopt;

  std::string action = invoke.action;
  nlohmann::json params = arguments;
  if (invoke.forwards_action) {
    action = arguments.value("action", std::string());
    params = arguments.contains("params") ? arguments["params"] : nlohmann::json::object();
  }
  const int timeout_ms = invoke.timeout_ms > 0 ? invoke.timeout_ms : (cfg ? cfg->request_timeout_ms : 0);

  auto item = services_.bridge->Call(action, params, timeout_ms, err);
  if (!item) {
    if (err) err->data["tool"] = def.name;
    return std::nullopt;
  }
  return item->result;
}

ActionHandler Dispatcher::InboundHandler() {
  return [this](const std::string& action, const nlohmann::json& params) -> nlohmann::json {
    auto def = services_.registry ? services_.registry->GetTool(action) : std::nullopt;
    if (!def) throw std::runtime_error("Unknown action type: " + action);
    if (RoutesThroughMailbox(*def)) {
      throw std::runtime_error("tool " + action + " is not available on the inbound channel");
    }
    ClientContext ctx;
    ctx.set_client_name("inbound");
    GatewayError err;
    auto result = CallTool(action, params.is_object() ? params : nlohmann::json::object(), nullptr, &ctx, &err);
    if (!result) throw std::runtime_error(std::string(ErrorKindName(err.code)) + ": " + err.message);
    return *result;
  };
}

}  // namespace deskbridge
