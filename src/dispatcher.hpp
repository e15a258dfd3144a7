#pragma once

#include "errors.hpp"
#include "mailbox.hpp"
#include "services.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace deskbridge {

inline constexpr const char* kDefaultProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "deskbridge";
inline constexpr const char* kServerVersion = "0.3.0";

// Per-connection state: the client announced at initialize, the session
// issued to it, and the request ids currently being handled.
class ClientContext {
 public:
  ClientContext() = default;
  ClientContext(const ClientContext&) = delete;
  ClientContext& operator=(const ClientContext&) = delete;

  std::string client_name() const;
  void set_client_name(std::string name);

  std::optional<SessionToken> session() const;
  void set_session(SessionToken token);

  // False when `key` is already in flight on this connection.
  bool BeginRequest(const std::string& key);
  void EndRequest(const std::string& key);

 private:
  mutable std::mutex mu_;
  std::string client_name_;
  std::optional<SessionToken> session_;
  std::set<std::string> in_flight_;
};

class Dispatcher {
 public:
  explicit Dispatcher(GatewayServices services);

  // Handles one raw JSON-RPC document. Returns the canonical response line,
  // or nullopt when nothing is to be sent (notification, dropped duplicate).
  std::optional<std::string> HandleRaw(const std::string& raw, ClientContext* ctx);

  // Same for an already parsed envelope; the result is not yet canonical.
  std::optional<nlohmann::json> Handle(const nlohmann::json& envelope, ClientContext* ctx);

  // Runs a tool by name on behalf of `ctx`. `meta` is params._meta.
  std::optional<nlohmann::json> CallTool(const std::string& name, nlohmann::json arguments, const nlohmann::json& meta,
                                         ClientContext* ctx, GatewayError* err);

  // Serves requests arriving on the inbound channel: the action names a
  // local tool, the params are its arguments.
  ActionHandler InboundHandler();

  const GatewayServices& services() const { return services_; }

 private:
  nlohmann::json Initialize(const nlohmann::json& params, ClientContext* ctx);
  nlohmann::json ListTools() const;
  std::optional<nlohmann::json> ToolsCall(const nlohmann::json& params, ClientContext* ctx, GatewayError* err);

  bool Authorize(const nlohmann::json& meta, nlohmann::json* arguments, ClientContext* ctx, GatewayError* err);
  bool TranslatePathArguments(const MailboxInvoke& invoke, nlohmann::json* arguments, GatewayError* err) const;
  std::optional<nlohmann::json> InvokeMailbox(const ToolDefinition& def, const MailboxInvoke& invoke,
                                              nlohmann::json arguments, GatewayError* err);

  GatewayServices services_;
};

nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result);
nlohmann::json MakeError(const nlohmann::json& id, const GatewayError& err);

// Dump, strict re-parse, dump. When the envelope cannot be serialized an
// InternalError envelope with the same id is returned instead.
std::string SerializeEnvelope(const nlohmann::json& envelope);

}  // namespace deskbridge
