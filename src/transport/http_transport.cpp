#include "transport/http_transport.hpp"

#include "builtin_tools.hpp"
#include "log.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace deskbridge {

HttpTransport::HttpTransport(Dispatcher* dispatcher, std::string host, int port)
    : dispatcher_(dispatcher), host_(std::move(host)), port_(port) {
  InstallRoutes();
}

void HttpTransport::InstallRoutes() {
  server_.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
    ClientContext ctx;
    const auto sid = req.get_header_value("X-Deskbridge-Session-Id");
    const auto secret = req.get_header_value("X-Deskbridge-Session-Token");
    if (!sid.empty() && !secret.empty()) {
      SessionToken token;
      token.id = sid;
      token.secret = secret;
      ctx.set_session(token);
    }
    auto response = dispatcher_->HandleRaw(req.body, &ctx);
    if (!response) {
      res.status = 202;
      return;
    }
    res.status = 200;
    res.set_content(*response, "application/json");
  });

  server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    j["bridge"] = BridgeStatus(dispatcher_->services());
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      message = e.what();
    } catch (...) {
      message = "non-standard exception";
    }
    LogError("http") << "handler failed: " << message;
    GatewayError err;
    Fail(&err, ErrorCode::kInternalError, message);
    res.status = 500;
    res.set_content(SerializeEnvelope(MakeError(nullptr, err)), "application/json");
  });

  server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    nlohmann::json j;
    j["error"] = {{"message", res.status == 404 ? "not found" : "bad request"}, {"status", res.status}};
    res.set_content(j.dump(), "application/json");
  });

  server_.set_keep_alive_timeout(5);
  server_.set_read_timeout(60);
  // A mailbox call may wait for the whole request timeout.
  server_.set_write_timeout(120);
}

bool HttpTransport::Bind(std::string* err) {
  if (bound_port_ > 0) return true;
  if (port_ == 0) {
    bound_port_ = server_.bind_to_any_port(host_);
  } else {
    bound_port_ = server_.bind_to_port(host_, port_) ? port_ : -1;
  }
  if (bound_port_ <= 0) {
    if (err) *err = "cannot bind " + host_ + ":" + std::to_string(port_);
    return false;
  }
  return true;
}

int HttpTransport::Run() {
  std::string err;
  if (!Bind(&err)) {
    LogError("http") << err;
    return 1;
  }
  LogInfo("http") << "listen host=" << host_ << " port=" << bound_port_;
  const bool ok = server_.listen_after_bind();
  LogInfo("http") << "listen returned ok=" << (ok ? 1 : 0);
  return ok ? 0 : 1;
}

void HttpTransport::Shutdown() { server_.stop(); }

}  // namespace deskbridge
