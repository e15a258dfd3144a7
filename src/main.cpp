#include "builtin_tools.hpp"
#include "config.hpp"
#include "desktop_actions.hpp"
#include "dispatcher.hpp"
#include "instance_lock.hpp"
#include "log.hpp"
#include "mailbox.hpp"
#include "path_translator.hpp"
#include "plugin_loader.hpp"
#include "process_probe.hpp"
#include "session_authority.hpp"
#include "tooling.hpp"
#include "transport/http_transport.hpp"
#include "transport/socket_transport.hpp"
#include "transport/stdio_transport.hpp"

#include <nlohmann/json.hpp>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace deskbridge;

constexpr int64_t kSessionSweepIntervalMs = 60LL * 60 * 1000;

struct CommandLine {
  std::vector<std::string> positional;
  std::map<std::string, std::string> flags;

  std::string Flag(const std::string& name) const {
    auto it = flags.find(name);
    return it == flags.end() ? std::string() : it->second;
  }
};

CommandLine ParseCommandLine(int argc, char** argv) {
  CommandLine cl;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      std::string key = arg.substr(2);
      std::string value;
      auto eq = key.find('=');
      if (eq != std::string::npos) {
        value = key.substr(eq + 1);
        key = key.substr(0, eq);
      } else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        value = argv[++i];
      }
      cl.flags[key] = value;
    } else {
      cl.positional.push_back(arg);
    }
  }
  return cl;
}

void PrintUsage() {
  std::cerr << "usage:\n"
               "  deskbridge serve   [--config F] [--transport stdio|socket|http] [--host H] [--port N]\n"
               "  deskbridge respond [--config F] [--channel C] [--desktop-config F]\n"
               "  deskbridge session issue <client> | revoke <id> | verify <id> <secret> | sweep\n"
               "  deskbridge path to-guest <p> | to-host <p>\n"
               "  deskbridge lock status <resource>\n";
}

// Config precedence: defaults < file < env < flags.
bool LoadEffectiveConfig(const CommandLine& cl, GatewayConfig* cfg) {
  std::string err;
  *cfg = LoadConfig(cl.Flag("config"), &err);
  if (!err.empty()) {
    std::cerr << "[config] " << err << "\n";
    return false;
  }
  if (auto t = cl.Flag("transport"); !t.empty()) cfg->transport = ToLower(t);
  if (auto h = cl.Flag("host"); !h.empty()) cfg->listen.host = h;
  if (auto p = cl.Flag("port"); !p.empty()) {
    try {
      cfg->listen.port = std::stoi(p);
    } catch (const std::exception&) {
      std::cerr << "[config] invalid --port " << p << "\n";
      return false;
    }
  }
  if (auto c = cl.Flag("channel"); !c.empty()) cfg->outbound_channel = c;
  if (auto d = cl.Flag("desktop-config"); !d.empty()) cfg->desktop_config_path = d;
  if (auto l = cl.Flag("log-level"); !l.empty()) cfg->log_level = ToLower(l);
  if (auto m = cl.Flag("mailbox-root"); !m.empty()) cfg->mailbox_root = m;

  LogLevel level = LogLevel::kInfo;
  if (!ParseLogLevel(cfg->log_level, &level)) {
    std::cerr << "[config] unknown log level " << cfg->log_level << ", using info\n";
  }
  InitLogging(cfg->log_file, level);
  return true;
}

// SIGINT / SIGTERM are blocked in every thread and collected here, so the
// shutdown path runs as ordinary code. Construct before starting any thread.
// SIGUSR1 only releases the waiting thread on Stop().
class SignalWaiter {
 public:
  SignalWaiter() {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    sigaddset(&set_, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &set_, nullptr);
    ::signal(SIGPIPE, SIG_IGN);
  }

  // Calls on_signal from a dedicated thread when a signal arrives.
  void Start(std::function<void(int)> on_signal) {
    thread_ = std::thread([this, on_signal] {
      int sig = 0;
      if (sigwait(&set_, &sig) != 0) return;
      if (sig == SIGUSR1) return;  // released by Stop()
      LogInfo("main") << "received signal " << sig << ", shutting down";
      fired_.store(true);
      on_signal(sig);
    });
  }

  void Stop() {
    if (!thread_.joinable()) return;
    if (!fired_.load()) pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
  }

  ~SignalWaiter() { Stop(); }

 private:
  sigset_t set_;
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

// Sweeps expired sessions at startup and then hourly.
class SessionSweeper {
 public:
  explicit SessionSweeper(SessionAuthority* sessions) : sessions_(sessions) {
    Sweep();
    thread_ = std::thread([this] {
      std::unique_lock<std::mutex> lock(mu_);
      while (!cv_.wait_for(lock, std::chrono::milliseconds(kSessionSweepIntervalMs), [this] { return stop_; })) {
        lock.unlock();
        Sweep();
        lock.lock();
      }
    });
  }

  ~SessionSweeper() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

 private:
  void Sweep() {
    const int removed = sessions_->SweepExpired();
    if (removed > 0) LogInfo("session") << "swept " << removed << " expired session(s)";
  }

  SessionAuthority* sessions_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::thread thread_;
};

PathSyntax ResolveSyntax(const std::string& name, PathSyntax fallback) {
  PathSyntax s = fallback;
  if (!ParsePathSyntax(name, &s)) {
    LogWarn("config") << "unknown path syntax " << name << ", using " << PathSyntaxName(fallback);
    return fallback;
  }
  return s;
}

int RunServe(const CommandLine& cl) {
  SignalWaiter signals;

  GatewayConfig cfg;
  if (!LoadEffectiveConfig(cl, &cfg)) return 2;

  SystemProcessProbe probe;
  InstanceLock lock(cfg.lock_dir, &probe);
  GatewayError lock_err;
  if (!lock.Acquire("gateway-" + cfg.outbound_channel, &lock_err)) {
    LogError("main") << ErrorKindName(lock_err.code) << ": " << lock_err.message << " " << lock_err.data.dump();
    return 3;
  }

  SessionAuthority sessions(MakeFileSessionStore(cfg.session_store_path), {}, cfg.session_ttl_ms);
  SessionSweeper sweeper(&sessions);

  PathTranslator translator(cfg.guest_distro);

  MailboxOptions mopts;
  mopts.layout = MailboxLayout{cfg.mailbox_root, cfg.outbound_channel};
  mopts.source = "gateway";
  mopts.poll_interval_ms = cfg.poll_interval_ms;
  mopts.default_timeout_ms = cfg.request_timeout_ms;
  mopts.watcher_interval_ms = cfg.watcher_interval_ms;
  mopts.archive_consumed = cfg.archive_consumed;
  MailboxBridge bridge(mopts);
  bridge.Reconcile();
  bridge.StartReaper();

  ToolRegistry registry;
  GatewayServices services;
  services.config = &cfg;
  services.registry = &registry;
  services.sessions = &sessions;
  services.bridge = &bridge;
  services.translator = &translator;
  services.probe = &probe;
  services.lock = &lock;
  services.local_syntax = ResolveSyntax(cfg.local_path_syntax, PathSyntax::kGuest);
  services.peer_syntax = ResolveSyntax(cfg.peer_path_syntax, PathSyntax::kHost);

  const int builtins = RegisterBuiltinTools(services, &registry);
  std::vector<std::string> plugin_dirs{cfg.plugins_dir};
  plugin_dirs.insert(plugin_dirs.end(), cfg.extra_plugin_dirs.begin(), cfg.extra_plugin_dirs.end());
  for (const auto& dir : plugin_dirs) {
    auto report = LoadPluginDirectory(dir, &registry);
    if (!report.manifests.empty()) {
      LogInfo("plugins") << dir << ": manifests=" << report.manifests.size() << " loaded=" << report.LoadedCount()
          << " rejected=" << report.RejectedCount() << " collided=" << report.CollidedCount();
    }
  }
  LogInfo("tools") << "builtin=" << builtins << " total=" << registry.size();

  Dispatcher dispatcher(services);

  std::unique_ptr<MailboxResponder> inbound;
  if (!cfg.inbound_channel.empty()) {
    ResponderOptions ropts;
    ropts.layout = MailboxLayout{cfg.mailbox_root, cfg.inbound_channel};
    ropts.source = "gateway";
    ropts.watcher_interval_ms = cfg.watcher_interval_ms;
    inbound = std::make_unique<MailboxResponder>(ropts, dispatcher.InboundHandler());
    inbound->Reconcile();
    inbound->Start();
  }

  std::unique_ptr<Transport> transport;
  if (cfg.transport == "stdio") {
    transport = std::make_unique<StdioTransport>(&dispatcher, STDIN_FILENO, std::cout);
  } else if (cfg.transport == "socket") {
    auto socket = std::make_unique<SocketTransport>(&dispatcher, cfg.listen.host, cfg.listen.port,
                                                    cfg.heartbeat_interval_ms);
    std::string err;
    if (!socket->Listen(&err)) {
      LogError("main") << err;
      return 1;
    }
    transport = std::move(socket);
  } else if (cfg.transport == "http") {
    transport = std::make_unique<HttpTransport>(&dispatcher, cfg.listen.host, cfg.listen.port);
  } else {
    LogError("main") << "unknown transport " << cfg.transport;
    return 2;
  }

  LogInfo("main") << "serving transport=" << transport->name() << " channel=" << cfg.outbound_channel << " mailbox="
      << cfg.mailbox_root;
  Transport* running = transport.get();
  signals.Start([running](int) { running->Shutdown(); });
  const int rc = transport->Run();
  signals.Stop();

  if (inbound) inbound->Stop();
  bridge.StopReaper();
  lock.Release();
  LogInfo("main") << "exit code " << rc;
  ShutdownLogging();
  return rc;
}

int RunRespond(const CommandLine& cl) {
  SignalWaiter signals;

  GatewayConfig cfg;
  if (!LoadEffectiveConfig(cl, &cfg)) return 2;

  SystemProcessProbe probe;
  InstanceLock lock(cfg.lock_dir, &probe);
  GatewayError lock_err;
  if (!lock.Acquire("responder-" + cfg.outbound_channel, &lock_err)) {
    LogError("main") << ErrorKindName(lock_err.code) << ": " << lock_err.message << " " << lock_err.data.dump();
    return 3;
  }

  SystemProcessControl control;
  DesktopActions actions(cfg.desktop_config_path, cfg.desktop_process_name, &probe, &control,
                         cfg.desktop_executable);
  ResponderOptions ropts;
  ropts.layout = MailboxLayout{cfg.mailbox_root, cfg.outbound_channel};
  ropts.source = "desktop";
  ropts.watcher_interval_ms = cfg.watcher_interval_ms;
  MailboxResponder responder(ropts, actions.AsHandler());
  responder.Reconcile();
  responder.Start();
  LogInfo("main") << "responding on channel=" << cfg.outbound_channel << " desktop_config=" << cfg.desktop_config_path;

  std::mutex mu;
  std::condition_variable cv;
  bool stop = false;
  signals.Start([&](int) {
    std::lock_guard<std::mutex> guard(mu);
    stop = true;
    cv.notify_all();
  });
  {
    std::unique_lock<std::mutex> guard(mu);
    cv.wait(guard, [&] { return stop; });
  }
  signals.Stop();

  responder.Stop();
  lock.Release();
  LogInfo("main") << "responder processed " << responder.processed_count() << " request(s)";
  ShutdownLogging();
  return 0;
}

int RunSession(const CommandLine& cl) {
  GatewayConfig cfg;
  if (!LoadEffectiveConfig(cl, &cfg)) return 2;
  if (cl.positional.size() < 2) {
    PrintUsage();
    return 2;
  }
  SessionAuthority sessions(MakeFileSessionStore(cfg.session_store_path), {}, cfg.session_ttl_ms);
  const std::string& verb = cl.positional[1];
  GatewayError err;

  auto token_json = [](const SessionToken& t) {
    return nlohmann::json{{"sessionId", t.id},
                          {"sessionToken", t.secret},
                          {"boundClientId", t.bound_client_id},
                          {"createdAt", t.issued_at_ms},
                          {"expiresAt", t.expires_at_ms}};
  };

  if (verb == "issue" && cl.positional.size() >= 3) {
    auto token = sessions.Issue(cl.positional[2], &err);
    if (!token) {
      std::cerr << "[session] " << err.message << "\n";
      return 1;
    }
    std::cout << token_json(*token).dump(2) << "\n";
    return 0;
  }
  if (verb == "revoke" && cl.positional.size() >= 3) {
    const bool removed = sessions.Revoke(cl.positional[2]);
    std::cout << nlohmann::json{{"revoked", removed}}.dump() << "\n";
    return removed ? 0 : 1;
  }
  if (verb == "verify" && cl.positional.size() >= 4) {
    auto token = sessions.Verify(cl.positional[2], cl.positional[3], &err);
    if (!token) {
      std::cout << nlohmann::json{{"valid", false}, {"error", ErrorToJson(err)}}.dump() << "\n";
      return 1;
    }
    auto j = token_json(*token);
    j.erase("sessionToken");
    j["valid"] = true;
    std::cout << j.dump(2) << "\n";
    return 0;
  }
  if (verb == "sweep") {
    std::cout << nlohmann::json{{"removed", sessions.SweepExpired()}}.dump() << "\n";
    return 0;
  }
  PrintUsage();
  return 2;
}

int RunPath(const CommandLine& cl) {
  GatewayConfig cfg;
  if (!LoadEffectiveConfig(cl, &cfg)) return 2;
  if (cl.positional.size() < 3) {
    PrintUsage();
    return 2;
  }
  PathTranslator translator(cfg.guest_distro);
  GatewayError err;
  std::optional<std::string> out;
  if (cl.positional[1] == "to-guest") {
    out = translator.ToGuest(cl.positional[2], &err);
  } else if (cl.positional[1] == "to-host") {
    out = translator.ToHost(cl.positional[2], &err);
  } else {
    PrintUsage();
    return 2;
  }
  if (!out) {
    std::cerr << "[path] " << ErrorKindName(err.code) << ": " << err.message << "\n";
    return 1;
  }
  std::cout << *out << "\n";
  return 0;
}

int RunLock(const CommandLine& cl) {
  GatewayConfig cfg;
  if (!LoadEffectiveConfig(cl, &cfg)) return 2;
  if (cl.positional.size() < 3 || cl.positional[1] != "status") {
    PrintUsage();
    return 2;
  }
  SystemProcessProbe probe;
  InstanceLock lock(cfg.lock_dir, &probe);
  const std::string& resource = cl.positional[2];
  nlohmann::json j = {{"resource", resource}, {"path", lock.PathFor(resource).string()}};
  if (auto owner = lock.CurrentOwner(resource)) {
    j["held"] = true;
    j["owner_pid"] = owner->pid;
    j["since"] = owner->timestamp;
    j["probe"] = ProbeResultName(probe.ProbePid(owner->pid));
  } else {
    j["held"] = false;
  }
  std::cout << j.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  auto cl = ParseCommandLine(argc, argv);
  if (cl.positional.empty()) {
    PrintUsage();
    return 2;
  }
  const std::string& command = cl.positional[0];
  if (command == "serve") return RunServe(cl);
  if (command == "respond") return RunRespond(cl);
  if (command == "session") return RunSession(cl);
  if (command == "path") return RunPath(cl);
  if (command == "lock") return RunLock(cl);
  PrintUsage();
  return 2;
}
