#include "process_probe.hpp"

#include "log.hpp"
#include "path_translator.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace deskbridge {
namespace {

static std::string ToLowerAscii(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static bool IsAllDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static std::string ReadSmallFile(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return {};
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return s;
}

// Only plain image names are passed to a shell.
static bool IsPlainImageName(const std::string& name) {
  if (name.empty()) return false;
  for (char c : name) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-' || c == ' ')) return false;
  }
  return true;
}

static bool EndsWithExe(const std::string& name) {
  const std::string lower = ToLowerAscii(name);
  return lower.size() > 4 && lower.compare(lower.size() - 4, 4, ".exe") == 0;
}

// Runs `cmd` and returns its exit status, with the output in *out.
static int RunCommand(const std::string& cmd, std::string* out) {
  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe) return -1;
  char buf[512];
  while (std::fgets(buf, sizeof(buf), pipe)) {
    if (out) *out += buf;
  }
  return ::pclose(pipe);
}

}  // namespace

const char* ProbeResultName(ProbeResult r) {
  switch (r) {
    case ProbeResult::kRunning:
      return "running";
    case ProbeResult::kNotRunning:
      return "not_running";
    case ProbeResult::kUnknown:
      return "unknown";
  }
  return "unknown";
}

SystemProcessProbe::SystemProcessProbe() : in_guest_(RunningInGuest()) {}

ProbeResult SystemProcessProbe::ProbePid(long pid) const {
  if (pid <= 0) return ProbeResult::kNotRunning;
  if (::kill(static_cast<pid_t>(pid), 0) == 0) return ProbeResult::kRunning;
  if (errno == ESRCH) return ProbeResult::kNotRunning;
  // EPERM: the process exists but belongs to someone else.
  if (errno == EPERM) return ProbeResult::kRunning;
  return ProbeResult::kUnknown;
}

ProbeResult SystemProcessProbe::ProbeName(const std::string& name) const {
  if (name.empty()) return ProbeResult::kUnknown;
  auto local = ProbeProcTable(name);
  if (local == ProbeResult::kRunning || !in_guest_) return local;
  auto host = ProbeHostTaskList(name);
  if (host == ProbeResult::kUnknown) return local;
  return host;
}

ProbeResult SystemProcessProbe::ProbeProcTable(const std::string& name) const {
  std::error_code ec;
  std::filesystem::directory_iterator it("/proc", ec);
  if (ec) return ProbeResult::kUnknown;
  const std::string needle = ToLowerAscii(name);
  for (const auto& entry : it) {
    const auto pid_dir = entry.path();
    if (!IsAllDigits(pid_dir.filename().string())) continue;
    std::string comm = ReadSmallFile(pid_dir / "comm");
    while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\r')) comm.pop_back();
    if (ToLowerAscii(comm) == needle) return ProbeResult::kRunning;
    // cmdline is NUL separated; argv[0] may carry the full path.
    std::string cmdline = ReadSmallFile(pid_dir / "cmdline");
    for (auto& c : cmdline) {
      if (c == '\0') c = ' ';
    }
    if (!cmdline.empty() && ToLowerAscii(cmdline).find(needle) != std::string::npos) return ProbeResult::kRunning;
  }
  return ProbeResult::kNotRunning;
}

ProbeResult SystemProcessProbe::ProbeHostTaskList(const std::string& name) const {
  if (!IsPlainImageName(name)) return ProbeResult::kUnknown;
  const std::string cmd = "tasklist.exe /FO CSV /NH /FI \"IMAGENAME eq " + name + "\" 2>/dev/null";
  std::string out;
  const int rc = RunCommand(cmd, &out);
  if (rc != 0) {
    LogDebug("probe") << "tasklist.exe exited rc=" << rc;
    return ProbeResult::kUnknown;
  }
  if (ToLowerAscii(out).find("\"" + ToLowerAscii(name) + "\"") != std::string::npos) return ProbeResult::kRunning;
  return ProbeResult::kNotRunning;
}

SystemProcessControl::SystemProcessControl() : in_guest_(RunningInGuest()) {}

bool SystemProcessControl::Terminate(const std::string& name, std::string* err) {
  if (!IsPlainImageName(name)) {
    if (err) *err = "refusing process name: " + name;
    return false;
  }
  const bool host = in_guest_ || EndsWithExe(name);
  const std::string cmd =
      host ? "taskkill.exe /F /IM \"" + name + "\" 2>&1" : "pkill -x \"" + name + "\" 2>&1";
  std::string out;
  const int rc = RunCommand(cmd, &out);
  if (rc != 0) {
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    if (err) *err = std::string(host ? "taskkill.exe" : "pkill") + " exited rc=" + std::to_string(rc) + ": " + out;
    return false;
  }
  LogInfo("probe") << "terminated " << name;
  return true;
}

bool SystemProcessControl::Launch(const std::string& executable, std::string* err) {
  std::string path = executable;
  if (DetectSyntax(path) == PathSyntax::kHost) {
    GatewayError perr;
    auto guest = PathTranslator().ToGuest(path, &perr);
    if (!guest) {
      if (err) *err = perr.message;
      return false;
    }
    path = *guest;
  }
  if (::access(path.c_str(), X_OK) != 0) {
    if (err) *err = "not executable: " + path + ": " + std::strerror(errno);
    return false;
  }

  // Double fork so the application is reparented and never becomes our zombie.
  const pid_t child = ::fork();
  if (child < 0) {
    if (err) *err = std::string("fork: ") + std::strerror(errno);
    return false;
  }
  if (child == 0) {
    ::setsid();
    const pid_t grandchild = ::fork();
    if (grandchild != 0) ::_exit(grandchild < 0 ? 1 : 0);
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, 0);
      ::dup2(devnull, 1);
      ::dup2(devnull, 2);
    }
    ::execl(path.c_str(), path.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(child, &status, 0);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    if (err) *err = "failed to start " + path;
    return false;
  }
  LogInfo("probe") << "launched " << path;
  return true;
}

}  // namespace deskbridge
