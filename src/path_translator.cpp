#include "path_translator.hpp"

#include <cctype>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace deskbridge {
namespace {

constexpr const char* kWslUncPrefixes[] = {"\\\\wsl$\\", "\\\\wsl.localhost\\"};

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string ToLowerAscii(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static bool IsDriveLetter(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

static bool IsDriveAbsolute(const std::string& p) {
  return p.size() >= 3 && IsDriveLetter(p[0]) && p[1] == ':' && (p[2] == '\\' || p[2] == '/');
}

// Length of the `\\wsl$\` style prefix, or 0.
static size_t WslUncPrefixLength(const std::string& p) {
  for (const char* prefix : kWslUncPrefixes) {
    if (StartsWith(p, prefix)) return std::string(prefix).size();
  }
  return 0;
}

static std::vector<std::string> SplitSegments(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == sep) {
      out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  out.push_back(cur);
  return out;
}

static std::string JoinSegments(const std::vector<std::string>& segs, char sep) {
  std::string out;
  for (size_t i = 0; i < segs.size(); i++) {
    if (i) out.push_back(sep);
    out += segs[i];
  }
  return out;
}

static bool Untranslatable(GatewayError* err, const std::string& path, const std::string& why) {
  return Fail(err, ErrorCode::kPathTranslationError, why + ": " + path, {{"path", path}});
}

}  // namespace

const char* PathSyntaxName(PathSyntax syntax) {
  switch (syntax) {
    case PathSyntax::kHost:
      return "host";
    case PathSyntax::kGuest:
      return "guest";
    case PathSyntax::kUnknown:
      return "unknown";
  }
  return "unknown";
}

bool ParsePathSyntax(const std::string& s, PathSyntax* out) {
  if (!out) return false;
  if (s == "host" || s == "windows") {
    *out = PathSyntax::kHost;
    return true;
  }
  if (s == "guest" || s == "wsl" || s == "posix") {
    *out = PathSyntax::kGuest;
    return true;
  }
  if (s == "auto") {
    *out = RunningInGuest() ? PathSyntax::kGuest : PathSyntax::kHost;
    return true;
  }
  return false;
}

PathSyntax DetectSyntax(const std::string& path) {
  if (path.empty()) return PathSyntax::kUnknown;
  if (IsDriveAbsolute(path)) return PathSyntax::kHost;
  if (const size_t n = WslUncPrefixLength(path); n > 0) {
    // Needs a distro name after the prefix.
    return path.size() > n && path[n] != '\\' ? PathSyntax::kHost : PathSyntax::kUnknown;
  }
  if (path[0] == '/') return PathSyntax::kGuest;
  return PathSyntax::kUnknown;
}

bool RunningInGuest() {
  std::ifstream in("/proc/sys/kernel/osrelease");
  std::string release;
  if (!(in >> release)) return false;
  return ToLowerAscii(release).find("microsoft") != std::string::npos;
}

PathTranslator::PathTranslator(std::string distro) : distro_(std::move(distro)) {}

std::optional<std::string> PathTranslator::Convert(const std::string& path,
                                                   PathSyntax from,
                                                   PathSyntax to,
                                                   GatewayError* err) const {
  if (from == PathSyntax::kUnknown || to == PathSyntax::kUnknown) {
    Untranslatable(err, path, "unknown path syntax requested");
    return std::nullopt;
  }
  const PathSyntax detected = DetectSyntax(path);
  if (detected == PathSyntax::kUnknown) {
    Untranslatable(err, path, "path is not absolute");
    return std::nullopt;
  }
  // Already in the target syntax.
  if (detected == to) {
    if (to == PathSyntax::kGuest && path.find('\\') != std::string::npos) {
      Untranslatable(err, path, "guest path contains a backslash");
      return std::nullopt;
    }
    return path;
  }
  if (detected != from) {
    Untranslatable(err, path, std::string("path is not in ") + PathSyntaxName(from) + " syntax");
    return std::nullopt;
  }
  if (from == PathSyntax::kHost) return HostToGuest(path, err);
  return GuestToHost(path, err);
}

std::optional<std::string> PathTranslator::ToGuest(const std::string& path, GatewayError* err) const {
  return Convert(path, PathSyntax::kHost, PathSyntax::kGuest, err);
}

std::optional<std::string> PathTranslator::ToHost(const std::string& path, GatewayError* err) const {
  return Convert(path, PathSyntax::kGuest, PathSyntax::kHost, err);
}

std::optional<std::string> PathTranslator::HostToGuest(const std::string& path, GatewayError* err) const {
  // Only the canonical spellings convert, so that converting back yields the
  // same string.
  if (IsDriveAbsolute(path)) {
    if (!std::isupper(static_cast<unsigned char>(path[0]))) {
      Untranslatable(err, path, "drive letter must be upper case");
      return std::nullopt;
    }
    if (path.find('/') != std::string::npos) {
      Untranslatable(err, path, "host path uses '/' separators");
      return std::nullopt;
    }
    const std::string rest = path.substr(3);
    std::string out = "/mnt/";
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(path[0]))));
    if (!rest.empty()) {
      out.push_back('/');
      out += JoinSegments(SplitSegments(rest, '\\'), '/');
    }
    return out;
  }

  if (StartsWith(path, kWslUncPrefixes[0])) {
    Untranslatable(err, path, "legacy \\\\wsl$ prefix, use \\\\wsl.localhost");
    return std::nullopt;
  }
  const size_t n = WslUncPrefixLength(path);
  const std::string tail = path.substr(n);
  if (tail.find('/') != std::string::npos) {
    Untranslatable(err, path, "host path uses '/' separators");
    return std::nullopt;
  }
  auto segs = SplitSegments(tail, '\\');
  // segs[0] is the distro name; the remainder is rooted at the guest's '/'.
  if (distro_.empty()) {
    Untranslatable(err, path, "no guest distribution is configured");
    return std::nullopt;
  }
  if (segs.size() == 1) {
    Untranslatable(err, path, "distribution root needs a trailing backslash");
    return std::nullopt;
  }
  if (segs[0] != distro_) {
    Untranslatable(err, path, "path belongs to another guest distribution");
    return std::nullopt;
  }
  segs.erase(segs.begin());
  std::string out = "/" + JoinSegments(segs, '/');
  if (StartsWith(out, "/mnt/") && out.size() >= 6 && IsDriveLetter(out[5]) &&
      (out.size() == 6 || out[6] == '/')) {
    Untranslatable(err, path, "path aliases a mounted drive, use the drive letter");
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> PathTranslator::GuestToHost(const std::string& path, GatewayError* err) const {
  if (path.find('\\') != std::string::npos) {
    Untranslatable(err, path, "guest path contains a backslash");
    return std::nullopt;
  }
  // /mnt/<drive> or /mnt/<drive>/...
  if (StartsWith(path, "/mnt/") && path.size() >= 6 && IsDriveLetter(path[5]) &&
      (path.size() == 6 || path[6] == '/')) {
    std::string out;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(path[5]))));
    out += ":\\";
    if (path.size() > 7) out += JoinSegments(SplitSegments(path.substr(7), '/'), '\\');
    return out;
  }
  if (distro_.empty()) {
    Untranslatable(err, path, "guest path is outside /mnt and no guest distribution is configured");
    return std::nullopt;
  }
  std::string out = "\\\\wsl.localhost\\" + distro_;
  out += "\\" + JoinSegments(SplitSegments(path.substr(1), '/'), '\\');
  return out;
}

}  // namespace deskbridge
