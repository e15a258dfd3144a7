#pragma once

#include "errors.hpp"

#include <optional>
#include <string>

namespace deskbridge {

enum class PathSyntax { kUnknown, kHost, kGuest };

const char* PathSyntaxName(PathSyntax syntax);
bool ParsePathSyntax(const std::string& s, PathSyntax* out);

// Classifies an absolute path. Drive-letter (`C:\`, `C:/`) and WSL UNC
// (`\\wsl$\<distro>\`, `\\wsl.localhost\<distro>\`) forms are host syntax;
// `/...` is guest syntax. Anything relative or malformed is kUnknown.
PathSyntax DetectSyntax(const std::string& path);

// Returns true when this process runs inside a WSL guest.
bool RunningInGuest();

class PathTranslator {
 public:
  // distro names the guest for guest paths outside /mnt/<drive>. When empty
  // such paths cannot be expressed on the host and fail to translate.
  explicit PathTranslator(std::string distro = {});

  std::optional<std::string> Convert(const std::string& path, PathSyntax from, PathSyntax to, GatewayError* err) const;
  std::optional<std::string> ToGuest(const std::string& path, GatewayError* err) const;
  std::optional<std::string> ToHost(const std::string& path, GatewayError* err) const;

  const std::string& distro() const { return distro_; }

 private:
  std::optional<std::string> HostToGuest(const std::string& path, GatewayError* err) const;
  std::optional<std::string> GuestToHost(const std::string& path, GatewayError* err) const;

  std::string distro_;
};

}  // namespace deskbridge
