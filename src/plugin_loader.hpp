#pragma once

#include "tooling.hpp"

#include <string>
#include <vector>

namespace deskbridge {

struct ManifestReport {
  std::string file;
  std::string plugin_name;
  std::string error;  // set when the whole file was excluded
  std::vector<std::string> loaded;
  std::vector<std::string> rejected;  // "<tool>: <reason>"
  std::vector<std::string> collided;
};

struct LoadReport {
  std::vector<ManifestReport> manifests;

  size_t LoadedCount() const;
  size_t RejectedCount() const;
  size_t CollidedCount() const;
};

// Loads every `*.json` manifest under `dir` in lexicographic filename order
// and registers its tools as MailboxInvoke tools. A missing directory is not
// an error. A manifest that fails to parse excludes only itself, and a tool
// that fails validation excludes only that tool.
LoadReport LoadPluginDirectory(const std::string& dir, ToolRegistry* registry);

// Loads a single manifest document. `origin` names it in logs and reports.
ManifestReport LoadPluginManifest(const nlohmann::json& manifest, const std::string& origin, ToolRegistry* registry);

}  // namespace deskbridge
