#include "plugin_loader.hpp"

#include "fs_util.hpp"
#include "log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace deskbridge {

size_t LoadReport::LoadedCount() const {
  size_t n = 0;
  for (const auto& m : manifests) n += m.loaded.size();
  return n;
}

size_t LoadReport::RejectedCount() const {
  size_t n = 0;
  for (const auto& m : manifests) n += m.rejected.size();
  return n;
}

size_t LoadReport::CollidedCount() const {
  size_t n = 0;
  for (const auto& m : manifests) n += m.collided.size();
  return n;
}

namespace {

bool ParseToolEntry(const nlohmann::json& entry, const std::string& origin, ToolDefinition* out, std::string* err) {
  if (!entry.is_object()) {
    *err = "tool entry is not an object";
    return false;
  }
  if (!entry.contains("name") || !entry["name"].is_string() || entry["name"].get<std::string>().empty()) {
    *err = "missing tool name";
    return false;
  }
  out->name = entry["name"].get<std::string>();
  out->description = entry.value("description", std::string());
  out->origin = origin;

  if (entry.contains("inputSchema")) {
    out->parameter_schema = entry["inputSchema"];
  } else if (entry.contains("parameters")) {
    out->parameter_schema = entry["parameters"];
  } else {
    out->parameter_schema = nullptr;
  }

  MailboxInvoke invoke;
  invoke.action = out->name;
  if (entry.contains("bridge")) {
    const auto& b = entry["bridge"];
    if (!b.is_object()) {
      *err = "bridge is not an object";
      return false;
    }
    if (b.contains("action")) {
      if (!b["action"].is_string() || b["action"].get<std::string>().empty()) {
        *err = "bridge.action must be a non-empty string";
        return false;
      }
      invoke.action = b["action"].get<std::string>();
    }
    if (b.contains("timeout_ms")) {
      if (!b["timeout_ms"].is_number_integer() || b["timeout_ms"].get<long long>() <= 0) {
        *err = "bridge.timeout_ms must be a positive integer";
        return false;
      }
      invoke.timeout_ms = static_cast<int>(b["timeout_ms"].get<long long>());
    }
    if (b.contains("path_arguments")) {
      if (!b["path_arguments"].is_array()) {
        *err = "bridge.path_arguments must be an array";
        return false;
      }
      for (const auto& p : b["path_arguments"]) {
        if (!p.is_string()) {
          *err = "bridge.path_arguments entries must be strings";
          return false;
        }
        invoke.path_arguments.push_back(p.get<std::string>());
      }
    }
  }
  out->invoke = std::move(invoke);
  return true;
}

}  // namespace

ManifestReport LoadPluginManifest(const nlohmann::json& manifest, const std::string& origin, ToolRegistry* registry) {
  ManifestReport report;
  report.file = origin;
  if (!manifest.is_object()) {
    report.error = "manifest is not an object";
    return report;
  }
  report.plugin_name = manifest.value("name", std::string());
  if (!manifest.contains("tools") || !manifest["tools"].is_array()) {
    report.error = "manifest has no tools array";
    return report;
  }

  for (const auto& entry : manifest["tools"]) {
    ToolDefinition def;
    std::string err;
    if (!ParseToolEntry(entry, origin, &def, &err)) {
      std::string label = entry.is_object() ? entry.value("name", std::string("?")) : std::string("?");
      report.rejected.push_back(label + ": " + err);
      LogWarn("plugins") << origin << ": rejected tool " << label << ": " << err;
      continue;
    }
    if (registry->HasTool(def.name)) {
      report.collided.push_back(def.name);
      LogWarn("plugins") << origin << ": tool " << def.name << " already registered, keeping the first";
      continue;
    }
    const std::string name = def.name;
    if (!registry->RegisterTool(std::move(def), &err)) {
      // A concurrent registration can still take the name between the checks.
      if (registry->HasTool(name)) {
        report.collided.push_back(name);
      } else {
        report.rejected.push_back(name + ": " + err);
      }
      LogWarn("plugins") << origin << ": " << err;
      continue;
    }
    report.loaded.push_back(name);
  }
  return report;
}

LoadReport LoadPluginDirectory(const std::string& dir, ToolRegistry* registry) {
  LoadReport report;
  std::error_code ec;
  if (dir.empty() || !std::filesystem::is_directory(dir, ec)) {
    LogDebug("plugins") << "no plugin directory at " << dir;
    return report;
  }

  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& p = it->path();
    const auto name = p.filename().string();
    if (name.empty() || name[0] == '.') continue;
    if (p.extension() != ".json") continue;
    if (!it->is_regular_file(ec)) continue;
    files.push_back(p);
  }
  if (ec) LogWarn("plugins") << "listing " << dir << ": " << ec.message();
  std::sort(files.begin(), files.end(),
            [](const std::filesystem::path& a, const std::filesystem::path& b) {
              return a.filename().string() < b.filename().string();
            });

  for (const auto& file : files) {
    auto doc = ReadJsonFile(file);
    if (!doc) {
      ManifestReport bad;
      bad.file = file.string();
      bad.error = "manifest is not valid JSON";
      LogWarn("plugins") << file.string() << ": " << bad.error;
      report.manifests.push_back(std::move(bad));
      continue;
    }
    auto m = LoadPluginManifest(*doc, file.string(), registry);
    if (!m.error.empty()) LogWarn("plugins") << file.string() << ": " << m.error;
    LogInfo("plugins") << file.filename().string() << ": loaded=" << m.loaded.size() << " rejected="
        << m.rejected.size() << " collided=" << m.collided.size();
    report.manifests.push_back(std::move(m));
  }
  return report;
}

}  // namespace deskbridge
