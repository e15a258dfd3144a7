#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace deskbridge {

int64_t NowMs();

// Writes `<dir>/.<name>.<rand>.tmp` and renames it over `path`, so readers
// see either the old content or the complete new content.
bool WriteFileAtomic(const std::filesystem::path& path, const std::string& content, std::string* err);
bool WriteJsonAtomic(const std::filesystem::path& path, const nlohmann::json& j, std::string* err);

// Writes a temp file and hard-links it to `path`. Fails with EEXIST
// semantics (returns false, *exists = true) when `path` is already present.
bool CreateFileExclusive(const std::filesystem::path& path, const std::string& content, bool* exists, std::string* err);

std::optional<std::string> ReadFileToString(const std::filesystem::path& path);

// nullopt when the file is missing or does not parse as strict JSON.
std::optional<nlohmann::json> ReadJsonFile(const std::filesystem::path& path);

std::string TempNameFor(const std::filesystem::path& path);

}  // namespace deskbridge
