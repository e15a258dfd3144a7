#include "fs_util.hpp"

#include "session_authority.hpp"

#include <chrono>
#include <fstream>
#include <system_error>

namespace deskbridge {

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string TempNameFor(const std::filesystem::path& path) {
  return (path.parent_path() / ("." + path.filename().string() + "." + NewId("tmp") + ".tmp")).string();
}

static bool WriteTemp(const std::filesystem::path& tmp, const std::string& content, std::string* err) {
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "cannot open " + tmp.string();
    return false;
  }
  out << content;
  out.flush();
  if (!out) {
    if (err) *err = "short write to " + tmp.string();
    return false;
  }
  return true;
}

bool WriteFileAtomic(const std::filesystem::path& path, const std::string& content, std::string* err) {
  std::error_code ec;
  auto dir = path.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  const std::filesystem::path tmp = TempNameFor(path);
  if (!WriteTemp(tmp, content, err)) {
    std::filesystem::remove(tmp, ec);
    return false;
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    if (err) *err = "rename " + tmp.string() + " -> " + path.string() + ": " + ec.message();
    std::error_code ec2;
    std::filesystem::remove(tmp, ec2);
    return false;
  }
  return true;
}

bool WriteJsonAtomic(const std::filesystem::path& path, const nlohmann::json& j, std::string* err) {
  return WriteFileAtomic(path, j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace), err);
}

bool CreateFileExclusive(const std::filesystem::path& path, const std::string& content, bool* exists, std::string* err) {
  if (exists) *exists = false;
  std::error_code ec;
  auto dir = path.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  const std::filesystem::path tmp = TempNameFor(path);
  if (!WriteTemp(tmp, content, err)) {
    std::filesystem::remove(tmp, ec);
    return false;
  }
  std::filesystem::create_hard_link(tmp, path, ec);
  std::error_code ec2;
  std::filesystem::remove(tmp, ec2);
  if (ec) {
    if (ec == std::errc::file_exists) {
      if (exists) *exists = true;
      if (err) *err = path.string() + " already exists";
    } else if (err) {
      *err = "link " + path.string() + ": " + ec.message();
    }
    return false;
  }
  return true;
}

std::optional<std::string> ReadFileToString(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return s;
}

std::optional<nlohmann::json> ReadJsonFile(const std::filesystem::path& path) {
  auto text = ReadFileToString(path);
  if (!text) return std::nullopt;
  auto j = nlohmann::json::parse(*text, nullptr, false);
  if (j.is_discarded()) return std::nullopt;
  return j;
}

}  // namespace deskbridge
