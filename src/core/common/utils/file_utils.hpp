#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace netbatch::core::common::file {

inline bool EnsureDir(const std::filesystem::path& d) {
  std::error_code ec;
  std::filesystem::create_directories(d, ec);
  return !ec;
}

inline std::optional<std::string> ReadTextFile(const std::filesystem::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Writes to a sibling temp file, then renames over p, so readers never see a partial file.
inline bool WriteTextFileAtomic(const std::filesystem::path& p, const std::string& content) {
  static std::atomic<std::uint64_t> seq{0};

  std::error_code ec;
  const auto dir = p.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  if (ec) return false;

  const auto tmp = p.string() + ".tmp" + std::to_string(seq.fetch_add(1));
  {
    std::ofstream ofs(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::filesystem::rename(tmp, p, ec);
  if (!ec) return true;

  ec.clear();
  std::filesystem::remove(p, ec);
  ec.clear();
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    ec.clear();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

// Names of the immediate subdirectories of dir, sorted. Empty if dir is missing.
inline std::vector<std::string> ListSubdirs(const std::filesystem::path& dir) {
  std::vector<std::string> out;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code tec;
    if (it->is_directory(tec) && !tec) out.push_back(it->path().filename().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace netbatch::core::common::file
