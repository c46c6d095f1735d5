#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "core/inventory/inventory.hpp"
#include "core/inventory/model/device_ref.hpp"

namespace netbatch::testing {

// Per-test scratch directory, removed on destruction.
class TempDir {
public:
  TempDir() {
    static std::atomic<int> seq{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("netbatch-test-" + std::to_string(stamp) + "-" + std::to_string(seq.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& Path() const { return path_; }

  std::filesystem::path Write(const std::string& name, const std::string& content) const {
    const auto p = path_ / name;
    std::ofstream(p, std::ios::binary | std::ios::trunc) << content;
    return p;
  }

private:
  std::filesystem::path path_;
};

inline core::inventory::model::DeviceRef MakeDevice(const std::string& name,
                                                    const std::string& role = "",
                                                    const std::string& site = "",
                                                    const std::string& platform = "cisco_ios",
                                                    const std::string& group = "") {
  core::inventory::model::DeviceRef d;
  d.name = name;
  d.address = name + ".lab";
  d.platform = platform;
  d.role = role;
  d.site = site;
  d.group = group;
  return d;
}

// R1 core/lab, R2 core/lab, R3 access/lab.
inline core::inventory::Inventory LabInventory() {
  core::inventory::Inventory inv;
  inv.Register(MakeDevice("R1", "core", "lab"));
  inv.Register(MakeDevice("R2", "core", "lab"));
  inv.Register(MakeDevice("R3", "access", "lab"));
  return inv;
}

}  // namespace netbatch::testing
