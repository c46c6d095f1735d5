#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/batch/batch_types.hpp"
#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"

namespace netbatch::services::result_sink {

struct StoredBlob {
  std::string run_id;
  std::string category;
  std::string device;
  std::string command;
  std::string intent;
  std::string status;
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::int64_t duration_ms = 0;
  std::int64_t attempts = 0;
  std::int64_t index = 0;
  std::filesystem::path path;

  bool ok() const { return status == "ok"; }
};

struct PersistReceipt {
  std::string run_id;
  std::string category;
  std::filesystem::path category_dir;
  std::filesystem::path manifest_path;
  std::size_t blobs_written = 0;
};

// <root>/<run>/<category>/<device>/<command>.json plus a manifest per category.
class ResultSink {
public:
  struct Options {
    std::filesystem::path root_dir = "data/results";
  };

  explicit ResultSink(Options opt, std::shared_ptr<core::common::log::Logger> logger = nullptr);

  ResultSink(const ResultSink&) = delete;
  ResultSink& operator=(const ResultSink&) = delete;

  const Options& GetOptions() const { return opt_; }

  bool Persist(const core::batch::BatchResult& result, const std::string& category,
               PersistReceipt& receipt, core::common::Error& err);
  bool Persist(const core::batch::BatchResult& result, const std::string& category,
               const std::string& run_id, PersistReceipt& receipt, core::common::Error& err);

  // All blobs of one device in command order; NotFound when nothing is stored.
  bool Read(const std::string& run_id, const std::string& category, const std::string& device,
            std::vector<StoredBlob>& out, core::common::Error& err) const;
  std::optional<StoredBlob> ReadOne(const std::string& run_id, const std::string& category,
                                    const std::string& device, const std::string& command) const;
  std::optional<std::string> ReadManifest(const std::string& run_id,
                                          const std::string& category) const;

  std::vector<std::string> ListRuns() const;
  std::vector<std::string> ListCategories(const std::string& run_id) const;
  std::vector<std::string> ListDevices(const std::string& run_id, const std::string& category) const;

  std::filesystem::path CategoryDir(const std::string& run_id, const std::string& category) const;
  std::filesystem::path DeviceDir(const std::string& run_id, const std::string& category,
                                  const std::string& device) const;

  // Sanitized name plus its FNV-1a hash, so distinct names never share a path.
  static std::string PathComponent(const std::string& name);
  static std::string BlobFileName(const std::string& command);
  static std::optional<StoredBlob> ParseBlob(const std::string& json);

private:
  std::shared_ptr<std::mutex> KeyMutex(const std::string& key);

  void LogInfo(const std::string& msg) const;
  void LogError(const std::string& msg) const;

private:
  Options opt_;
  std::shared_ptr<core::common::log::Logger> logger_;

  std::mutex keys_mu_;
  std::map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

}  // namespace netbatch::services::result_sink
