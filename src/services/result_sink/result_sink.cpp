#include "services/result_sink/result_sink.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "core/common/utils/file_utils.hpp"
#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/string_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "mongoose.h"

namespace netbatch::services::result_sink {

namespace {

namespace json = core::common::json;
namespace str = core::common::str;
using core::common::ErrorCode;

std::optional<std::string> JsonString(const std::string& doc, const char* path) {
  char* s = mg_json_get_str(mg_str_n(doc.data(), doc.size()), path);
  if (s == nullptr) return std::nullopt;
  std::string out(s);
  mg_free(s);
  return out;
}

std::int64_t JsonInt(const std::string& doc, const char* path) {
  return static_cast<std::int64_t>(mg_json_get_long(mg_str_n(doc.data(), doc.size()), path, 0));
}

std::string BlobJson(const core::batch::CommandResult& r, const std::string& run_id,
                     const std::string& category, std::size_t index) {
  json::Fields f{
      {"run_id", json::Quote(run_id)},
      {"category", json::Quote(category)},
      {"device", json::Quote(r.device_name)},
      {"command", json::Quote(r.command)},
  };
  if (!r.intent.empty()) f.emplace_back("intent", json::Quote(r.intent));
  f.emplace_back("status", json::Quote(core::batch::ToString(r.status)));
  if (r.output) f.emplace_back("output", json::Quote(*r.output));
  if (r.error) f.emplace_back("error", json::Quote(*r.error));
  f.emplace_back("duration_ms", json::Number(static_cast<std::int64_t>(r.duration.count())));
  f.emplace_back("attempts", json::Number(static_cast<std::uint64_t>(r.attempts)));
  f.emplace_back("index", json::Number(static_cast<std::uint64_t>(index)));
  return json::Object(f) + "\n";
}

std::string ManifestJson(const core::batch::BatchResult& result, const std::string& run_id,
                         const std::string& category) {
  return json::Object({
             {"run_id", json::Quote(run_id)},
             {"category", json::Quote(category)},
             {"batch_run_id", json::Quote(result.run_id)},
             {"started_at", json::Quote(core::common::time::FormatIso8601Utc(result.started_at))},
             {"finished_at", json::Quote(core::common::time::FormatIso8601Utc(result.finished_at))},
             {"persisted_at", json::Quote(core::common::time::NowIso8601Utc())},
             {"cancelled", json::Bool(result.cancelled)},
             {"commands", json::StringArray(result.commands)},
             {"devices_requested", json::StringArray(result.devices_requested)},
             {"devices_succeeded", json::StringArray(result.devices_succeeded)},
             {"devices_failed", json::StringArray(result.devices_failed)},
             {"result_count", json::Number(static_cast<std::uint64_t>(result.results.size()))},
         }) +
         "\n";
}

bool IsBlobFile(const std::filesystem::path& p) {
  if (p.extension() != ".json") return false;
  return p.filename() != "manifest.json";
}

// Directory names are hashed, so listings read the original names back from the files.
std::optional<std::string> ManifestField(const std::filesystem::path& category_dir,
                                         const char* path) {
  const auto text = core::common::file::ReadTextFile(category_dir / "manifest.json");
  if (!text) return std::nullopt;
  return JsonString(*text, path);
}

std::optional<std::string> FirstBlobDevice(const std::filesystem::path& device_dir) {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(device_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!IsBlobFile(it->path())) continue;
    const auto text = core::common::file::ReadTextFile(it->path());
    if (!text) continue;
    if (auto device = JsonString(*text, "$.device")) return device;
  }
  return std::nullopt;
}

}  // namespace

ResultSink::ResultSink(Options opt, std::shared_ptr<core::common::log::Logger> logger)
    : opt_(std::move(opt)), logger_(std::move(logger)) {}

std::string ResultSink::PathComponent(const std::string& name) {
  return str::SanitizeFilename(name, 48) + "-" + str::Hex64(str::Fnv1a64(name));
}

std::string ResultSink::BlobFileName(const std::string& command) {
  return PathComponent(command) + ".json";
}

std::filesystem::path ResultSink::CategoryDir(const std::string& run_id,
                                              const std::string& category) const {
  return opt_.root_dir / PathComponent(run_id) / PathComponent(category);
}

std::filesystem::path ResultSink::DeviceDir(const std::string& run_id, const std::string& category,
                                            const std::string& device) const {
  return CategoryDir(run_id, category) / PathComponent(device);
}

std::shared_ptr<std::mutex> ResultSink::KeyMutex(const std::string& key) {
  std::lock_guard<std::mutex> lk(keys_mu_);
  auto& m = key_mutexes_[key];
  if (!m) m = std::make_shared<std::mutex>();
  return m;
}

bool ResultSink::Persist(const core::batch::BatchResult& result, const std::string& category,
                         PersistReceipt& receipt, core::common::Error& err) {
  return Persist(result, category, result.run_id, receipt, err);
}

bool ResultSink::Persist(const core::batch::BatchResult& result, const std::string& category,
                         const std::string& run_id, PersistReceipt& receipt,
                         core::common::Error& err) {
  if (str::Trim(run_id).empty() || str::Trim(category).empty()) {
    err = core::common::Error(ErrorCode::InvalidArgument, "run id and category are required");
    return false;
  }

  receipt = PersistReceipt{};
  receipt.run_id = run_id;
  receipt.category = category;
  receipt.category_dir = CategoryDir(run_id, category);
  receipt.manifest_path = receipt.category_dir / "manifest.json";

  // Group in result order; the per-device position is the command index.
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<const core::batch::CommandResult*>> by_device;
  for (const auto& r : result.results) {
    auto& bucket = by_device[r.device_name];
    if (bucket.empty()) order.push_back(r.device_name);
    bucket.push_back(&r);
  }

  for (const auto& device : order) {
    const auto dir = DeviceDir(run_id, category, device);
    const auto mu = KeyMutex(run_id + "\n" + category + "\n" + device);
    std::lock_guard<std::mutex> lk(*mu);

    const auto& bucket = by_device[device];
    for (std::size_t i = 0; i < bucket.size(); ++i) {
      const auto path = dir / BlobFileName(bucket[i]->command);
      if (!core::common::file::WriteTextFileAtomic(path, BlobJson(*bucket[i], run_id, category, i))) {
        err = core::common::Error(ErrorCode::Io, "failed to write result blob", path.string());
        LogError(err.ToString());
        return false;
      }
      ++receipt.blobs_written;
    }
  }

  {
    const auto mu = KeyMutex(run_id + "\n" + category);
    std::lock_guard<std::mutex> lk(*mu);
    if (!core::common::file::WriteTextFileAtomic(receipt.manifest_path,
                                                 ManifestJson(result, run_id, category))) {
      err = core::common::Error(ErrorCode::Io, "failed to write manifest",
                                receipt.manifest_path.string());
      LogError(err.ToString());
      return false;
    }
  }

  LogInfo("persisted " + std::to_string(receipt.blobs_written) + " result(s) to " +
          receipt.category_dir.string());
  return true;
}

std::optional<StoredBlob> ResultSink::ParseBlob(const std::string& doc) {
  StoredBlob b;
  auto device = JsonString(doc, "$.device");
  auto command = JsonString(doc, "$.command");
  auto status = JsonString(doc, "$.status");
  if (!device || !command || !status) return std::nullopt;

  b.device = std::move(*device);
  b.command = std::move(*command);
  b.status = std::move(*status);
  b.run_id = JsonString(doc, "$.run_id").value_or("");
  b.category = JsonString(doc, "$.category").value_or("");
  b.intent = JsonString(doc, "$.intent").value_or("");
  b.output = JsonString(doc, "$.output");
  b.error = JsonString(doc, "$.error");
  b.duration_ms = JsonInt(doc, "$.duration_ms");
  b.attempts = JsonInt(doc, "$.attempts");
  b.index = JsonInt(doc, "$.index");
  return b;
}

bool ResultSink::Read(const std::string& run_id, const std::string& category,
                      const std::string& device, std::vector<StoredBlob>& out,
                      core::common::Error& err) const {
  out.clear();
  const auto dir = DeviceDir(run_id, category, device);

  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!IsBlobFile(it->path())) continue;
    const auto text = core::common::file::ReadTextFile(it->path());
    if (!text) continue;
    auto blob = ParseBlob(*text);
    if (!blob) {
      LogError("unreadable result blob: " + it->path().string());
      continue;
    }
    blob->path = it->path();
    out.push_back(std::move(*blob));
  }

  if (out.empty()) {
    err = core::common::Error(ErrorCode::NotFound, "no stored results",
                              run_id + "/" + category + "/" + device);
    return false;
  }
  std::sort(out.begin(), out.end(),
            [](const StoredBlob& a, const StoredBlob& b) { return a.index < b.index; });
  return true;
}

std::optional<StoredBlob> ResultSink::ReadOne(const std::string& run_id,
                                              const std::string& category,
                                              const std::string& device,
                                              const std::string& command) const {
  const auto path = DeviceDir(run_id, category, device) / BlobFileName(command);
  const auto text = core::common::file::ReadTextFile(path);
  if (!text) return std::nullopt;
  auto blob = ParseBlob(*text);
  if (blob) blob->path = path;
  return blob;
}

std::optional<std::string> ResultSink::ReadManifest(const std::string& run_id,
                                                    const std::string& category) const {
  return core::common::file::ReadTextFile(CategoryDir(run_id, category) / "manifest.json");
}

std::vector<std::string> ResultSink::ListRuns() const {
  std::vector<std::string> out;
  for (const auto& run_dir : core::common::file::ListSubdirs(opt_.root_dir)) {
    const auto base = opt_.root_dir / run_dir;
    for (const auto& cat_dir : core::common::file::ListSubdirs(base)) {
      if (auto id = ManifestField(base / cat_dir, "$.run_id")) {
        out.push_back(std::move(*id));
        break;
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> ResultSink::ListCategories(const std::string& run_id) const {
  std::vector<std::string> out;
  const auto base = opt_.root_dir / PathComponent(run_id);
  for (const auto& cat_dir : core::common::file::ListSubdirs(base)) {
    if (auto cat = ManifestField(base / cat_dir, "$.category")) out.push_back(std::move(*cat));
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> ResultSink::ListDevices(const std::string& run_id,
                                                 const std::string& category) const {
  std::vector<std::string> out;
  const auto base = CategoryDir(run_id, category);
  for (const auto& dev_dir : core::common::file::ListSubdirs(base)) {
    if (auto device = FirstBlobDevice(base / dev_dir)) out.push_back(std::move(*device));
  }
  std::sort(out.begin(), out.end());
  return out;
}

void ResultSink::LogInfo(const std::string& msg) const {
  if (logger_) logger_->Log(core::common::log::Level::Info, "sink", msg);
}

void ResultSink::LogError(const std::string& msg) const {
  if (logger_) logger_->Log(core::common::log::Level::Error, "sink", msg);
}

}  // namespace netbatch::services::result_sink
