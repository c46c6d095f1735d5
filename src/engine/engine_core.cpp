#include "engine/engine_core.hpp"

#include <cstdint>
#include <utility>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/string_utils.hpp"

namespace netbatch {
namespace engine {

namespace {

using core::common::Error;
using core::common::ErrorCode;
namespace json = core::common::json;

bool ReadBounded(const core::common::config::ConfigManager& cfg, const std::string& key,
                 std::int64_t lo, std::int64_t hi, std::int64_t& value, Error& err) {
  if (!cfg.Has(key)) return true;
  std::int64_t v = 0;
  if (!cfg.GetInt64(key, v) || v < lo || v > hi) {
    err = Error(ErrorCode::Config,
                "expected an integer in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]",
                key);
    return false;
  }
  value = v;
  return true;
}

}  // namespace

bool EngineSettings::FromConfig(const core::common::config::ConfigManager& cfg,
                                EngineSettings& out, Error& err) {
  EngineSettings s = out;

  std::int64_t max_conc = static_cast<std::int64_t>(s.batch.max_concurrency);
  std::int64_t cmd_timeout = s.batch.per_command_timeout.count();
  std::int64_t batch_timeout = s.batch.batch_timeout.count();
  std::int64_t attempts = s.batch.max_attempts;
  std::int64_t idle_sec = s.pool.idle_eviction_age.count() / 1000;
  std::int64_t connect_ms = s.pool.connect_timeout.count();
  std::int64_t acquire_ms = s.pool.acquire_timeout.count();
  std::int64_t port = s.session.default_port;

  if (!ReadBounded(cfg, "engine.max_concurrency", 1, 1024, max_conc, err)) return false;
  if (!ReadBounded(cfg, "engine.per_command_timeout_ms", 1, 86400000, cmd_timeout, err)) return false;
  if (!ReadBounded(cfg, "engine.batch_timeout_ms", 0, 86400000, batch_timeout, err)) return false;
  if (!ReadBounded(cfg, "engine.command_attempts", 1, 10, attempts, err)) return false;
  if (!ReadBounded(cfg, "pool.idle_eviction_sec", 0, 86400, idle_sec, err)) return false;
  if (!ReadBounded(cfg, "pool.connect_timeout_ms", 1, 600000, connect_ms, err)) return false;
  if (!ReadBounded(cfg, "pool.acquire_timeout_ms", 1, 3600000, acquire_ms, err)) return false;
  if (!ReadBounded(cfg, "session.default_port", 1, 65535, port, err)) return false;

  if (cfg.Has("engine.stop_on_first_failure") &&
      !cfg.GetBool("engine.stop_on_first_failure", s.batch.stop_on_first_failure)) {
    err = Error(ErrorCode::Config, "expected a boolean", "engine.stop_on_first_failure");
    return false;
  }

  s.batch.max_concurrency = static_cast<std::size_t>(max_conc);
  s.batch.per_command_timeout = std::chrono::milliseconds(cmd_timeout);
  s.batch.batch_timeout = std::chrono::milliseconds(batch_timeout);
  s.batch.max_attempts = static_cast<std::uint32_t>(attempts);
  s.pool.idle_eviction_age = std::chrono::seconds(idle_sec);
  s.pool.connect_timeout = std::chrono::milliseconds(connect_ms);
  s.pool.acquire_timeout = std::chrono::milliseconds(acquire_ms);
  s.session.default_port = static_cast<std::uint16_t>(port);

  auto suffixes = cfg.GetStringList("session.prompt_suffixes");
  if (!suffixes.empty()) s.session.prompt_suffixes = std::move(suffixes);

  cfg.GetString("inventory.file", s.inventory_file);
  cfg.GetString("commands.catalog_file", s.catalog_file);
  cfg.GetString("commands.blacklist_file", s.blacklist_file);
  cfg.GetString("results.dir", s.results_dir);
  cfg.GetString("log.file", s.log_file);
  cfg.GetString("log.level", s.log_level);

  out = std::move(s);
  return true;
}

EngineCore::EngineCore(EngineSettings settings, core::inventory::Inventory inventory,
                       core::command::CommandCatalog catalog, core::command::CommandPolicy policy,
                       std::shared_ptr<core::session::SessionFactory> factory,
                       std::shared_ptr<core::common::log::Logger> logger)
    : settings_(std::move(settings)),
      inventory_(std::move(inventory)),
      catalog_(std::move(catalog)),
      logger_(std::move(logger)) {
  pool_ = std::make_shared<core::pool::ConnectionPool>(settings_.pool, std::move(factory), logger_);
  executor_ = std::make_unique<core::batch::BatchExecutor>(
      pool_, std::make_shared<const core::command::CommandPolicy>(std::move(policy)), logger_);

  services::result_sink::ResultSink::Options sink_opt;
  sink_opt.root_dir = settings_.results_dir;
  sink_ = std::make_shared<services::result_sink::ResultSink>(sink_opt, logger_);

  queue_ = std::make_shared<services::post_process::TaskQueue>("post", logger_);
  queue_->Start();
  post_ = std::make_unique<services::post_process::PostProcessor>(sink_, queue_, logger_);
}

EngineCore::~EngineCore() { Shutdown(); }

bool EngineCore::Create(const EngineSettings& settings,
                        std::shared_ptr<core::common::log::Logger> logger,
                        std::unique_ptr<EngineCore>& out, Error& err) {
  if (settings.inventory_file.empty()) {
    err = Error(ErrorCode::Config, "no inventory file configured", "inventory.file");
    return false;
  }
  core::inventory::Inventory inventory;
  if (!core::inventory::LoadInventoryYaml(settings.inventory_file, inventory, err)) return false;

  core::command::CommandCatalog catalog = core::command::CommandCatalog::Builtin();
  if (!settings.catalog_file.empty() && !catalog.LoadYamlFile(settings.catalog_file, err)) {
    return false;
  }

  core::command::CommandPolicy policy;
  if (!settings.blacklist_file.empty() && !policy.LoadFile(settings.blacklist_file, err)) {
    return false;
  }

  auto factory = std::make_shared<core::session::TcpCliSessionFactory>(settings.session, logger);
  out = std::make_unique<EngineCore>(settings, std::move(inventory), std::move(catalog),
                                     std::move(policy), std::move(factory), logger);
  if (logger) {
    logger->Info("engine ready: devices=" + std::to_string(out->inventory_.Size()) +
                 " intents=" + std::to_string(out->catalog_.Intents().size()) +
                 " results_dir=" + settings.results_dir);
  }
  return true;
}

core::scope::ScopeResolution EngineCore::ResolveScope(std::string_view expression) const {
  return core::scope::ResolveScope(expression, inventory_);
}

bool EngineCore::ExecuteBatch(const std::vector<core::inventory::model::DeviceRef>& devices,
                              const std::vector<std::string>& commands,
                              const core::batch::BatchOptions& options,
                              std::shared_ptr<const core::batch::BatchResult>& out, Error& err) {
  pool_->EvictIdle();
  return executor_->ExecuteBatch(devices, commands, options, out, err);
}

bool EngineCore::ExecuteIntents(const std::vector<core::inventory::model::DeviceRef>& devices,
                                const std::vector<std::string>& intents,
                                const core::batch::BatchOptions& options,
                                std::shared_ptr<const core::batch::BatchResult>& out, Error& err) {
  pool_->EvictIdle();
  return executor_->ExecuteIntents(devices, intents, catalog_, options, out, err);
}

bool EngineCore::ResolveForRun(std::string_view scope,
                               std::vector<core::inventory::model::DeviceRef>& devices,
                               Error& err) const {
  auto res = ResolveScope(scope);
  if (!res.Ok()) {
    err = *res.error;
    return false;
  }
  if (!res.unresolved_names.empty() && logger_) {
    std::string names;
    for (const auto& n : res.unresolved_names) names += (names.empty() ? "" : ",") + n;
    logger_->Warn("unknown devices in scope '" + std::string(scope) + "': " + names);
  }
  if (res.devices.empty()) {
    err = Error(ErrorCode::NoDevices, "scope matched no devices", std::string(scope));
    return false;
  }
  devices = std::move(res.devices);
  return true;
}

void EngineCore::SubmitForPersistence(
    const std::shared_ptr<const core::batch::BatchResult>& result, const std::string& category) {
  if (!result || category.empty()) return;
  if (!post_->Submit(result, category) && logger_) {
    logger_->Warn("result " + result->run_id + " not queued for persistence");
  }
}

bool EngineCore::Collect(std::string_view scope, const std::vector<std::string>& commands,
                         const std::string& category,
                         std::shared_ptr<const core::batch::BatchResult>& out, Error& err) {
  std::vector<core::inventory::model::DeviceRef> devices;
  if (!ResolveForRun(scope, devices, err)) return false;
  const bool ok = ExecuteBatch(devices, commands, settings_.batch, out, err);
  SubmitForPersistence(out, category);
  return ok;
}

bool EngineCore::CollectIntents(std::string_view scope, const std::vector<std::string>& intents,
                                const std::string& category,
                                std::shared_ptr<const core::batch::BatchResult>& out, Error& err) {
  std::vector<core::inventory::model::DeviceRef> devices;
  if (!ResolveForRun(scope, devices, err)) return false;
  const bool ok = ExecuteIntents(devices, intents, settings_.batch, out, err);
  SubmitForPersistence(out, category);
  return ok;
}

std::string EngineCore::Plan(std::string_view scope, const std::vector<std::string>& commands,
                             const std::vector<std::string>& intents) const {
  const auto res = ResolveScope(scope);

  std::vector<std::string> rows;
  for (const auto& d : res.devices) {
    std::vector<std::string> planned;
    for (const auto& c : commands) {
      planned.push_back(json::Object({{"command", json::Quote(std::string(core::common::str::Trim(c)))}}));
    }
    for (const auto& i : intents) {
      const auto cmd = catalog_.Lookup(i, d.platform);
      planned.push_back(json::Object({
          {"intent", json::Quote(core::common::str::ToLower(core::common::str::Trim(i)))},
          {"command", cmd ? json::Quote(*cmd) : json::Null()},
      }));
    }
    rows.push_back(json::Object({
        {"device", json::Quote(d.name)},
        {"address", json::Quote(d.address)},
        {"platform", json::Quote(d.platform)},
        {"commands", json::Array(planned)},
    }));
  }

  return json::Object({
      {"scope", res.ToJson()},
      {"plan", json::Array(rows)},
  });
}

void EngineCore::WaitForBackground() {
  if (queue_) queue_->WaitIdle();
}

void EngineCore::Shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  queue_->Stop(true);
  pool_->CloseAll();
  if (logger_) {
    const auto st = post_->Stats();
    logger_->Info("engine stopped: persisted=" + std::to_string(st.persisted) +
                  " persist_failures=" + std::to_string(st.persist_failures));
  }
}

}  // namespace engine
}  // namespace netbatch
