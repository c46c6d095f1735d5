#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/batch/batch_executor.hpp"
#include "core/batch/batch_types.hpp"
#include "core/command/command_catalog.hpp"
#include "core/command/command_policy.hpp"
#include "core/common/config/config_manager.hpp"
#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/inventory/inventory.hpp"
#include "core/pool/connection_pool.hpp"
#include "core/scope/scope_resolver.hpp"
#include "core/session/session.hpp"
#include "core/session/tcp_cli_session.hpp"
#include "services/post_process/post_processor.hpp"
#include "services/post_process/task_queue.hpp"
#include "services/result_sink/result_sink.hpp"

namespace netbatch {
namespace engine {

struct EngineSettings {
  std::string inventory_file;
  std::string catalog_file;
  std::string blacklist_file;
  std::string results_dir = "data/results";
  std::string log_file;
  std::string log_level = "info";

  core::batch::BatchOptions batch;
  core::pool::PoolOptions pool;
  core::session::TcpCliSession::Options session;

  // Missing keys keep their defaults; present but invalid values are Config errors.
  static bool FromConfig(const core::common::config::ConfigManager& cfg, EngineSettings& out,
                         core::common::Error& err);
};

class EngineCore {
public:
  EngineCore(EngineSettings settings, core::inventory::Inventory inventory,
             core::command::CommandCatalog catalog, core::command::CommandPolicy policy,
             std::shared_ptr<core::session::SessionFactory> factory,
             std::shared_ptr<core::common::log::Logger> logger = nullptr);
  ~EngineCore();

  EngineCore(const EngineCore&) = delete;
  EngineCore& operator=(const EngineCore&) = delete;

  static bool Create(const EngineSettings& settings,
                     std::shared_ptr<core::common::log::Logger> logger,
                     std::unique_ptr<EngineCore>& out, core::common::Error& err);

  core::scope::ScopeResolution ResolveScope(std::string_view expression) const;

  bool ExecuteBatch(const std::vector<core::inventory::model::DeviceRef>& devices,
                    const std::vector<std::string>& commands,
                    const core::batch::BatchOptions& options,
                    std::shared_ptr<const core::batch::BatchResult>& out,
                    core::common::Error& err);

  bool ExecuteIntents(const std::vector<core::inventory::model::DeviceRef>& devices,
                      const std::vector<std::string>& intents,
                      const core::batch::BatchOptions& options,
                      std::shared_ptr<const core::batch::BatchResult>& out,
                      core::common::Error& err);

  // Resolve, execute, then hand the result to background persistence under category.
  // An empty category skips persistence.
  bool Collect(std::string_view scope, const std::vector<std::string>& commands,
               const std::string& category,
               std::shared_ptr<const core::batch::BatchResult>& out, core::common::Error& err);
  bool CollectIntents(std::string_view scope, const std::vector<std::string>& intents,
                      const std::string& category,
                      std::shared_ptr<const core::batch::BatchResult>& out,
                      core::common::Error& err);

  // Preview: resolved devices and the command each would run. No device is contacted.
  std::string Plan(std::string_view scope, const std::vector<std::string>& commands,
                   const std::vector<std::string>& intents) const;

  void WaitForBackground();
  // Drains background work and closes every pooled session. Idempotent.
  void Shutdown();

  const EngineSettings& GetSettings() const { return settings_; }
  const core::inventory::Inventory& GetInventory() const { return inventory_; }
  const core::command::CommandCatalog& GetCatalog() const { return catalog_; }
  core::pool::ConnectionPool& GetPool() { return *pool_; }
  services::result_sink::ResultSink& GetSink() { return *sink_; }
  services::post_process::PostProcessor& GetPostProcessor() { return *post_; }

private:
  bool ResolveForRun(std::string_view scope,
                     std::vector<core::inventory::model::DeviceRef>& devices,
                     core::common::Error& err) const;
  void SubmitForPersistence(const std::shared_ptr<const core::batch::BatchResult>& result,
                            const std::string& category);

private:
  EngineSettings settings_;
  core::inventory::Inventory inventory_;
  core::command::CommandCatalog catalog_;
  std::shared_ptr<core::common::log::Logger> logger_;

  std::shared_ptr<core::pool::ConnectionPool> pool_;
  std::unique_ptr<core::batch::BatchExecutor> executor_;
  std::shared_ptr<services::result_sink::ResultSink> sink_;
  std::shared_ptr<services::post_process::TaskQueue> queue_;
  std::unique_ptr<services::post_process::PostProcessor> post_;
  bool shut_down_ = false;
};

}  // namespace engine
}  // namespace netbatch
