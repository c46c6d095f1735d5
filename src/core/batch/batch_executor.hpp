#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/batch/batch_types.hpp"
#include "core/command/command_catalog.hpp"
#include "core/command/command_policy.hpp"
#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/inventory/model/device_ref.hpp"
#include "core/pool/connection_pool.hpp"

namespace netbatch::core::batch {

class BatchExecutor {
public:
  BatchExecutor(std::shared_ptr<pool::ConnectionPool> pool,
                std::shared_ptr<const command::CommandPolicy> policy = nullptr,
                std::shared_ptr<common::log::Logger> logger = nullptr);

  BatchExecutor(const BatchExecutor&) = delete;
  BatchExecutor& operator=(const BatchExecutor&) = delete;

  // Returns false on NoDevices / InvalidArgument (out untouched) and on
  // PoolShutdown (out still holds the complete result).
  bool ExecuteBatch(const std::vector<inventory::model::DeviceRef>& devices,
                    const std::vector<std::string>& commands,
                    const BatchOptions& options,
                    std::shared_ptr<const BatchResult>& out,
                    common::Error& err);

  bool ExecuteIntents(const std::vector<inventory::model::DeviceRef>& devices,
                      const std::vector<std::string>& intents,
                      const command::CommandResolver& resolver,
                      const BatchOptions& options,
                      std::shared_ptr<const BatchResult>& out,
                      common::Error& err);

  static std::string NewRunId();

private:
  struct DeviceGroup {
    inventory::model::DeviceRef device;
    std::vector<CommandTask> tasks;
  };

  using Deadline = std::chrono::steady_clock::time_point;

  bool Run(std::vector<DeviceGroup> groups, std::vector<std::string> labels,
           const BatchOptions& options, std::shared_ptr<const BatchResult>& out,
           common::Error& err);

  bool RunGroup(const DeviceGroup& group, const BatchOptions& options, Deadline deadline,
                std::vector<CommandResult>& results, bool& interrupted);

  static bool Interrupted(const BatchOptions& options, Deadline deadline);
  static std::string InterruptDetail(const BatchOptions& options);

  bool ValidateInputs(const std::vector<inventory::model::DeviceRef>& devices,
                      const std::vector<std::string>& labels, const char* what,
                      common::Error& err) const;

  void Log(common::log::Level level, const std::string& msg) const;

private:
  std::shared_ptr<pool::ConnectionPool> pool_;
  std::shared_ptr<const command::CommandPolicy> policy_;
  std::shared_ptr<common::log::Logger> logger_;
};

}  // namespace netbatch::core::batch
