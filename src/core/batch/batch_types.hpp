#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/batch/cancellation.hpp"
#include "core/common/error/error.hpp"
#include "core/inventory/model/device_ref.hpp"

namespace netbatch::core::batch {

enum class CommandStatus : std::uint8_t {
  Ok = 0,
  Error,
  Timeout
};

const char* ToString(CommandStatus status);

struct CommandTask {
  inventory::model::DeviceRef device;
  std::string command;
  // Set when the command was resolved from an intent.
  std::string intent;
  std::chrono::milliseconds timeout{0};
  std::uint32_t attempt = 0;
  // Recorded without touching the device (unresolvable intent).
  std::optional<common::Error> preset_error;
};

struct CommandResult {
  std::string device_name;
  std::string command;
  std::string intent;
  CommandStatus status = CommandStatus::Error;
  // Exactly one of output / error is set: output iff status == Ok.
  std::optional<std::string> output;
  std::optional<std::string> error;
  common::ErrorCode error_code = common::ErrorCode::None;
  std::chrono::milliseconds duration{0};
  std::uint32_t attempts = 0;

  bool ok() const { return status == CommandStatus::Ok; }

  static CommandResult Success(const CommandTask& task, std::string output,
                               std::chrono::milliseconds duration);
  static CommandResult Failure(const CommandTask& task, CommandStatus status,
                               common::ErrorCode code, std::string detail,
                               std::chrono::milliseconds duration = std::chrono::milliseconds(0));

  std::string ToJson() const;
};

struct BatchOptions {
  std::size_t max_concurrency = 10;
  std::chrono::milliseconds per_command_timeout{30000};
  // Per device: after a failed command, the device's remaining commands are skipped.
  bool stop_on_first_failure = false;
  // Zero means no batch-wide deadline.
  std::chrono::milliseconds batch_timeout{0};
  // Executions per command when the session breaks mid-command. Timeouts are never retried.
  std::uint32_t max_attempts = 1;
  std::string run_id;
  std::optional<CancellationToken> cancellation;
};

struct BatchResult {
  std::string run_id;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  std::vector<std::string> commands;
  // Ordered by (device order, command order).
  std::vector<CommandResult> results;
  std::vector<std::string> devices_requested;
  std::vector<std::string> devices_succeeded;
  std::vector<std::string> devices_failed;
  bool cancelled = false;

  std::vector<CommandResult> ResultsFor(const std::string& device_name) const;
  std::size_t CountStatus(CommandStatus status) const;
  std::chrono::milliseconds Elapsed() const;

  std::string Summary() const;
  std::string ToJson() const;
};

}  // namespace netbatch::core::batch
