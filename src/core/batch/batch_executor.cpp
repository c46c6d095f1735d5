#include "core/batch/batch_executor.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

#include "core/common/utils/string_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace netbatch::core::batch {

namespace {

using common::ErrorCode;
using inventory::model::DeviceRef;
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Releases the held connection on scope exit; evicts it when unwinding.
class ConnectionLease {
public:
  ConnectionLease(pool::ConnectionPool& pool, std::string device, pool::ConnectionPtr& conn)
      : pool_(pool),
        device_(std::move(device)),
        conn_(conn),
        exceptions_(std::uncaught_exceptions()) {}

  ~ConnectionLease() {
    if (!conn_) return;
    if (std::uncaught_exceptions() > exceptions_) {
      pool_.Evict(device_);
    } else {
      pool_.Release(conn_);
    }
  }

  ConnectionLease(const ConnectionLease&) = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

private:
  pool::ConnectionPool& pool_;
  std::string device_;
  pool::ConnectionPtr& conn_;
  int exceptions_;
};

}  // namespace

BatchExecutor::BatchExecutor(std::shared_ptr<pool::ConnectionPool> pool,
                             std::shared_ptr<const command::CommandPolicy> policy,
                             std::shared_ptr<common::log::Logger> logger)
    : pool_(std::move(pool)), policy_(std::move(policy)), logger_(std::move(logger)) {}

std::string BatchExecutor::NewRunId() {
  static std::atomic<std::uint32_t> counter{0};
  thread_local std::mt19937 rng{std::random_device{}()};

  std::uint32_t salt = (rng() & 0xffff00u) | (counter.fetch_add(1) & 0xffu);
  std::ostringstream oss;
  oss << common::time::FormatCompactUtc(std::chrono::system_clock::now()) << '-'
      << std::hex << std::setw(6) << std::setfill('0') << salt;
  return oss.str();
}

bool BatchExecutor::ValidateInputs(const std::vector<DeviceRef>& devices,
                                   const std::vector<std::string>& labels, const char* what,
                                   common::Error& err) const {
  if (devices.empty()) {
    err = common::Error(ErrorCode::NoDevices, "no devices to run against");
    return false;
  }
  if (labels.empty()) {
    err = common::Error(ErrorCode::InvalidArgument, std::string("no ") + what + " given");
    return false;
  }
  for (const auto& l : labels) {
    if (common::str::Trim(l).empty()) {
      err = common::Error(ErrorCode::InvalidArgument, std::string("blank entry in ") + what);
      return false;
    }
  }
  if (!pool_) {
    err = common::Error(ErrorCode::InvalidArgument, "executor has no connection pool");
    return false;
  }
  return true;
}

bool BatchExecutor::ExecuteBatch(const std::vector<DeviceRef>& devices,
                                 const std::vector<std::string>& commands,
                                 const BatchOptions& options,
                                 std::shared_ptr<const BatchResult>& out,
                                 common::Error& err) {
  if (!ValidateInputs(devices, commands, "commands", err)) return false;

  std::vector<DeviceGroup> groups;
  groups.reserve(devices.size());
  for (const auto& d : devices) {
    DeviceGroup g;
    g.device = d;
    for (const auto& c : commands) {
      CommandTask t;
      t.device = d;
      t.command = std::string(common::str::Trim(c));
      t.timeout = options.per_command_timeout;
      g.tasks.push_back(std::move(t));
    }
    groups.push_back(std::move(g));
  }
  return Run(std::move(groups), commands, options, out, err);
}

bool BatchExecutor::ExecuteIntents(const std::vector<DeviceRef>& devices,
                                   const std::vector<std::string>& intents,
                                   const command::CommandResolver& resolver,
                                   const BatchOptions& options,
                                   std::shared_ptr<const BatchResult>& out,
                                   common::Error& err) {
  if (!ValidateInputs(devices, intents, "intents", err)) return false;

  std::vector<DeviceGroup> groups;
  groups.reserve(devices.size());
  for (const auto& d : devices) {
    DeviceGroup g;
    g.device = d;
    for (const auto& raw : intents) {
      std::string intent = common::str::ToLower(common::str::Trim(raw));
      CommandTask t;
      t.device = d;
      t.intent = intent;
      t.timeout = options.per_command_timeout;
      if (auto cmd = resolver.Lookup(intent, d.platform)) {
        t.command = *cmd;
      } else {
        t.command = intent;
        std::string platform = d.platform.empty() ? std::string("<none>") : d.platform;
        t.preset_error = common::Error(ErrorCode::NotFound,
                                       "no command for intent '" + intent + "' on platform " + platform,
                                       d.name);
      }
      g.tasks.push_back(std::move(t));
    }
    groups.push_back(std::move(g));
  }
  return Run(std::move(groups), intents, options, out, err);
}

bool BatchExecutor::Interrupted(const BatchOptions& options, Deadline deadline) {
  if (options.cancellation && options.cancellation->StopRequested()) return true;
  return Clock::now() >= deadline;
}

std::string BatchExecutor::InterruptDetail(const BatchOptions& options) {
  if (options.cancellation && options.cancellation->StopRequested()) {
    return "cancelled before execution";
  }
  return "cancelled: batch timeout exceeded";
}

bool BatchExecutor::Run(std::vector<DeviceGroup> groups, std::vector<std::string> labels,
                        const BatchOptions& options, std::shared_ptr<const BatchResult>& out,
                        common::Error& err) {
  BatchResult result;
  result.run_id = options.run_id.empty() ? NewRunId() : options.run_id;
  result.commands = std::move(labels);
  result.started_at = std::chrono::system_clock::now();
  for (const auto& g : groups) result.devices_requested.push_back(g.device.name);

  const Deadline deadline = options.batch_timeout.count() > 0
                                ? Clock::now() + options.batch_timeout
                                : Deadline::max();

  std::size_t workers = std::max<std::size_t>(1, options.max_concurrency);
  workers = std::min(workers, groups.size());

  Log(common::log::Level::Info,
      "batch " + result.run_id + " started: devices=" + std::to_string(groups.size()) +
          " commands=" + std::to_string(result.commands.size()) +
          " workers=" + std::to_string(workers));

  std::vector<std::vector<CommandResult>> slots(groups.size());
  std::vector<char> interrupted_flags(groups.size(), 0);
  std::atomic<std::size_t> next{0};
  std::atomic<bool> pool_shutdown{false};

  auto worker = [&]() {
    for (;;) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= groups.size()) return;

      const DeviceGroup& group = groups[idx];
      std::vector<CommandResult>& out_slot = slots[idx];
      bool interrupted = false;
      try {
        if (RunGroup(group, options, deadline, out_slot, interrupted)) {
          pool_shutdown.store(true);
        }
      } catch (const std::exception& e) {
        Log(common::log::Level::Error, "device " + group.device.name + ": " + e.what());
        for (std::size_t i = out_slot.size(); i < group.tasks.size(); ++i) {
          out_slot.push_back(CommandResult::Failure(group.tasks[i], CommandStatus::Error,
                                                    ErrorCode::Connection,
                                                    std::string("internal error: ") + e.what()));
        }
      }
      interrupted_flags[idx] = interrupted ? 1 : 0;
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
  for (auto& t : threads) t.join();

  for (std::size_t i = 0; i < groups.size(); ++i) {
    const auto& name = groups[i].device.name;
    bool all_ok = !slots[i].empty() && std::all_of(slots[i].begin(), slots[i].end(),
                                                   [](const CommandResult& r) { return r.ok(); });
    if (all_ok) {
      result.devices_succeeded.push_back(name);
    } else {
      result.devices_failed.push_back(name);
    }
    if (interrupted_flags[i]) result.cancelled = true;
    for (auto& r : slots[i]) result.results.push_back(std::move(r));
  }
  result.finished_at = std::chrono::system_clock::now();

  if (result.cancelled) {
    Log(common::log::Level::Warn, "batch " + result.run_id + " " + InterruptDetail(options));
  }
  Log(result.devices_failed.empty() ? common::log::Level::Info : common::log::Level::Warn,
      result.Summary());

  out = std::make_shared<const BatchResult>(std::move(result));

  if (pool_shutdown.load()) {
    err = common::Error(ErrorCode::PoolShutdown, "connection pool shut down during batch",
                        out->run_id);
    return false;
  }
  return true;
}

bool BatchExecutor::RunGroup(const DeviceGroup& group, const BatchOptions& options,
                             Deadline deadline, std::vector<CommandResult>& results,
                             bool& interrupted) {
  const std::uint32_t max_attempts = std::max<std::uint32_t>(1, options.max_attempts);
  results.reserve(group.tasks.size());

  pool::ConnectionPtr conn;
  ConnectionLease lease(*pool_, group.device.name, conn);
  std::optional<common::Error> acquire_failure;
  bool device_failed = false;
  bool shutdown_seen = false;

  for (const auto& base : group.tasks) {
    if (acquire_failure) {
      results.push_back(CommandResult::Failure(base, CommandStatus::Error, acquire_failure->code,
                                               "connection failed: " + acquire_failure->message));
      continue;
    }
    if (Interrupted(options, deadline)) {
      interrupted = true;
      results.push_back(CommandResult::Failure(base, CommandStatus::Error, ErrorCode::Cancelled,
                                               InterruptDetail(options)));
      continue;
    }
    if (options.stop_on_first_failure && device_failed) {
      results.push_back(CommandResult::Failure(base, CommandStatus::Error, ErrorCode::Cancelled,
                                               "skipped after earlier failure on device"));
      continue;
    }
    if (base.preset_error) {
      results.push_back(CommandResult::Failure(base, CommandStatus::Error, base.preset_error->code,
                                               base.preset_error->message));
      device_failed = true;
      continue;
    }
    if (policy_) {
      if (auto pattern = policy_->MatchBlocked(base.command)) {
        results.push_back(CommandResult::Failure(base, CommandStatus::Error,
                                                 ErrorCode::CommandBlocked,
                                                 "command blocked by policy: " + *pattern));
        device_failed = true;
        continue;
      }
    }

    CommandTask task = base;
    std::optional<CommandResult> outcome;
    for (task.attempt = 1; task.attempt <= max_attempts && !outcome; ++task.attempt) {
      // Closed underneath us by Evict/CloseAll.
      if (conn && conn->State() == pool::ConnectionState::Broken) conn.reset();
      if (!conn) {
        common::Error aerr;
        if (!pool_->Acquire(group.device, conn, aerr)) {
          if (aerr.code == ErrorCode::PoolShutdown) shutdown_seen = true;
          Log(common::log::Level::Warn, "device " + group.device.name + ": " + aerr.message);
          acquire_failure = aerr;
          outcome = CommandResult::Failure(task, CommandStatus::Error, aerr.code,
                                           "connection failed: " + aerr.message);
          break;
        }
      }

      const auto start = Clock::now();
      session::ExecOutcome exec = conn->Execute(task.command, task.timeout);
      const auto took = ElapsedSince(start);

      switch (exec.status) {
        case session::ExecStatus::Ok:
          outcome = CommandResult::Success(task, std::move(exec.output), took);
          break;
        case session::ExecStatus::Timeout:
          pool_->Evict(group.device);
          conn.reset();
          outcome = CommandResult::Failure(task, CommandStatus::Timeout, ErrorCode::CommandTimeout,
                                           exec.error, took);
          break;
        case session::ExecStatus::IoError:
          pool_->Evict(group.device);
          conn.reset();
          if (task.attempt < max_attempts) {
            Log(common::log::Level::Debug, "device " + group.device.name + ": retrying '" +
                                               task.command + "' after: " + exec.error);
            continue;
          }
          outcome = CommandResult::Failure(task, CommandStatus::Error, ErrorCode::Connection,
                                           exec.error, took);
          break;
      }
    }

    if (!outcome) {
      task.attempt = max_attempts;
      outcome = CommandResult::Failure(task, CommandStatus::Error, ErrorCode::Connection,
                                       "session returned an unknown status");
    }
    if (!outcome->ok()) {
      device_failed = true;
      Log(common::log::Level::Warn, "device " + group.device.name + " '" + task.command +
                                        "' " + ToString(outcome->status) + ": " +
                                        outcome->error.value_or(""));
    }
    results.push_back(std::move(*outcome));
  }

  return shutdown_seen;
}

void BatchExecutor::Log(common::log::Level level, const std::string& msg) const {
  if (logger_) logger_->Log(level, "batch", msg);
}

}  // namespace netbatch::core::batch
