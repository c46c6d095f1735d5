#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/inventory/model/device_ref.hpp"
#include "core/session/session.hpp"

namespace netbatch::core::pool {

enum class ConnectionState : std::uint8_t {
  Idle = 0,
  Busy,
  Broken
};

const char* ToString(ConnectionState state);

// A pooled session to one device. Owned by the pool, lent out by Acquire.
class Connection {
public:
  Connection(std::string device_name, std::unique_ptr<session::Session> session);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  const std::string& DeviceName() const { return device_name_; }
  std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }
  std::chrono::system_clock::time_point LastUsed() const;
  ConnectionState State() const { return state_.load(std::memory_order_acquire); }
  std::uint64_t UseCount() const { return use_count_.load(std::memory_order_relaxed); }

  session::ExecOutcome Execute(const std::string& command, std::chrono::milliseconds timeout);

private:
  friend class ConnectionPool;

  void SetState(ConnectionState s) { state_.store(s, std::memory_order_release); }
  void Touch();

private:
  std::string device_name_;
  std::unique_ptr<session::Session> session_;
  std::chrono::system_clock::time_point created_at_;
  std::atomic<std::int64_t> last_used_ms_{0};
  std::atomic<ConnectionState> state_{ConnectionState::Busy};
  std::atomic<std::uint64_t> use_count_{0};
};

using ConnectionPtr = std::shared_ptr<Connection>;

struct PoolOptions {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds acquire_timeout{60000};
  // Idle connections older than this are closed instead of reused. Zero disables.
  std::chrono::milliseconds idle_eviction_age{300000};
};

struct PoolStats {
  std::size_t connections = 0;
  std::size_t idle = 0;
  std::size_t busy = 0;
  std::uint64_t created = 0;
  std::uint64_t creation_failures = 0;
  std::uint64_t reused = 0;
  std::uint64_t evicted = 0;
};

// One connection per device. Creation failures are not cached.
class ConnectionPool {
public:
  ConnectionPool(PoolOptions opt, std::shared_ptr<session::SessionFactory> factory,
                 std::shared_ptr<common::log::Logger> logger = nullptr);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  bool Acquire(const inventory::model::DeviceRef& device, ConnectionPtr& out, common::Error& err);
  void Release(const ConnectionPtr& conn);

  void Evict(const inventory::model::DeviceRef& device);
  void Evict(const std::string& device_name);

  // Closes idle connections older than idle_eviction_age. Returns how many.
  std::size_t EvictIdle();

  void CloseAll();
  bool IsShutdown() const;

  PoolStats Stats() const;
  const PoolOptions& Options() const { return opt_; }

private:
  struct Slot {
    ConnectionPtr conn;
    bool creating = false;
  };

  bool IsStale(const Connection& c, std::chrono::system_clock::time_point now) const;
  void LogInfo(const std::string& msg) const;
  void LogWarn(const std::string& msg) const;

private:
  PoolOptions opt_;
  std::shared_ptr<session::SessionFactory> factory_;
  std::shared_ptr<common::log::Logger> logger_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Slot> slots_;
  bool shutdown_ = false;
  PoolStats counters_;
};

}  // namespace netbatch::core::pool
