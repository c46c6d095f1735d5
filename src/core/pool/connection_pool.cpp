#include "core/pool/connection_pool.hpp"

#include <utility>
#include <vector>

#include "core/common/utils/time_utils.hpp"

namespace netbatch::core::pool {

namespace ntime = common::time;

const char* ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Idle:   return "idle";
    case ConnectionState::Busy:   return "busy";
    case ConnectionState::Broken: return "broken";
    default:                      return "unknown";
  }
}

Connection::Connection(std::string device_name, std::unique_ptr<session::Session> session)
    : device_name_(std::move(device_name)),
      session_(std::move(session)),
      created_at_(std::chrono::system_clock::now()) {
  last_used_ms_.store(ntime::ToUnixMs(created_at_), std::memory_order_relaxed);
}

Connection::~Connection() {
  if (session_) session_->Close();
}

std::chrono::system_clock::time_point Connection::LastUsed() const {
  return std::chrono::system_clock::time_point(
      std::chrono::milliseconds(last_used_ms_.load(std::memory_order_relaxed)));
}

void Connection::Touch() {
  last_used_ms_.store(ntime::NowUnixMs(), std::memory_order_relaxed);
}

session::ExecOutcome Connection::Execute(const std::string& command,
                                         std::chrono::milliseconds timeout) {
  if (!session_ || State() == ConnectionState::Broken) {
    return session::ExecOutcome::Failed("connection is broken");
  }
  use_count_.fetch_add(1, std::memory_order_relaxed);
  auto outcome = session_->Execute(command, timeout);
  Touch();
  if (outcome.status == session::ExecStatus::IoError) SetState(ConnectionState::Broken);
  return outcome;
}

ConnectionPool::ConnectionPool(PoolOptions opt, std::shared_ptr<session::SessionFactory> factory,
                               std::shared_ptr<common::log::Logger> logger)
    : opt_(opt), factory_(std::move(factory)), logger_(std::move(logger)) {}

ConnectionPool::~ConnectionPool() { CloseAll(); }

bool ConnectionPool::IsStale(const Connection& c, std::chrono::system_clock::time_point now) const {
  if (opt_.idle_eviction_age.count() <= 0) return false;
  return now - c.LastUsed() >= opt_.idle_eviction_age;
}

bool ConnectionPool::Acquire(const inventory::model::DeviceRef& device, ConnectionPtr& out,
                             common::Error& err) {
  const auto deadline = std::chrono::steady_clock::now() + opt_.acquire_timeout;
  std::vector<ConnectionPtr> dropped;

  std::unique_lock<std::mutex> lk(mu_);
  while (true) {
    if (shutdown_) {
      err = common::Error(common::ErrorCode::PoolShutdown, "connection pool is shut down", device.name);
      return false;
    }

    Slot& slot = slots_[device.name];

    if (slot.conn && !slot.creating) {
      const auto state = slot.conn->State();
      if (state == ConnectionState::Broken ||
          (state == ConnectionState::Idle && IsStale(*slot.conn, std::chrono::system_clock::now()))) {
        slot.conn->SetState(ConnectionState::Broken);
        dropped.push_back(std::move(slot.conn));
        slot.conn.reset();
        ++counters_.evicted;
      } else if (state == ConnectionState::Idle) {
        slot.conn->SetState(ConnectionState::Busy);
        slot.conn->Touch();
        ++counters_.reused;
        out = slot.conn;
        return true;
      }
    }

    if (slot.creating || slot.conn) {
      // Another caller is creating or using this device's connection.
      if (cv_.wait_until(lk, deadline) == std::cv_status::timeout) {
        err = common::Error(common::ErrorCode::Connection,
                            "timed out waiting for connection", device.name);
        return false;
      }
      continue;
    }

    slot.creating = true;
    lk.unlock();
    dropped.clear();

    std::string open_err;
    std::unique_ptr<session::Session> session = factory_ ? factory_->Create(device) : nullptr;
    bool opened = false;
    if (!session) {
      open_err = "no session driver for device";
    } else {
      opened = session->Open(opt_.connect_timeout, open_err);
    }

    lk.lock();
    Slot& fresh = slots_[device.name];
    fresh.creating = false;
    cv_.notify_all();

    if (!opened) {
      ++counters_.creation_failures;
      lk.unlock();
      session.reset();
      err = common::Error(common::ErrorCode::Connection,
                          open_err.empty() ? "session open failed" : open_err, device.name);
      LogWarn("session to " + device.name + " failed: " + err.message);
      return false;
    }

    if (shutdown_) {
      lk.unlock();
      session->Close();
      err = common::Error(common::ErrorCode::PoolShutdown, "connection pool is shut down", device.name);
      return false;
    }

    fresh.conn = std::make_shared<Connection>(device.name, std::move(session));
    ++counters_.created;
    out = fresh.conn;
    lk.unlock();
    LogInfo("session opened: " + device.name);
    return true;
  }
}

void ConnectionPool::Release(const ConnectionPtr& conn) {
  if (!conn) return;
  ConnectionPtr dropped;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = slots_.find(conn->DeviceName());
    const bool tracked = it != slots_.end() && it->second.conn == conn;
    if (!tracked || conn->State() == ConnectionState::Broken) {
      conn->SetState(ConnectionState::Broken);
      if (tracked) {
        dropped = std::move(it->second.conn);
        it->second.conn.reset();
        ++counters_.evicted;
      }
    } else {
      conn->SetState(ConnectionState::Idle);
      conn->Touch();
    }
  }
  cv_.notify_all();
}

void ConnectionPool::Evict(const inventory::model::DeviceRef& device) { Evict(device.name); }

void ConnectionPool::Evict(const std::string& device_name) {
  ConnectionPtr dropped;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = slots_.find(device_name);
    if (it == slots_.end() || !it->second.conn) return;
    it->second.conn->SetState(ConnectionState::Broken);
    dropped = std::move(it->second.conn);
    it->second.conn.reset();
    ++counters_.evicted;
  }
  cv_.notify_all();
  LogInfo("session evicted: " + device_name);
}

std::size_t ConnectionPool::EvictIdle() {
  std::vector<ConnectionPtr> dropped;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = std::chrono::system_clock::now();
    for (auto& kv : slots_) {
      auto& c = kv.second.conn;
      if (c && c->State() == ConnectionState::Idle && IsStale(*c, now)) {
        c->SetState(ConnectionState::Broken);
        dropped.push_back(std::move(c));
        c.reset();
        ++counters_.evicted;
      }
    }
  }
  if (!dropped.empty()) {
    cv_.notify_all();
    LogInfo("closed " + std::to_string(dropped.size()) + " idle session(s)");
  }
  return dropped.size();
}

void ConnectionPool::CloseAll() {
  std::vector<ConnectionPtr> dropped;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (shutdown_ && slots_.empty()) return;
    shutdown_ = true;
    for (auto& kv : slots_) {
      if (kv.second.conn) {
        kv.second.conn->SetState(ConnectionState::Broken);
        dropped.push_back(std::move(kv.second.conn));
      }
    }
    slots_.clear();
  }
  cv_.notify_all();
  if (!dropped.empty()) LogInfo("closing " + std::to_string(dropped.size()) + " session(s)");
}

bool ConnectionPool::IsShutdown() const {
  std::lock_guard<std::mutex> lk(mu_);
  return shutdown_;
}

PoolStats ConnectionPool::Stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  PoolStats s = counters_;
  s.connections = 0;
  s.idle = 0;
  s.busy = 0;
  for (const auto& kv : slots_) {
    if (!kv.second.conn) continue;
    ++s.connections;
    if (kv.second.conn->State() == ConnectionState::Idle) ++s.idle;
    if (kv.second.conn->State() == ConnectionState::Busy) ++s.busy;
  }
  return s;
}

void ConnectionPool::LogInfo(const std::string& msg) const {
  if (logger_) logger_->Log(common::log::Level::Info, "pool", msg);
}

void ConnectionPool::LogWarn(const std::string& msg) const {
  if (logger_) logger_->Log(common::log::Level::Warn, "pool", msg);
}

}  // namespace netbatch::core::pool
