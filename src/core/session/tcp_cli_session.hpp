#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"
#include "core/session/session.hpp"

namespace netbatch::core::session {

class TcpCliSession final : public Session {
public:
  struct Options {
    std::uint16_t default_port = 23;
    std::vector<std::string> prompt_suffixes{"#", ">"};
    std::string line_ending = "\n";
    int poll_interval_ms = 10;
  };

  TcpCliSession(inventory::model::DeviceRef device, Options opt,
                std::shared_ptr<common::log::Logger> logger);
  ~TcpCliSession() override;

  TcpCliSession(const TcpCliSession&) = delete;
  TcpCliSession& operator=(const TcpCliSession&) = delete;

  std::string Name() const override;
  bool Open(std::chrono::milliseconds timeout, std::string& err) override;
  ExecOutcome Execute(const std::string& command, std::chrono::milliseconds timeout) override;
  void Close() override;
  bool IsOpen() const override;

  // Exposed for tests: true when the last line of buf is a CLI prompt.
  static bool EndsWithPrompt(const std::string& buf, const std::vector<std::string>& suffixes);
  // Drops CRs, the echoed command line and the trailing prompt line.
  static std::string CleanOutput(const std::string& raw, const std::string& command);

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data);
  void HandleEvent(struct mg_connection* c, int ev, void* ev_data);

  bool PollUntil(std::chrono::steady_clock::time_point deadline, const std::function<bool()>& done);

private:
  inventory::model::DeviceRef device_;
  Options opt_;
  std::shared_ptr<common::log::Logger> logger_;

  struct mg_mgr mgr_{};
  bool mgr_ready_ = false;
  struct mg_connection* conn_ = nullptr;
  bool connected_ = false;
  bool closed_ = false;
  std::string last_error_;
  std::string rx_;
};

class TcpCliSessionFactory final : public SessionFactory {
public:
  TcpCliSessionFactory(TcpCliSession::Options opt, std::shared_ptr<common::log::Logger> logger)
      : opt_(std::move(opt)), logger_(std::move(logger)) {}

  std::unique_ptr<Session> Create(const inventory::model::DeviceRef& device) override {
    return std::make_unique<TcpCliSession>(device, opt_, logger_);
  }

private:
  TcpCliSession::Options opt_;
  std::shared_ptr<common::log::Logger> logger_;
};

}  // namespace netbatch::core::session
