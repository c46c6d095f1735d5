#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "core/inventory/model/device_ref.hpp"

namespace netbatch {
namespace core {
namespace session {

enum class ExecStatus : std::uint8_t {
  Ok = 0,
  Timeout,
  // The session is unusable afterwards and must be replaced.
  IoError
};

const char* ToString(ExecStatus status);

struct ExecOutcome {
  ExecStatus status = ExecStatus::Ok;
  std::string output;
  std::string error;

  static ExecOutcome Success(std::string out) { return {ExecStatus::Ok, std::move(out), {}}; }
  static ExecOutcome TimedOut(std::string detail) { return {ExecStatus::Timeout, {}, std::move(detail)}; }
  static ExecOutcome Failed(std::string detail) { return {ExecStatus::IoError, {}, std::move(detail)}; }
};

// One live CLI session to one device. Not safe for concurrent use.
class Session {
public:
  virtual ~Session() = default;

  virtual std::string Name() const = 0;
  virtual bool Open(std::chrono::milliseconds timeout, std::string& err) = 0;
  virtual ExecOutcome Execute(const std::string& command, std::chrono::milliseconds timeout) = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

class SessionFactory {
public:
  virtual ~SessionFactory() = default;

  virtual std::unique_ptr<Session> Create(const inventory::model::DeviceRef& device) = 0;
};

}  // namespace session
}  // namespace core
}  // namespace netbatch
