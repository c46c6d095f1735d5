#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace netbatch::core::common {

enum class ErrorCode : std::uint8_t {
  None = 0,
  ScopeParse,
  DeviceNotFound,
  Connection,
  CommandTimeout,
  Cancelled,
  PoolShutdown,
  NoDevices,
  CommandBlocked,
  InvalidArgument,
  Io,
  Config,
  NotFound
};

const char* ToString(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  // Offending expression, device name or path.
  std::string subject;

  Error() = default;
  Error(ErrorCode c, std::string msg, std::string subj = std::string())
      : code(c), message(std::move(msg)), subject(std::move(subj)) {}

  explicit operator bool() const { return code != ErrorCode::None; }

  std::string ToString() const;
};

}  // namespace netbatch::core::common
