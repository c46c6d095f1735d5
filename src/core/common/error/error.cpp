#include "core/common/error/error.hpp"

namespace netbatch::core::common {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:            return "none";
    case ErrorCode::ScopeParse:      return "scope_parse";
    case ErrorCode::DeviceNotFound:  return "device_not_found";
    case ErrorCode::Connection:      return "connection";
    case ErrorCode::CommandTimeout:  return "command_timeout";
    case ErrorCode::Cancelled:       return "cancelled";
    case ErrorCode::PoolShutdown:    return "pool_shutdown";
    case ErrorCode::NoDevices:       return "no_devices";
    case ErrorCode::CommandBlocked:  return "command_blocked";
    case ErrorCode::InvalidArgument: return "invalid_argument";
    case ErrorCode::Io:              return "io";
    case ErrorCode::Config:          return "config";
    case ErrorCode::NotFound:        return "not_found";
    default:                         return "unknown";
  }
}

std::string Error::ToString() const {
  std::string out = common::ToString(code);
  if (!message.empty()) out += ": " + message;
  if (!subject.empty()) out += " [" + subject + "]";
  return out;
}

}  // namespace netbatch::core::common
