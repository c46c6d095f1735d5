#include "core/session/session.hpp"

namespace netbatch::core::session {

const char* ToString(ExecStatus status) {
  switch (status) {
    case ExecStatus::Ok:      return "ok";
    case ExecStatus::Timeout: return "timeout";
    case ExecStatus::IoError: return "io_error";
    default:                  return "unknown";
  }
}

}  // namespace netbatch::core::session
