#include "core/command/command_policy.hpp"

#include <fstream>

#include "core/common/utils/string_utils.hpp"

namespace netbatch::core::command {

namespace str = common::str;

void CommandPolicy::AddPattern(std::string_view pattern) {
  const std::string p = str::ToLower(str::Trim(pattern));
  if (p.empty() || p == "*") return;
  patterns_.push_back(p);
}

std::optional<std::string> CommandPolicy::MatchBlocked(std::string_view command) const {
  const std::string cmd = str::ToLower(str::Trim(command));
  for (const auto& p : patterns_) {
    if (p.back() == '*') {
      if (str::StartsWith(cmd, std::string_view(p).substr(0, p.size() - 1))) return p;
    } else if (cmd == p) {
      return p;
    }
  }
  return std::nullopt;
}

bool CommandPolicy::LoadFile(const std::string& file_path, common::Error& err) {
  std::ifstream ifs(file_path);
  if (!ifs) {
    err = common::Error(common::ErrorCode::Config, "cannot open command blacklist", file_path);
    return false;
  }
  std::string line;
  while (std::getline(ifs, line)) {
    const auto t = str::Trim(line);
    if (t.empty() || t.front() == '#') continue;
    AddPattern(t);
  }
  return true;
}

}  // namespace netbatch::core::command
