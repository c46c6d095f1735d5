#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/common/error/error.hpp"

namespace netbatch::core::command {

// Blacklist of commands that must never reach a device. Patterns are matched
// case-insensitively against the trimmed command; a trailing '*' makes the
// pattern a prefix match ("reload*", "configure terminal").
class CommandPolicy {
public:
  void AddPattern(std::string_view pattern);

  // The first matching pattern, if the command is blocked.
  std::optional<std::string> MatchBlocked(std::string_view command) const;

  bool Empty() const { return patterns_.empty(); }
  std::size_t Size() const { return patterns_.size(); }

  // One pattern per line; blank lines and '#' comments are skipped.
  bool LoadFile(const std::string& file_path, common::Error& err);

private:
  std::vector<std::string> patterns_;
};

}  // namespace netbatch::core::command
