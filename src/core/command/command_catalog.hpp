#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/common/error/error.hpp"

namespace netbatch::core::command {

// Maps (intent, platform) to a concrete CLI command. Consumed by the batch
// executor, owned by whoever configures the engine.
class CommandResolver {
public:
  virtual ~CommandResolver() = default;

  virtual std::optional<std::string> Lookup(std::string_view intent,
                                            std::string_view platform) const = 0;
};

class CommandCatalog final : public CommandResolver {
public:
  // Entries under this platform apply to any platform without its own entry.
  static constexpr const char* kDefaultPlatform = "default";

  void Add(std::string_view intent, std::string_view platform, std::string command);

  std::optional<std::string> Lookup(std::string_view intent,
                                    std::string_view platform) const override;

  std::vector<std::string> Intents() const;
  std::size_t Size() const { return table_.size(); }

  // YAML: intents: { <intent>: { <platform>: <command> } }
  bool LoadYamlFile(const std::string& file_path, common::Error& err);
  bool LoadYamlString(std::string_view yaml, common::Error& err);

  // Read-only show commands for the common platforms.
  static CommandCatalog Builtin();

private:
  using Key = std::pair<std::string, std::string>;
  std::map<Key, std::string> table_;
};

}  // namespace netbatch::core::command
