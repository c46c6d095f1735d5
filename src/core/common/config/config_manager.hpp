#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ryml.hpp>
#include <ryml_std.hpp>

namespace netbatch {
namespace core {
namespace common {
namespace config {

// Flattened view of a YAML document: nested maps become dotted keys
// ("pool.idle_eviction_sec"), sequence items become "key[i]".
class ConfigManager {
public:
  using Map = std::unordered_map<std::string, std::string>;

  bool LoadYamlFile(const std::string& file_path);
  bool LoadYamlFileMerge(const std::string& file_path);
  bool LoadYamlString(std::string_view yaml);

  void Set(const std::string& key, std::string value) { data_[key] = std::move(value); }

  bool Has(const std::string& key) const { return data_.find(key) != data_.end(); }

  bool GetString(const std::string& key, std::string& out) const;
  std::string GetStringOr(const std::string& key, std::string default_value) const;

  bool GetInt64(const std::string& key, std::int64_t& out) const;
  std::int64_t GetInt64Or(const std::string& key, std::int64_t default_value) const;

  bool GetBool(const std::string& key, bool& out) const;
  bool GetBoolOr(const std::string& key, bool default_value) const;

  // Collects key[0], key[1], ... until the first gap.
  std::vector<std::string> GetStringList(const std::string& key) const;

  const Map& Data() const { return data_; }
  const std::string& LastError() const { return last_error_; }

private:
  bool MergeYaml(std::string contents, const std::string& origin);
  void FlattenYaml(const ryml::ConstNodeRef& node, const std::string& prefix);

  static bool ParseBool(const std::string& s, bool& out);

private:
  Map data_;
  std::string last_error_;
};

std::vector<std::string> ValidateRequiredKeys(const ConfigManager& cfg,
                                              const std::vector<std::string>& required_keys);

}  // namespace config
}  // namespace common
}  // namespace core
}  // namespace netbatch
