#include "core/common/config/config_manager.hpp"

#include <exception>
#include <fstream>
#include <iterator>
#include <utility>

#include "core/common/utils/string_utils.hpp"

namespace netbatch {
namespace core {
namespace common {
namespace config {

namespace {

std::string ToStdString(c4::csubstr s) { return std::string(s.str, s.len); }

}  // namespace

bool ConfigManager::LoadYamlFile(const std::string& file_path) {
  data_.clear();
  return LoadYamlFileMerge(file_path);
}

bool ConfigManager::LoadYamlFileMerge(const std::string& file_path) {
  std::ifstream file(file_path, std::ios::in | std::ios::binary);
  if (!file) {
    last_error_ = "cannot open " + file_path;
    return false;
  }
  std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (contents.empty()) {
    last_error_ = "empty config file " + file_path;
    return false;
  }
  return MergeYaml(std::move(contents), file_path);
}

bool ConfigManager::LoadYamlString(std::string_view yaml) {
  data_.clear();
  return MergeYaml(std::string(yaml), "<string>");
}

bool ConfigManager::MergeYaml(std::string contents, const std::string& origin) {
  try {
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(contents));
    const ryml::ConstNodeRef root = tree.rootref();
    if (!root.valid()) {
      last_error_ = "no document in " + origin;
      return false;
    }
    FlattenYaml(root, std::string());
  } catch (const std::exception& e) {
    last_error_ = origin + ": " + e.what();
    return false;
  }
  last_error_.clear();
  return true;
}

bool ConfigManager::GetString(const std::string& key, std::string& out) const {
  const auto it = data_.find(key);
  if (it == data_.end()) return false;
  out = it->second;
  return true;
}

std::string ConfigManager::GetStringOr(const std::string& key, std::string default_value) const {
  std::string out;
  if (GetString(key, out)) return out;
  return default_value;
}

bool ConfigManager::GetInt64(const std::string& key, std::int64_t& out) const {
  std::string s;
  if (!GetString(key, s)) return false;
  return str::ParseInt64(s, out);
}

std::int64_t ConfigManager::GetInt64Or(const std::string& key, std::int64_t default_value) const {
  std::int64_t out = 0;
  if (GetInt64(key, out)) return out;
  return default_value;
}

bool ConfigManager::GetBool(const std::string& key, bool& out) const {
  std::string s;
  if (!GetString(key, s)) return false;
  return ParseBool(s, out);
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) const {
  bool out = false;
  if (GetBool(key, out)) return out;
  return default_value;
}

std::vector<std::string> ConfigManager::GetStringList(const std::string& key) const {
  std::vector<std::string> out;
  for (std::size_t i = 0;; ++i) {
    const auto it = data_.find(key + "[" + std::to_string(i) + "]");
    if (it == data_.end()) break;
    out.push_back(it->second);
  }
  return out;
}

bool ConfigManager::ParseBool(const std::string& s, bool& out) {
  const std::string t = str::ToLower(str::Trim(s));
  if (t == "1" || t == "true" || t == "yes" || t == "on") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "no" || t == "off") {
    out = false;
    return true;
  }
  return false;
}

void ConfigManager::FlattenYaml(const ryml::ConstNodeRef& node, const std::string& prefix) {
  if (!node.valid()) return;

  if (node.has_val()) {
    if (!prefix.empty()) data_[prefix] = ToStdString(node.val());
    return;
  }

  if (node.is_map()) {
    for (ryml::ConstNodeRef child : node.children()) {
      if (!child.has_key()) continue;
      const std::string ks = ToStdString(child.key());
      const std::string next = prefix.empty() ? ks : (prefix + "." + ks);
      FlattenYaml(child, next);
    }
    return;
  }

  if (node.is_seq()) {
    std::size_t i = 0;
    for (ryml::ConstNodeRef child : node.children()) {
      FlattenYaml(child, prefix + "[" + std::to_string(i) + "]");
      ++i;
    }
  }
}

}  // namespace config
}  // namespace common
}  // namespace core
}  // namespace netbatch
