#include "core/inventory/inventory.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/string_utils.hpp"

namespace netbatch {
namespace core {
namespace inventory {

namespace {

using Attrs = std::unordered_map<std::string, std::string>;

std::string ToStdString(c4::csubstr s) { return std::string(s.str, s.len); }

std::string ScalarOf(const ryml::ConstNodeRef& node) {
  if (!node.has_val()) return {};
  std::string v = ToStdString(node.val());
  if (v == "~" || v == "null") return {};
  return v;
}

std::optional<ryml::ConstNodeRef> FindChild(const ryml::ConstNodeRef& node, std::string_view key) {
  if (!node.valid() || !node.is_map()) return std::nullopt;
  for (ryml::ConstNodeRef child : node.children()) {
    if (child.has_key() && ToStdString(child.key()) == key) return child;
  }
  return std::nullopt;
}

// Scalars at this level plus those under "data:"; "groups:" contributes its first entry.
void ReadAttrs(const ryml::ConstNodeRef& node, Attrs& out) {
  if (!node.valid() || !node.is_map()) return;
  for (ryml::ConstNodeRef child : node.children()) {
    if (!child.has_key()) continue;
    const std::string key = ToStdString(child.key());
    if (child.has_val()) {
      const std::string v = ScalarOf(child);
      if (!v.empty()) out[key] = v;
    } else if (key == "data" && child.is_map()) {
      ReadAttrs(child, out);
    } else if (key == "groups" && child.is_seq()) {
      for (ryml::ConstNodeRef g : child.children()) {
        const std::string v = ScalarOf(g);
        if (!v.empty()) {
          out["groups"] = v;
          break;
        }
      }
    }
  }
}

void Overlay(Attrs& base, const Attrs& top) {
  for (const auto& kv : top) base[kv.first] = kv.second;
}

std::string Pick(const Attrs& a, const char* key) {
  const auto it = a.find(key);
  return it == a.end() ? std::string() : it->second;
}

model::DeviceRef BuildDevice(const std::string& name, const Attrs& attrs) {
  model::DeviceRef d;
  d.name = name;

  std::string host = Pick(attrs, "hostname");
  if (host.empty()) host = Pick(attrs, "address");
  if (host.empty()) host = name;
  d.address = host;
  std::int64_t port = 0;
  if (common::str::ParseInt64(Pick(attrs, "port"), port) &&
      common::net::IsValidPort(static_cast<std::uint32_t>(port))) {
    d.address = common::net::JoinHostPort(host, static_cast<std::uint16_t>(port));
  }

  d.platform = Pick(attrs, "platform");
  d.group = Pick(attrs, "group");
  if (d.group.empty()) d.group = Pick(attrs, "groups");
  d.role = Pick(attrs, "role");
  d.site = Pick(attrs, "site");
  return d;
}

}  // namespace

bool ParseInventoryYaml(const std::string& yaml, Inventory& out, common::Error& err) {
  std::string contents = yaml;
  try {
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(contents));
    const ryml::ConstNodeRef root = tree.rootref();
    if (!root.valid() || !root.is_map()) {
      err = common::Error(common::ErrorCode::Config, "inventory root must be a map");
      return false;
    }

    const auto hosts = FindChild(root, "hosts");
    if (!hosts || !hosts->is_map()) {
      err = common::Error(common::ErrorCode::Config, "inventory has no 'hosts' map");
      return false;
    }

    Attrs defaults;
    if (const auto d = FindChild(root, "defaults")) ReadAttrs(*d, defaults);

    std::unordered_map<std::string, Attrs> groups;
    if (const auto g = FindChild(root, "groups")) {
      if (g->is_map()) {
        for (ryml::ConstNodeRef child : g->children()) {
          if (!child.has_key()) continue;
          Attrs ga;
          ReadAttrs(child, ga);
          groups[ToStdString(child.key())] = std::move(ga);
        }
      }
    }

    Inventory inv;
    for (ryml::ConstNodeRef host : hosts->children()) {
      if (!host.has_key()) continue;
      const std::string name = ToStdString(host.key());

      Attrs own;
      ReadAttrs(host, own);

      Attrs merged = defaults;
      std::string group = Pick(own, "group");
      if (group.empty()) group = Pick(own, "groups");
      if (group.empty()) group = Pick(defaults, "group");
      const auto git = groups.find(group);
      if (git != groups.end()) Overlay(merged, git->second);
      Overlay(merged, own);
      if (!group.empty()) merged["group"] = group;

      if (!inv.Register(BuildDevice(name, merged))) {
        err = common::Error(common::ErrorCode::Config, "invalid host entry", name);
        return false;
      }
    }
    out = std::move(inv);
  } catch (const std::exception& e) {
    err = common::Error(common::ErrorCode::Config, std::string("inventory parse error: ") + e.what());
    return false;
  }
  return true;
}

bool LoadInventoryYaml(const std::string& file_path, Inventory& out, common::Error& err) {
  std::ifstream file(file_path, std::ios::in | std::ios::binary);
  if (!file) {
    err = common::Error(common::ErrorCode::Config, "cannot open inventory file", file_path);
    return false;
  }
  const std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (!ParseInventoryYaml(contents, out, err)) {
    if (err.subject.empty()) err.subject = file_path;
    return false;
  }
  return true;
}

}  // namespace inventory
}  // namespace core
}  // namespace netbatch
