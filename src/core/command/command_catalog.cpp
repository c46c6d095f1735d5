#include "core/command/command_catalog.hpp"

#include "core/common/config/config_manager.hpp"
#include "core/common/utils/string_utils.hpp"

namespace netbatch::core::command {

namespace str = common::str;

void CommandCatalog::Add(std::string_view intent, std::string_view platform, std::string command) {
  table_[Key(str::ToLower(str::Trim(intent)), str::ToLower(str::Trim(platform)))] = std::move(command);
}

std::optional<std::string> CommandCatalog::Lookup(std::string_view intent,
                                                  std::string_view platform) const {
  const std::string i = str::ToLower(str::Trim(intent));
  auto it = table_.find(Key(i, str::ToLower(str::Trim(platform))));
  if (it != table_.end()) return it->second;
  it = table_.find(Key(i, kDefaultPlatform));
  if (it != table_.end()) return it->second;
  return std::nullopt;
}

std::vector<std::string> CommandCatalog::Intents() const {
  std::vector<std::string> out;
  for (const auto& kv : table_) {
    if (out.empty() || out.back() != kv.first.first) out.push_back(kv.first.first);
  }
  return out;
}

namespace {

bool FromConfig(const common::config::ConfigManager& cfg, CommandCatalog& out) {
  const std::string prefix = "intents.";
  for (const auto& kv : cfg.Data()) {
    if (!str::StartsWith(kv.first, prefix)) continue;
    const std::string_view rest = std::string_view(kv.first).substr(prefix.size());
    const auto dot = rest.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= rest.size()) continue;
    const auto command = str::Trim(kv.second);
    if (command.empty()) continue;
    out.Add(rest.substr(0, dot), rest.substr(dot + 1), std::string(command));
  }
  return out.Size() > 0;
}

}  // namespace

bool CommandCatalog::LoadYamlFile(const std::string& file_path, common::Error& err) {
  common::config::ConfigManager cfg;
  if (!cfg.LoadYamlFile(file_path)) {
    err = common::Error(common::ErrorCode::Config, cfg.LastError(), file_path);
    return false;
  }
  CommandCatalog loaded;
  if (!FromConfig(cfg, loaded)) {
    err = common::Error(common::ErrorCode::Config, "no intents defined", file_path);
    return false;
  }
  *this = std::move(loaded);
  return true;
}

bool CommandCatalog::LoadYamlString(std::string_view yaml, common::Error& err) {
  common::config::ConfigManager cfg;
  if (!cfg.LoadYamlString(yaml)) {
    err = common::Error(common::ErrorCode::Config, cfg.LastError());
    return false;
  }
  CommandCatalog loaded;
  if (!FromConfig(cfg, loaded)) {
    err = common::Error(common::ErrorCode::Config, "no intents defined");
    return false;
  }
  *this = std::move(loaded);
  return true;
}

CommandCatalog CommandCatalog::Builtin() {
  CommandCatalog c;
  c.Add("version", "cisco_ios", "show version");
  c.Add("version", "cisco_nxos", "show version");
  c.Add("version", "arista_eos", "show version");
  c.Add("version", "juniper_junos", "show version");
  c.Add("version", "huawei_vrp", "display version");

  c.Add("interface", "cisco_ios", "show ip interface brief");
  c.Add("interface", "cisco_nxos", "show interface brief");
  c.Add("interface", "arista_eos", "show ip interface brief");
  c.Add("interface", "juniper_junos", "show interfaces terse");
  c.Add("interface", "huawei_vrp", "display ip interface brief");

  c.Add("bgp", "cisco_ios", "show ip bgp summary");
  c.Add("bgp", "cisco_nxos", "show bgp ipv4 unicast summary");
  c.Add("bgp", "arista_eos", "show ip bgp summary");
  c.Add("bgp", "juniper_junos", "show bgp summary");
  c.Add("bgp", "huawei_vrp", "display bgp peer");

  c.Add("ospf", "cisco_ios", "show ip ospf neighbor");
  c.Add("ospf", "arista_eos", "show ip ospf neighbor");
  c.Add("ospf", "juniper_junos", "show ospf neighbor");
  c.Add("ospf", "huawei_vrp", "display ospf peer brief");

  c.Add("route", "cisco_ios", "show ip route");
  c.Add("route", "arista_eos", "show ip route");
  c.Add("route", "juniper_junos", "show route");
  c.Add("route", "huawei_vrp", "display ip routing-table");

  c.Add("arp", "cisco_ios", "show ip arp");
  c.Add("arp", "juniper_junos", "show arp no-resolve");
  c.Add("arp", "huawei_vrp", "display arp");

  c.Add("mac", "cisco_ios", "show mac address-table");
  c.Add("mac", "juniper_junos", "show ethernet-switching table");
  c.Add("mac", "huawei_vrp", "display mac-address");

  c.Add("vlan", "cisco_ios", "show vlan brief");
  c.Add("vlan", "huawei_vrp", "display vlan");

  c.Add("config", "cisco_ios", "show running-config");
  c.Add("config", "arista_eos", "show running-config");
  c.Add("config", "juniper_junos", "show configuration");
  c.Add("config", "huawei_vrp", "display current-configuration");
  return c;
}

}  // namespace netbatch::core::command
