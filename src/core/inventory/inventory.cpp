#include "core/inventory/inventory.hpp"

#include <utility>

#include "core/common/utils/json_utils.hpp"

namespace netbatch {
namespace core {
namespace inventory {

namespace json = common::json;

bool Inventory::Register(model::DeviceRef device) {
  if (device.name.empty()) return false;
  const auto it = index_by_name_.find(device.name);
  if (it != index_by_name_.end()) {
    devices_[it->second] = std::move(device);
    return true;
  }
  index_by_name_.emplace(device.name, devices_.size());
  devices_.push_back(std::move(device));
  return true;
}

bool Inventory::Has(const std::string& name) const {
  return index_by_name_.find(name) != index_by_name_.end();
}

bool Inventory::Get(const std::string& name, model::DeviceRef& out) const {
  const auto* d = Find(name);
  if (d == nullptr) return false;
  out = *d;
  return true;
}

const model::DeviceRef* Inventory::Find(const std::string& name) const {
  const auto it = index_by_name_.find(name);
  if (it == index_by_name_.end()) return nullptr;
  return &devices_[it->second];
}

std::string Inventory::DeviceToJson(const model::DeviceRef& d) {
  return json::Object({
      {"name", json::Quote(d.name)},
      {"address", json::Quote(d.address)},
      {"platform", json::Quote(d.platform)},
      {"group", json::Quote(d.group)},
      {"role", json::Quote(d.role)},
      {"site", json::Quote(d.site)},
  });
}

std::string Inventory::ToJsonList() const {
  std::vector<std::string> items;
  items.reserve(devices_.size());
  for (const auto& d : devices_) items.push_back(DeviceToJson(d));
  return json::Array(items);
}

}  // namespace inventory
}  // namespace core
}  // namespace netbatch
