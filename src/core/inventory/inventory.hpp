#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/common/error/error.hpp"
#include "core/inventory/model/device_ref.hpp"

namespace netbatch {
namespace core {
namespace inventory {

// Read-only device catalogue. Iteration order is registration order.
class Inventory {
public:
  // Rejects empty names. Re-registering a name replaces its attributes in place.
  bool Register(model::DeviceRef device);

  bool Has(const std::string& name) const;
  bool Get(const std::string& name, model::DeviceRef& out) const;
  const model::DeviceRef* Find(const std::string& name) const;

  const std::vector<model::DeviceRef>& List() const { return devices_; }
  std::size_t Size() const { return devices_.size(); }
  bool Empty() const { return devices_.empty(); }

  std::string ToJsonList() const;
  static std::string DeviceToJson(const model::DeviceRef& d);

private:
  std::vector<model::DeviceRef> devices_;
  std::unordered_map<std::string, std::size_t> index_by_name_;
};

// Nornir-style hosts file with optional "defaults:" and "groups:" sections.
bool LoadInventoryYaml(const std::string& file_path, Inventory& out, common::Error& err);
bool ParseInventoryYaml(const std::string& yaml, Inventory& out, common::Error& err);

}  // namespace inventory
}  // namespace core
}  // namespace netbatch
