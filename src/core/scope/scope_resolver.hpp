#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/common/error/error.hpp"
#include "core/inventory/inventory.hpp"
#include "core/inventory/model/device_ref.hpp"

namespace netbatch::core::scope {

// Grammar rule that produced a resolution, in precedence order.
enum class ScopeRule : std::uint8_t {
  None = 0,
  All,
  QualifiedAll,
  KeyValue,
  Range,
  List
};

const char* ToString(ScopeRule rule);

struct ScopeResolution {
  std::string expression;
  ScopeRule rule = ScopeRule::None;
  std::vector<inventory::model::DeviceRef> devices;
  // Names from an explicit list that are absent from the inventory.
  std::vector<std::string> unresolved_names;
  std::optional<common::Error> error;

  bool Ok() const { return !error.has_value(); }
  std::vector<std::string> DeviceNames() const;
  std::string ToJson() const;
};

// Pure: depends only on the expression and the inventory snapshot.
ScopeResolution ResolveScope(std::string_view expression, const inventory::Inventory& inventory);

}  // namespace netbatch::core::scope
