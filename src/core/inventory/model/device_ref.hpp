#pragma once

#include <string>

namespace netbatch {
namespace core {
namespace inventory {
namespace model {

// Identity plus the attributes used for scope matching and dispatch.
struct DeviceRef {
  std::string name;
  // "host" or "host:port"; the session layer applies its default port.
  std::string address;
  std::string platform;
  std::string group;
  std::string role;
  std::string site;
};

inline bool operator==(const DeviceRef& a, const DeviceRef& b) {
  return a.name == b.name && a.address == b.address && a.platform == b.platform &&
         a.group == b.group && a.role == b.role && a.site == b.site;
}

inline bool operator!=(const DeviceRef& a, const DeviceRef& b) { return !(a == b); }

}  // namespace model
}  // namespace inventory
}  // namespace core
}  // namespace netbatch
