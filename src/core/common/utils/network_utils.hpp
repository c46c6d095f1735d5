#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netbatch::core::common::net {

struct Endpoint {
  std::string host;
  std::uint16_t port{};
};

inline bool IsValidPort(std::uint32_t port) {
  return port >= 1 && port <= 65535;
}

inline std::string JoinHostPort(std::string_view host, std::uint16_t port) {
  if (host.find(':') != std::string_view::npos) {
    return "[" + std::string(host) + "]:" + std::to_string(port);
  }
  return std::string(host) + ":" + std::to_string(port);
}

// Accepts "host", "host:port", "[v6]" and "[v6]:port". A bare host takes default_port.
inline std::optional<Endpoint> ParseHostPort(std::string_view s, std::uint16_t default_port) {
  if (s.empty()) return std::nullopt;

  Endpoint ep;
  std::string_view port_part;

  if (s.front() == '[') {
    const auto close = s.find(']');
    if (close == std::string_view::npos || close == 1) return std::nullopt;
    ep.host = std::string(s.substr(1, close - 1));
    const auto rest = s.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':' || rest.size() == 1) return std::nullopt;
      port_part = rest.substr(1);
    }
  } else {
    const auto pos = s.rfind(':');
    if (pos == std::string_view::npos || s.find(':') != pos) {
      // No port, or an unbracketed IPv6 literal.
      ep.host = std::string(s);
    } else {
      if (pos == 0 || pos + 1 >= s.size()) return std::nullopt;
      ep.host = std::string(s.substr(0, pos));
      port_part = s.substr(pos + 1);
    }
  }

  if (port_part.empty()) {
    if (!IsValidPort(default_port)) return std::nullopt;
    ep.port = default_port;
    return ep;
  }

  std::uint32_t port = 0;
  for (const char c : port_part) {
    if (c < '0' || c > '9') return std::nullopt;
    port = port * 10 + static_cast<std::uint32_t>(c - '0');
    if (port > 65535) return std::nullopt;
  }
  if (!IsValidPort(port)) return std::nullopt;
  ep.port = static_cast<std::uint16_t>(port);
  return ep;
}

}  // namespace netbatch::core::common::net
