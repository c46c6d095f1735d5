#include "core/scope/scope_resolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>
#include <utility>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/string_utils.hpp"

namespace netbatch::core::scope {

namespace {

namespace str = common::str;
namespace json = common::json;
using inventory::Inventory;
using inventory::model::DeviceRef;

constexpr std::array<std::string_view, 16> kKindWords = {
    "device", "devices", "router", "routers", "switch", "switches", "host", "hosts",
    "node",   "nodes",   "firewall", "firewalls", "box", "boxes", "the", "*"};

// Longest numeric suffix accepted in a range bound.
constexpr std::size_t kMaxRangeDigits = 9;

bool IsKindWord(std::string_view token) {
  const std::string t = str::ToLower(token);
  return std::find(kKindWords.begin(), kKindWords.end(), t) != kKindWords.end();
}

bool IsWordToken(std::string_view token) {
  if (token.empty()) return false;
  for (const char c : token) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

ScopeResolution ParseFailure(std::string_view expression, std::string reason) {
  ScopeResolution r;
  r.expression = std::string(expression);
  r.error = common::Error(common::ErrorCode::ScopeParse, std::move(reason), std::string(expression));
  return r;
}

// Rule 1 and 2. Returns false when the expression does not start with "all".
bool TryAll(const std::vector<std::string_view>& tokens, const Inventory& inv, ScopeResolution& out) {
  if (tokens.empty() || !str::IEquals(tokens.front(), "all")) return false;

  std::vector<std::string_view> filter;
  for (size_t i = 1; i < tokens.size(); ++i) {
    if (IsKindWord(tokens[i])) continue;
    if (!IsWordToken(tokens[i])) return false;
    filter.push_back(tokens[i]);
  }

  if (filter.empty()) {
    out.rule = ScopeRule::All;
    out.devices = inv.List();
    return true;
  }

  out.rule = ScopeRule::QualifiedAll;

  std::vector<std::string> candidates;
  for (const char joiner : {' ', '-', '_'}) {
    std::string joined;
    for (size_t i = 0; i < filter.size(); ++i) {
      if (i > 0) joined.push_back(joiner);
      joined.append(filter[i].data(), filter[i].size());
    }
    if (std::find(candidates.begin(), candidates.end(), joined) == candidates.end()) {
      candidates.push_back(std::move(joined));
    }
    if (filter.size() == 1) break;
  }

  auto collect = [&](const std::string& role) {
    for (const auto& d : inv.List()) {
      if (str::IEquals(d.role, role)) out.devices.push_back(d);
    }
  };

  for (const auto& c : candidates) {
    collect(c);
    if (!out.devices.empty()) return true;
  }
  // "all cores" -> role "core".
  for (const auto& c : candidates) {
    if (c.size() > 1 && (c.back() == 's' || c.back() == 'S')) {
      collect(c.substr(0, c.size() - 1));
      if (!out.devices.empty()) return true;
    }
  }
  return true;
}

// Rule 3.
bool TryKeyValue(const std::vector<std::string_view>& tokens, const Inventory& inv,
                 ScopeResolution& out) {
  std::string_view kv;
  if (tokens.size() == 1) {
    kv = tokens[0];
  } else if (tokens.size() == 3 &&
             (str::IEquals(tokens[0], "devices") || str::IEquals(tokens[0], "device")) &&
             str::IEquals(tokens[1], "in")) {
    kv = tokens[2];
  } else {
    return false;
  }

  const auto colon = kv.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 >= kv.size()) return false;

  const std::string key = str::ToLower(kv.substr(0, colon));
  const std::string value(kv.substr(colon + 1));

  std::string DeviceRef::*field = nullptr;
  if (key == "group") field = &DeviceRef::group;
  else if (key == "role") field = &DeviceRef::role;
  else if (key == "site") field = &DeviceRef::site;
  else if (key == "platform") field = &DeviceRef::platform;
  else return false;

  out.rule = ScopeRule::KeyValue;
  for (const auto& d : inv.List()) {
    if (d.*field == value) out.devices.push_back(d);
  }
  return true;
}

// "x:y" or "devices in x:y" that TryKeyValue rejected.
bool LooksLikeKeyValue(const std::vector<std::string_view>& tokens) {
  if (tokens.empty()) return false;
  const auto last = tokens.back();
  if (last.find(':') == std::string_view::npos || last.find(',') != std::string_view::npos) return false;
  return tokens.size() == 1 || (tokens.size() == 3 && str::IEquals(tokens[1], "in"));
}

struct SuffixSplit {
  std::string_view prefix;
  std::string_view digits;
};

std::optional<SuffixSplit> SplitNumericSuffix(std::string_view s) {
  size_t i = s.size();
  while (i > 0 && std::isdigit(static_cast<unsigned char>(s[i - 1]))) --i;
  if (i == s.size() || i == 0) return std::nullopt;
  return SuffixSplit{s.substr(0, i), s.substr(i)};
}

bool ParseBound(std::string_view digits, std::uint32_t& out) {
  if (digits.empty() || digits.size() > kMaxRangeDigits) return false;
  std::uint32_t v = 0;
  for (const char c : digits) v = v * 10 + static_cast<std::uint32_t>(c - '0');
  out = v;
  return true;
}

// Rule 4. Any '-' may be the separator, so hyphenated prefixes work ("edge-r1-edge-r4").
bool TryRange(std::string_view expr, const Inventory& inv, ScopeResolution& out) {
  if (str::HasWhitespace(expr) || expr.find(',') != std::string_view::npos) return false;

  for (size_t pos = expr.find('-'); pos != std::string_view::npos; pos = expr.find('-', pos + 1)) {
    const auto left = SplitNumericSuffix(expr.substr(0, pos));
    const auto right = SplitNumericSuffix(expr.substr(pos + 1));
    if (!left || !right || !str::IEquals(left->prefix, right->prefix)) continue;

    std::uint32_t lo = 0;
    std::uint32_t hi = 0;
    if (!ParseBound(left->digits, lo) || !ParseBound(right->digits, hi)) continue;
    if (lo > hi) std::swap(lo, hi);

    std::vector<std::pair<std::uint32_t, const DeviceRef*>> hits;
    for (const auto& d : inv.List()) {
      const std::string_view name = d.name;
      if (name.size() < left->prefix.size() ||
          !str::IEquals(name.substr(0, left->prefix.size()), left->prefix)) {
        continue;
      }
      const auto rest = name.substr(left->prefix.size());
      if (rest.empty() || !std::all_of(rest.begin(), rest.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
          })) {
        continue;
      }
      std::uint32_t n = 0;
      if (!ParseBound(rest, n)) continue;
      if (n >= lo && n <= hi) hits.emplace_back(n, &d);
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    out.rule = ScopeRule::Range;
    for (const auto& h : hits) out.devices.push_back(*h.second);
    return true;
  }
  return false;
}

const DeviceRef* LookupName(std::string_view name, const Inventory& inv) {
  if (const auto* d = inv.Find(std::string(name))) return d;

  const DeviceRef* match = nullptr;
  for (const auto& d : inv.List()) {
    if (!str::IEquals(d.name, name)) continue;
    if (match != nullptr) return nullptr;  // ambiguous
    match = &d;
  }
  return match;
}

// Rule 5.
bool TryList(std::string_view expr, const Inventory& inv, ScopeResolution& out) {
  std::vector<std::string_view> names;
  for (const auto part : str::Split(expr, ',')) {
    const auto name = str::Trim(part);
    if (name.empty()) continue;
    if (str::HasWhitespace(name)) return false;
    names.push_back(name);
  }
  if (names.empty()) return false;

  out.rule = ScopeRule::List;
  std::unordered_set<std::string> seen_missing;
  for (const auto name : names) {
    if (const auto* d = LookupName(name, inv)) {
      out.devices.push_back(*d);
    } else if (seen_missing.insert(std::string(name)).second) {
      out.unresolved_names.emplace_back(name);
    }
  }
  return true;
}

void Deduplicate(std::vector<DeviceRef>& devices) {
  std::unordered_set<std::string> seen;
  std::vector<DeviceRef> unique;
  unique.reserve(devices.size());
  for (auto& d : devices) {
    if (seen.insert(d.name).second) unique.push_back(std::move(d));
  }
  devices = std::move(unique);
}

}  // namespace

const char* ToString(ScopeRule rule) {
  switch (rule) {
    case ScopeRule::None:         return "none";
    case ScopeRule::All:          return "all";
    case ScopeRule::QualifiedAll: return "qualified_all";
    case ScopeRule::KeyValue:     return "key_value";
    case ScopeRule::Range:        return "range";
    case ScopeRule::List:         return "list";
    default:                      return "unknown";
  }
}

std::vector<std::string> ScopeResolution::DeviceNames() const {
  std::vector<std::string> out;
  out.reserve(devices.size());
  for (const auto& d : devices) out.push_back(d.name);
  return out;
}

std::string ScopeResolution::ToJson() const {
  std::vector<std::string> devs;
  devs.reserve(devices.size());
  for (const auto& d : devices) devs.push_back(Inventory::DeviceToJson(d));
  return json::Object({
      {"expression", json::Quote(expression)},
      {"rule", json::Quote(ToString(rule))},
      {"devices", json::Array(devs)},
      {"unresolved_names", json::StringArray(unresolved_names)},
      {"error", error ? json::Quote(error->ToString()) : json::Null()},
  });
}

ScopeResolution ResolveScope(std::string_view expression, const Inventory& inventory) {
  const auto expr = str::Trim(expression);
  if (expr.empty()) return ParseFailure(expression, "empty scope expression");

  ScopeResolution out;
  out.expression = std::string(expression);

  const auto tokens = str::SplitWhitespace(expr);
  bool matched = TryAll(tokens, inventory, out) || TryKeyValue(tokens, inventory, out);
  if (!matched && LooksLikeKeyValue(tokens)) {
    return ParseFailure(expression, "unsupported filter key (expected group, role, site or platform)");
  }
  matched = matched || TryRange(expr, inventory, out) || TryList(expr, inventory, out);
  if (!matched) return ParseFailure(expression, "unrecognized scope expression");

  Deduplicate(out.devices);
  return out;
}

}  // namespace netbatch::core::scope
