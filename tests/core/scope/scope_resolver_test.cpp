#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/scope/scope_resolver.hpp"
#include "support/test_helpers.hpp"

using netbatch::core::common::ErrorCode;
using netbatch::core::inventory::Inventory;
using netbatch::core::scope::ResolveScope;
using netbatch::core::scope::ScopeRule;
using netbatch::testing::LabInventory;
using netbatch::testing::MakeDevice;

using Names = std::vector<std::string>;

namespace {

Inventory MixedInventory() {
  Inventory inv;
  inv.Register(MakeDevice("R1", "core", "DC1", "cisco_ios", "backbone"));
  inv.Register(MakeDevice("R2", "core", "DC2", "arista_eos", "backbone"));
  inv.Register(MakeDevice("SW1", "access", "DC1", "cisco_ios", "campus"));
  inv.Register(MakeDevice("SW2", "access", "DC2", "cisco_ios", "campus"));
  inv.Register(MakeDevice("FW1", "dmz-edge", "DC1", "juniper_junos", "security"));
  return inv;
}

}  // namespace

TEST(ScopeResolver, AllReturnsEveryDeviceInInventoryOrder) {
  const auto inv = MixedInventory();
  for (const char* expr : {"all", "ALL", "all devices", "all routers", "  all  ", "all the devices"}) {
    const auto r = ResolveScope(expr, inv);
    ASSERT_TRUE(r.Ok()) << expr;
    EXPECT_EQ(r.rule, ScopeRule::All) << expr;
    EXPECT_EQ(r.DeviceNames(), (Names{"R1", "R2", "SW1", "SW2", "FW1"})) << expr;
    EXPECT_TRUE(r.unresolved_names.empty());
  }
}

TEST(ScopeResolver, QualifiedAllFiltersByRole) {
  const auto inv = MixedInventory();

  auto r = ResolveScope("all core routers", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::QualifiedAll);
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "R2"}));

  r = ResolveScope("all Access switches", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"SW1", "SW2"}));
}

TEST(ScopeResolver, QualifiedAllJoinsMultiWordRoles) {
  const auto r = ResolveScope("all dmz edge devices", MixedInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"FW1"}));
}

TEST(ScopeResolver, QualifiedAllAcceptsPluralRole) {
  const auto r = ResolveScope("all cores", MixedInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "R2"}));
}

TEST(ScopeResolver, QualifiedAllWithUnknownRoleIsEmptyNotError) {
  const auto r = ResolveScope("all spine routers", MixedInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::QualifiedAll);
  EXPECT_TRUE(r.devices.empty());
}

TEST(ScopeResolver, KeyValueMatchesAttributesExactly) {
  const auto inv = MixedInventory();

  auto r = ResolveScope("site:DC1", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::KeyValue);
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "SW1", "FW1"}));

  r = ResolveScope("devices in site:DC2", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"R2", "SW2"}));

  r = ResolveScope("group:campus", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"SW1", "SW2"}));

  r = ResolveScope("Platform:cisco_ios", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "SW1", "SW2"}));

  // Values are case-sensitive.
  r = ResolveScope("site:dc1", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_TRUE(r.devices.empty());
}

TEST(ScopeResolver, UnknownKeyIsParseError) {
  const auto r = ResolveScope("vendor:cisco", MixedInventory());
  ASSERT_FALSE(r.Ok());
  EXPECT_EQ(r.error->code, ErrorCode::ScopeParse);
  EXPECT_EQ(r.error->subject, "vendor:cisco");
  EXPECT_TRUE(r.devices.empty());
}

TEST(ScopeResolver, RangeSkipsMissingMembers) {
  Inventory inv;
  inv.Register(MakeDevice("R4"));
  inv.Register(MakeDevice("R1"));
  inv.Register(MakeDevice("R2"));
  inv.Register(MakeDevice("R10"));

  const auto r = ResolveScope("R1-R5", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::Range);
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "R2", "R4"}));
  EXPECT_TRUE(r.unresolved_names.empty());
}

TEST(ScopeResolver, RangePrefixIgnoresCaseLikeNameLists) {
  Inventory inv;
  inv.Register(MakeDevice("R1"));
  inv.Register(MakeDevice("R2"));
  inv.Register(MakeDevice("R3"));
  inv.Register(MakeDevice("Rx4"));

  auto r = ResolveScope("r1-r2", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::Range);
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "R2"}));

  r = ResolveScope("r2-R3", inv);
  EXPECT_EQ(r.DeviceNames(), (Names{"R2", "R3"}));

  EXPECT_EQ(ResolveScope("r1,r2", inv).DeviceNames(), ResolveScope("r1-r2", inv).DeviceNames());
}

TEST(ScopeResolver, RangeAcceptsReversedBoundsAndHyphenatedPrefix) {
  Inventory inv;
  inv.Register(MakeDevice("edge-r1"));
  inv.Register(MakeDevice("edge-r2"));
  inv.Register(MakeDevice("edge-r3"));

  auto r = ResolveScope("edge-r3-edge-r2", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::Range);
  EXPECT_EQ(r.DeviceNames(), (Names{"edge-r2", "edge-r3"}));
}

TEST(ScopeResolver, HyphenatedNameFallsBackToList) {
  Inventory inv;
  inv.Register(MakeDevice("core-a"));
  const auto r = ResolveScope("core-a", inv);
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::List);
  EXPECT_EQ(r.DeviceNames(), (Names{"core-a"}));
}

TEST(ScopeResolver, ListReportsUnknownNamesWithoutFailing) {
  const auto r = ResolveScope("R1, R9 ,SW2,R9,,", MixedInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.rule, ScopeRule::List);
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "SW2"}));
  EXPECT_EQ(r.unresolved_names, (Names{"R9"}));
}

TEST(ScopeResolver, ListWithOnlyUnknownNamesIsEmptyWithUnresolved) {
  const auto r = ResolveScope("X1,X2", MixedInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_TRUE(r.devices.empty());
  EXPECT_EQ(r.unresolved_names, (Names{"X1", "X2"}));
}

TEST(ScopeResolver, ListDeduplicatesAndMatchesCaseInsensitively) {
  const auto r = ResolveScope("sw1,SW1,r2", MixedInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"SW1", "R2"}));
}

TEST(ScopeResolver, MalformedExpressionsAreParseErrors) {
  const auto inv = MixedInventory();
  for (const char* expr : {"", "   ", "show me everything", "all devices in site:DC1", "R1 R2"}) {
    const auto r = ResolveScope(expr, inv);
    ASSERT_FALSE(r.Ok()) << expr;
    EXPECT_EQ(r.error->code, ErrorCode::ScopeParse) << expr;
    EXPECT_TRUE(r.devices.empty()) << expr;
    EXPECT_EQ(r.rule, ScopeRule::None) << expr;
  }
}

TEST(ScopeResolver, EndToEndRoleScope) {
  const auto r = ResolveScope("role:core", LabInventory());
  ASSERT_TRUE(r.Ok());
  EXPECT_EQ(r.DeviceNames(), (Names{"R1", "R2"}));
}

TEST(ScopeResolver, JsonCarriesRuleAndUnresolved) {
  const auto r = ResolveScope("R1,R7", LabInventory());
  const auto j = r.ToJson();
  EXPECT_NE(j.find("\"rule\":\"list\""), std::string::npos);
  EXPECT_NE(j.find("\"unresolved_names\":[\"R7\"]"), std::string::npos);
  EXPECT_NE(j.find("\"error\":null"), std::string::npos);
}
