#include <gtest/gtest.h>

#include <string>

#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/string_utils.hpp"

namespace str = netbatch::core::common::str;
namespace net = netbatch::core::common::net;

TEST(StringUtils, SanitizeFilenameKeepsSafeCharacters) {
  EXPECT_EQ(str::SanitizeFilename("show ip int brief | inc up"), "show_ip_int_brief_inc_up");
  EXPECT_EQ(str::SanitizeFilename("../../etc"), "etc");
  EXPECT_EQ(str::SanitizeFilename("///"), "_");
  EXPECT_EQ(str::SanitizeFilename("abcdef", 3), "abc");
}

TEST(StringUtils, Fnv1a64IsStable) {
  EXPECT_EQ(str::Fnv1a64(""), 0xcbf29ce484222325ULL);
  EXPECT_EQ(str::Hex64(str::Fnv1a64("a")), "af63dc4c8601ec8c");
  EXPECT_NE(str::Fnv1a64("show version"), str::Fnv1a64("show  version"));
}

TEST(StringUtils, ParseInt64RejectsJunk) {
  std::int64_t v = 0;
  EXPECT_TRUE(str::ParseInt64(" 42 ", v));
  EXPECT_EQ(v, 42);
  EXPECT_TRUE(str::ParseInt64("-7", v));
  EXPECT_EQ(v, -7);
  EXPECT_FALSE(str::ParseInt64("4x", v));
  EXPECT_FALSE(str::ParseInt64("", v));
  EXPECT_FALSE(str::ParseInt64("-", v));
}

TEST(NetworkUtils, ParseHostPortHandlesDefaultsAndIpv6) {
  auto ep = net::ParseHostPort("10.0.0.1", 23);
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->host, "10.0.0.1");
  EXPECT_EQ(ep->port, 23);

  ep = net::ParseHostPort("r1.lab:2201", 23);
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->host, "r1.lab");
  EXPECT_EQ(ep->port, 2201);

  ep = net::ParseHostPort("[fe80::1]:830", 23);
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->host, "fe80::1");
  EXPECT_EQ(ep->port, 830);

  EXPECT_FALSE(net::ParseHostPort("r1:0", 23).has_value());
  EXPECT_FALSE(net::ParseHostPort("r1:99999", 23).has_value());
  EXPECT_EQ(net::JoinHostPort("fe80::1", 22), "[fe80::1]:22");
}
