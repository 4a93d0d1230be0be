#include "net/query.hpp"
#include "speedtest/policy.hpp"
#include <cstdint>
#include <limits>
#include <gtest/gtest.h>

TEST(QueryTest, SplitsPathAndParams) {
  auto t = URL::SplitTarget("/api/download?size=2097152&chunkSize=1048576");
  EXPECT_EQ(t.path, "/api/download");
  EXPECT_EQ(t.GetInt("size"), 2097152);
  EXPECT_EQ(t.GetInt("chunkSize"), 1048576);
  EXPECT_FALSE(t.GetInt("missing").has_value());
}

TEST(QueryTest, BadNumbersReadAsAbsent) {
  auto t = URL::SplitTarget("/api/ping?timestamp=abc&a=1.5&b=&c=12x&d=+7");
  EXPECT_FALSE(t.GetInt("timestamp").has_value());
  EXPECT_FALSE(t.GetInt("a").has_value());
  EXPECT_FALSE(t.GetInt("b").has_value());
  EXPECT_FALSE(t.GetInt("c").has_value());
  EXPECT_EQ(t.GetInt("d"), 7);
}

TEST(QueryTest, NegativeNumbersParse) {
  auto t = URL::SplitTarget("/x?size=-10");
  EXPECT_EQ(t.GetInt("size"), -10);
}

TEST(QueryTest, OversizedNumbersSaturate) {
  auto t = URL::SplitTarget(
      "/api/download?size=99999999999999999999&low=-99999999999999999999");
  EXPECT_EQ(t.GetInt("size"), std::numeric_limits<std::int64_t>::max());
  EXPECT_EQ(t.GetInt("low"), std::numeric_limits<std::int64_t>::min());

  speedtest::Policy policy;
  EXPECT_EQ(policy.ClampSize(t.GetInt("size")), 100 * speedtest::kMiB);
  EXPECT_EQ(policy.ClampSize(t.GetInt("low")), 0u);
}

TEST(QueryTest, NoQueryAndFragments) {
  EXPECT_EQ(URL::SplitTarget("").path, "/");
  auto t = URL::SplitTarget("/ws?x=1#frag");
  EXPECT_EQ(t.path, "/ws");
  EXPECT_EQ(t.Get("x"), "1");
  auto flag = URL::SplitTarget("/p?flag&&y=2");
  EXPECT_EQ(flag.Get("flag"), "");
  EXPECT_EQ(flag.GetInt("y"), 2);
}

TEST(QueryTest, PathMatching) {
  EXPECT_TRUE(URL::PathIs("/api/ping", "/api/ping"));
  EXPECT_TRUE(URL::PathIs("/api/ping/", "/api/ping"));
  EXPECT_TRUE(URL::PathIs("/API/Ping", "/api/ping"));
  EXPECT_FALSE(URL::PathIs("/api/pingx", "/api/ping"));
  EXPECT_TRUE(URL::PathIs("/", "/"));
  EXPECT_FALSE(URL::PathIs("/ws/actor", "/ws"));
}
