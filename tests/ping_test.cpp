#include "speedtest/ping.hpp"
#include <gtest/gtest.h>
#include <optional>

using speedtest::HandlePing;

TEST(PingTest, ProcessingTimeIsServerMinusClient) {
  auto r = HandlePing(1000, 1025);
  EXPECT_EQ(r.clientTimestamp, 1000);
  EXPECT_EQ(r.serverTimestamp, 1025);
  EXPECT_EQ(r.serverProcessingTime, 25);
}

TEST(PingTest, ClientClockAheadGivesNegativeValue) {
  auto r = HandlePing(2000, 1500);
  EXPECT_EQ(r.serverProcessingTime, -500);
}

TEST(PingTest, MissingClientTimestampDefaultsToServerTime) {
  auto r = HandlePing(std::nullopt, 777);
  EXPECT_EQ(r.clientTimestamp, 777);
  EXPECT_EQ(r.serverProcessingTime, 0);
}
