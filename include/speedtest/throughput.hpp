#pragma once

#include "speedtest/policy.hpp"
#include <cstdint>
#include <optional>

namespace speedtest {

struct TestResult {
  std::uint64_t totalBytes = 0;
  double durationSeconds = 0.0;
  // Empty when the elapsed time is zero or negative: the throughput is
  // undefined rather than infinite.
  std::optional<double> throughputMBps;
};

// Same formula for download (bytes sent, start = test start) and upload
// (bytes received, start = first received byte).
inline TestResult ComputeThroughput(std::uint64_t totalBytes,
                                    std::int64_t startMs, std::int64_t endMs) {
  TestResult r;
  r.totalBytes = totalBytes;
  r.durationSeconds = static_cast<double>(endMs - startMs) / 1000.0;
  if (r.durationSeconds <= 0.0) {
    return r;
  }
  r.throughputMBps = static_cast<double>(totalBytes) /
                     static_cast<double>(kMiB) / r.durationSeconds;
  return r;
}

} // namespace speedtest
