#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace speedtest {

inline constexpr std::uint64_t kKiB = 1024;
inline constexpr std::uint64_t kMiB = 1024 * kKiB;

// Policy — limits applied to client-requested sizes before a run starts.
// Values read off the wire are never used unclamped.
struct Policy {
  std::uint64_t max_total_size = 100 * kMiB;
  std::uint64_t max_chunk_size = kMiB;
  std::uint64_t default_size = kMiB;
  std::uint64_t default_chunk_size = 64 * kKiB;
  std::uint64_t progress_step = kMiB;
  std::uint64_t upload_body_limit = 50 * kMiB;
  // Queued outbound frames at which a socket transport reports backpressure
  std::size_t outbound_high_water = 4;

  // Absent → default_size; explicit 0 is honored; result in [0, max_total_size]
  std::uint64_t ClampSize(std::optional<std::int64_t> requested) const {
    if (!requested.has_value()) {
      return std::min(default_size, max_total_size);
    }
    if (*requested <= 0) {
      return 0;
    }
    return std::min(static_cast<std::uint64_t>(*requested), max_total_size);
  }

  // Absent → default_chunk_size; result in [1, max_chunk_size]
  std::uint64_t ClampChunk(std::optional<std::int64_t> requested) const {
    const std::uint64_t cap = std::max<std::uint64_t>(1, max_chunk_size);
    if (!requested.has_value()) {
      return std::clamp<std::uint64_t>(default_chunk_size, 1, cap);
    }
    if (*requested <= 1) {
      return 1;
    }
    return std::min(static_cast<std::uint64_t>(*requested), cap);
  }
};

} // namespace speedtest
