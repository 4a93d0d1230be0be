#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <unistd.h>

namespace proc {

struct MemoryUsage {
  std::uint64_t rss = 0;
  std::uint64_t vsize = 0;
};

// Reads /proc/self/statm (sizes in pages). Empty where procfs is missing.
inline std::optional<MemoryUsage> ReadMemoryUsage() {
  std::ifstream in("/proc/self/statm");
  std::uint64_t size = 0;
  std::uint64_t resident = 0;
  if (!(in >> size >> resident)) {
    return std::nullopt;
  }
  const long page = ::sysconf(_SC_PAGESIZE);
  const std::uint64_t bytes = page > 0 ? static_cast<std::uint64_t>(page) : 4096;
  return MemoryUsage{.rss = resident * bytes, .vsize = size * bytes};
}

} // namespace proc
