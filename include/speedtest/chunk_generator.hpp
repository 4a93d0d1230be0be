#pragma once

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <cstddef>
#include <random>
#include <vector>

namespace speedtest {

enum class ChunkFill { pattern, random };

// ChunkGenerator
// - Allocates the payload for one run exactly once; every chunk, including a
//   shorter final one, is a prefix slice of the same buffer
// - Content is opaque to the measurement, only its length matters. The
//   pattern fill is deterministic and is what tests rely on; the random fill
//   (non-cryptographic) is for clients sitting behind compressing proxies
// - Owned by a single scheduler run, never shared across sessions
class ChunkGenerator {
public:
  explicit ChunkGenerator(std::size_t size, ChunkFill fill = ChunkFill::pattern)
      : buf_(std::max<std::size_t>(1, size)) {
    if (fill == ChunkFill::random) {
      std::minstd_rand rng{std::random_device{}()};
      std::uniform_int_distribution<int> byte(0, 255);
      for (auto &b : buf_) {
        b = static_cast<unsigned char>(byte(rng));
      }
    } else {
      for (std::size_t i = 0; i < buf_.size(); ++i) {
        buf_[i] = static_cast<unsigned char>((i * 31) & 0xff);
      }
    }
  }

  ChunkGenerator(const ChunkGenerator &) = delete;
  ChunkGenerator &operator=(const ChunkGenerator &) = delete;

  std::size_t Size() const { return buf_.size(); }

  // First min(n, Size()) bytes. Valid for the generator's lifetime.
  boost::asio::const_buffer Slice(std::size_t n) const {
    return boost::asio::const_buffer(buf_.data(), std::min(n, buf_.size()));
  }

  const unsigned char *Data() const { return buf_.data(); }

private:
  std::vector<unsigned char> buf_;
};

} // namespace speedtest
