#pragma once

#include <cstddef>
#include <errno.h>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace io {

// Gathers `cnt` iovecs into one or more writev calls. Partially written
// vectors are advanced in place, so `iov` is clobbered.
inline bool WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      return false;
    }
    std::size_t consumed = static_cast<std::size_t>(n);
    while (consumed > 0 && cnt > 0) {
      if (consumed >= iov[0].iov_len) {
        consumed -= iov[0].iov_len;
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= consumed;
        consumed = 0;
      }
    }
  }
  return true;
}

} // namespace io
