#pragma once

#include "io/file_writer.hpp"
#include "logging/result_event.hpp"
#include "util/branch.hpp"
#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for it to drain and exit
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ =
        std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// ResultLogger
// Threading model:
// - Single background thread drains every registered ResultQueue round-robin
//   and appends one NDJSON line per completed test, batched through writev
// - Sessions are producers; the logger is the only consumer of each queue
// - Sources must be added before Start(); the queues must outlive the logger
class ResultLogger : public LoggerBase<ResultLogger> {
public:
  static constexpr std::size_t kLineMax = 256;

  ResultLogger() = default;
  ~ResultLogger() {
    Join();
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  // Opens (appends to) `path`. Returns false if the file cannot be opened.
  bool Open(const std::string &path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ == -1) {
      std::cerr << "[result_logger] cannot open " << path << ": "
                << std::strerror(errno) << "\n";
      return false;
    }
    return true;
  }

  bool OpenOk() const { return fd_ != -1; }

  void AddSource(ResultQueue &queue) { queues_.push_back(&queue); }

  void RunLoop() {
    for (;;) {
      const bool running = this->running_.load(std::memory_order_relaxed);
      std::size_t drained = 0;
      for (ResultQueue *q : queues_) {
        drained += DrainQueue(*q);
      }
      if (!running) {
        break;
      }
      if (drained == 0) {
        std::this_thread::sleep_for(kIdleSleep);
      }
    }
  }

  // {"ts":..,"source":"websocket","test":"download","session":"..",
  //  "totalBytes":..,"duration":1.234,"throughputMBps":12.34|null}\n
  // Returns the number of bytes written into `out` (at most kLineMax).
  static std::size_t FormatLine(const ResultEvent &ev, char *out) {
    char *p = out;
    char *const end = out + kLineMax - 1;
    auto put = [&](const char *s) {
      const std::size_t n = std::min<std::size_t>(std::strlen(s), end - p);
      std::memcpy(p, s, n);
      p += n;
    };
    put("{\"ts\":");
    p = std::to_chars(p, end, ev.finished_ms).ptr;
    put(",\"source\":\"");
    put(ResultSourceName(ev.source));
    put("\",\"test\":\"");
    put(ResultKindName(ev.kind));
    put("\",\"session\":\"");
    put(ev.session_id);
    put("\",\"totalBytes\":");
    p = std::to_chars(p, end, ev.total_bytes).ptr;
    put(",\"duration\":");
    p = std::to_chars(p, end, ev.duration_s, std::chars_format::fixed, 3).ptr;
    put(",\"throughputMBps\":");
    if (ev.has_throughput) {
      p = std::to_chars(p, end, ev.throughput_mbps, std::chars_format::fixed, 2)
              .ptr;
    } else {
      put("null");
    }
    put("}");
    *p++ = '\n';
    return static_cast<std::size_t>(p - out);
  }

private:
  static constexpr std::chrono::milliseconds kIdleSleep{5};
  static constexpr int kBatch = 64;

  std::size_t DrainQueue(ResultQueue &q) {
    ResultEvent ev;
    struct iovec iov[kBatch];
    char linebuf[kBatch][kLineMax];
    int cnt = 0;
    std::size_t total = 0;
    // batch consume to reduce syscalls
    while (q.pop(ev)) {
      ++total;
      if (WIRESPEED_UNLIKELY(fd_ == -1)) {
        continue;
      }
      const std::size_t len = FormatLine(ev, linebuf[cnt]);
      iov[cnt] = {linebuf[cnt], len};
      ++cnt;
      if (cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (!io::WritevAll(fd_, iov, cnt)) {
      std::cerr << "[result_logger] write failed: " << std::strerror(errno)
                << "\n";
    }
  }

  std::vector<ResultQueue *> queues_;
  int fd_ = -1;
};

} // namespace logging
