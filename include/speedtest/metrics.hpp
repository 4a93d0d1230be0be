#pragma once

#include "logging/result_event.hpp"
#include "speedtest/throughput.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <deque>
#include <mutex>
#include <string_view>

namespace speedtest {

struct MetricsSnapshot {
  std::uint64_t totalRequests = 0;
  std::uint64_t pingRequests = 0;
  std::uint64_t downloadRequests = 0;
  std::uint64_t uploadRequests = 0;
  std::uint64_t errors = 0;
  std::uint64_t connections = 0;
  std::uint64_t activeConnections = 0;
  std::uint64_t completedTests = 0;
  std::uint64_t droppedResults = 0;
  std::size_t requestsPerMinute = 0;
};

// Metrics — counters for one adapter, handed to each of its sessions by
// reference. There is one collector per adapter rather than one for the
// process. Counters are atomics; only the one-minute request window takes a
// lock. Completed results are queued for ResultLogger.
class Metrics {
public:
  explicit Metrics(logging::ResultSource source,
                   timeutil::Clock clock = timeutil::EpochMillisUtc)
      : source_(source), clock_(std::move(clock)) {}

  Metrics(const Metrics &) = delete;
  Metrics &operator=(const Metrics &) = delete;

  logging::ResultSource Source() const { return source_; }
  const char *Name() const { return logging::ResultSourceName(source_); }

  void CountPing() { CountRequest(ping_); }
  void CountDownload() { CountRequest(download_); }
  void CountUpload() { CountRequest(upload_); }
  void CountError() { errors_.fetch_add(1, std::memory_order_relaxed); }

  void ConnectionOpened() {
    connections_.fetch_add(1, std::memory_order_relaxed);
    active_.fetch_add(1, std::memory_order_relaxed);
  }
  void ConnectionClosed() { active_.fetch_sub(1, std::memory_order_relaxed); }

  void RecordResult(logging::ResultKind kind, std::string_view sessionId,
                    const TestResult &r) {
    completed_.fetch_add(1, std::memory_order_relaxed);
    logging::ResultEvent ev{};
    ev.finished_ms = clock_();
    ev.total_bytes = r.totalBytes;
    ev.duration_s = r.durationSeconds;
    ev.has_throughput = r.throughputMBps.has_value();
    ev.throughput_mbps = r.throughputMBps.value_or(0.0);
    ev.kind = kind;
    ev.source = source_;
    const std::size_t n =
        std::min(sessionId.size(), sizeof(ev.session_id) - 1);
    std::memcpy(ev.session_id, sessionId.data(), n);
    ev.session_id[n] = '\0';
    if (!results_.push(ev)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  logging::ResultQueue &Results() { return results_; }

  MetricsSnapshot Snapshot() const {
    MetricsSnapshot s;
    s.pingRequests = ping_.load(std::memory_order_relaxed);
    s.downloadRequests = download_.load(std::memory_order_relaxed);
    s.uploadRequests = upload_.load(std::memory_order_relaxed);
    s.totalRequests = total_.load(std::memory_order_relaxed);
    s.errors = errors_.load(std::memory_order_relaxed);
    s.connections = connections_.load(std::memory_order_relaxed);
    s.activeConnections = active_.load(std::memory_order_relaxed);
    s.completedTests = completed_.load(std::memory_order_relaxed);
    s.droppedResults = dropped_.load(std::memory_order_relaxed);
    s.requestsPerMinute = RequestsLastMinute();
    return s;
  }

private:
  static constexpr std::int64_t kWindowMs = 60'000;

  void CountRequest(std::atomic<std::uint64_t> &counter) {
    counter.fetch_add(1, std::memory_order_relaxed);
    total_.fetch_add(1, std::memory_order_relaxed);
    const std::int64_t now = clock_();
    std::lock_guard<std::mutex> lock(window_mu_);
    window_.push_back(now);
    Expire(now);
  }

  std::size_t RequestsLastMinute() const {
    std::lock_guard<std::mutex> lock(window_mu_);
    Expire(clock_());
    return window_.size();
  }

  void Expire(std::int64_t now) const {
    while (!window_.empty() && window_.front() <= now - kWindowMs) {
      window_.pop_front();
    }
  }

  logging::ResultSource source_;
  timeutil::Clock clock_;
  std::atomic<std::uint64_t> total_{0};
  std::atomic<std::uint64_t> ping_{0};
  std::atomic<std::uint64_t> download_{0};
  std::atomic<std::uint64_t> upload_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::atomic<std::uint64_t> connections_{0};
  std::atomic<std::uint64_t> active_{0};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> dropped_{0};
  mutable std::mutex window_mu_;
  mutable std::deque<std::int64_t> window_;
  logging::ResultQueue results_;
};

} // namespace speedtest
