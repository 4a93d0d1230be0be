#pragma once

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace speedtest {

enum class Phase { idle, download, upload };

inline const char *PhaseName(Phase p) {
  switch (p) {
  case Phase::download:
    return "download";
  case Phase::upload:
    return "upload";
  case Phase::idle:
    break;
  }
  return "idle";
}

inline std::string NewSessionId() {
  // random_generator holds its own entropy source; one per thread keeps
  // connection setup lock-free.
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

// Session — per-connection test state.
// Owned by exactly one adapter and mutated only from that adapter's callback
// chain; it dies with the connection.
class Session {
public:
  Session(std::string id, std::int64_t nowMs)
      : id_(std::move(id)), connected_at_(nowMs), last_activity_(nowMs) {}

  const std::string &Id() const { return id_; }
  Phase GetPhase() const { return phase_; }
  std::uint64_t BytesTransferred() const { return bytes_; }
  std::optional<std::int64_t> TestStartTime() const { return test_start_; }
  std::optional<std::int64_t> FirstByteTime() const { return first_byte_; }
  std::optional<std::int64_t> LastByteTime() const { return last_byte_; }
  std::int64_t LastActivity() const { return last_activity_; }
  std::int64_t ConnectedAt() const { return connected_at_; }

  void Touch(std::int64_t nowMs) { last_activity_ = nowMs; }

  // Entering download or upload always restarts the counters.
  void Begin(Phase phase, std::int64_t nowMs) {
    phase_ = phase;
    last_activity_ = nowMs;
    if (phase == Phase::idle) {
      return;
    }
    bytes_ = 0;
    test_start_ = nowMs;
    first_byte_.reset();
    last_byte_.reset();
  }

  // Download side: mirrors the scheduler's acknowledged byte count. Never
  // moves backwards.
  void AdvanceTo(std::uint64_t total, std::int64_t nowMs) {
    bytes_ = std::max(bytes_, total);
    last_activity_ = nowMs;
  }

  // Upload side: adds received bytes and stamps first/last byte times.
  void AddReceived(std::uint64_t n, std::int64_t nowMs) {
    if (!first_byte_.has_value()) {
      first_byte_ = nowMs;
    }
    last_byte_ = nowMs;
    bytes_ += n;
    last_activity_ = nowMs;
  }

  // Back to idle. Counters are kept so the last run can still be reported.
  void End(std::int64_t nowMs) {
    phase_ = Phase::idle;
    last_activity_ = nowMs;
  }

private:
  std::string id_;
  Phase phase_ = Phase::idle;
  std::uint64_t bytes_ = 0;
  std::optional<std::int64_t> test_start_;
  std::optional<std::int64_t> first_byte_;
  std::optional<std::int64_t> last_byte_;
  std::int64_t connected_at_;
  std::int64_t last_activity_;
};

} // namespace speedtest
