#pragma once

#include <cstdint>
#include <optional>

namespace speedtest {

struct PingReply {
  std::int64_t clientTimestamp = 0;
  std::int64_t serverTimestamp = 0;
  std::int64_t serverProcessingTime = 0;
};

// serverProcessingTime = serverTimestamp - clientTimestamp. This is not a
// round-trip time: it folds one-way delay, clock skew between the hosts and
// server processing into one number, and is negative whenever the client
// clock runs ahead. A missing client timestamp defaults to server time.
inline PingReply HandlePing(std::optional<std::int64_t> clientTimestamp,
                            std::int64_t nowMs) {
  PingReply r;
  r.serverTimestamp = nowMs;
  r.clientTimestamp = clientTimestamp.value_or(nowMs);
  r.serverProcessingTime = r.serverTimestamp - r.clientTimestamp;
  return r;
}

} // namespace speedtest
