#pragma once

#include <boost/lockfree/queue.hpp>
#include <cstddef>
#include <cstdint>

namespace logging {

enum class ResultSource : std::uint8_t { http, websocket, actor };
enum class ResultKind : std::uint8_t { download, upload };

inline const char *ResultSourceName(ResultSource s) {
  switch (s) {
  case ResultSource::websocket:
    return "websocket";
  case ResultSource::actor:
    return "actor";
  case ResultSource::http:
    break;
  }
  return "http";
}

inline const char *ResultKindName(ResultKind k) {
  return k == ResultKind::upload ? "upload" : "download";
}

// ResultEvent — one completed test, flattened so it can travel through a
// lock-free queue (trivially copyable, fixed size).
struct ResultEvent {
  std::int64_t finished_ms;
  std::uint64_t total_bytes;
  double duration_s;
  double throughput_mbps;
  bool has_throughput;
  ResultKind kind;
  ResultSource source;
  char session_id[40];
};

inline constexpr std::size_t kResultQueueCapacity = 1024;

// Multi-producer: every session of one adapter pushes into the same queue,
// possibly from several reactor threads; ResultLogger is the only consumer.
using ResultQueue =
    boost::lockfree::queue<ResultEvent,
                           boost::lockfree::capacity<kResultQueueCapacity>>;

} // namespace logging
