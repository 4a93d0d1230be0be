#pragma once

#include "speedtest/throughput.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace speedtest {

enum class StreamEventKind { started, progress, complete, error };

// One observable step of a download run. Fields not relevant to `kind` are
// left at their defaults.
struct StreamEvent {
  StreamEventKind kind = StreamEventKind::started;
  std::int64_t timestampMs = 0;
  std::uint64_t bytesSent = 0;
  std::uint64_t totalBytes = 0;
  std::uint64_t chunkSize = 0;
  double percent = 0.0;
  TestResult result;
  std::string message;
};

// Transport — what the scheduler needs from a concrete connection.
// Threading model:
// - Every method is called on the connection's own executor (strand), and
//   every callback the transport runs is posted back onto it
// - Implementations never invoke `done`, drain or deferred callbacks inline
//   from the call that registered them
class Transport {
public:
  using Completion = std::function<void(const boost::system::error_code &)>;

  virtual ~Transport() = default;

  // True while the outbound side cannot take another chunk.
  virtual bool Backpressured() const = 0;

  // Queue one binary payload. `chunk` stays valid until `done` runs; `done`
  // fires once the transport has accepted the bytes or failed.
  virtual void WriteChunk(boost::asio::const_buffer chunk, Completion done) = 0;

  // Control event for the peer (framed or not, depending on the transport).
  virtual void WriteEvent(const StreamEvent &ev) = 0;

  // Run `fn` once backpressure clears.
  virtual void OnDrain(std::function<void()> fn) = 0;

  // Run `fn` later as its own scheduling unit on the connection executor.
  virtual void Defer(std::function<void()> fn) = 0;
};

// ControlChannel — a Transport that can also carry free-form control frames,
// i.e. the duplex socket transports.
class ControlChannel : public Transport {
public:
  virtual void WriteText(std::string text) = 0;
};

} // namespace speedtest
