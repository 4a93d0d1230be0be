#pragma once

#include "speedtest/chunk_generator.hpp"
#include "speedtest/policy.hpp"
#include "speedtest/session.hpp"
#include "speedtest/throughput.hpp"
#include "speedtest/transport.hpp"
#include "util/branch.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace speedtest {

enum class StreamState { idle, started, streaming, completed, error };

// StreamScheduler — drives one download run over a Transport.
// Threading model:
// - Lives on the connection's executor; never blocks and never loops over
//   chunks. Each Tick() writes at most one chunk and returns.
// - The next Tick() is reached only through the write completion (which
//   defers a fresh task), a drain callback, or a deferred task. Stack depth
//   stays constant for any transfer size.
// - Deferred and drain callbacks hold a weak reference; a write completion
//   holds a strong one so the chunk buffer outlives the write. Every entry
//   point checks the state first, so nothing runs after Cancel() or after
//   the owning session is gone.
// - bytesSent only counts acknowledged chunks; progress and complete never
//   describe bytes the transport has not taken.
class StreamScheduler : public std::enable_shared_from_this<StreamScheduler> {
public:
  using FinishHandler = std::function<void(const StreamEvent &)>;

  StreamScheduler(Transport &transport, Session &session, const Policy &policy,
                  timeutil::Clock clock = timeutil::EpochMillisUtc,
                  ChunkFill fill = ChunkFill::pattern)
      : transport_(transport), session_(session), policy_(policy),
        clock_(std::move(clock)), fill_(fill) {}

  StreamScheduler(const StreamScheduler &) = delete;
  StreamScheduler &operator=(const StreamScheduler &) = delete;

  // Called with the complete or error event when the run ends.
  void OnFinish(FinishHandler handler) { on_finish_ = std::move(handler); }

  // Clamps the request, emits `started` and defers the first Tick().
  // Must be called once, on a scheduler owned by a shared_ptr.
  void Start(std::optional<std::int64_t> requestedSize,
             std::optional<std::int64_t> requestedChunkSize) {
    if (state_ != StreamState::idle) {
      return;
    }
    total_ = policy_.ClampSize(requestedSize);
    chunk_ = policy_.ClampChunk(requestedChunkSize);
    step_ = std::max<std::uint64_t>(1, policy_.progress_step);
    start_ms_ = clock_();
    // One buffer for the run, never larger than the run itself.
    chunks_.emplace(static_cast<std::size_t>(
                        std::max<std::uint64_t>(1, std::min(chunk_, total_))),
                    fill_);

    state_ = StreamState::started;
    StreamEvent ev;
    ev.kind = StreamEventKind::started;
    ev.timestampMs = start_ms_;
    ev.totalBytes = total_;
    ev.chunkSize = chunk_;
    transport_.WriteEvent(ev);
    if (state_ != StreamState::started) {
      return; // cancelled from inside WriteEvent
    }

    state_ = StreamState::streaming;
    ScheduleTick();
  }

  // Aborts a live run silently. Pending resumptions become no-ops.
  void Cancel() {
    if (state_ == StreamState::started || state_ == StreamState::streaming) {
      state_ = StreamState::error;
      cancelled_ = true;
    }
  }

  StreamState State() const { return state_; }
  bool Finished() const {
    return state_ == StreamState::completed || state_ == StreamState::error;
  }
  bool Cancelled() const { return cancelled_; }
  std::uint64_t BytesSent() const { return sent_; }
  std::uint64_t TotalBytes() const { return total_; }
  std::uint64_t ChunkSize() const { return chunk_; }

private:
  void ScheduleTick() {
    std::weak_ptr<StreamScheduler> weak = weak_from_this();
    transport_.Defer([weak] {
      if (auto self = weak.lock()) {
        self->Tick();
      }
    });
  }

  void Tick() {
    if (WIRESPEED_UNLIKELY(state_ != StreamState::streaming || in_flight_)) {
      return;
    }
    if (sent_ >= total_) {
      Complete();
      return;
    }
    if (transport_.Backpressured()) {
      std::weak_ptr<StreamScheduler> weak = weak_from_this();
      transport_.OnDrain([weak] {
        if (auto self = weak.lock()) {
          self->Tick();
        }
      });
      return;
    }
    const std::uint64_t next = std::min(chunk_, total_ - sent_);
    in_flight_ = true;
    transport_.WriteChunk(
        chunks_->Slice(static_cast<std::size_t>(next)),
        [self = shared_from_this(), next](const boost::system::error_code &ec) {
          self->OnWritten(ec, next);
        });
  }

  void OnWritten(const boost::system::error_code &ec, std::uint64_t n) {
    in_flight_ = false;
    if (WIRESPEED_UNLIKELY(state_ != StreamState::streaming)) {
      return;
    }
    if (WIRESPEED_UNLIKELY(ec)) {
      Fail(ec.message());
      return;
    }
    const std::uint64_t before = sent_;
    sent_ += n;
    const std::int64_t now = clock_();
    session_.AdvanceTo(sent_, now);
    if (sent_ / step_ != before / step_ || sent_ == total_) {
      StreamEvent ev;
      ev.kind = StreamEventKind::progress;
      ev.timestampMs = now;
      ev.bytesSent = sent_;
      ev.totalBytes = total_;
      ev.percent = std::round(static_cast<double>(sent_) * 1000.0 /
                              static_cast<double>(total_)) /
                   10.0;
      transport_.WriteEvent(ev);
    }
    ScheduleTick();
  }

  void Complete() {
    const std::int64_t now = clock_();
    state_ = StreamState::completed;
    StreamEvent ev;
    ev.kind = StreamEventKind::complete;
    ev.timestampMs = now;
    ev.bytesSent = sent_;
    ev.totalBytes = total_;
    ev.chunkSize = chunk_;
    ev.percent = 100.0;
    ev.result = ComputeThroughput(sent_, start_ms_, now);
    transport_.WriteEvent(ev);
    if (on_finish_) {
      on_finish_(ev);
    }
  }

  void Fail(std::string message) {
    state_ = StreamState::error;
    StreamEvent ev;
    ev.kind = StreamEventKind::error;
    ev.timestampMs = clock_();
    ev.bytesSent = sent_;
    ev.totalBytes = total_;
    ev.message = std::move(message);
    transport_.WriteEvent(ev);
    if (on_finish_) {
      on_finish_(ev);
    }
  }

  Transport &transport_;
  Session &session_;
  const Policy &policy_;
  timeutil::Clock clock_;
  ChunkFill fill_;
  FinishHandler on_finish_;

  StreamState state_ = StreamState::idle;
  bool cancelled_ = false;
  bool in_flight_ = false;
  std::uint64_t total_ = 0;
  std::uint64_t chunk_ = 0;
  std::uint64_t step_ = 1;
  std::uint64_t sent_ = 0;
  std::int64_t start_ms_ = 0;
  std::optional<ChunkGenerator> chunks_;
};

} // namespace speedtest
