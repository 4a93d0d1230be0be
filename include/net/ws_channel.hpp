#pragma once

#include "protocol/messages.hpp"
#include "speedtest/transport.hpp"
#include "util/branch.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

// WsChannel — speedtest::ControlChannel over one Beast websocket stream.
// Threading model:
// - Lives on the stream's strand; every method must be called there
// - Outbound frames go through a FIFO with exactly one async_write in flight;
//   text and binary frames share the queue so their order on the wire is the
//   order they were written
// - Backpressure: the queue has reached `high_water` frames. Drain waiters run
//   as soon as a write completion brings it below the mark again
// - On a write error the channel fails: queued chunk completions get the
//   error, drain waiters are released, and later writes complete with
//   operation_aborted
// - Held by shared_ptr; the in-flight write keeps the channel (and the frame
//   it is sending) alive past the owning session
class WsChannel : public speedtest::ControlChannel,
                  public std::enable_shared_from_this<WsChannel> {
public:
  using Stream = websocket::stream<beast::tcp_stream>;

  WsChannel(Stream ws, std::size_t highWater, std::string tag)
      : ws_(std::move(ws)), high_water_(highWater == 0 ? 1 : highWater),
        tag_(std::move(tag)) {}

  Stream &Ws() { return ws_; }
  bool Failed() const { return failed_; }
  std::size_t Queued() const { return queue_.size(); }

  bool Backpressured() const override {
    return !failed_ && queue_.size() >= high_water_;
  }

  void WriteChunk(net::const_buffer chunk, Completion done) override {
    if (WIRESPEED_UNLIKELY(failed_)) {
      Defer([done = std::move(done)] { done(net::error::operation_aborted); });
      return;
    }
    Frame f;
    f.binary = true;
    f.chunk = chunk;
    f.done = std::move(done);
    queue_.push_back(std::move(f));
    StartWrite();
  }

  void WriteEvent(const speedtest::StreamEvent &ev) override {
    WriteText(proto::EncodeStreamEvent(ev));
  }

  void WriteText(std::string text) override {
    if (WIRESPEED_UNLIKELY(failed_)) {
      return;
    }
    Frame f;
    f.text = std::move(text);
    queue_.push_back(std::move(f));
    StartWrite();
  }

  void OnDrain(std::function<void()> fn) override {
    if (!Backpressured()) {
      Defer(std::move(fn));
      return;
    }
    drain_waiters_.push_back(std::move(fn));
  }

  void Defer(std::function<void()> fn) override {
    net::post(ws_.get_executor(), std::move(fn));
  }

private:
  struct Frame {
    bool binary = false;
    std::string text;
    net::const_buffer chunk;
    Completion done;
  };

  void StartWrite() {
    // A completion may already have restarted the chain.
    if (writing_ || queue_.empty()) {
      return;
    }
    writing_ = true;
    Frame &f = queue_.front();
    ws_.binary(f.binary);
    net::const_buffer buf = f.binary ? f.chunk : net::buffer(f.text);
    ws_.async_write(buf, [self = shared_from_this()](beast::error_code ec,
                                                     std::size_t) {
      self->OnWrite(ec);
    });
  }

  void OnWrite(beast::error_code ec) {
    writing_ = false;
    Frame f = std::move(queue_.front());
    queue_.pop_front();
    if (WIRESPEED_UNLIKELY(ec)) {
      Fail(ec);
      if (f.done) {
        f.done(ec);
      }
      return;
    }
    if (f.done) {
      f.done(ec);
    }
    StartWrite();
    if (!Backpressured()) {
      RunDrainWaiters();
    }
  }

  void Fail(const beast::error_code &ec) {
    if (failed_) {
      return;
    }
    failed_ = true;
    if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
      std::cerr << "[" << tag_ << "] write error: " << ec.message() << "\n";
    }
    std::deque<Frame> pending;
    pending.swap(queue_);
    for (auto &f : pending) {
      if (f.done) {
        Defer([done = std::move(f.done), ec] { done(ec); });
      }
    }
    RunDrainWaiters();
  }

  void RunDrainWaiters() {
    if (drain_waiters_.empty()) {
      return;
    }
    std::vector<std::function<void()>> waiters;
    waiters.swap(drain_waiters_);
    for (auto &fn : waiters) {
      Defer(std::move(fn));
    }
  }

  Stream ws_;
  std::size_t high_water_;
  std::string tag_;
  std::deque<Frame> queue_;
  std::vector<std::function<void()>> drain_waiters_;
  bool writing_ = false;
  bool failed_ = false;
};
