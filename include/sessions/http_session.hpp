#pragma once

#include "core/server_context.hpp"
#include "logging/result_event.hpp"
#include "net/query.hpp"
#include "protocol/messages.hpp"
#include "sessions/actor_session.hpp"
#include "sessions/ws_session.hpp"
#include "speedtest/ping.hpp"
#include "speedtest/scheduler.hpp"
#include "speedtest/session.hpp"
#include "speedtest/throughput.hpp"
#include "speedtest/transport.hpp"
#include "util/branch.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

// HttpSession — the one-shot adapter: one request, one response, then the
// next request on the same keep-alive connection.
// Threading model:
// - Callback chain on the connection's strand of the main reactor
// - For /api/download the session is the scheduler's Transport: the body is
//   a buffer_body streamed through one response_serializer, one async_write
//   per chunk. At most one write is in flight; that is the backpressure
//   signal
// - Socket upgrades leave this class: the stream is moved into a WsSession,
//   or re-homed onto the actor reactor for an ActorSession
class HttpSession : public speedtest::Transport,
                    public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket socket, ServerContext &ctx)
      : stream_(std::move(socket)), ctx_(ctx), index_(NextIndex()) {
    ctx_.http.ConnectionOpened();
  }

  ~HttpSession() override { ctx_.http.ConnectionClosed(); }

  void Run() {
    net::dispatch(stream_.get_executor(),
                  [self = shared_from_this()] { self->DoRead(); });
  }

  // speedtest::Transport, used only while a download response is streaming.

  bool Backpressured() const override { return !failed_ && writing_; }

  void WriteChunk(net::const_buffer chunk, Completion done) override {
    if (WIRESPEED_UNLIKELY(failed_ || !serializer_)) {
      Defer([done = std::move(done)] { done(net::error::operation_aborted); });
      return;
    }
    auto &body = download_->body();
    body.data = const_cast<void *>(chunk.data());
    body.size = chunk.size();
    body.more = true;
    pending_ = std::move(done);
    writing_ = true;
    stream_.expires_after(kIoTimeout);
    http::async_write(stream_, *serializer_,
                      [self = shared_from_this()](beast::error_code ec,
                                                  std::size_t) {
                        if (ec == http::error::need_buffer) {
                          ec = {};
                        }
                        self->OnStreamWrite(ec);
                      });
  }

  void WriteEvent(const speedtest::StreamEvent &ev) override {
    switch (ev.kind) {
    case speedtest::StreamEventKind::started:
      BeginDownload(ev.totalBytes);
      break;
    case speedtest::StreamEventKind::progress:
      // No side channel on a plain response.
      break;
    case speedtest::StreamEventKind::complete:
      finish_pending_ = true;
      if (!writing_) {
        FinishDownload();
      }
      break;
    case speedtest::StreamEventKind::error:
      keep_alive_ = false;
      std::cerr << "[http_session " << index_
                << "] download error: " << ev.message << "\n";
      break;
    }
  }

  void OnDrain(std::function<void()> fn) override {
    if (!Backpressured()) {
      Defer(std::move(fn));
      return;
    }
    drain_waiters_.push_back(std::move(fn));
  }

  // The posted task keeps the session alive between chunks; nothing else
  // holds it while no I/O is pending.
  void Defer(std::function<void()> fn) override {
    net::post(stream_.get_executor(),
              [self = shared_from_this(), fn = std::move(fn)] { fn(); });
  }

private:
  static constexpr std::chrono::seconds kIoTimeout{30};

  static std::uint64_t NextIndex() {
    static std::atomic<std::uint64_t> next{0};
    return next.fetch_add(1, std::memory_order_relaxed);
  }

  void DoRead() {
    run_.reset();
    test_session_.reset();
    serializer_.reset();
    download_.reset();
    failed_ = false;
    finish_pending_ = false;
    parser_.emplace();
    parser_->body_limit(ctx_.policy.upload_body_limit);
    stream_.expires_after(kIoTimeout);
    http::async_read_header(
        stream_, buffer_, *parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
          self->OnHeader(ec);
        });
  }

  void OnHeader(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      DoClose();
      return;
    }
    if (WIRESPEED_UNLIKELY(ec)) {
      OnError("read header", ec);
      return;
    }
    header_ms_ = ctx_.clock();
    if (parser_->is_done()) {
      OnRead({});
      return;
    }
    http::async_read(stream_, buffer_, *parser_,
                     [self = shared_from_this()](beast::error_code ec,
                                                 std::size_t) {
                       self->OnRead(ec);
                     });
  }

  void OnRead(beast::error_code ec) {
    body_ms_ = ctx_.clock();
    if (ec == http::error::body_limit) {
      ctx_.http.CountError();
      SendJson(http::status::payload_too_large,
               proto::EncodeHttpError("Payload too large"), true);
      return;
    }
    if (WIRESPEED_UNLIKELY(ec)) {
      OnError("read body", ec);
      return;
    }
    req_ = parser_->release();
    if (websocket::is_upgrade(req_)) {
      Upgrade();
      return;
    }
    Handle();
  }

  void Handle() {
    const auto raw = req_.target();
    const URL::Target target =
        URL::SplitTarget(std::string_view(raw.data(), raw.size()));
    const http::verb method = req_.method();

    if (method == http::verb::options) {
      SendEmpty(http::status::no_content);
      return;
    }
    if (method == http::verb::get && URL::PathIs(target.path, "/api/ping")) {
      ctx_.http.CountPing();
      const auto reply =
          speedtest::HandlePing(target.GetInt("timestamp"), ctx_.clock());
      SendJson(http::status::ok, proto::EncodeHttpPing(reply));
      return;
    }
    if (method == http::verb::get &&
        URL::PathIs(target.path, "/api/download")) {
      StartDownload(target);
      return;
    }
    if (method == http::verb::post && URL::PathIs(target.path, "/api/upload")) {
      HandleUpload();
      return;
    }
    if (method == http::verb::get && URL::PathIs(target.path, "/api/status")) {
      SendJson(http::status::ok, proto::EncodeStatus(Stats()));
      return;
    }
    if (method == http::verb::get && URL::PathIs(target.path, "/api/health")) {
      SendJson(http::status::ok,
               proto::EncodeHealth(Stats(), ctx_.clock()));
      return;
    }
    SendJson(http::status::not_found, proto::EncodeHttpError("Not found"));
  }

  proto::ServerStats Stats() const {
    return proto::ServerStats{.uptimeSeconds = ctx_.UptimeSeconds(),
                              .http = ctx_.http.Snapshot(),
                              .websocket = ctx_.websocket.Snapshot(),
                              .actor = ctx_.actor.Snapshot(),
                              .version = ctx_.version};
  }

  void HandleUpload() {
    ctx_.http.CountUpload();
    switch (proto::CheckUploadBody(req_.body())) {
    case proto::UploadBody::invalid:
      ctx_.http.CountError();
      SendJson(http::status::bad_request,
               proto::EncodeHttpError("Invalid JSON body"));
      return;
    case proto::UploadBody::empty:
      SendJson(http::status::bad_request,
               proto::EncodeHttpError("No content provided"));
      return;
    case proto::UploadBody::ok:
      break;
    }
    const auto result =
        speedtest::ComputeThroughput(req_.body().size(), header_ms_, body_ms_);
    ctx_.http.RecordResult(logging::ResultKind::upload,
                           speedtest::NewSessionId(), result);
    SendJson(http::status::ok, proto::EncodeUploadResult(result));
  }

  void StartDownload(const URL::Target &target) {
    ctx_.http.CountDownload();
    const std::int64_t now = ctx_.clock();
    test_session_.emplace(speedtest::NewSessionId(), now);
    test_session_->Begin(speedtest::Phase::download, now);
    keep_alive_ = req_.keep_alive();
    run_ = std::make_shared<speedtest::StreamScheduler>(
        *this, *test_session_, ctx_.policy, ctx_.clock,
        speedtest::ChunkFill::random);
    run_->OnFinish([this](const speedtest::StreamEvent &ev) {
      if (ev.kind == speedtest::StreamEventKind::complete) {
        ctx_.http.RecordResult(logging::ResultKind::download,
                               test_session_->Id(), ev.result);
      } else {
        ctx_.http.CountError();
        // A half-sent body cannot be followed by another response.
        failed_ = true;
        DoClose();
      }
      test_session_->End(ev.timestampMs);
    });
    run_->Start(target.GetInt("size"), target.GetInt("chunkSize"));
  }

  // Header goes out first; chunk writes wait on it through backpressure.
  void BeginDownload(std::uint64_t total) {
    download_.emplace(http::status::ok, req_.version());
    download_->set(http::field::server, ctx_.server_name);
    download_->set(http::field::content_type, "application/octet-stream");
    download_->set(http::field::cache_control,
                   "no-cache, no-store, must-revalidate");
    download_->set(http::field::pragma, "no-cache");
    download_->set(http::field::expires, "0");
    download_->set(http::field::access_control_allow_origin, "*");
    download_->content_length(total);
    download_->keep_alive(keep_alive_);
    download_->body().data = nullptr;
    download_->body().more = true;
    serializer_.emplace(*download_);
    writing_ = true;
    stream_.expires_after(kIoTimeout);
    http::async_write_header(stream_, *serializer_,
                             [self = shared_from_this()](beast::error_code ec,
                                                         std::size_t) {
                               self->OnStreamWrite(ec);
                             });
  }

  void OnStreamWrite(beast::error_code ec) {
    writing_ = false;
    if (WIRESPEED_UNLIKELY(ec)) {
      failed_ = true;
      keep_alive_ = false;
      if (ec != net::error::operation_aborted) {
        OnError("download write", ec);
      }
    }
    if (auto done = std::move(pending_)) {
      pending_ = nullptr;
      done(ec);
    }
    if (finish_pending_ && !failed_) {
      FinishDownload();
      return;
    }
    RunDrainWaiters();
  }

  void FinishDownload() {
    finish_pending_ = false;
    auto &body = download_->body();
    body.data = nullptr;
    body.size = 0;
    body.more = false;
    writing_ = true;
    stream_.expires_after(kIoTimeout);
    http::async_write(stream_, *serializer_,
                      [self = shared_from_this()](beast::error_code ec,
                                                  std::size_t) {
                        self->writing_ = false;
                        if (ec) {
                          self->OnError("download finish", ec);
                          return;
                        }
                        if (!self->keep_alive_) {
                          self->DoClose();
                          return;
                        }
                        self->DoRead();
                      });
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

  void Upgrade() {
    const auto raw = req_.target();
    const URL::Target target =
        URL::SplitTarget(std::string_view(raw.data(), raw.size()));
    if (URL::PathIs(target.path, "/") || URL::PathIs(target.path, "/ws")) {
      std::make_shared<WsSession>(std::move(stream_), ctx_)
          ->Run(std::move(req_));
      return;
    }
    if (URL::PathIs(target.path, "/functions/websocket") ||
        URL::PathIs(target.path, "/ws/actor")) {
      if (ctx_.actor_ioc == nullptr) {
        std::cerr << "[http_session " << index_
                  << "] actor reactor not running\n";
        SendJson(http::status::service_unavailable,
                 proto::EncodeHttpError("Actor endpoint unavailable"), true);
        return;
      }
      stream_.expires_never();
      ActorSession::Adopt(stream_, *ctx_.actor_ioc, ctx_, std::move(req_));
      return;
    }
    SendJson(http::status::not_found, proto::EncodeHttpError("Not found"),
             true);
  }

  template <typename Res> void SetCommonHeaders(Res &res, bool close) {
    res.set(http::field::server, ctx_.server_name);
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req_.keep_alive() && !close);
  }

  void SendJson(http::status status, std::string body, bool close = false) {
    auto res = std::make_shared<http::response<http::string_body>>(
        status, req_.version());
    SetCommonHeaders(*res, close);
    res->set(http::field::content_type, "application/json");
    res->body() = std::move(body);
    res->prepare_payload();
    Send(std::move(res));
  }

  void SendEmpty(http::status status) {
    auto res = std::make_shared<http::response<http::string_body>>(
        status, req_.version());
    SetCommonHeaders(*res, false);
    res->set(http::field::access_control_allow_methods,
             "GET, POST, PUT, DELETE, OPTIONS");
    res->set(http::field::access_control_allow_headers,
             "Content-Type, Authorization, X-Requested-With");
    res->prepare_payload();
    Send(std::move(res));
  }

  void Send(std::shared_ptr<http::response<http::string_body>> res) {
    stream_.expires_after(kIoTimeout);
    http::async_write(stream_, *res,
                      [self = shared_from_this(), res](beast::error_code ec,
                                                       std::size_t) {
                        self->OnWrite(ec, res->need_eof());
                      });
  }

  void OnWrite(beast::error_code ec, bool close) {
    if (WIRESPEED_UNLIKELY(ec)) {
      OnError("write", ec);
      return;
    }
    if (close) {
      DoClose();
      return;
    }
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  void OnError(const char *stage, const beast::error_code &ec) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    std::cerr << "[http_session " << index_ << "] " << stage
              << " error: " << ec.message() << "\n";
  }

  beast::tcp_stream stream_;
  ServerContext &ctx_;
  std::uint64_t index_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  http::request<http::string_body> req_;
  std::int64_t header_ms_ = 0;
  std::int64_t body_ms_ = 0;

  // download state
  std::optional<speedtest::Session> test_session_;
  std::shared_ptr<speedtest::StreamScheduler> run_;
  std::optional<http::response<http::buffer_body>> download_;
  std::optional<http::response_serializer<http::buffer_body>> serializer_;
  Completion pending_;
  std::vector<std::function<void()>> drain_waiters_;
  bool writing_ = false;
  bool failed_ = false;
  bool finish_pending_ = false;
  bool keep_alive_ = true;
};
