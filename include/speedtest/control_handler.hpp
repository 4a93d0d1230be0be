#pragma once

#include "logging/result_event.hpp"
#include "protocol/messages.hpp"
#include "speedtest/metrics.hpp"
#include "speedtest/ping.hpp"
#include "speedtest/policy.hpp"
#include "speedtest/scheduler.hpp"
#include "speedtest/session.hpp"
#include "speedtest/throughput.hpp"
#include "speedtest/transport.hpp"
#include "util/time.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace speedtest {

// ControlHandler — the socket-side test protocol, independent of how the
// frames travel. One instance per connection; it owns the Session and at most
// one live StreamScheduler.
// Threading model:
// - All entry points run on the connection's executor; the handler never
//   locks and never blocks
// - A new test, test_complete and OnClose() cancel the live run first
// - The destructor cancels too, so a scheduler never outlives its Session in
//   a state where it could touch it
class ControlHandler {
public:
  ControlHandler(ControlChannel &channel, Metrics &metrics,
                 const Policy &policy, std::string sessionId,
                 timeutil::Clock clock = timeutil::EpochMillisUtc)
      : channel_(channel), metrics_(metrics), policy_(policy),
        clock_(std::move(clock)), session_(std::move(sessionId), clock_()) {}

  ControlHandler(const ControlHandler &) = delete;
  ControlHandler &operator=(const ControlHandler &) = delete;

  ~ControlHandler() { CancelRun(); }

  // Counts the connection and greets the peer.
  void OnOpen() {
    if (opened_) {
      return;
    }
    opened_ = true;
    metrics_.ConnectionOpened();
    channel_.WriteText(proto::EncodeConnected(session_.Id(), clock_()));
  }

  // Idempotent; safe to call from every teardown path.
  void OnClose() {
    CancelRun();
    if (opened_ && !closed_) {
      closed_ = true;
      metrics_.ConnectionClosed();
    }
  }

  void OnText(std::string_view text) {
    const std::int64_t now = clock_();
    session_.Touch(now);
    auto req = proto::ParseRequest(text);
    if (!req) {
      metrics_.CountError();
      channel_.WriteText(proto::EncodeError(req.error(), now));
      return;
    }
    switch (req->kind) {
    case proto::RequestKind::ping:
      metrics_.CountPing();
      channel_.WriteText(proto::EncodePong(HandlePing(req->timestamp, now)));
      break;
    case proto::RequestKind::download:
      StartDownload(*req);
      break;
    case proto::RequestKind::upload:
      StartUpload();
      break;
    case proto::RequestKind::upload_data:
      OnUploadData(*req);
      break;
    case proto::RequestKind::complete:
      CompleteTest();
      break;
    case proto::RequestKind::unknown:
      metrics_.CountError();
      channel_.WriteText(proto::EncodeError("Unknown message type", now));
      break;
    }
  }

  // A binary frame from the peer is raw upload payload.
  void OnBinary(std::size_t n) {
    const std::int64_t now = clock_();
    session_.Touch(now);
    if (session_.GetPhase() != Phase::upload) {
      metrics_.CountError();
      channel_.WriteText(
          proto::EncodeError("Upload data received outside upload test", now));
      return;
    }
    Receive(n, now);
  }

  const Session &GetSession() const { return session_; }
  bool Downloading() const { return run_ && !run_->Finished(); }

private:
  void StartDownload(const proto::TestRequest &req) {
    CancelRun();
    metrics_.CountDownload();
    session_.Begin(Phase::download, clock_());
    auto run = std::make_shared<StreamScheduler>(channel_, session_, policy_,
                                                 clock_);
    run->OnFinish([this](const StreamEvent &ev) { OnRunFinished(ev); });
    run_ = run;
    run->Start(req.size, req.chunkSize);
  }

  void OnRunFinished(const StreamEvent &ev) {
    if (ev.kind == StreamEventKind::complete) {
      metrics_.RecordResult(logging::ResultKind::download, session_.Id(),
                            ev.result);
    } else {
      metrics_.CountError();
      std::cerr << "[" << metrics_.Name() << " " << session_.Id()
                << "] download error: " << ev.message << "\n";
    }
    session_.End(ev.timestampMs);
  }

  void StartUpload() {
    CancelRun();
    metrics_.CountUpload();
    const std::int64_t now = clock_();
    session_.Begin(Phase::upload, now);
    channel_.WriteText(proto::EncodeUploadReady(now));
  }

  void OnUploadData(const proto::TestRequest &req) {
    const std::int64_t now = clock_();
    if (session_.GetPhase() != Phase::upload) {
      metrics_.CountError();
      channel_.WriteText(
          proto::EncodeError("Upload data received outside upload test", now));
      return;
    }
    std::uint64_t n = 0;
    if (req.byteLength.has_value() && *req.byteLength > 0) {
      n = static_cast<std::uint64_t>(*req.byteLength);
    } else if (req.dataLength.has_value()) {
      n = *req.dataLength;
    }
    if (n == 0) {
      metrics_.CountError();
      channel_.WriteText(proto::EncodeError("No upload content provided", now));
      return;
    }
    Receive(n, now);
  }

  void Receive(std::uint64_t n, std::int64_t now) {
    session_.AddReceived(n, now);
    channel_.WriteText(
        proto::EncodeUploadAck(now, n, session_.BytesTransferred()));
  }

  void CompleteTest() {
    CancelRun();
    const std::int64_t now = clock_();
    const Phase phase = session_.GetPhase();
    std::optional<TestResult> upload;
    if (phase == Phase::upload) {
      const std::int64_t first = session_.FirstByteTime().value_or(now);
      const std::int64_t last = session_.LastByteTime().value_or(first);
      upload = ComputeThroughput(session_.BytesTransferred(), first, last);
      metrics_.RecordResult(logging::ResultKind::upload, session_.Id(),
                            *upload);
    }
    session_.End(now);
    channel_.WriteText(proto::EncodeTestCompleteAck(now, phase, upload));
  }

  void CancelRun() {
    if (run_) {
      run_->Cancel();
      run_.reset();
    }
  }

  ControlChannel &channel_;
  Metrics &metrics_;
  const Policy &policy_;
  timeutil::Clock clock_;
  Session session_;
  std::shared_ptr<StreamScheduler> run_;
  bool opened_ = false;
  bool closed_ = false;
};

} // namespace speedtest
