#pragma once

#include "core/server_context.hpp"
#include "net/ws_channel.hpp"
#include "net/ws_ops.hpp"
#include "speedtest/control_handler.hpp"
#include "speedtest/session.hpp"
#include "util/branch.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <cstddef>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

// ActorSession — the isolated per-connection adapter. Same control protocol
// as WsSession, different execution model.
// Threading model:
// - The socket is re-homed from the main reactor onto a private strand of the
//   actor reactor; the actor never shares an executor with another connection
// - Socket events do not call the handler directly: they are posted as
//   envelopes into the actor's mailbox, and the mailbox is drained one
//   envelope per posted task, so a burst of frames cannot starve the
//   actor's own download ticks
// - Callback driven (no coroutine); every pending operation holds the actor
//   alive through shared_from_this
class ActorSession : public std::enable_shared_from_this<ActorSession> {
public:
  ActorSession(tcp::socket socket, ServerContext &ctx)
      : ctx_(ctx), id_(speedtest::NewSessionId()),
        channel_(std::make_shared<WsChannel>(
            WsChannel::Stream(std::move(socket)),
            ctx.policy.outbound_high_water, "actor_session " + id_)),
        handler_(*channel_, ctx.actor, ctx.policy, id_, ctx.clock) {}

  // Moves an accepted connection onto a fresh strand of `actorIoc` and starts
  // the actor there. The stream must have no pending operations.
  static void Adopt(beast::tcp_stream &stream, net::io_context &actorIoc,
                    ServerContext &ctx, http::request<http::string_body> req) {
    beast::error_code ec;
    tcp::socket &src = stream.socket();
    const auto protocol = src.local_endpoint(ec).protocol();
    if (ec) {
      std::cerr << "[actor_session] handoff error: " << ec.message() << "\n";
      return;
    }
    const auto fd = src.release(ec);
    if (ec) {
      std::cerr << "[actor_session] handoff error: " << ec.message() << "\n";
      return;
    }
    auto strand = net::make_strand(actorIoc);
    net::post(strand, [strand, protocol, fd, &ctx,
                       req = std::move(req)]() mutable {
      tcp::socket sock(strand);
      beast::error_code aec;
      sock.assign(protocol, fd, aec);
      if (aec) {
        std::cerr << "[actor_session] assign error: " << aec.message() << "\n";
        ::close(fd);
        return;
      }
      std::make_shared<ActorSession>(std::move(sock), ctx)
          ->Run(std::move(req));
    });
  }

  void Run(http::request<http::string_body> req) {
    auto &ws = channel_->Ws();
    beast::get_lowest_layer(ws).expires_never();
    wsops::ConfigureWebSocket(ws, ctx_.server_name);
    ws.read_message_max(ctx_.policy.upload_body_limit);
    wsops::SetTcpNoDelay(beast::get_lowest_layer(ws));
    req_ = std::move(req);
    ws.async_accept(req_, [self = shared_from_this()](beast::error_code ec) {
      self->OnAccept(ec);
    });
  }

private:
  struct Envelope {
    enum class Kind { open, text, binary, close };
    Kind kind = Kind::open;
    std::string text;
    std::size_t bytes = 0;
  };

  void OnAccept(beast::error_code ec) {
    if (WIRESPEED_UNLIKELY(ec)) {
      OnError("accept", ec);
      return;
    }
    Deliver(Envelope{.kind = Envelope::Kind::open});
    DoRead();
  }

  void DoRead() {
    channel_->Ws().async_read(
        buffer_, [self = shared_from_this()](beast::error_code ec,
                                             std::size_t) { self->OnRead(ec); });
  }

  void OnRead(beast::error_code ec) {
    if (WIRESPEED_UNLIKELY(ec)) {
      if (ec != websocket::error::closed) {
        OnError("read", ec);
      }
      Deliver(Envelope{.kind = Envelope::Kind::close});
      return;
    }
    Envelope env;
    if (channel_->Ws().got_text()) {
      env.kind = Envelope::Kind::text;
      env.text = beast::buffers_to_string(buffer_.data());
    } else {
      env.kind = Envelope::Kind::binary;
      env.bytes = buffer_.size();
    }
    buffer_.consume(buffer_.size());
    Deliver(std::move(env));
    DoRead();
  }

  void Deliver(Envelope env) {
    mailbox_.push_back(std::move(env));
    if (draining_) {
      return;
    }
    draining_ = true;
    ScheduleDrain();
  }

  void ScheduleDrain() {
    net::post(channel_->Ws().get_executor(),
              [self = shared_from_this()] { self->DrainOne(); });
  }

  void DrainOne() {
    if (mailbox_.empty()) {
      draining_ = false;
      return;
    }
    Envelope env = std::move(mailbox_.front());
    mailbox_.pop_front();
    switch (env.kind) {
    case Envelope::Kind::open:
      handler_.OnOpen();
      break;
    case Envelope::Kind::text:
      handler_.OnText(env.text);
      break;
    case Envelope::Kind::binary:
      handler_.OnBinary(env.bytes);
      break;
    case Envelope::Kind::close:
      handler_.OnClose();
      mailbox_.clear();
      break;
    }
    if (mailbox_.empty()) {
      draining_ = false;
      return;
    }
    ScheduleDrain();
  }

  void OnError(const char *stage, const beast::error_code &ec) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    std::cerr << "[actor_session " << id_ << "] " << stage
              << " error: " << ec.message() << "\n";
  }

  ServerContext &ctx_;
  std::string id_;
  std::shared_ptr<WsChannel> channel_;
  speedtest::ControlHandler handler_;
  http::request<http::string_body> req_;
  beast::flat_buffer buffer_;
  std::deque<Envelope> mailbox_;
  bool draining_ = false;
};
