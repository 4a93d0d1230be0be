#pragma once

#include "core/server_context.hpp"
#include "net/ws_channel.hpp"
#include "net/ws_ops.hpp"
#include "speedtest/control_handler.hpp"
#include "speedtest/session.hpp"
#include "util/branch.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

// WsSession — the persistent duplex adapter. One connection serves any number
// of sequential tests.
// Threading model:
// - Executes as a Boost.Asio coroutine (spawn) on the connection's strand of
//   the main reactor; no dedicated OS thread per session
// - The coroutine only reads. Outbound frames and download chunks go through
//   the WsChannel write queue, whose completions run on the same strand, so
//   handler state is never touched concurrently
// - The coroutine holds the session alive; when the read loop ends the
//   handler cancels any live run and the session is released
class WsSession : public std::enable_shared_from_this<WsSession> {
public:
  WsSession(beast::tcp_stream stream, ServerContext &ctx)
      : ctx_(ctx), id_(speedtest::NewSessionId()),
        channel_(std::make_shared<WsChannel>(
            WsChannel::Stream(std::move(stream)),
            ctx.policy.outbound_high_water, "ws_session " + id_)),
        handler_(*channel_, ctx.websocket, ctx.policy, id_, ctx.clock) {}

  // Completes the upgrade for `req` and serves frames until the peer leaves.
  void Run(http::request<http::string_body> req) {
    net::spawn(channel_->Ws().get_executor(),
               [self = shared_from_this(),
                req = std::move(req)](net::yield_context yield) {
                 self->Serve(req, yield);
               });
  }

private:
  void Serve(const http::request<http::string_body> &req,
             net::yield_context yield) {
    auto &ws = channel_->Ws();
    // The websocket stream applies its own timeouts.
    beast::get_lowest_layer(ws).expires_never();
    wsops::ConfigureWebSocket(ws, ctx_.server_name);
    ws.read_message_max(ctx_.policy.upload_body_limit);
    wsops::SetTcpNoDelay(beast::get_lowest_layer(ws));

    auto st = wsops::AsyncWsAccept(ws, req, yield);
    if (WIRESPEED_UNLIKELY(!st)) {
      OnError("accept", st.error());
      return;
    }
    handler_.OnOpen();
    beast::error_code ec = ReadLoop(yield);
    if (ec != websocket::error::closed) {
      OnError("read", ec);
    }
    handler_.OnClose();
  }

  beast::error_code ReadLoop(net::yield_context yield) {
    auto &ws = channel_->Ws();
    beast::flat_buffer buffer;
    beast::error_code ec;
    for (;;) {
      ws.async_read(buffer, yield[ec]);
      if (WIRESPEED_UNLIKELY(ec)) {
        break;
      }
      if (ws.got_text()) {
        handler_.OnText(beast::buffers_to_string(buffer.data()));
      } else {
        handler_.OnBinary(buffer.size());
      }
      buffer.consume(buffer.size());
    }
    return ec;
  }

  void OnError(const char *stage, const beast::error_code &ec) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    std::cerr << "[ws_session " << id_ << "] " << stage
              << " error: " << ec.message() << "\n";
  }

  ServerContext &ctx_;
  std::string id_;
  std::shared_ptr<WsChannel> channel_;
  speedtest::ControlHandler handler_;
};
