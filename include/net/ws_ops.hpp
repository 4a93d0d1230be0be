#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <expected>
#include <string>

// namespace wsops — thin std::expected wrappers over the Asio/Beast calls the
// server makes. Async variants suspend a spawn coroutine; the sync variants
// are what the blocking test clients use.
namespace wsops {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using Status = std::expected<void, beast::error_code>;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

// Accepts one connection onto its own strand of `ex`.
template <typename Executor>
inline std::expected<tcp::socket, beast::error_code>
AsyncAccept(tcp::acceptor &acceptor, const Executor &ex,
            net::yield_context yield) {
  beast::error_code ec;
  tcp::socket sock(net::make_strand(ex));
  acceptor.async_accept(sock, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return sock;
}

// Completes the server side of the upgrade for an already-read request.
template <typename WS>
inline Status AsyncWsAccept(WS &ws, const http::request<http::string_body> &req,
                            net::yield_context yield) {
  beast::error_code ec;
  ws.async_accept(req, yield[ec]);
  return MakeStatus(ec);
}

// Sync variants

inline std::expected<tcp::resolver::results_type, beast::error_code>
Resolve(tcp::resolver &resolver, const std::string &host,
        const std::string &port) {
  beast::error_code ec;
  auto r = resolver.resolve(host, port, ec);
  if (ec)
    return std::unexpected(ec);
  return r;
}

inline Status Connect(tcp::socket &sock,
                      const tcp::resolver::results_type &endpoints) {
  beast::error_code ec;
  net::connect(sock, endpoints, ec);
  return MakeStatus(ec);
}

inline Status WsHandshake(websocket::stream<tcp::socket> &ws,
                          const std::string &host, const std::string &target) {
  beast::error_code ec;
  ws.handshake(host, target, ec);
  return MakeStatus(ec);
}

// Shared helpers

inline void SetTcpNoDelay(tcp::socket &sock) {
  beast::error_code ec;
  sock.set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

inline void SetTcpNoDelay(beast::tcp_stream &stream) {
  SetTcpNoDelay(stream.socket());
}

// Server-side stream options: permessage-deflate off so throughput is
// measured on raw bytes, suggested server timeouts, Server header.
template <typename WS>
inline void ConfigureWebSocket(WS &ws, const std::string &serverName,
                               bool disablePmd = true) {
  if (disablePmd) {
    websocket::permessage_deflate pmd;
    pmd.client_enable = false;
    pmd.server_enable = false;
    ws.set_option(pmd);
  }
  ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws.set_option(websocket::stream_base::decorator(
      [serverName](websocket::response_type &res) {
        res.set(http::field::server, serverName);
      }));
}

} // namespace wsops
