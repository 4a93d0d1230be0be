#pragma once

#include "core/server_context.hpp"
#include "net/backoff.hpp"
#include "net/ws_ops.hpp"
#include "sessions/http_session.hpp"
#include "util/branch.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <iostream>
#include <memory>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Listener
// Threading model:
// - Accept loop is one coroutine (spawn) on the main reactor
// - Each accepted socket gets its own strand and an HttpSession; upgrades
//   continue from there
// - Accept errors back off (retry::Backoff) instead of spinning, so fd
//   exhaustion does not turn into a busy loop
class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(net::io_context &ioc, ServerContext &ctx)
      : ioc_(ioc), acceptor_(net::make_strand(ioc)), ctx_(ctx) {}

  // Opens, binds and listens. Port 0 picks an ephemeral port.
  wsops::Status Open(const tcp::endpoint &endpoint) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      return std::unexpected(ec);
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      return std::unexpected(ec);
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
      return std::unexpected(ec);
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    return wsops::MakeStatus(ec);
  }

  tcp::endpoint LocalEndpoint() const {
    beast::error_code ec;
    return acceptor_.local_endpoint(ec);
  }

  void Start() {
    net::spawn(acceptor_.get_executor(),
               [self = shared_from_this()](net::yield_context yield) {
                 self->AcceptLoop(yield);
               });
  }

  // Closing the acceptor ends the loop with operation_aborted.
  void Stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
      beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

private:
  void AcceptLoop(net::yield_context yield) {
    retry::Backoff backoff;
    for (;;) {
      auto sock = wsops::AsyncAccept(acceptor_, ioc_.get_executor(), yield);
      if (WIRESPEED_UNLIKELY(!sock)) {
        if (sock.error() == net::error::operation_aborted ||
            !acceptor_.is_open()) {
          return;
        }
        std::cerr << "[listener] accept error: " << sock.error().message()
                  << "\n";
        if (!retry::WaitAsync(acceptor_.get_executor(), yield,
                              backoff.Next())) {
          return;
        }
        continue;
      }
      backoff.Reset();
      wsops::SetTcpNoDelay(*sock);
      std::make_shared<HttpSession>(std::move(*sock), ctx_)->Run();
    }
  }

  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  ServerContext &ctx_;
};
