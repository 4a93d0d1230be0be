#pragma once

#include "core/reactor.hpp"
#include "core/server_context.hpp"
#include "logging/result_logger.hpp"
#include "net/listener.hpp"
#include "speedtest/policy.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <expected>
#include <iostream>
#include <memory>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;

struct ServerOptions {
  std::string address = "0.0.0.0";
  std::uint16_t port = 3000;
  int threads = 1;
  int actorThreads = 2;
  // Empty disables the results file.
  std::string resultsOut;
  speedtest::Policy policy;
};

// Server — composition root.
// Threading model:
// - Main Reactor: listener, HTTP sessions, duplex sessions
// - Actor Reactor: actor sessions, one strand each
// - ResultLogger: one jthread draining the three per-adapter result queues
// - Start() returns once the port is bound; Stop() closes the listener, stops
//   both reactors and joins the logger after its final drain
class Server {
public:
  explicit Server(ServerOptions opt)
      : opt_(std::move(opt)), ctx_(opt_.policy), main_("main"),
        actor_("actor") {
    ctx_.actor_ioc = &actor_.GetIoContext();
  }

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  ~Server() { Stop(); }

  // Returns the bound port.
  std::expected<std::uint16_t, std::string> Start() {
    if (started_) {
      return listener_->LocalEndpoint().port();
    }
    beast::error_code ec;
    const auto addr = net::ip::make_address(opt_.address, ec);
    if (ec) {
      return std::unexpected("bad address " + opt_.address + ": " +
                             ec.message());
    }
    listener_ = std::make_shared<Listener>(main_.GetIoContext(), ctx_);
    if (auto st = listener_->Open(tcp::endpoint(addr, opt_.port)); !st) {
      return std::unexpected("listen on " + opt_.address + ":" +
                             std::to_string(opt_.port) + ": " +
                             st.error().message());
    }
    if (!opt_.resultsOut.empty() && logger_.Open(opt_.resultsOut)) {
      logger_.AddSource(ctx_.http.Results());
      logger_.AddSource(ctx_.websocket.Results());
      logger_.AddSource(ctx_.actor.Results());
      logger_.Start();
    }
    listener_->Start();
    main_.Start(opt_.threads);
    actor_.Start(opt_.actorThreads);
    started_ = true;
    return listener_->LocalEndpoint().port();
  }

  void Stop() {
    if (!started_) {
      return;
    }
    started_ = false;
    listener_->Stop();
    main_.Join();
    actor_.Join();
    logger_.Join();
  }

  ServerContext &Context() { return ctx_; }

private:
  ServerOptions opt_;
  ServerContext ctx_;
  Reactor main_;
  Reactor actor_;
  logging::ResultLogger logger_;
  std::shared_ptr<Listener> listener_;
  bool started_ = false;
};
