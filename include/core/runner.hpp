#pragma once

#include "core/server.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace net = boost::asio;

// Runner composition/threading overview:
// - Server: main reactor (listener, HTTP, duplex) and actor reactor, each on
//   its own jthread pool
// - ResultLogger: dedicated jthread; drains per-adapter result queues into
//   one NDJSON file with writev
// - Main thread: waits on SIGINT/SIGTERM or the --seconds deadline, then
//   stops the server and joins every component
struct RunOptions {
  ServerOptions server;
  int seconds = 0;
};

// Makes sure the directory of `path` exists. Returns false on failure.
inline bool PrepareResultsPath(const std::string &path) {
  if (path.empty()) {
    return true;
  }
  const auto dir = std::filesystem::path(path).parent_path();
  if (dir.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "[runner] cannot create " << dir << ": " << ec.message()
              << "\n";
    return false;
  }
  return true;
}

inline int Run(const RunOptions &opt) {
  // Init
  if (!PrepareResultsPath(opt.server.resultsOut)) {
    return 1;
  }
  Server server(opt.server);

  // Start
  auto port = server.Start();
  if (!port) {
    std::cerr << "[runner] " << port.error() << "\n";
    return 1;
  }
  std::cout << "Listening on " << opt.server.address << ":" << *port
            << " (threads=" << opt.server.threads
            << ", actor threads=" << opt.server.actorThreads << ")\n";
  std::cout << "HTTP  /api/ping /api/download /api/upload /api/status "
               "/api/health\n";
  std::cout << "WS    /ws  actor /ws/actor\n";
  if (!opt.server.resultsOut.empty()) {
    std::cout << "Results -> " << opt.server.resultsOut << "\n";
  }

  // Wait for signal or deadline
  net::io_context waiter;
  net::signal_set signals(waiter, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int sig) {
    if (!ec) {
      std::cout << "Received signal " << sig << ", shutting down\n";
    }
    waiter.stop();
  });
  net::steady_timer deadline(waiter);
  if (opt.seconds > 0) {
    deadline.expires_after(std::chrono::seconds(opt.seconds));
    deadline.async_wait([&](const boost::system::error_code &ec) {
      if (!ec) {
        waiter.stop();
      }
    });
  }
  waiter.run();

  // Stop
  server.Stop();
  return 0;
}
