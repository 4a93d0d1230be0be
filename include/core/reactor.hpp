#pragma once

#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (1.74)
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns one io_context; connections run as coroutines or callback chains on
//   their own strands of it
// - Runs io_context::run() on N std::jthread workers; no thread per
//   connection
// - The server owns two: the main reactor (listener, HTTP and duplex
//   sessions) and the actor reactor (actor sessions only)
class Reactor {
public:
  explicit Reactor(std::string name = "reactor") : name_(std::move(name)) {}

  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }
  const std::string &Name() const { return name_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    if (numThreads < 1) {
      numThreads = 1;
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  // Stops and waits for every worker to leave run().
  void Join() {
    Stop();
    threads_.clear();
  }

  ~Reactor() { Join(); }

private:
  std::string name_;
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
