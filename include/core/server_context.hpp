#pragma once

#include "logging/result_event.hpp"
#include "speedtest/metrics.hpp"
#include "speedtest/policy.hpp"
#include "util/time.hpp"
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <string>

// ServerContext — what every connection needs from the server: the limits,
// the metrics collector of its adapter and the actor reactor for handoff.
// Owned by Server and outlives every session.
struct ServerContext {
  explicit ServerContext(speedtest::Policy p,
                         timeutil::Clock clock = timeutil::EpochMillisUtc)
      : policy(p), clock(clock), http(logging::ResultSource::http, clock),
        websocket(logging::ResultSource::websocket, clock),
        actor(logging::ResultSource::actor, clock), started_ms(clock()) {}

  ServerContext(const ServerContext &) = delete;
  ServerContext &operator=(const ServerContext &) = delete;

  std::int64_t UptimeSeconds() const { return (clock() - started_ms) / 1000; }

  speedtest::Policy policy;
  timeutil::Clock clock;
  speedtest::Metrics http;
  speedtest::Metrics websocket;
  speedtest::Metrics actor;
  boost::asio::io_context *actor_ioc = nullptr;
  std::int64_t started_ms;
  std::string version = "2.0.0";
  std::string server_name = "wirespeed/2.0.0";
};
