#pragma once

#include "net/query.hpp"
#include "protocol/json_writer.hpp"
#include "speedtest/metrics.hpp"
#include "speedtest/ping.hpp"
#include "speedtest/session.hpp"
#include "speedtest/throughput.hpp"
#include "speedtest/transport.hpp"
#include "util/proc.hpp"
#include "util/time.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cmath>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// namespace proto — wire vocabulary of the server: the JSON control frames
// shared by the duplex and actor socket adapters, and the HTTP API bodies.
// Every adapter goes through these functions so field names cannot drift.
namespace proto {

namespace pt = boost::property_tree;

inline constexpr std::string_view kPing = "ping";
inline constexpr std::string_view kPong = "pong";
inline constexpr std::string_view kConnected = "connected";
inline constexpr std::string_view kDownloadStart = "download_start";
inline constexpr std::string_view kDownloadStarted = "download_started";
inline constexpr std::string_view kDownloadProgress = "download_progress";
inline constexpr std::string_view kDownloadComplete = "download_complete";
inline constexpr std::string_view kUploadStart = "upload_start";
inline constexpr std::string_view kUploadReady = "upload_ready";
inline constexpr std::string_view kUploadData = "upload_data";
inline constexpr std::string_view kUploadAck = "upload_ack";
inline constexpr std::string_view kTestComplete = "test_complete";
inline constexpr std::string_view kTestCompleteAck = "test_complete_ack";
inline constexpr std::string_view kError = "error";

enum class RequestKind {
  ping,
  download,
  upload,
  upload_data,
  complete,
  unknown
};

struct TestRequest {
  RequestKind kind = RequestKind::unknown;
  std::string type;
  std::optional<std::int64_t> timestamp;
  std::optional<std::int64_t> size;
  std::optional<std::int64_t> chunkSize;
  std::optional<std::int64_t> byteLength;
  // Length of `data` when present: element count for arrays, byte count for
  // strings.
  std::optional<std::size_t> dataLength;
};

inline RequestKind KindFromType(std::string_view type) {
  if (type == kPing) {
    return RequestKind::ping;
  }
  if (type == kDownloadStart) {
    return RequestKind::download;
  }
  if (type == kUploadStart) {
    return RequestKind::upload;
  }
  if (type == kUploadData) {
    return RequestKind::upload_data;
  }
  if (type == kTestComplete) {
    return RequestKind::complete;
  }
  return RequestKind::unknown;
}

// Integer field or nothing. Numbers outside int64 saturate and fractional
// numbers truncate; text, null and objects read as absent.
inline std::optional<std::int64_t> ReadInt(const pt::ptree &tree,
                                           const char *key) {
  auto child = tree.get_child_optional(key);
  if (!child || !child->empty()) {
    return std::nullopt;
  }
  if (auto v = URL::ParseInt(child->data())) {
    return v;
  }
  // Exponent or fraction forms: truncate, saturating at the int64 range.
  auto d = child->get_value_optional<double>();
  if (!d || !std::isfinite(*d)) {
    return std::nullopt;
  }
  constexpr double kLimit = 9.2e18;
  if (*d >= kLimit) {
    return std::numeric_limits<std::int64_t>::max();
  }
  if (*d <= -kLimit) {
    return std::numeric_limits<std::int64_t>::min();
  }
  return static_cast<std::int64_t>(*d);
}

// Parses one text control frame. Malformed JSON and a missing `type` are
// reported as an error string for the `error` reply; an unknown `type` parses
// fine as RequestKind::unknown.
inline std::expected<TestRequest, std::string>
ParseRequest(std::string_view text) {
  pt::ptree tree;
  try {
    std::istringstream in{std::string(text)};
    pt::read_json(in, tree);
  } catch (const pt::json_parser_error &e) {
    return std::unexpected(std::string("Invalid message: ") + e.message());
  }
  auto type = tree.get_child_optional("type");
  if (!type || !type->empty() || type->data().empty()) {
    return std::unexpected(std::string("Missing message type"));
  }
  TestRequest r;
  r.type = type->data();
  r.kind = KindFromType(r.type);
  r.timestamp = ReadInt(tree, "timestamp");
  r.size = ReadInt(tree, "size");
  r.chunkSize = ReadInt(tree, "chunkSize");
  r.byteLength = ReadInt(tree, "byteLength");
  if (auto data = tree.get_child_optional("data")) {
    r.dataLength = data->empty() ? data->data().size() : data->size();
  }
  return r;
}

inline std::string EncodeConnected(std::string_view clientId,
                                   std::int64_t nowMs) {
  return JsonWriter{}
      .Field("type", kConnected)
      .Field("clientId", clientId)
      .Field("timestamp", nowMs)
      .Field("message", "WebSocket connection established")
      .Str();
}

inline std::string EncodePong(const speedtest::PingReply &r) {
  return JsonWriter{}
      .Field("type", kPong)
      .Field("timestamp", r.serverTimestamp)
      .Field("clientTimestamp", r.clientTimestamp)
      .Field("serverTimestamp", r.serverTimestamp)
      .Field("serverProcessingTime", r.serverProcessingTime)
      .Str();
}

inline std::string EncodeError(std::string_view message, std::int64_t nowMs) {
  return JsonWriter{}
      .Field("type", kError)
      .Field("message", message)
      .Field("timestamp", nowMs)
      .Str();
}

inline std::string EncodeStreamEvent(const speedtest::StreamEvent &ev) {
  using speedtest::StreamEventKind;
  switch (ev.kind) {
  case StreamEventKind::started:
    return JsonWriter{}
        .Field("type", kDownloadStarted)
        .Field("timestamp", ev.timestampMs)
        .Field("totalBytes", ev.totalBytes)
        .Field("chunkSize", ev.chunkSize)
        .Str();
  case StreamEventKind::progress:
    return JsonWriter{}
        .Field("type", kDownloadProgress)
        .Field("timestamp", ev.timestampMs)
        .Field("bytesSent", ev.bytesSent)
        .Field("totalBytes", ev.totalBytes)
        .Fixed("progress", ev.percent, 1)
        .Str();
  case StreamEventKind::complete:
    return JsonWriter{}
        .Field("type", kDownloadComplete)
        .Field("timestamp", ev.timestampMs)
        .Field("bytesSent", ev.bytesSent)
        .Field("totalBytes", ev.result.totalBytes)
        .Fixed("duration", ev.result.durationSeconds, 3)
        .Fixed("throughputMBps", ev.result.throughputMBps, 2)
        .Str();
  case StreamEventKind::error:
    break;
  }
  return EncodeError(ev.message, ev.timestampMs);
}

inline std::string EncodeUploadReady(std::int64_t nowMs) {
  return JsonWriter{}
      .Field("type", kUploadReady)
      .Field("timestamp", nowMs)
      .Field("message", "Ready to receive upload data")
      .Str();
}

inline std::string EncodeUploadAck(std::int64_t nowMs, std::uint64_t received,
                                   std::uint64_t totalReceived) {
  return JsonWriter{}
      .Field("type", kUploadAck)
      .Field("timestamp", nowMs)
      .Field("bytesReceived", received)
      .Field("totalBytesReceived", totalReceived)
      .Str();
}

// `upload` carries the result when an upload test is being closed.
inline std::string
EncodeTestCompleteAck(std::int64_t nowMs, speedtest::Phase phase,
                      const std::optional<speedtest::TestResult> &upload) {
  JsonWriter w;
  w.Field("type", kTestCompleteAck)
      .Field("timestamp", nowMs)
      .Field("phase", speedtest::PhaseName(phase));
  if (upload.has_value()) {
    w.Field("totalBytes", upload->totalBytes)
        .Fixed("duration", upload->durationSeconds, 3)
        .Fixed("throughputMBps", upload->throughputMBps, 2);
  }
  return w.Str();
}

// HTTP bodies

enum class UploadBody { ok, empty, invalid };

// POST /api/upload wants {"content": ...} with a truthy content value.
// "", 0, false, null, [] and {} all count as no content.
inline UploadBody CheckUploadBody(std::string_view body) {
  pt::ptree tree;
  try {
    std::istringstream in{std::string(body)};
    pt::read_json(in, tree);
  } catch (const pt::json_parser_error &) {
    return UploadBody::invalid;
  }
  auto content = tree.get_child_optional("content");
  if (!content) {
    return UploadBody::empty;
  }
  if (!content->empty()) {
    return UploadBody::ok;
  }
  const std::string &v = content->data();
  if (v.empty() || v == "0" || v == "false" || v == "null") {
    return UploadBody::empty;
  }
  return UploadBody::ok;
}

inline std::string EncodeHttpError(std::string_view message) {
  return JsonWriter{}.Field("error", message).Str();
}

inline std::string EncodeHttpPing(const speedtest::PingReply &r) {
  return JsonWriter{}
      .Field("timestamp", r.serverTimestamp)
      .Field("clientTimestamp", r.clientTimestamp)
      .Field("serverProcessingTime", r.serverProcessingTime)
      .Str();
}

inline std::string EncodeUploadResult(const speedtest::TestResult &r) {
  return JsonWriter{}
      .Field("received", r.totalBytes)
      .Fixed("duration", r.durationSeconds, 3)
      .Fixed("throughputMBps", r.throughputMBps, 2)
      .Str();
}

// Per-adapter block nested into /api/status.
inline std::string EncodeAdapterStats(const speedtest::MetricsSnapshot &m) {
  return JsonWriter{}
      .Field("connections", m.connections)
      .Field("activeConnections", m.activeConnections)
      .Field("totalRequests", m.totalRequests)
      .Field("pingRequests", m.pingRequests)
      .Field("downloadRequests", m.downloadRequests)
      .Field("uploadRequests", m.uploadRequests)
      .Field("completedTests", m.completedTests)
      .Field("errors", m.errors)
      .Field("droppedResults", m.droppedResults)
      .Str();
}

inline std::string EncodeMemory() {
  auto mem = proc::ReadMemoryUsage();
  if (!mem) {
    return "null";
  }
  return JsonWriter{}.Field("rss", mem->rss).Field("vsize", mem->vsize).Str();
}

struct ServerStats {
  std::int64_t uptimeSeconds = 0;
  speedtest::MetricsSnapshot http;
  speedtest::MetricsSnapshot websocket;
  speedtest::MetricsSnapshot actor;
  std::string_view version;
};

inline std::string EncodeStatus(const ServerStats &s) {
  return JsonWriter{}
      .Field("status", "running")
      .Field("uptime", s.uptimeSeconds)
      .Field("requestsPerMinute", s.http.requestsPerMinute)
      .Field("totalRequests", s.http.totalRequests)
      .Field("errors", s.http.errors)
      .Field("pingRequests", s.http.pingRequests)
      .Field("downloadRequests", s.http.downloadRequests)
      .Field("uploadRequests", s.http.uploadRequests)
      .Raw("websocket", EncodeAdapterStats(s.websocket))
      .Raw("actor", EncodeAdapterStats(s.actor))
      .Raw("memory", EncodeMemory())
      .Field("version", s.version)
      .Str();
}

inline std::string EncodeHealth(const ServerStats &s, std::int64_t nowMs) {
  return JsonWriter{}
      .Field("status", "healthy")
      .Field("timestamp", timeutil::IsoTimestampUtc(nowMs))
      .Field("uptime", s.uptimeSeconds)
      .Field("requestsPerMinute", s.http.requestsPerMinute)
      .Field("totalRequests", s.http.totalRequests)
      .Field("errors", s.http.errors)
      .Raw("memory", EncodeMemory())
      .Field("version", s.version)
      .Str();
}

} // namespace proto
