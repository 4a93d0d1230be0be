#include "core/server.hpp"
#include "net/ws_ops.hpp"
#include "speedtest/policy.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace pt = boost::property_tree;
using tcp = net::ip::tcp;

namespace {

pt::ptree ParseJson(const std::string &text) {
  pt::ptree tree;
  std::istringstream in(text);
  pt::read_json(in, tree);
  return tree;
}

struct Frame {
  bool text = false;
  std::string payload;

  std::string Type() const { return ParseJson(payload).get<std::string>("type"); }
};

// Blocking Beast clients against a live server on an ephemeral port.
class ServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ServerOptions opt;
    opt.address = "127.0.0.1";
    opt.port = 0;
    opt.threads = 2;
    opt.actorThreads = 2;
    server_ = std::make_unique<Server>(opt);
    auto port = server_->Start();
    ASSERT_TRUE(port.has_value()) << port.error();
    port_ = *port;
  }

  void TearDown() override { server_->Stop(); }

  tcp::socket Dial() {
    tcp::resolver resolver(ioc_);
    auto endpoints =
        wsops::Resolve(resolver, "127.0.0.1", std::to_string(port_));
    EXPECT_TRUE(endpoints.has_value());
    tcp::socket sock(ioc_);
    auto st = wsops::Connect(sock, *endpoints);
    EXPECT_TRUE(st.has_value());
    return sock;
  }

  http::response<http::string_body> Request(tcp::socket &sock, http::verb verb,
                                            const std::string &target,
                                            std::string body = {}) {
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
      req.set(http::field::content_type, "application/json");
      req.body() = std::move(body);
    }
    req.prepare_payload();
    http::write(sock, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(200 * speedtest::kMiB);
    http::read(sock, buffer, parser);
    return parser.release();
  }

  http::response<http::string_body> Get(const std::string &target) {
    auto sock = Dial();
    return Request(sock, http::verb::get, target);
  }

  websocket::stream<tcp::socket> OpenWs(const std::string &target) {
    websocket::stream<tcp::socket> ws(Dial());
    auto st = wsops::WsHandshake(ws, "127.0.0.1", target);
    EXPECT_TRUE(st.has_value());
    return ws;
  }

  static Frame Read(websocket::stream<tcp::socket> &ws) {
    beast::flat_buffer buf;
    ws.read(buf);
    return Frame{ws.got_text(), beast::buffers_to_string(buf.data())};
  }

  static void Send(websocket::stream<tcp::socket> &ws,
                   const std::string &text) {
    ws.text(true);
    ws.write(net::buffer(text));
  }

  void ExpectDownloadSequence(const std::string &target) {
    auto ws = OpenWs(target);
    auto hello = Read(ws);
    ASSERT_TRUE(hello.text);
    EXPECT_EQ(hello.Type(), "connected");

    Send(ws, R"({"type":"download_start","size":2097152,"chunkSize":1048576})");
    std::vector<Frame> frames;
    for (int i = 0; i < 6; ++i) {
      frames.push_back(Read(ws));
    }
    EXPECT_EQ(frames[0].Type(), "download_started");
    EXPECT_FALSE(frames[1].text);
    EXPECT_EQ(frames[1].payload.size(), 1048576u);
    EXPECT_EQ(frames[2].Type(), "download_progress");
    EXPECT_EQ(ParseJson(frames[2].payload).get<std::uint64_t>("bytesSent"),
              1048576u);
    EXPECT_FALSE(frames[3].text);
    EXPECT_EQ(frames[3].payload.size(), 1048576u);
    EXPECT_EQ(frames[4].Type(), "download_progress");
    EXPECT_EQ(ParseJson(frames[4].payload).get<std::string>("progress"),
              "100.0");
    ASSERT_EQ(frames[5].Type(), "download_complete");
    auto done = ParseJson(frames[5].payload);
    EXPECT_EQ(done.get<std::uint64_t>("bytesSent"), 2097152u);
    EXPECT_EQ(done.get<std::uint64_t>("totalBytes"), 2097152u);

    // Same connection serves the next test.
    Send(ws, R"({"type":"ping","timestamp":1})");
    EXPECT_EQ(Read(ws).Type(), "pong");
    ws.close(websocket::close_code::normal);
  }

  template <typename Pred> static bool WaitFor(Pred pred) {
    for (int i = 0; i < 500; ++i) {
      if (pred()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
  }

  net::io_context ioc_;
  std::unique_ptr<Server> server_;
  std::uint16_t port_ = 0;
};

TEST_F(ServerTest, HttpPing) {
  auto res = Get("/api/ping?timestamp=123");
  EXPECT_EQ(res.result(), http::status::ok);
  auto body = ParseJson(res.body());
  EXPECT_EQ(body.get<std::int64_t>("clientTimestamp"), 123);
  EXPECT_GT(body.get<std::int64_t>("serverProcessingTime"), 0);
}

TEST_F(ServerTest, HttpDownloadStreamsExactSize) {
  auto res = Get("/api/download?size=2097152&chunkSize=1048576");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body().size(), 2097152u);
  EXPECT_EQ(res[http::field::content_type], "application/octet-stream");
  EXPECT_EQ(res[http::field::cache_control],
            "no-cache, no-store, must-revalidate");
  EXPECT_EQ(res[http::field::pragma], "no-cache");
  EXPECT_EQ(res[http::field::expires], "0");
}

TEST_F(ServerTest, HttpDownloadOfZeroBytes) {
  auto res = Get("/api/download?size=0");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_TRUE(res.body().empty());
}

TEST_F(ServerTest, HttpDownloadDefaultsToOneMiB) {
  auto res = Get("/api/download?size=abc");
  EXPECT_EQ(res.body().size(), speedtest::kMiB);
}

TEST_F(ServerTest, KeepAliveAcrossDownloadAndPing) {
  auto sock = Dial();
  auto first = Request(sock, http::verb::get, "/api/download?size=70000");
  EXPECT_EQ(first.body().size(), 70000u);
  auto second = Request(sock, http::verb::get, "/api/ping");
  EXPECT_EQ(second.result(), http::status::ok);
}

TEST_F(ServerTest, UploadWithoutContentIs400) {
  auto sock = Dial();
  auto res = Request(sock, http::verb::post, "/api/upload", R"({"x":1})");
  EXPECT_EQ(res.result(), http::status::bad_request);
  EXPECT_EQ(res.body(), R"({"error":"No content provided"})");
}

TEST_F(ServerTest, UploadWithContentReportsBytes) {
  const std::string body = R"({"content":")" + std::string(4096, 'a') + "\"}";
  auto sock = Dial();
  auto res = Request(sock, http::verb::post, "/api/upload", body);
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(ParseJson(res.body()).get<std::uint64_t>("received"),
            body.size());
}

TEST_F(ServerTest, StatusHealthAndNotFound) {
  Get("/api/ping");
  auto status = ParseJson(Get("/api/status").body());
  EXPECT_EQ(status.get<std::string>("status"), "running");
  EXPECT_GE(status.get<std::uint64_t>("pingRequests"), 1u);
  EXPECT_EQ(status.get<std::string>("version"), "2.0.0");
  EXPECT_TRUE(status.get_child_optional("websocket").has_value());
  EXPECT_TRUE(status.get_child_optional("actor").has_value());

  auto health = ParseJson(Get("/api/health").body());
  EXPECT_EQ(health.get<std::string>("status"), "healthy");

  auto missing = Get("/nope");
  EXPECT_EQ(missing.result(), http::status::not_found);
  EXPECT_EQ(missing.body(), R"({"error":"Not found"})");
}

TEST_F(ServerTest, DuplexDownloadFrameOrder) { ExpectDownloadSequence("/ws"); }

TEST_F(ServerTest, ActorDownloadFrameOrder) {
  ExpectDownloadSequence("/ws/actor");
}

TEST_F(ServerTest, ActorAliasPath) {
  auto ws = OpenWs("/functions/websocket");
  EXPECT_EQ(Read(ws).Type(), "connected");
  Send(ws, R"({"type":"ping","timestamp":99999999999999})");
  auto pong = ParseJson(Read(ws).payload);
  EXPECT_LT(pong.get<std::int64_t>("serverProcessingTime"), 0);
}

TEST_F(ServerTest, ActorsKeepSeparateSessions) {
  auto a = OpenWs("/ws/actor");
  auto b = OpenWs("/ws/actor");
  const auto idA = ParseJson(Read(a).payload).get<std::string>("clientId");
  const auto idB = ParseJson(Read(b).payload).get<std::string>("clientId");
  EXPECT_NE(idA, idB);

  // One actor uploading does not move the other out of idle.
  Send(a, R"({"type":"upload_start"})");
  EXPECT_EQ(Read(a).Type(), "upload_ready");
  Send(b, R"({"type":"upload_data","byteLength":10})");
  EXPECT_EQ(Read(b).Type(), "error");
  Send(a, R"({"type":"upload_data","byteLength":10})");
  EXPECT_EQ(ParseJson(Read(a).payload).get<std::uint64_t>(
                "totalBytesReceived"),
            10u);

  // Only the adapter's counters are aggregated across actors.
  auto &ctx = server_->Context();
  EXPECT_EQ(ctx.actor.Snapshot().activeConnections, 2u);
  EXPECT_EQ(ctx.actor.Snapshot().errors, 1u);
  EXPECT_EQ(ctx.websocket.Snapshot().connections, 0u);
  a.close(websocket::close_code::normal);
  b.close(websocket::close_code::normal);
}

TEST_F(ServerTest, DuplexUploadFlow) {
  auto ws = OpenWs("/ws");
  Read(ws); // connected
  Send(ws, R"({"type":"upload_start"})");
  EXPECT_EQ(Read(ws).Type(), "upload_ready");

  std::string payload(1000, 'x');
  ws.binary(true);
  ws.write(net::buffer(payload));
  auto ack = ParseJson(Read(ws).payload);
  EXPECT_EQ(ack.get<std::string>("type"), "upload_ack");
  EXPECT_EQ(ack.get<std::uint64_t>("totalBytesReceived"), 1000u);

  Send(ws, R"({"type":"upload_data","byteLength":24})");
  EXPECT_EQ(ParseJson(Read(ws).payload).get<std::uint64_t>(
                "totalBytesReceived"),
            1024u);

  Send(ws, R"({"type":"test_complete"})");
  auto done = ParseJson(Read(ws).payload);
  EXPECT_EQ(done.get<std::string>("type"), "test_complete_ack");
  EXPECT_EQ(done.get<std::string>("phase"), "upload");
  EXPECT_EQ(done.get<std::uint64_t>("totalBytes"), 1024u);
  ws.close(websocket::close_code::normal);
}

TEST_F(ServerTest, MalformedFrameKeepsConnectionOpen) {
  auto ws = OpenWs("/ws");
  Read(ws);
  Send(ws, "{{{");
  EXPECT_EQ(Read(ws).Type(), "error");
  Send(ws, R"({"type":"nope"})");
  EXPECT_EQ(ParseJson(Read(ws).payload).get<std::string>("message"),
            "Unknown message type");
  Send(ws, R"({"type":"ping"})");
  EXPECT_EQ(Read(ws).Type(), "pong");
}

TEST_F(ServerTest, DisconnectMidRunReleasesTheSession) {
  {
    auto ws = OpenWs("/ws");
    Read(ws);
    Send(ws, R"({"type":"download_start","size":104857600,"chunkSize":65536})");
    EXPECT_EQ(Read(ws).Type(), "download_started");
    Read(ws); // first chunk
    beast::error_code ec;
    ws.next_layer().close(ec);
  }
  auto &ctx = server_->Context();
  EXPECT_TRUE(
      WaitFor([&] { return ctx.websocket.Snapshot().activeConnections == 0; }));
  // Other connections are unaffected.
  EXPECT_EQ(Get("/api/ping").result(), http::status::ok);
  EXPECT_EQ(ctx.websocket.Snapshot().completedTests, 0u);
}

TEST_F(ServerTest, HttpDisconnectMidDownload) {
  {
    auto sock = Dial();
    http::request<http::string_body> req{http::verb::get,
                                         "/api/download?size=104857600", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(sock, req);
    char some[4096];
    sock.read_some(net::buffer(some));
    beast::error_code ec;
    sock.close(ec);
  }
  EXPECT_EQ(Get("/api/ping").result(), http::status::ok);
  auto &ctx = server_->Context();
  EXPECT_TRUE(WaitFor([&] { return ctx.http.Snapshot().errors >= 1; }));
}

} // namespace
