#include "fake_transport.hpp"
#include "logging/result_event.hpp"
#include "speedtest/control_handler.hpp"
#include "speedtest/metrics.hpp"
#include "speedtest/policy.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

namespace pt = boost::property_tree;
using namespace speedtest;

namespace {

class ControlHandlerTest : public ::testing::Test {
protected:
  ControlHandlerTest()
      : metrics(logging::ResultSource::websocket, [this] { return now; }),
        handler(std::make_unique<ControlHandler>(
            channel, metrics, policy, "client-1", [this] { return now; })) {}

  pt::ptree Last() const { return ParseText(channel.texts.back()); }

  static pt::ptree ParseText(const std::string &text) {
    pt::ptree tree;
    std::istringstream in(text);
    pt::read_json(in, tree);
    return tree;
  }

  std::string LastType() const { return Last().get<std::string>("type"); }

  std::int64_t now = 1000;
  Policy policy;
  FakeTransport channel;
  Metrics metrics;
  std::unique_ptr<ControlHandler> handler;
};

TEST_F(ControlHandlerTest, GreetsOnOpen) {
  handler->OnOpen();
  auto t = Last();
  EXPECT_EQ(t.get<std::string>("type"), "connected");
  EXPECT_EQ(t.get<std::string>("clientId"), "client-1");
  EXPECT_EQ(metrics.Snapshot().activeConnections, 1u);
  handler->OnClose();
  handler->OnClose();
  EXPECT_EQ(metrics.Snapshot().activeConnections, 0u);
}

TEST_F(ControlHandlerTest, PingRepliesWithPong) {
  handler->OnText(R"({"type":"ping","timestamp":900})");
  auto t = Last();
  EXPECT_EQ(t.get<std::string>("type"), "pong");
  EXPECT_EQ(t.get<std::int64_t>("serverProcessingTime"), 100);
  EXPECT_EQ(metrics.Snapshot().pingRequests, 1u);
}

TEST_F(ControlHandlerTest, PingAcceptsNegativeProcessingTime) {
  handler->OnText(R"({"type":"ping","timestamp":5000})");
  EXPECT_EQ(Last().get<std::int64_t>("serverProcessingTime"), -4000);
}

TEST_F(ControlHandlerTest, MalformedFrameGetsErrorAndKeepsGoing) {
  handler->OnText("{oops");
  EXPECT_EQ(LastType(), "error");
  handler->OnText(R"({"type":"ping"})");
  EXPECT_EQ(LastType(), "pong");
}

TEST_F(ControlHandlerTest, UnknownTypeGetsError) {
  handler->OnText(R"({"type":"teleport"})");
  auto t = Last();
  EXPECT_EQ(t.get<std::string>("type"), "error");
  EXPECT_EQ(t.get<std::string>("message"), "Unknown message type");
}

TEST_F(ControlHandlerTest, RejectedFramesAreCountedAlike) {
  handler->OnText("{oops");
  EXPECT_EQ(metrics.Snapshot().errors, 1u);
  handler->OnText(R"({"type":"teleport"})");
  EXPECT_EQ(metrics.Snapshot().errors, 2u);
  handler->OnText(R"({"type":"ping"})");
  EXPECT_EQ(metrics.Snapshot().errors, 2u);
}

TEST_F(ControlHandlerTest, DownloadRunsThroughTheChannel) {
  handler->OnText(
      R"({"type":"download_start","size":2097152,"chunkSize":1048576})");
  EXPECT_TRUE(handler->Downloading());
  EXPECT_EQ(handler->GetSession().GetPhase(), Phase::download);
  channel.RunAll();

  const std::vector<std::string> expected = {
      "started",     "bin:1048576", "progress",
      "bin:1048576", "progress",    "complete"};
  EXPECT_EQ(channel.log, expected);
  EXPECT_FALSE(handler->Downloading());
  EXPECT_EQ(handler->GetSession().GetPhase(), Phase::idle);
  EXPECT_EQ(handler->GetSession().BytesTransferred(), 2097152u);
  EXPECT_EQ(metrics.Snapshot().completedTests, 1u);

  logging::ResultEvent ev{};
  ASSERT_TRUE(metrics.Results().pop(ev));
  EXPECT_EQ(ev.kind, logging::ResultKind::download);
  EXPECT_EQ(ev.total_bytes, 2097152u);
}

TEST_F(ControlHandlerTest, NewDownloadCancelsTheLiveOne) {
  handler->OnText(R"({"type":"download_start","size":4194304})");
  channel.RunAll(3);
  handler->OnText(R"({"type":"download_start","size":1024,"chunkSize":512})");
  channel.RunAll();

  // The first run never completes; the second does.
  int completes = 0;
  for (const auto &ev : channel.events) {
    if (ev.kind == StreamEventKind::complete) {
      ++completes;
      EXPECT_EQ(ev.bytesSent, 1024u);
    }
  }
  EXPECT_EQ(completes, 1);
}

TEST_F(ControlHandlerTest, UploadFlow) {
  handler->OnText(R"({"type":"upload_start"})");
  EXPECT_EQ(LastType(), "upload_ready");

  now = 2000;
  handler->OnText(R"({"type":"upload_data","byteLength":1048576})");
  auto ack = Last();
  EXPECT_EQ(ack.get<std::string>("type"), "upload_ack");
  EXPECT_EQ(ack.get<std::uint64_t>("bytesReceived"), 1048576u);
  EXPECT_EQ(ack.get<std::uint64_t>("totalBytesReceived"), 1048576u);

  now = 3000;
  handler->OnBinary(1048576);
  EXPECT_EQ(Last().get<std::uint64_t>("totalBytesReceived"), 2097152u);

  now = 9000;
  handler->OnText(R"({"type":"test_complete"})");
  auto done = Last();
  EXPECT_EQ(done.get<std::string>("type"), "test_complete_ack");
  EXPECT_EQ(done.get<std::string>("phase"), "upload");
  EXPECT_EQ(done.get<std::uint64_t>("totalBytes"), 2097152u);
  // Timed first byte (2000) to last byte (3000), not to test_complete.
  EXPECT_EQ(done.get<std::string>("duration"), "1.000");
  EXPECT_EQ(done.get<std::string>("throughputMBps"), "2.00");
  EXPECT_EQ(handler->GetSession().GetPhase(), Phase::idle);
}

TEST_F(ControlHandlerTest, UploadWithSingleChunkHasUndefinedThroughput) {
  handler->OnText(R"({"type":"upload_start"})");
  handler->OnText(R"({"type":"upload_data","data":"abcd"})");
  handler->OnText(R"({"type":"test_complete"})");
  auto done = Last();
  EXPECT_EQ(done.get<std::uint64_t>("totalBytes"), 4u);
  EXPECT_EQ(done.get<std::string>("throughputMBps"), "null");
}

TEST_F(ControlHandlerTest, UploadDataOutsideUploadIsRejected) {
  handler->OnText(R"({"type":"upload_data","byteLength":10})");
  EXPECT_EQ(LastType(), "error");
  handler->OnBinary(10);
  EXPECT_EQ(LastType(), "error");
  EXPECT_EQ(handler->GetSession().BytesTransferred(), 0u);
  EXPECT_EQ(metrics.Snapshot().errors, 2u);
}

TEST_F(ControlHandlerTest, UploadDataWithoutContentIsRejected) {
  handler->OnText(R"({"type":"upload_start"})");
  handler->OnText(R"({"type":"upload_data"})");
  EXPECT_EQ(LastType(), "error");
  handler->OnText(R"({"type":"upload_data","byteLength":0,"data":""})");
  EXPECT_EQ(LastType(), "error");
  EXPECT_EQ(handler->GetSession().BytesTransferred(), 0u);
  EXPECT_FALSE(handler->GetSession().FirstByteTime().has_value());
}

TEST_F(ControlHandlerTest, TestCompleteCancelsDownload) {
  handler->OnText(R"({"type":"download_start","size":4194304})");
  channel.RunAll(2);
  handler->OnText(R"({"type":"test_complete"})");
  EXPECT_EQ(LastType(), "test_complete_ack");
  EXPECT_EQ(Last().get<std::string>("phase"), "download");
  channel.RunAll();
  for (const auto &ev : channel.events) {
    EXPECT_NE(ev.kind, StreamEventKind::complete);
  }
}

TEST_F(ControlHandlerTest, DestroyingMidRunLeavesNoLiveWork) {
  handler->OnText(R"({"type":"download_start","size":4194304})");
  channel.RunAll(2);
  const auto written = channel.chunk_sizes.size();
  handler.reset();
  channel.RunAll();
  EXPECT_EQ(channel.chunk_sizes.size(), written);
}

} // namespace
