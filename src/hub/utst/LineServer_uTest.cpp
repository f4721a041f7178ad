/**
 * @file LineServer_uTest.cpp
 * @brief Newline-delimited JSON over a loopback TCP connection.
 */

#include "src/hub/inc/LineServer.hpp"
#include "src/helpers/inc/Json.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using cascade::hub::DistributionHub;
using cascade::hub::LineServer;
using cascade::hub::LineServerOptions;

namespace {

/// Blocking loopback client reading whole lines with a timeout.
class LineClient {
public:
  explicit LineClient(std::uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  }
  ~LineClient() { ::close(fd_); }

  [[nodiscard]] bool connected() const noexcept { return connected_; }

  void sendLine(const std::string& text) {
    const std::string LINE = text + "\n";
    ASSERT_EQ(::send(fd_, LINE.data(), LINE.size(), MSG_NOSIGNAL),
              static_cast<ssize_t>(LINE.size()));
  }

  /// Next frame, or null on timeout/EOF.
  Json::Value readFrame(int timeoutMs = 2000) {
    while (buf_.find('\n') == std::string::npos) {
      pollfd pfd{fd_, POLLIN, 0};
      if (::poll(&pfd, 1, timeoutMs) <= 0) {
        return Json::Value();
      }
      char tmp[1024];
      const ssize_t N = ::recv(fd_, tmp, sizeof(tmp), 0);
      if (N <= 0) {
        eof_ = true;
        return Json::Value();
      }
      buf_.append(tmp, static_cast<std::size_t>(N));
    }
    const std::size_t NL = buf_.find('\n');
    const std::string LINE = buf_.substr(0, NL);
    buf_.erase(0, NL + 1);
    Json::Value v;
    EXPECT_TRUE(cascade::helpers::json::parse(LINE, v)) << LINE;
    return v;
  }

  /// True once the server closed the connection.
  bool waitEof(int timeoutMs = 2000) {
    while (!eof_) {
      if (readFrame(timeoutMs).isNull() && !eof_) {
        return false;
      }
    }
    return true;
  }

private:
  int fd_{-1};
  bool connected_{false};
  bool eof_{false};
  std::string buf_;
};

bool waitFor(const std::function<bool()>& pred) {
  for (int i = 0; i < 200; ++i) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

LineServerOptions ephemeral() {
  LineServerOptions o{};
  o.port = 0;
  return o;
}

} // namespace

TEST(LineServerTest, StartStopIdempotent) {
  DistributionHub hub;
  LineServer server(hub, ephemeral());
  ASSERT_TRUE(server.start());
  EXPECT_TRUE(server.running());
  EXPECT_NE(server.port(), 0);
  EXPECT_FALSE(server.start());
  server.stop();
  server.stop();
  EXPECT_FALSE(server.running());
}

TEST(LineServerTest, RejectsBadBindAddress) {
  DistributionHub hub;
  LineServerOptions o = ephemeral();
  o.bindAddress = "not-an-ip";
  LineServer server(hub, o);
  std::string err;
  EXPECT_FALSE(server.start(&err));
  EXPECT_FALSE(err.empty());
}

/** @test connected, ping/pong, subscribe, then a pushed channel event. */
TEST(LineServerTest, RequestResponseAndBroadcast) {
  DistributionHub hub;
  LineServer server(hub, ephemeral());
  ASSERT_TRUE(server.start());

  LineClient client(server.port());
  ASSERT_TRUE(client.connected());

  const Json::Value HELLO = client.readFrame();
  EXPECT_EQ(HELLO["type"].asString(), "connected");
  EXPECT_FALSE(HELLO["clientId"].asString().empty());
  ASSERT_TRUE(waitFor([&] { return hub.subscriberCount() == 1; }));

  client.sendLine(R"({"type":"ping"})");
  EXPECT_EQ(client.readFrame()["type"].asString(), "pong");

  client.sendLine(R"({"type":"subscribe","channels":["alerts"]})");
  EXPECT_EQ(client.readFrame()["type"].asString(), "subscribed");

  Json::Value event(Json::objectValue);
  event["alertName"] = "Hot CPU";
  EXPECT_EQ(hub.channel("alerts").push(event), 1U);
  const Json::Value FRAME = client.readFrame();
  EXPECT_EQ(FRAME["type"].asString(), "alert");
  EXPECT_EQ(FRAME["data"]["alertName"].asString(), "Hot CPU");

  server.stop();
  EXPECT_EQ(hub.subscriberCount(), 0U);
}

TEST(LineServerTest, ClientDisconnectUnregisters) {
  DistributionHub hub;
  LineServer server(hub, ephemeral());
  ASSERT_TRUE(server.start());
  {
    LineClient client(server.port());
    ASSERT_TRUE(client.connected());
    (void)client.readFrame();
    ASSERT_TRUE(waitFor([&] { return hub.subscriberCount() == 1; }));
  }
  EXPECT_TRUE(waitFor([&] { return hub.subscriberCount() == 0; }));
}

TEST(LineServerTest, CloseAllClosesSockets) {
  DistributionHub hub;
  LineServer server(hub, ephemeral());
  ASSERT_TRUE(server.start());

  LineClient client(server.port());
  ASSERT_TRUE(client.connected());
  (void)client.readFrame();
  ASSERT_TRUE(waitFor([&] { return hub.subscriberCount() == 1; }));

  hub.closeAll();
  EXPECT_TRUE(client.waitEof());
}

/** @test A subscriber that never reads is dropped once its buffer cap is hit. */
TEST(LineServerTest, OverflowDropsConnection) {
  DistributionHub hub;
  LineServerOptions o = ephemeral();
  o.maxBufferBytes = 1024;
  LineServer server(hub, o);
  ASSERT_TRUE(server.start());

  LineClient client(server.port());
  ASSERT_TRUE(client.connected());
  ASSERT_TRUE(waitFor([&] { return hub.subscriberCount() == 1; }));

  Json::Value big(Json::objectValue);
  big["blob"] = std::string(4096, 'x');
  (void)hub.channel("snapshot").push(big);
  EXPECT_TRUE(waitFor([&] { return hub.subscriberCount() == 0; }));
}
