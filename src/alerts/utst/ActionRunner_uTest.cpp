/**
 * @file ActionRunner_uTest.cpp
 * @brief Webhook POST through libcurl against a local listener, shell commands and deadlines.
 */

#include "src/alerts/inc/ActionRunner.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/utst/FakeRoot.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using cascade::alerts::ActionType;
using cascade::alerts::AlertAction;
using cascade::alerts::AlertEvent;
using cascade::alerts::DefaultActionRunner;
using cascade::alerts::httpPostJson;
using cascade::alerts::runShell;
using cascade::snapshot::SensorReading;
using cascade::testing::FakeRoot;

namespace {

/// One-shot HTTP listener on 127.0.0.1 with an ephemeral port.
class OneShotServer {
public:
  explicit OneShotServer(std::string response) : response_(std::move(response)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { serve(); });
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(fd_);
  }

  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  /// Request text; valid after the client finished.
  std::string request() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return request_;
  }

private:
  void serve() {
    const int CLIENT = ::accept(fd_, nullptr, nullptr);
    if (CLIENT < 0) {
      return;
    }
    std::array<char, 4096> buf{};
    // Read until the declared body is complete.
    while (true) {
      const ssize_t N = ::recv(CLIENT, buf.data(), buf.size(), 0);
      if (N <= 0) {
        break;
      }
      request_.append(buf.data(), static_cast<std::size_t>(N));
      const std::size_t HEAD_END = request_.find("\r\n\r\n");
      if (HEAD_END == std::string::npos) {
        continue;
      }
      const std::size_t CL = request_.find("Content-Length: ");
      const std::size_t LEN = CL == std::string::npos ? 0 : std::stoul(request_.substr(CL + 16));
      if (request_.size() >= HEAD_END + 4 + LEN) {
        break;
      }
    }
    ::send(CLIENT, response_.data(), response_.size(), MSG_NOSIGNAL);
    ::close(CLIENT);
  }

  int fd_{-1};
  std::uint16_t port_{0};
  std::string response_;
  std::string request_;
  std::thread thread_;
};

AlertEvent sampleEvent() {
  AlertEvent e{};
  e.id = "ev-1";
  e.alertId = "al-1";
  e.alertName = "Hot CPU";
  e.sensorPath = "cpu.temperature";
  e.value = 91.5;
  e.threshold = 85.0;
  e.timestamp = 1700000000000;
  return e;
}

SensorReading sampleReading() {
  SensorReading r{};
  r.name = "CPU Temperature";
  r.value = 91.5;
  r.unit = "°C";
  r.source = "cpu.temperature";
  return r;
}

} // namespace

/* ----------------------------- Webhook ----------------------------- */

/** @test The webhook posts {event, reading} and accepts a 2xx answer. */
TEST(DefaultActionRunnerTest, WebhookPostsEventAndReading) {
  OneShotServer server("HTTP/1.1 204 No Content\r\nContent-Length: 0\r\n\r\n");

  AlertAction action{};
  action.type = ActionType::Webhook;
  action.config["url"] = "http://127.0.0.1:" + std::to_string(server.port()) + "/hook";

  DefaultActionRunner runner(2000);
  std::string err;
  EXPECT_TRUE(runner.run(action, sampleEvent(), sampleReading(), &err)) << err;

  const std::string REQ = server.request();
  EXPECT_EQ(REQ.rfind("POST /hook HTTP/1.1\r\n", 0), 0U);
  EXPECT_NE(REQ.find("Content-Type: application/json"), std::string::npos);

  Json::Value body;
  ASSERT_TRUE(cascade::helpers::json::parse(REQ.substr(REQ.find("\r\n\r\n") + 4), body));
  EXPECT_EQ(body["event"]["alertName"].asString(), "Hot CPU");
  EXPECT_DOUBLE_EQ(body["event"]["value"].asDouble(), 91.5);
  EXPECT_TRUE(body.isMember("reading"));
}

TEST(DefaultActionRunnerTest, WebhookNon2xxFails) {
  OneShotServer server("HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\n\r\n");

  AlertAction action{};
  action.type = ActionType::Webhook;
  action.config["url"] = "http://127.0.0.1:" + std::to_string(server.port()) + "/";

  DefaultActionRunner runner(2000);
  std::string err;
  EXPECT_FALSE(runner.run(action, sampleEvent(), sampleReading(), &err));
  EXPECT_NE(err.find("500"), std::string::npos);
}

/** @test The response status is reported for any 2xx answer. */
TEST(HttpPostJsonTest, ReportsStatus) {
  OneShotServer server("HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\nok");
  const std::string URL = "http://127.0.0.1:" + std::to_string(server.port()) + "/in";

  long status = 0;
  std::string err;
  EXPECT_TRUE(httpPostJson(URL, R"({"a":1})", 2000, &status, &err)) << err;
  EXPECT_EQ(status, 201);

  const std::string REQ = server.request();
  EXPECT_NE(REQ.find(R"({"a":1})"), std::string::npos);
  EXPECT_EQ(REQ.find("Expect:"), std::string::npos);
}

/** @test Only http and https URLs are attempted. */
TEST(HttpPostJsonTest, RejectsOtherSchemes) {
  std::string err;
  EXPECT_FALSE(httpPostJson("file:///etc/hostname", "{}", 1000, nullptr, &err));
  EXPECT_FALSE(err.empty());

  err.clear();
  EXPECT_FALSE(httpPostJson("not a url", "{}", 1000, nullptr, &err));
  EXPECT_FALSE(err.empty());
}

TEST(HttpPostJsonTest, ConnectionRefusedFails) {
  std::uint16_t port = 0;
  {
    // Bind and release an ephemeral port so nothing is listening on it.
    const int FD = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(FD, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(FD, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    ::close(FD);
  }
  std::string err;
  EXPECT_FALSE(httpPostJson("http://127.0.0.1:" + std::to_string(port) + "/", "{}", 1000,
                            nullptr, &err));
  EXPECT_FALSE(err.empty());
}

/* ----------------------------- Command ----------------------------- */

TEST(DefaultActionRunnerTest, CommandRunsThroughShell) {
  FakeRoot root;
  const auto OUT = root.path() / "fired.txt";

  AlertAction action{};
  action.type = ActionType::Command;
  action.config["command"] = "echo fired > '" + OUT.string() + "'";

  DefaultActionRunner runner;
  std::string err;
  ASSERT_TRUE(runner.run(action, sampleEvent(), sampleReading(), &err)) << err;
  EXPECT_EQ(cascade::helpers::files::readLine(OUT), "fired");

  action.config["command"] = "exit 3";
  EXPECT_FALSE(runner.run(action, sampleEvent(), sampleReading(), &err));
  EXPECT_NE(err.find("3"), std::string::npos);
}

TEST(RunShellTest, ExitStatus) {
  EXPECT_EQ(runShell("true", 5000), 0);
  EXPECT_EQ(runShell("exit 7", 5000), 7);
}

/** @test A command past its deadline is killed and reported as a failure. */
TEST(RunShellTest, DeadlineKillsCommand) {
  const auto START = std::chrono::steady_clock::now();
  std::string err;
  EXPECT_EQ(runShell("sleep 5", 200, &err), -1);
  const auto ELAPSED = std::chrono::steady_clock::now() - START;
  EXPECT_LT(ELAPSED, std::chrono::seconds(2));
  EXPECT_NE(err.find("timed out"), std::string::npos) << err;
}

/** @test Background children of the shell die with it at the deadline. */
TEST(RunShellTest, DeadlineKillsProcessGroup) {
  FakeRoot root;
  const auto MARK = root.path() / "late.txt";
  const std::string CMD = "(sleep 1; echo late > '" + MARK.string() + "') & wait";

  std::string err;
  EXPECT_EQ(runShell(CMD, 200, &err), -1);
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  EXPECT_FALSE(cascade::helpers::files::pathExists(MARK));
}

TEST(DefaultActionRunnerTest, CommandTimeoutFails) {
  AlertAction action{};
  action.type = ActionType::Command;
  action.config["command"] = "sleep 5";

  DefaultActionRunner runner(2000, 200);
  std::string err;
  EXPECT_FALSE(runner.run(action, sampleEvent(), sampleReading(), &err));
  EXPECT_NE(err.find("timed out"), std::string::npos) << err;
}

TEST(DefaultActionRunnerTest, EmailAndSoundSucceed) {
  DefaultActionRunner runner;
  AlertAction action{};
  action.type = ActionType::Email;
  EXPECT_TRUE(runner.run(action, sampleEvent(), sampleReading(), nullptr));
  action.type = ActionType::Sound;
  EXPECT_TRUE(runner.run(action, sampleEvent(), sampleReading(), nullptr));
}
