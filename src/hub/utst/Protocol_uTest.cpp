/**
 * @file Protocol_uTest.cpp
 * @brief Request decoding and frame shapes.
 */

#include "src/hub/inc/Protocol.hpp"
#include "src/helpers/inc/Json.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace cascade::hub;

TEST(ProtocolTest, ParseSubscribe) {
  Request r{};
  ASSERT_TRUE(parseRequest(R"({"type":"subscribe","channels":["alerts",3,"readings"]})", r));
  EXPECT_EQ(r.type, RequestType::Subscribe);
  ASSERT_EQ(r.channels.size(), 2U);
  EXPECT_EQ(r.channels[0], "alerts");
  EXPECT_EQ(r.channels[1], "readings");
}

TEST(ProtocolTest, ParseAuthAndGet) {
  Request r{};
  ASSERT_TRUE(parseRequest(R"({"type":"auth","apiKey":"k"})", r));
  EXPECT_EQ(r.type, RequestType::Auth);
  EXPECT_EQ(r.apiKey.value_or(""), "k");

  ASSERT_TRUE(parseRequest(R"({"type":"get","resource":"cpu"})", r));
  EXPECT_EQ(r.type, RequestType::Get);
  EXPECT_EQ(r.resource.value_or(""), "cpu");
  EXPECT_FALSE(r.apiKey.has_value());
}

TEST(ProtocolTest, UnknownAndInvalid) {
  Request r{};
  ASSERT_TRUE(parseRequest(R"({"type":"launch"})", r));
  EXPECT_EQ(r.type, RequestType::Unknown);
  ASSERT_TRUE(parseRequest(R"({"channels":[]})", r));
  EXPECT_EQ(r.type, RequestType::Unknown);

  std::string err;
  EXPECT_FALSE(parseRequest("{not json", r, &err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(parseRequest("[1,2]", r));
}

TEST(ProtocolTest, EventTypeForChannel) {
  EXPECT_EQ(eventTypeFor(CHANNEL_ALERTS), "alert");
  EXPECT_EQ(eventTypeFor(CHANNEL_SNAPSHOT), "snapshot");
  EXPECT_EQ(eventTypeFor(CHANNEL_READINGS), "readings");
  EXPECT_EQ(eventTypeFor(CHANNEL_UNIFIED), "unified");
}

TEST(ProtocolTest, FramesAreSingleLine) {
  Json::Value data(Json::objectValue);
  data["text"] = "a\nb";
  const std::string TEXT = encode(eventFrame(CHANNEL_ALERTS, data));
  EXPECT_EQ(TEXT.find('\n'), std::string::npos);

  Json::Value back;
  ASSERT_TRUE(cascade::helpers::json::parse(TEXT, back));
  EXPECT_EQ(back["type"].asString(), "alert");
  EXPECT_EQ(back["data"]["text"].asString(), "a\nb");
}

TEST(ProtocolTest, AuthFrameError) {
  const Json::Value OK = authFrame(true);
  EXPECT_TRUE(OK["success"].asBool());
  EXPECT_FALSE(OK.isMember("error"));

  const Json::Value BAD = authFrame(false, ERR_INVALID_API_KEY);
  EXPECT_FALSE(BAD["success"].asBool());
  EXPECT_EQ(BAD["error"].asString(), "Invalid API key");
}
