/**
 * @file Protocol.cpp
 * @brief Request decoding and frame builders.
 */

#include "src/hub/inc/Protocol.hpp"
#include "src/helpers/inc/Json.hpp"

#include <utility>

namespace cascade {
namespace hub {

std::string eventTypeFor(std::string_view channel) {
  if (channel == CHANNEL_ALERTS) {
    return "alert";
  }
  return std::string(channel);
}

const char* toString(RequestType type) noexcept {
  switch (type) {
  case RequestType::Auth:
    return "auth";
  case RequestType::Subscribe:
    return "subscribe";
  case RequestType::Unsubscribe:
    return "unsubscribe";
  case RequestType::Ping:
    return "ping";
  case RequestType::Get:
    return "get";
  case RequestType::Unknown:
    return "unknown";
  }
  return "unknown";
}

bool parseRequest(std::string_view text, Request& out, std::string* error) {
  Json::Value doc;
  if (!helpers::json::parse(text, doc, error)) {
    return false;
  }
  if (!doc.isObject()) {
    if (error != nullptr) {
      *error = "frame is not a JSON object";
    }
    return false;
  }

  Request req{};
  const std::string TYPE = doc["type"].isString() ? doc["type"].asString() : std::string{};
  if (TYPE == "auth") {
    req.type = RequestType::Auth;
  } else if (TYPE == "subscribe") {
    req.type = RequestType::Subscribe;
  } else if (TYPE == "unsubscribe") {
    req.type = RequestType::Unsubscribe;
  } else if (TYPE == "ping") {
    req.type = RequestType::Ping;
  } else if (TYPE == "get") {
    req.type = RequestType::Get;
  }

  if (doc["apiKey"].isString()) {
    req.apiKey = doc["apiKey"].asString();
  }
  if (doc["resource"].isString()) {
    req.resource = doc["resource"].asString();
  }
  if (doc["channels"].isArray()) {
    for (const Json::Value& C : doc["channels"]) {
      if (C.isString()) {
        req.channels.push_back(C.asString());
      }
    }
  }
  out = std::move(req);
  return true;
}

/* ----------------------------- Frames ----------------------------- */

Json::Value connectedFrame(const std::string& clientId, std::int64_t timestamp) {
  Json::Value v(Json::objectValue);
  v["type"] = "connected";
  v["clientId"] = clientId;
  v["timestamp"] = static_cast<Json::Int64>(timestamp);
  return v;
}

Json::Value authFrame(bool success, const char* error) {
  Json::Value v(Json::objectValue);
  v["type"] = "auth";
  v["success"] = success;
  if (error != nullptr) {
    v["error"] = error;
  }
  return v;
}

Json::Value channelsFrame(const char* type, const std::vector<std::string>& channels) {
  Json::Value v(Json::objectValue);
  v["type"] = type;
  Json::Value arr(Json::arrayValue);
  for (const std::string& C : channels) {
    arr.append(C);
  }
  v["channels"] = arr;
  return v;
}

Json::Value pongFrame(std::int64_t timestamp) {
  Json::Value v(Json::objectValue);
  v["type"] = "pong";
  v["timestamp"] = static_cast<Json::Int64>(timestamp);
  return v;
}

Json::Value dataFrame(const std::string& resource, Json::Value data) {
  Json::Value v(Json::objectValue);
  v["type"] = "data";
  v["resource"] = resource;
  v["data"] = std::move(data);
  return v;
}

Json::Value errorFrame(const char* message) {
  Json::Value v(Json::objectValue);
  v["type"] = "error";
  v["message"] = message;
  return v;
}

Json::Value eventFrame(std::string_view channel, Json::Value data) {
  Json::Value v(Json::objectValue);
  v["type"] = eventTypeFor(channel);
  v["data"] = std::move(data);
  return v;
}

std::string encode(const Json::Value& frame) { return helpers::json::dumpCompact(frame); }

} // namespace hub
} // namespace cascade
