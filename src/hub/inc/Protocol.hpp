#ifndef CASCADE_HUB_PROTOCOL_HPP
#define CASCADE_HUB_PROTOCOL_HPP
/**
 * @file Protocol.hpp
 * @brief Subscriber wire protocol: one JSON object per frame.
 *
 * Client -> hub:
 *   {"type":"auth","apiKey":"..."}
 *   {"type":"subscribe","channels":["readings","alerts"]}
 *   {"type":"unsubscribe","channels":["snapshot"]}
 *   {"type":"ping"}
 *   {"type":"get","resource":"cpu"}
 *
 * Hub -> client:
 *   connected{clientId,timestamp}  auth{success[,error]}  subscribed{channels}
 *   unsubscribed{channels}  pong{timestamp}  data{resource,data}  error{message}
 *   and channel events {type: snapshot|readings|alert|unified, data}.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace hub {

/* ----------------------------- Channels ----------------------------- */

inline constexpr const char* CHANNEL_SNAPSHOT = "snapshot";
inline constexpr const char* CHANNEL_READINGS = "readings";
inline constexpr const char* CHANNEL_ALERTS = "alerts";
inline constexpr const char* CHANNEL_UNIFIED = "unified";

/// Frame type broadcast on a channel ("alerts" -> "alert", others unchanged).
[[nodiscard]] std::string eventTypeFor(std::string_view channel);

/* ----------------------------- Error messages ----------------------------- */

inline constexpr const char* ERR_UNKNOWN_TYPE = "Unknown message type";
inline constexpr const char* ERR_INVALID_FORMAT = "Invalid message format";
inline constexpr const char* ERR_NOT_AUTHENTICATED = "Not authenticated";
inline constexpr const char* ERR_UNKNOWN_RESOURCE = "Unknown resource";
inline constexpr const char* ERR_RESOURCE_FAILED = "Failed to get resource";
inline constexpr const char* ERR_INVALID_API_KEY = "Invalid API key";

/* ----------------------------- Requests ----------------------------- */

enum class RequestType : std::uint8_t { Auth = 0, Subscribe, Unsubscribe, Ping, Get, Unknown };

[[nodiscard]] const char* toString(RequestType type) noexcept;

struct Request {
  RequestType type{RequestType::Unknown};
  std::optional<std::string> apiKey{};
  std::vector<std::string> channels{}; ///< Non-string entries are dropped
  std::optional<std::string> resource{};
};

/**
 * @brief Decode one client frame.
 * @return false when the text is not a JSON object. A missing or unrecognized
 *         "type" yields RequestType::Unknown.
 */
[[nodiscard]] bool parseRequest(std::string_view text, Request& out, std::string* error = nullptr);

/* ----------------------------- Frames ----------------------------- */

[[nodiscard]] Json::Value connectedFrame(const std::string& clientId, std::int64_t timestamp);
[[nodiscard]] Json::Value authFrame(bool success, const char* error = nullptr);
[[nodiscard]] Json::Value channelsFrame(const char* type, const std::vector<std::string>& channels);
[[nodiscard]] Json::Value pongFrame(std::int64_t timestamp);
[[nodiscard]] Json::Value dataFrame(const std::string& resource, Json::Value data);
[[nodiscard]] Json::Value errorFrame(const char* message);
[[nodiscard]] Json::Value eventFrame(std::string_view channel, Json::Value data);

/// Single-line JSON text of a frame (no trailing newline).
[[nodiscard]] std::string encode(const Json::Value& frame);

} // namespace hub
} // namespace cascade

#endif // CASCADE_HUB_PROTOCOL_HPP
