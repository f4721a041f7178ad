#ifndef CASCADE_HUB_DISTRIBUTION_HUB_HPP
#define CASCADE_HUB_DISTRIBUTION_HUB_HPP
/**
 * @file DistributionHub.hpp
 * @brief Subscriber registry, request handling and channel fan-out.
 *
 * Each subscriber starts subscribed to "snapshot" and is authenticated when
 * auth is disabled. Producers push payloads into a named EventChannel; the
 * hub sends {type, data} to every authenticated subscriber of that channel.
 *
 * The registry is copied under the lock and frames are sent without it, so
 * a send may call back into the hub (disconnect) and the set never changes
 * mid-broadcast. A failed send is logged and the subscriber is left for the
 * transport to disconnect.
 */

#include "src/helpers/inc/Clock.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace hub {

/* ----------------------------- Seams ----------------------------- */

/// One connected client as seen by the hub.
class Subscriber {
public:
  virtual ~Subscriber() = default;

  /// Queue one frame; false if the connection can no longer accept data.
  virtual bool send(const std::string& frame) = 0;

  /// Close the connection. Must be idempotent.
  virtual void close() = 0;
};

/// Answers `get{resource}` requests.
class ResourceResolver {
public:
  virtual ~ResourceResolver() = default;

  /// nullopt for an unknown resource; throws when the lookup itself fails.
  virtual std::optional<Json::Value> resolve(std::string_view resource) = 0;
};

struct HubOptions {
  bool enableAuth{false};
  std::string apiKey{};
};

class DistributionHub;

/* ----------------------------- EventChannel ----------------------------- */

/// Named producer endpoint owned by the hub.
class EventChannel {
public:
  EventChannel(DistributionHub& hub, std::string name) : hub_(hub), name_(std::move(name)) {}

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  /// Broadcast {type, data} to this channel's subscribers; returns frames sent.
  std::size_t push(Json::Value payload);

private:
  DistributionHub& hub_;
  std::string name_;
};

/* ----------------------------- DistributionHub ----------------------------- */

class DistributionHub {
public:
  explicit DistributionHub(HubOptions options = {},
                           helpers::clock::ClockFn clock = helpers::clock::systemClock());

  DistributionHub(const DistributionHub&) = delete;
  DistributionHub& operator=(const DistributionHub&) = delete;

  void setResolver(std::shared_ptr<ResourceResolver> resolver);

  /// Applies to later auth requests and new connections.
  void setOptions(HubOptions options);

  /// Register a subscriber and send it the connected frame. Returns its id.
  std::string connect(std::shared_ptr<Subscriber> subscriber);

  /// Handle one inbound text frame from subscriber `id`.
  void handleMessage(const std::string& id, std::string_view text);

  /// Forget a subscriber. Does not close it.
  void disconnect(const std::string& id);

  /// Close and forget every subscriber. Safe to call repeatedly.
  void closeAll();

  [[nodiscard]] std::size_t subscriberCount() const;

  /// Current subscription set of a subscriber (sorted); empty if unknown.
  [[nodiscard]] std::vector<std::string> subscriptions(const std::string& id) const;

  /// Channel by name, created on first use.
  EventChannel& channel(const std::string& name);

  /// Send a prepared frame to every authenticated subscriber of `channel`.
  std::size_t broadcast(const std::string& channel, const Json::Value& frame);

private:
  struct Client {
    std::shared_ptr<Subscriber> conn;
    std::set<std::string> subscriptions;
    bool authenticated{false};
  };

  void reply(const std::string& id, const std::shared_ptr<Subscriber>& conn,
             const Json::Value& frame);
  void handleGet(const std::string& id, const std::shared_ptr<Subscriber>& conn,
                 const std::optional<std::string>& resource, bool authenticated);

  helpers::clock::ClockFn clock_;

  mutable std::mutex mtx_;
  HubOptions options_;
  std::shared_ptr<ResourceResolver> resolver_;
  std::map<std::string, Client> clients_;
  std::map<std::string, std::unique_ptr<EventChannel>> channels_;
};

} // namespace hub
} // namespace cascade

#endif // CASCADE_HUB_DISTRIBUTION_HUB_HPP
