/**
 * @file DistributionHub.cpp
 * @brief Subscriber bookkeeping, request dispatch and fan-out.
 */

#include "src/hub/inc/DistributionHub.hpp"
#include "src/alerts/inc/Alert.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/hub/inc/Protocol.hpp"

#include <exception>
#include <utility>

namespace cascade {
namespace hub {

namespace {

constexpr const char* LOG_CAT = "hub";

std::vector<std::string> toVector(const std::set<std::string>& s) {
  return std::vector<std::string>(s.begin(), s.end());
}

} // namespace

/* ----------------------------- EventChannel ----------------------------- */

std::size_t EventChannel::push(Json::Value payload) {
  return hub_.broadcast(name_, eventFrame(name_, std::move(payload)));
}

/* ----------------------------- DistributionHub ----------------------------- */

DistributionHub::DistributionHub(HubOptions options, helpers::clock::ClockFn clock)
    : clock_(std::move(clock)), options_(std::move(options)) {}

void DistributionHub::setResolver(std::shared_ptr<ResourceResolver> resolver) {
  std::lock_guard<std::mutex> lock(mtx_);
  resolver_ = std::move(resolver);
}

void DistributionHub::setOptions(HubOptions options) {
  std::lock_guard<std::mutex> lock(mtx_);
  options_ = std::move(options);
}

std::string DistributionHub::connect(std::shared_ptr<Subscriber> subscriber) {
  const std::string ID = alerts::generateId();
  {
    std::lock_guard<std::mutex> lock(mtx_);
    Client c{};
    c.conn = subscriber;
    c.subscriptions.insert(CHANNEL_SNAPSHOT);
    c.authenticated = !options_.enableAuth;
    clients_.emplace(ID, std::move(c));
  }
  helpers::log::info(LOG_CAT, "subscriber connected: {}", ID);
  reply(ID, subscriber, connectedFrame(ID, clock_()));
  return ID;
}

void DistributionHub::disconnect(const std::string& id) {
  std::size_t erased = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    erased = clients_.erase(id);
  }
  if (erased > 0) {
    helpers::log::info(LOG_CAT, "subscriber disconnected: {}", id);
  }
}

void DistributionHub::closeAll() {
  std::map<std::string, Client> drained;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    drained.swap(clients_);
  }
  for (auto& [id, client] : drained) {
    try {
      client.conn->close();
    } catch (const std::exception& e) {
      helpers::log::debug(LOG_CAT, "close {} failed: {}", id, e.what());
    }
  }
  if (!drained.empty()) {
    helpers::log::info(LOG_CAT, "closed {} subscriber(s)", drained.size());
  }
}

std::size_t DistributionHub::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return clients_.size();
}

std::vector<std::string> DistributionHub::subscriptions(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto IT = clients_.find(id);
  if (IT == clients_.end()) {
    return {};
  }
  return toVector(IT->second.subscriptions);
}

EventChannel& DistributionHub::channel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& slot = channels_[name];
  if (!slot) {
    slot = std::make_unique<EventChannel>(*this, name);
  }
  return *slot;
}

std::size_t DistributionHub::broadcast(const std::string& channel, const Json::Value& frame) {
  std::vector<std::pair<std::string, std::shared_ptr<Subscriber>>> targets;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [id, client] : clients_) {
      if (client.authenticated && client.subscriptions.count(channel) > 0) {
        targets.emplace_back(id, client.conn);
      }
    }
  }
  if (targets.empty()) {
    return 0;
  }

  const std::string TEXT = encode(frame);
  std::size_t sent = 0;
  for (const auto& [id, conn] : targets) {
    try {
      if (conn->send(TEXT)) {
        ++sent;
      } else {
        helpers::log::debug(LOG_CAT, "send to {} on '{}' failed", id, channel);
      }
    } catch (const std::exception& e) {
      helpers::log::debug(LOG_CAT, "send to {} on '{}' threw: {}", id, channel, e.what());
    }
  }
  return sent;
}

void DistributionHub::reply(const std::string& id, const std::shared_ptr<Subscriber>& conn,
                            const Json::Value& frame) {
  try {
    if (!conn->send(encode(frame))) {
      helpers::log::debug(LOG_CAT, "reply to {} failed", id);
    }
  } catch (const std::exception& e) {
    helpers::log::debug(LOG_CAT, "reply to {} threw: {}", id, e.what());
  }
}

/* ----------------------------- Requests ----------------------------- */

void DistributionHub::handleMessage(const std::string& id, std::string_view text) {
  std::shared_ptr<Subscriber> conn;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto IT = clients_.find(id);
    if (IT == clients_.end()) {
      return;
    }
    conn = IT->second.conn;
  }

  Request req{};
  std::string err;
  if (!parseRequest(text, req, &err)) {
    helpers::log::warn(LOG_CAT, "bad frame from {}: {}", id, err);
    reply(id, conn, errorFrame(ERR_INVALID_FORMAT));
    return;
  }

  Json::Value response;
  bool authenticated = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto IT = clients_.find(id);
    if (IT == clients_.end()) {
      return;
    }
    Client& client = IT->second;

    switch (req.type) {
    case RequestType::Auth:
      if (!options_.enableAuth || (req.apiKey && *req.apiKey == options_.apiKey)) {
        client.authenticated = true;
        response = authFrame(true);
      } else {
        response = authFrame(false, ERR_INVALID_API_KEY);
      }
      break;
    case RequestType::Subscribe:
      if (!client.authenticated) {
        response = errorFrame(ERR_NOT_AUTHENTICATED);
        break;
      }
      client.subscriptions.insert(req.channels.begin(), req.channels.end());
      response = channelsFrame("subscribed", toVector(client.subscriptions));
      break;
    case RequestType::Unsubscribe:
      for (const std::string& C : req.channels) {
        client.subscriptions.erase(C);
      }
      response = channelsFrame("unsubscribed", toVector(client.subscriptions));
      break;
    case RequestType::Ping:
      response = pongFrame(clock_());
      break;
    case RequestType::Get:
      authenticated = client.authenticated;
      break;
    case RequestType::Unknown:
      response = errorFrame(ERR_UNKNOWN_TYPE);
      break;
    }
  }

  if (req.type == RequestType::Get) {
    handleGet(id, conn, req.resource, authenticated);
    return;
  }
  reply(id, conn, response);
}

void DistributionHub::handleGet(const std::string& id, const std::shared_ptr<Subscriber>& conn,
                                const std::optional<std::string>& resource, bool authenticated) {
  if (!authenticated) {
    reply(id, conn, errorFrame(ERR_NOT_AUTHENTICATED));
    return;
  }
  std::shared_ptr<ResourceResolver> resolver;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    resolver = resolver_;
  }
  if (!resolver || !resource) {
    reply(id, conn, errorFrame(ERR_UNKNOWN_RESOURCE));
    return;
  }

  try {
    std::optional<Json::Value> data = resolver->resolve(*resource);
    if (!data) {
      reply(id, conn, errorFrame(ERR_UNKNOWN_RESOURCE));
      return;
    }
    reply(id, conn, dataFrame(*resource, std::move(*data)));
  } catch (const std::exception& e) {
    helpers::log::warn(LOG_CAT, "resource '{}' failed: {}", *resource, e.what());
    reply(id, conn, errorFrame(ERR_RESOURCE_FAILED));
  }
}

} // namespace hub
} // namespace cascade
