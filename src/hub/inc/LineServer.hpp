#ifndef CASCADE_HUB_LINE_SERVER_HPP
#define CASCADE_HUB_LINE_SERVER_HPP
/**
 * @file LineServer.hpp
 * @brief TCP transport for the distribution hub: newline-delimited JSON frames.
 *
 * One I/O thread multiplexes the listener, an eventfd wake-up and every
 * connection with poll(). Each accepted connection becomes a hub Subscriber
 * whose send() only appends to a per-connection outbound buffer and wakes the
 * loop, so a broadcast never blocks on a slow client. A connection whose
 * outbound (or unterminated inbound) data exceeds maxBufferBytes is dropped.
 *
 * Inbound lines are passed to DistributionHub::handleMessage on the I/O thread.
 */

#include "src/hub/inc/DistributionHub.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace cascade {
namespace hub {

inline constexpr std::size_t DEFAULT_MAX_BUFFER_BYTES = 4U * 1024U * 1024U;

struct LineServerOptions {
  std::string bindAddress{"127.0.0.1"}; ///< IPv4 literal
  std::uint16_t port{8086};             ///< 0 picks an ephemeral port
  std::size_t maxBufferBytes{DEFAULT_MAX_BUFFER_BYTES};
};

class LineServer {
public:
  LineServer(DistributionHub& hub, LineServerOptions options);
  ~LineServer();

  LineServer(const LineServer&) = delete;
  LineServer& operator=(const LineServer&) = delete;

  /// Bind, listen and start the I/O thread. False if already running or bind fails.
  [[nodiscard]] bool start(std::string* error = nullptr);

  /// Stop the I/O thread and close every connection. Idempotent.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  /// Bound port; valid after a successful start().
  [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }

private:
  class Connection;

  void run();
  void acceptAll();
  bool readFrom(Connection& conn);
  bool flush(Connection& conn);
  void drop(int fd);

  DistributionHub& hub_;
  LineServerOptions options_;

  int listenFd_{-1};
  int wakeFd_{-1};
  std::uint16_t boundPort_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::thread thread_;

  std::map<int, std::shared_ptr<Connection>> conns_; ///< I/O thread only
};

} // namespace hub
} // namespace cascade

#endif // CASCADE_HUB_LINE_SERVER_HPP
