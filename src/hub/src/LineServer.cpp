/**
 * @file LineServer.cpp
 * @brief poll()-driven TCP listener feeding the distribution hub.
 */

#include "src/hub/inc/LineServer.hpp"
#include "src/helpers/inc/Log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/format.h>

namespace cascade {
namespace hub {

namespace {

constexpr const char* LOG_CAT = "server";
constexpr int LISTEN_BACKLOG = 16;
constexpr std::size_t READ_CHUNK = 16 * 1024;

void setError(std::string* error, std::string msg) {
  if (error != nullptr) {
    *error = std::move(msg);
  }
}

void wake(int fd) noexcept {
  const std::uint64_t ONE = 1;
  (void)::write(fd, &ONE, sizeof(ONE));
}

} // namespace

/* ----------------------------- Connection ----------------------------- */

/// Subscriber side of one socket. Only the I/O thread touches the fd.
class LineServer::Connection final : public Subscriber {
public:
  Connection(int fd, int wakeFd, std::size_t maxBuffer)
      : fd_(fd), wakeFd_(wakeFd), maxBuffer_(maxBuffer) {}

  bool send(const std::string& frame) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (detached_ || overflow_) {
      return false;
    }
    if (outbound_.size() + frame.size() + 1 > maxBuffer_) {
      overflow_ = true;
      wake(wakeFd_);
      return false;
    }
    outbound_.append(frame);
    outbound_.push_back('\n');
    wake(wakeFd_);
    return true;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (detached_ || closeRequested_) {
      return;
    }
    closeRequested_ = true;
    wake(wakeFd_);
  }

  /// Called by the server before the fd and wake fd go away.
  void detach() {
    std::lock_guard<std::mutex> lock(mtx_);
    detached_ = true;
    outbound_.clear();
  }

  [[nodiscard]] int fd() const noexcept { return fd_; }

  std::string id{};
  std::string inbound{};

  /// Outbound bytes pending; moves them to `out` for writing.
  bool takeOutbound(std::string& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    out.swap(outbound_);
    outbound_.clear();
    return !out.empty();
  }

  /// Put back bytes that could not be written, ahead of newer frames.
  void restoreOutbound(std::string rest) {
    std::lock_guard<std::mutex> lock(mtx_);
    rest.append(outbound_);
    outbound_.swap(rest);
  }

  [[nodiscard]] bool hasOutbound() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return !outbound_.empty();
  }

  [[nodiscard]] bool overflowed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return overflow_;
  }

  [[nodiscard]] bool closeRequested() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closeRequested_;
  }

private:
  int fd_;
  int wakeFd_;
  std::size_t maxBuffer_;

  mutable std::mutex mtx_;
  std::string outbound_{};
  bool overflow_{false};
  bool closeRequested_{false};
  bool detached_{false};
};

/* ----------------------------- LineServer ----------------------------- */

LineServer::LineServer(DistributionHub& hub, LineServerOptions options)
    : hub_(hub), options_(std::move(options)) {}

LineServer::~LineServer() { stop(); }

bool LineServer::start(std::string* error) {
  if (running_.load()) {
    setError(error, "server already running");
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options_.port);
  if (::inet_pton(AF_INET, options_.bindAddress.c_str(), &addr.sin_addr) != 1) {
    setError(error, fmt::format("invalid bind address '{}'", options_.bindAddress));
    return false;
  }

  listenFd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listenFd_ < 0) {
    setError(error, fmt::format("socket() failed: {}", std::strerror(errno)));
    return false;
  }
  int optval = 1;
  (void)::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
      ::listen(listenFd_, LISTEN_BACKLOG) < 0) {
    setError(error, fmt::format("bind {}:{} failed: {}", options_.bindAddress, options_.port,
                                std::strerror(errno)));
    ::close(listenFd_);
    listenFd_ = -1;
    return false;
  }

  socklen_t len = sizeof(addr);
  ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
  boundPort_ = ntohs(addr.sin_port);

  wakeFd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (wakeFd_ < 0) {
    setError(error, fmt::format("eventfd() failed: {}", std::strerror(errno)));
    ::close(listenFd_);
    listenFd_ = -1;
    return false;
  }

  stopping_.store(false);
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  helpers::log::info(LOG_CAT, "listening on {}:{}", options_.bindAddress, boundPort_);
  return true;
}

void LineServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  stopping_.store(true);
  wake(wakeFd_);
  if (thread_.joinable()) {
    thread_.join();
  }

  while (!conns_.empty()) {
    drop(conns_.begin()->first);
  }
  ::close(wakeFd_);
  wakeFd_ = -1;
  ::close(listenFd_);
  listenFd_ = -1;
  helpers::log::info(LOG_CAT, "stopped");
}

void LineServer::run() {
  std::vector<pollfd> fds;
  while (!stopping_.load()) {
    fds.clear();
    fds.push_back(pollfd{wakeFd_, POLLIN, 0});
    fds.push_back(pollfd{listenFd_, POLLIN, 0});
    for (const auto& [fd, conn] : conns_) {
      short events = POLLIN;
      if (conn->hasOutbound()) {
        events = static_cast<short>(events | POLLOUT);
      }
      fds.push_back(pollfd{fd, events, 0});
    }

    const int RC = ::poll(fds.data(), fds.size(), -1);
    if (RC < 0) {
      if (errno == EINTR) {
        continue;
      }
      helpers::log::error(LOG_CAT, "poll failed: {}", std::strerror(errno));
      break;
    }

    if ((fds[0].revents & POLLIN) != 0) {
      std::uint64_t drain = 0;
      (void)::read(wakeFd_, &drain, sizeof(drain));
    }
    if (stopping_.load()) {
      break;
    }
    if ((fds[1].revents & POLLIN) != 0) {
      acceptAll();
    }

    std::vector<int> dead;
    for (std::size_t i = 2; i < fds.size(); ++i) {
      const auto IT = conns_.find(fds[i].fd);
      if (IT == conns_.end()) {
        continue;
      }
      Connection& conn = *IT->second;
      bool alive = true;
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        alive = readFrom(conn);
      }
      if (alive && conn.overflowed()) {
        helpers::log::warn(LOG_CAT, "subscriber {} exceeded {} buffered bytes; dropping", conn.id,
                           options_.maxBufferBytes);
        alive = false;
      }
      if (alive && conn.hasOutbound()) {
        alive = flush(conn);
      }
      if (alive && conn.closeRequested() && !conn.hasOutbound()) {
        alive = false;
      }
      if (!alive) {
        dead.push_back(fds[i].fd);
      }
    }
    // Connections closed from another thread since the last poll.
    for (const auto& [fd, conn] : conns_) {
      if ((conn->closeRequested() && !conn->hasOutbound()) || conn->overflowed()) {
        dead.push_back(fd);
      }
    }
    for (int fd : dead) {
      drop(fd);
    }
  }
}

void LineServer::acceptAll() {
  while (true) {
    const int FD = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (FD < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        helpers::log::warn(LOG_CAT, "accept failed: {}", std::strerror(errno));
      }
      return;
    }
    int one = 1;
    (void)::setsockopt(FD, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    auto conn = std::make_shared<Connection>(FD, wakeFd_, options_.maxBufferBytes);
    conns_[FD] = conn;
    conn->id = hub_.connect(conn);
  }
}

bool LineServer::readFrom(Connection& conn) {
  std::array<char, READ_CHUNK> buf{};
  while (true) {
    const ssize_t N = ::recv(conn.fd(), buf.data(), buf.size(), 0);
    if (N > 0) {
      conn.inbound.append(buf.data(), static_cast<std::size_t>(N));
      continue;
    }
    if (N == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    helpers::log::debug(LOG_CAT, "recv from {} failed: {}", conn.id, std::strerror(errno));
    return false;
  }

  std::size_t start = 0;
  std::size_t nl = 0;
  while ((nl = conn.inbound.find('\n', start)) != std::string::npos) {
    std::string_view line(conn.inbound.data() + start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!line.empty()) {
      hub_.handleMessage(conn.id, line);
    }
    start = nl + 1;
  }
  conn.inbound.erase(0, start);

  if (conn.inbound.size() > options_.maxBufferBytes) {
    helpers::log::warn(LOG_CAT, "subscriber {} sent an oversized frame; dropping", conn.id);
    return false;
  }
  return true;
}

bool LineServer::flush(Connection& conn) {
  std::string pending;
  if (!conn.takeOutbound(pending)) {
    return true;
  }
  std::size_t off = 0;
  while (off < pending.size()) {
    const ssize_t N =
        ::send(conn.fd(), pending.data() + off, pending.size() - off, MSG_NOSIGNAL | MSG_DONTWAIT);
    if (N > 0) {
      off += static_cast<std::size_t>(N);
      continue;
    }
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    helpers::log::debug(LOG_CAT, "send to {} failed: {}", conn.id, std::strerror(errno));
    return false;
  }
  if (off < pending.size()) {
    conn.restoreOutbound(pending.substr(off));
  }
  return true;
}

void LineServer::drop(int fd) {
  const auto IT = conns_.find(fd);
  if (IT == conns_.end()) {
    return;
  }
  const std::shared_ptr<Connection> CONN = IT->second;
  conns_.erase(IT);
  CONN->detach();
  hub_.disconnect(CONN->id);
  ::close(fd);
}

} // namespace hub
} // namespace cascade
