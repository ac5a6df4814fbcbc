/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file net.hpp
 * @brief sockpp-based TCP/UDP transport used by links, payload channels and
 *        UDP discovery.
 *
 * Every blocking call takes an explicit timeout so that background tasks can
 * notice shutdown; timeouts are implemented with poll(2) on the sockpp handle.
 */

#ifndef PEERLINK_NET_HPP_
#define PEERLINK_NET_HPP_

#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <sockpp/inet_address.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_connector.h>
#include <sockpp/tcp_socket.h>
#include <sockpp/udp_socket.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

namespace peerlink {
namespace net {

// ============================================================================
// NetError
// ============================================================================

enum class NetError : uint8_t {
  kConnectFailed = 0,
  kBindFailed,
  kListenFailed,
  kAcceptFailed,
  kSendFailed,
  kRecvFailed,
  kTimeout,
  kClosed,
  kInvalidAddress,
  kLineTooLong,
};

inline const char* NetErrorName(NetError e) noexcept {
  switch (e) {
    case NetError::kConnectFailed:  return "connect failed";
    case NetError::kBindFailed:     return "bind failed";
    case NetError::kListenFailed:   return "listen failed";
    case NetError::kAcceptFailed:   return "accept failed";
    case NetError::kSendFailed:     return "send failed";
    case NetError::kRecvFailed:     return "recv failed";
    case NetError::kTimeout:        return "timeout";
    case NetError::kClosed:         return "closed";
    case NetError::kInvalidAddress: return "invalid address";
    case NetError::kLineTooLong:    return "line too long";
    default:                        return "unknown";
  }
}

namespace detail {

/**
 * @brief Wait until @p fd reports @p events.
 * @return 1 ready, 0 timeout, -1 error. timeout_ms < 0 waits forever.
 */
inline int PollFd(int fd, short events, int32_t timeout_ms) noexcept {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = events;
  for (;;) {
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno == EINTR) continue;
    return (rc > 0) ? 1 : rc;
  }
}

inline std::string Ipv4ToString(const in_addr& addr) {
  char buf[INET_ADDRSTRLEN] = {};
  if (::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) return {};
  return std::string(buf);
}

}  // namespace detail

// ============================================================================
// TcpClient - connected TCP stream
// ============================================================================

/**
 * @brief Connected TCP socket (sockpp::tcp_socket) with timeouts.
 * Move-only type.
 */
class TcpClient {
 public:
  TcpClient() noexcept = default;

  /**
   * @brief Connect to a remote TCP server.
   * @param host IPv4 address or hostname
   * @param port Port number in host byte order
   * @param timeout_ms Connection timeout in milliseconds (0 = blocking)
   */
  static expected<TcpClient, NetError> Connect(const std::string& host,
                                                uint16_t port,
                                                int32_t timeout_ms = 10000) {
    auto addr_res = sockpp::inet_address::create(host, port);
    if (!addr_res) {
      return expected<TcpClient, NetError>::error(NetError::kInvalidAddress);
    }

    sockpp::tcp_connector conn;
    sockpp::result<> res;
    if (timeout_ms > 0) {
      res = conn.connect(addr_res.value(),
                         std::chrono::milliseconds(timeout_ms));
    } else {
      res = conn.connect(addr_res.value());
    }
    if (!res) {
      return expected<TcpClient, NetError>::error(NetError::kConnectFailed);
    }

    TcpClient client;
    client.sock_ = std::move(conn);
    return expected<TcpClient, NetError>::success(std::move(client));
  }

  expected<size_t, NetError> Send(const void* data, size_t len) noexcept {
    if (!sock_.is_open()) {
      return expected<size_t, NetError>::error(NetError::kClosed);
    }
    auto res = sock_.write(data, len);
    if (!res) {
      return expected<size_t, NetError>::error(NetError::kSendFailed);
    }
    return expected<size_t, NetError>::success(res.value());
  }

  /** @brief Write the whole buffer (sockpp write_n). */
  expected<void, NetError> SendAll(const std::string& data) noexcept {
    if (!sock_.is_open()) {
      return expected<void, NetError>::error(NetError::kClosed);
    }
    auto res = sock_.write_n(data.data(), data.size());
    if (!res || res.value() != data.size()) {
      return expected<void, NetError>::error(NetError::kSendFailed);
    }
    return expected<void, NetError>::success();
  }

  /**
   * @brief Read one '\n'-terminated line byte by byte.
   *
   * Nothing past the newline is consumed, so the stream can be handed to a
   * TLS session afterwards.
   *
   * @param max_len Maximum line length including the newline
   * @param timeout_ms Per-byte inactivity timeout
   */
  expected<std::string, NetError> ReadLine(size_t max_len,
                                           int32_t timeout_ms) {
    using R = expected<std::string, NetError>;
    if (!sock_.is_open()) return R::error(NetError::kClosed);
    std::string line;
    while (line.size() < max_len) {
      int ready = detail::PollFd(sock_.handle(), POLLIN, timeout_ms);
      if (ready == 0) return R::error(NetError::kTimeout);
      if (ready < 0) return R::error(NetError::kRecvFailed);
      char ch = 0;
      auto res = sock_.read(&ch, 1);
      if (!res) return R::error(NetError::kRecvFailed);
      if (res.value() == 0U) return R::error(NetError::kClosed);
      line.push_back(ch);
      if (ch == '\n') return R::success(std::move(line));
    }
    return R::error(NetError::kLineTooLong);
  }

  /** @brief Enable TCP keep-alive probes. */
  void SetKeepAlive() noexcept {
    if (sock_.is_open()) {
      (void)sock_.set_option(SOL_SOCKET, SO_KEEPALIVE, int(1));
    }
  }

  /** @brief Peer IPv4 address as dotted quad (empty if unknown). */
  std::string PeerHost() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(Fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      return {};
    }
    return detail::Ipv4ToString(addr.sin_addr);
  }

  int Fd() const noexcept { return sock_.handle(); }
  bool IsOpen() const noexcept { return sock_.is_open(); }

  /** @brief Shut down both directions without releasing the descriptor. */
  void Shutdown() noexcept {
    if (sock_.is_open()) (void)::shutdown(sock_.handle(), SHUT_RDWR);
  }

  void Close() noexcept { sock_.close(); }

  // Move-only
  TcpClient(TcpClient&& other) noexcept = default;
  TcpClient& operator=(TcpClient&& other) noexcept = default;

  TcpClient(const TcpClient&) = delete;
  TcpClient& operator=(const TcpClient&) = delete;

 private:
  friend class TcpServer;

  explicit TcpClient(sockpp::tcp_socket&& sock) noexcept
      : sock_(std::move(sock)) {}

  sockpp::tcp_socket sock_;
};

// ============================================================================
// TcpServer - TCP listener
// ============================================================================

/**
 * @brief TCP listener wrapper around sockpp::tcp_acceptor.
 * Move-only type.
 */
class TcpServer {
 public:
  TcpServer() noexcept = default;

  /**
   * @brief Listen on @p port on all interfaces (0 = OS-assigned).
   */
  static expected<TcpServer, NetError> Listen(uint16_t port,
                                               int32_t backlog = 16) {
    TcpServer server;
    auto addr_res = sockpp::inet_address::create("0.0.0.0", port);
    if (!addr_res) {
      return expected<TcpServer, NetError>::error(NetError::kInvalidAddress);
    }
    auto open_res = server.acc_.open(addr_res.value(), backlog, SO_REUSEADDR);
    if (!open_res) {
      return expected<TcpServer, NetError>::error(NetError::kListenFailed);
    }
    return expected<TcpServer, NetError>::success(std::move(server));
  }

  /**
   * @brief Listen on a free port.
   *
   * When @p prefer_ephemeral is set an OS-assigned port is tried first; then
   * the range [min_port, max_port] is scanned in order.
   */
  static expected<TcpServer, NetError> ListenOnFreePort(uint16_t min_port,
                                                         uint16_t max_port,
                                                         bool prefer_ephemeral,
                                                         int32_t backlog = 16) {
    if (prefer_ephemeral) {
      auto r = Listen(0, backlog);
      if (r.has_value()) return r;
    }
    for (uint32_t port = min_port; port <= max_port; ++port) {
      auto r = Listen(static_cast<uint16_t>(port), backlog);
      if (r.has_value()) return r;
    }
    return expected<TcpServer, NetError>::error(NetError::kListenFailed);
  }

  /**
   * @brief Accept one connection, waiting at most @p timeout_ms
   *        (negative = forever).
   */
  expected<TcpClient, NetError> Accept(int32_t timeout_ms = -1) {
    if (!acc_.is_open()) {
      return expected<TcpClient, NetError>::error(NetError::kClosed);
    }
    int ready = detail::PollFd(acc_.handle(), POLLIN, timeout_ms);
    if (ready == 0) {
      return expected<TcpClient, NetError>::error(NetError::kTimeout);
    }
    if (ready < 0) {
      return expected<TcpClient, NetError>::error(NetError::kAcceptFailed);
    }
    auto res = acc_.accept();
    if (!res) {
      return expected<TcpClient, NetError>::error(NetError::kAcceptFailed);
    }
    return expected<TcpClient, NetError>::success(TcpClient(res.release()));
  }

  /** @brief Bound port in host byte order (0 if not listening). */
  uint16_t LocalPort() const noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(acc_.handle(), reinterpret_cast<sockaddr*>(&addr),
                      &len) != 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  int Fd() const noexcept { return acc_.handle(); }
  bool IsOpen() const noexcept { return acc_.is_open(); }
  void Close() noexcept { acc_.close(); }

  // Move-only
  TcpServer(TcpServer&& other) noexcept = default;
  TcpServer& operator=(TcpServer&& other) noexcept = default;

  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

 private:
  sockpp::tcp_acceptor acc_;
};

// ============================================================================
// UdpPeer - UDP socket
// ============================================================================

/**
 * @brief UDP socket wrapper around sockpp::udp_socket.
 * Move-only type.
 */
class UdpPeer {
 public:
  UdpPeer() noexcept = default;

  /**
   * @brief Bind to @p port on all interfaces with SO_REUSEADDR and
   *        SO_BROADCAST set.
   */
  static expected<UdpPeer, NetError> Bind(uint16_t port) {
    UdpPeer peer;
    auto addr_res = sockpp::inet_address::create("0.0.0.0", port);
    if (!addr_res) {
      return expected<UdpPeer, NetError>::error(NetError::kInvalidAddress);
    }
    (void)peer.sock_.set_option(SOL_SOCKET, SO_REUSEADDR, int(1));
    (void)peer.sock_.set_option(SOL_SOCKET, SO_BROADCAST, int(1));
    auto bind_res = peer.sock_.bind(addr_res.value());
    if (!bind_res) {
      return expected<UdpPeer, NetError>::error(NetError::kBindFailed);
    }
    return expected<UdpPeer, NetError>::success(std::move(peer));
  }

  /** @brief Create a socket for sending only (ephemeral port, broadcast on). */
  static expected<UdpPeer, NetError> Create() { return Bind(0); }

  expected<size_t, NetError> SendTo(const void* data, size_t len,
                                     const std::string& host, uint16_t port) {
    if (!sock_.is_open()) {
      return expected<size_t, NetError>::error(NetError::kClosed);
    }
    auto addr_res = sockpp::inet_address::create(host, port);
    if (!addr_res) {
      return expected<size_t, NetError>::error(NetError::kInvalidAddress);
    }
    auto res = sock_.send_to(data, len, addr_res.value());
    if (!res) {
      return expected<size_t, NetError>::error(NetError::kSendFailed);
    }
    return expected<size_t, NetError>::success(res.value());
  }

  /**
   * @brief Receive one datagram, waiting at most @p timeout_ms.
   * @param from_host Receives the sender's dotted-quad address (may be null)
   */
  expected<size_t, NetError> RecvFrom(void* buf, size_t len,
                                       std::string* from_host,
                                       int32_t timeout_ms = -1) {
    if (!sock_.is_open()) {
      return expected<size_t, NetError>::error(NetError::kClosed);
    }
    int ready = detail::PollFd(sock_.handle(), POLLIN, timeout_ms);
    if (ready == 0) {
      return expected<size_t, NetError>::error(NetError::kTimeout);
    }
    if (ready < 0) {
      return expected<size_t, NetError>::error(NetError::kRecvFailed);
    }
    sockpp::inet_address src_addr;
    auto res = sock_.recv_from(buf, len, &src_addr);
    if (!res) {
      return expected<size_t, NetError>::error(NetError::kRecvFailed);
    }
    if (from_host != nullptr) {
      in_addr a{};
      a.s_addr = src_addr.address();
      *from_host = detail::Ipv4ToString(a);
    }
    return expected<size_t, NetError>::success(res.value());
  }

  uint16_t LocalPort() const noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(sock_.handle(), reinterpret_cast<sockaddr*>(&addr),
                      &len) != 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  int Fd() const noexcept { return sock_.handle(); }
  bool IsOpen() const noexcept { return sock_.is_open(); }
  void Close() noexcept { sock_.close(); }

  // Move-only
  UdpPeer(UdpPeer&& other) noexcept = default;
  UdpPeer& operator=(UdpPeer&& other) noexcept = default;

  UdpPeer(const UdpPeer&) = delete;
  UdpPeer& operator=(const UdpPeer&) = delete;

 private:
  sockpp::udp_socket sock_;
};

}  // namespace net
}  // namespace peerlink

#endif  // PEERLINK_NET_HPP_
