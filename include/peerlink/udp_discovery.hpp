/**
 * @file udp_discovery.hpp
 * @brief UDP identity broadcast listener and sender.
 *
 * The listener hands each received datagram to the datagram callback on a
 * TaskPool task. The sender transmits one identity line to a list of hosts.
 * Throttling and target selection live in the link provider.
 */

#ifndef PEERLINK_UDP_DISCOVERY_HPP_
#define PEERLINK_UDP_DISCOVERY_HPP_

#include "peerlink/log.hpp"
#include "peerlink/net.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/task_pool.hpp"
#include "peerlink/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifndef PEERLINK_UDP_PORT
#define PEERLINK_UDP_PORT 1816
#endif

#ifndef PEERLINK_MAX_DATAGRAM_SIZE
#define PEERLINK_MAX_DATAGRAM_SIZE (512U * 1024U)
#endif

namespace peerlink {

class UdpDiscovery {
 public:
  /// Called on a pool task with the datagram text and the sender address.
  using DatagramFn = void (*)(const std::string& data,
                              const std::string& source_ip, void* ctx);

  struct Config {
    uint16_t port = PEERLINK_UDP_PORT;
    bool listen = true;
    int32_t poll_interval_ms = 250;
  };

  UdpDiscovery(TaskPool& pool, const Config& cfg) : pool_(pool), config_(cfg) {}
  ~UdpDiscovery() { Stop(); }

  UdpDiscovery(const UdpDiscovery&) = delete;
  UdpDiscovery& operator=(const UdpDiscovery&) = delete;

  void SetDatagramCallback(DatagramFn fn, void* ctx) noexcept {
    on_datagram_ = fn;
    datagram_ctx_ = ctx;
  }

  /**
   * @brief Open the sender and, if configured, the listener.
   *
   * A listener bind failure is logged; sending keeps working.
   * @return false only if no sender socket could be created.
   */
  bool Start() {
    if (running_.load(std::memory_order_acquire)) return true;
    {
      auto sender = net::UdpPeer::Create();
      if (!sender.has_value()) {
        PEERLINK_LOG_ERROR("udp", "cannot create sender socket: %s",
                           net::NetErrorName(sender.get_error()));
        return false;
      }
      std::lock_guard<std::mutex> lock(send_mutex_);
      sender_ = std::move(sender).value();
    }
    running_.store(true, std::memory_order_release);

    if (config_.listen) {
      auto listener = net::UdpPeer::Bind(config_.port);
      if (!listener.has_value()) {
        PEERLINK_LOG_ERROR("udp", "cannot bind port %u (%s), send only",
                           static_cast<unsigned>(config_.port),
                           net::NetErrorName(listener.get_error()));
      } else {
        listener_ = std::move(listener).value();
        PEERLINK_LOG_INFO("udp", "listening on port %u",
                          static_cast<unsigned>(listener_.LocalPort()));
        recv_thread_ = std::thread([this]() { ReceiveLoop(); });
      }
    }
    return true;
  }

  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    if (recv_thread_.joinable()) recv_thread_.join();
    listener_.Close();
    std::lock_guard<std::mutex> lock(send_mutex_);
    sender_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }
  bool IsListening() const noexcept { return listener_.IsOpen(); }
  uint16_t ListenPort() const noexcept { return listener_.LocalPort(); }

  /**
   * @brief Send @p line to every host in @p hosts on @p port.
   * @return Number of datagrams handed to the kernel.
   */
  size_t SendTo(const std::string& line, const std::vector<std::string>& hosts,
                uint16_t port) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!sender_.IsOpen()) return 0;
    size_t sent = 0;
    for (const auto& host : hosts) {
      auto r = sender_.SendTo(line.data(), line.size(), host, port);
      if (r.has_value()) {
        ++sent;
      } else {
        PEERLINK_LOG_DEBUG("udp", "send to %s:%u failed: %s", host.c_str(),
                           static_cast<unsigned>(port),
                           net::NetErrorName(r.get_error()));
      }
    }
    return sent;
  }

 private:
  void ReceiveLoop() {
    std::vector<char> buf(PEERLINK_MAX_DATAGRAM_SIZE);
    while (running_.load(std::memory_order_acquire)) {
      std::string from;
      auto n = listener_.RecvFrom(buf.data(), buf.size(), &from,
                                  config_.poll_interval_ms);
      if (!n.has_value()) {
        if (n.get_error() == net::NetError::kTimeout) continue;
        PEERLINK_LOG_WARN("udp", "receive failed: %s",
                          net::NetErrorName(n.get_error()));
        continue;
      }
      if (n.value() == 0U || on_datagram_ == nullptr) continue;
      std::string data(buf.data(), n.value());
      DatagramFn fn = on_datagram_;
      void* ctx = datagram_ctx_;
      if (!pool_.Spawn([fn, ctx, data, from]() { fn(data, from, ctx); })) {
        break;
      }
    }
  }

  TaskPool& pool_;
  Config config_;
  net::UdpPeer listener_;
  net::UdpPeer sender_;
  std::mutex send_mutex_;
  std::thread recv_thread_;
  std::atomic<bool> running_{false};
  DatagramFn on_datagram_ = nullptr;
  void* datagram_ctx_ = nullptr;
};

}  // namespace peerlink

#endif  // PEERLINK_UDP_DISCOVERY_HPP_
