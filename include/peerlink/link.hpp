/**
 * @file link.hpp
 * @brief Transport link to one remote device: packet I/O over a TLS stream
 *        plus the per-packet payload side-channel.
 *
 * A Link outlives the individual TLS streams it carries. Reset() swaps in a
 * replacement stream; the read loop of the old stream then ends without
 * reporting the link as lost, because the stream generation moved on.
 *
 * Payload side-channel:
 *   sender                               receiver
 *   listen on free port p
 *   send header {"payloadTransferInfo":{"port":p}}
 *                                        connect(peer, p), TLS client
 *   accept (10 s), TLS server
 *   copy payloadSize bytes  ------------> InboundPayload
 */

#ifndef PEERLINK_LINK_HPP_
#define PEERLINK_LINK_HPP_

#include "peerlink/device_info.hpp"
#include "peerlink/log.hpp"
#include "peerlink/net.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/payload.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/task_pool.hpp"
#include "peerlink/tls.hpp"
#include "peerlink/transfer_packet.hpp"
#include "peerlink/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifndef PEERLINK_MAX_LINE_LENGTH
#define PEERLINK_MAX_LINE_LENGTH (16U * 1024U * 1024U)
#endif

namespace peerlink {

enum class LinkError : uint8_t {
  kMalformedPacket = 0,
  kInvalidIdentity,
  kSelfIdentity,
  kRateLimited,
  kUntrustedNetwork,
  kProtocolDowngrade,
  kTargetMismatch,
  kHandshakeFailure,
  kCertificateMismatch,
  kTransportIo,
  kNotConnected,
  kCanceled,
};

inline const char* LinkErrorName(LinkError e) noexcept {
  switch (e) {
    case LinkError::kMalformedPacket:     return "malformed packet";
    case LinkError::kInvalidIdentity:     return "invalid identity";
    case LinkError::kSelfIdentity:        return "self identity";
    case LinkError::kRateLimited:         return "rate limited";
    case LinkError::kUntrustedNetwork:    return "untrusted network";
    case LinkError::kProtocolDowngrade:   return "protocol downgrade";
    case LinkError::kTargetMismatch:      return "target mismatch";
    case LinkError::kHandshakeFailure:    return "handshake failure";
    case LinkError::kCertificateMismatch: return "certificate mismatch";
    case LinkError::kTransportIo:         return "transport io";
    case LinkError::kNotConnected:        return "not connected";
    case LinkError::kCanceled:            return "canceled";
    default:                              return "unknown";
  }
}

// ============================================================================
// Callback interfaces
// ============================================================================

/**
 * @brief Send status notifications. Any pointer may be null.
 *
 * For asynchronous payload transfers the callbacks (and @c ctx) must stay
 * valid until the transfer finishes.
 */
struct SendCallbacks {
  void (*on_success)(void* ctx) = nullptr;
  void (*on_failure)(LinkError error, void* ctx) = nullptr;
  void (*on_progress)(int percent, void* ctx) = nullptr;
  void* ctx = nullptr;

  void Success() const {
    if (on_success != nullptr) on_success(ctx);
  }
  void Failure(LinkError error) const {
    if (on_failure != nullptr) on_failure(error, ctx);
  }
  void Progress(int percent) const {
    if (on_progress != nullptr) on_progress(percent, ctx);
  }
};

class Link;

/** @brief Consumer of inbound packets, called on the link's read thread. */
class PacketReceiver {
 public:
  virtual ~PacketReceiver() = default;
  virtual bool OnPacketReceived(Link& link, TransferPacket& packet) = 0;
};

/** @brief Notified when a link lost its stream and got no replacement. */
class LinkObserver {
 public:
  virtual ~LinkObserver() = default;
  virtual void OnLinkLost(const std::shared_ptr<Link>& link) = 0;
};

struct LinkOptions {
  int32_t payload_accept_timeout_ms = 10000;
  int32_t payload_connect_timeout_ms = 10000;
  int32_t loss_grace_ms = 300;
  int32_t progress_interval_ms = 500;
  uint16_t payload_port_min = 1839;
  uint16_t payload_port_max = 1864;
  bool payload_prefer_ephemeral = true;
};

// ============================================================================
// InboundPayload
// ============================================================================

/**
 * @brief Payload read from a side-channel TLS stream.
 *
 * Never yields more than the announced size. The sender closes the channel
 * right after the last byte, so EOF before the announced size and data
 * after it are both PayloadError::kSizeMismatch.
 */
class InboundPayload final : public Payload {
 public:
  InboundPayload(std::shared_ptr<TlsStream> stream, int64_t size)
      : stream_(std::move(stream)), size_(size), remaining_(size) {}

  ~InboundPayload() override { Close(); }

  expected<size_t, PayloadError> Read(void* buf, size_t len) override {
    using R = expected<size_t, PayloadError>;
    if (stream_ == nullptr) return R::error(PayloadError::kClosed);
    if (remaining_ <= 0) return CheckEnd();
    if (stream_->IsClosed()) return R::error(PayloadError::kClosed);
    size_t want = len;
    if (static_cast<int64_t>(want) > remaining_) {
      want = static_cast<size_t>(remaining_);
    }
    auto r = stream_->Read(buf, want);
    if (!r.has_value()) {
      return R::error(r.get_error() == TlsError::kClosed
                          ? PayloadError::kSizeMismatch
                          : PayloadError::kIo);
    }
    remaining_ -= static_cast<int64_t>(r.value());
    return R::success(r.value());
  }

  int64_t Size() const noexcept override { return size_; }

  void Close() noexcept override {
    if (stream_ != nullptr) stream_->Close();
  }

 private:
  // Called once the announced size is consumed: the next event must be EOF.
  expected<size_t, PayloadError> CheckEnd() {
    using R = expected<size_t, PayloadError>;
    if (overrun_) return R::error(PayloadError::kSizeMismatch);
    if (at_end_) return R::success(0U);
    if (stream_->IsClosed()) return R::error(PayloadError::kClosed);
    char extra = 0;
    auto r = stream_->Read(&extra, 1U);
    if (r.has_value()) {
      PEERLINK_LOG_WARN("link", "payload exceeds announced %lld bytes",
                        static_cast<long long>(size_));
      overrun_ = true;
      return R::error(PayloadError::kSizeMismatch);
    }
    if (r.get_error() != TlsError::kClosed) return R::error(PayloadError::kIo);
    at_end_ = true;
    return R::success(0U);
  }

  std::shared_ptr<TlsStream> stream_;
  int64_t size_;
  int64_t remaining_;
  bool at_end_ = false;
  bool overrun_ = false;
};

// ============================================================================
// Link
// ============================================================================

class Link : public std::enable_shared_from_this<Link> {
 public:
  static std::shared_ptr<Link> Create(DeviceInfo info, TaskPool& pool,
                                      std::shared_ptr<TlsContext> tls,
                                      LinkObserver* observer,
                                      const LinkOptions& options = {}) {
    return std::shared_ptr<Link>(new Link(std::move(info), pool,
                                          std::move(tls), observer, options));
  }

  ~Link() {
    std::shared_ptr<TlsStream> stream = CurrentStream();
    if (stream != nullptr) stream->Close();
  }

  Link(const Link&) = delete;
  Link& operator=(const Link&) = delete;

  /**
   * @brief Install @p stream and @p info, start reading from the stream.
   * @return The previous stream (already closed), or nullptr.
   */
  std::shared_ptr<TlsStream> Reset(std::shared_ptr<TlsStream> stream,
                                   DeviceInfo info) {
    std::shared_ptr<TlsStream> old;
    uint64_t gen;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      old = stream_;
      stream_ = stream;
      info_ = std::move(info);
      gen = generation_.fetch_add(1U, std::memory_order_acq_rel) + 1U;
    }
    if (old != nullptr) old->Close();

    std::shared_ptr<Link> self = shared_from_this();
    bool spawned = pool_.Spawn([self, stream, gen]() {
      self->ReadLoop(stream, gen);
    });
    if (!spawned) {
      PEERLINK_LOG_WARN("link", "task pool stopped, closing stream of %s",
                        DeviceId().c_str());
      stream->Close();
    }
    return old;
  }

  /**
   * @brief Write @p packet and, if it carries one, transfer its payload.
   * @param send_payload_sync Stream the payload before returning
   * @return false if the packet could not be written.
   */
  bool SendPacket(TransferPacket& packet, const SendCallbacks& callbacks,
                  bool send_payload_sync = true) {
    std::shared_ptr<TlsStream> stream = CurrentStream();
    if (stream == nullptr) {
      PEERLINK_LOG_ERROR("link", "send %s: not connected",
                         packet.Type().c_str());
      packet.ClosePayload();
      callbacks.Failure(LinkError::kNotConnected);
      return false;
    }

    const bool with_payload = packet.HasPayload();
    net::TcpServer server;
    if (with_payload) {
      auto listener = net::TcpServer::ListenOnFreePort(
          options_.payload_port_min, options_.payload_port_max,
          options_.payload_prefer_ephemeral);
      if (!listener.has_value()) {
        PEERLINK_LOG_ERROR("link", "no free payload port for %s",
                           packet.Type().c_str());
        packet.ClosePayload();
        callbacks.Failure(LinkError::kTransportIo);
        return false;
      }
      server = std::move(listener).value();
      Json info = Json::object();
      info["port"] = server.LocalPort();
      packet.SetRuntimeTransferInfo(std::move(info));
    }

    auto written = stream->WriteAll(packet.SerializeForWire());
    if (!written.has_value()) {
      PEERLINK_LOG_INFO("link", "write to %s failed (%s), disconnecting",
                        DeviceId().c_str(), TlsErrorName(written.get_error()));
      server.Close();
      packet.ClosePayload();
      stream->Close();
      callbacks.Failure(LinkError::kTransportIo);
      return false;
    }

    if (with_payload) {
      PayloadJob job;
      job.server = std::make_shared<net::TcpServer>(std::move(server));
      job.payload = packet.TakePayload();
      job.canceled = packet.CancelFlag();
      job.size = packet.PayloadSize();
      job.type = packet.Type();
      job.callbacks = callbacks;
      if (send_payload_sync) {
        auto rc = SendPayload(job);
        if (!rc.has_value()) {
          callbacks.Failure(rc.get_error());
          return false;
        }
      } else {
        std::shared_ptr<Link> self = shared_from_this();
        bool spawned = pool_.Spawn([self, job]() {
          auto rc = self->SendPayload(job);
          if (!rc.has_value()) {
            PEERLINK_LOG_ERROR("link",
                               "async payload of %s failed: %s",
                               job.type.c_str(), LinkErrorName(rc.get_error()));
          }
        });
        if (!spawned) {
          job.server->Close();
          job.payload->Close();
          callbacks.Failure(LinkError::kCanceled);
          return false;
        }
      }
    }

    if (!packet.IsCanceled()) callbacks.Success();
    return true;
  }

  /** @brief Close the current stream; loss follows unless Reset() intervenes. */
  void Disconnect() {
    std::shared_ptr<TlsStream> stream = CurrentStream();
    if (stream != nullptr) stream->Close();
  }

  bool IsConnected() const {
    std::shared_ptr<TlsStream> stream = CurrentStream();
    return stream != nullptr && !stream->IsClosed();
  }

  void AddReceiver(PacketReceiver* receiver) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(receivers_.begin(), receivers_.end(), receiver) ==
        receivers_.end()) {
      receivers_.push_back(receiver);
    }
  }

  void RemoveReceiver(PacketReceiver* receiver) {
    std::lock_guard<std::mutex> lock(mutex_);
    receivers_.erase(
        std::remove(receivers_.begin(), receivers_.end(), receiver),
        receivers_.end());
  }

  DeviceInfo Info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
  }

  std::string DeviceId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_.id;
  }

  uint64_t Generation() const noexcept {
    return generation_.load(std::memory_order_acquire);
  }

  std::shared_ptr<TlsStream> CurrentStream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_;
  }

 private:
  struct PayloadJob {
    std::shared_ptr<net::TcpServer> server;
    std::shared_ptr<Payload> payload;
    std::shared_ptr<std::atomic<bool>> canceled;
    int64_t size = 0;
    std::string type;
    SendCallbacks callbacks;
  };

  Link(DeviceInfo info, TaskPool& pool, std::shared_ptr<TlsContext> tls,
       LinkObserver* observer, const LinkOptions& options)
      : info_(std::move(info)),
        pool_(pool),
        tls_(std::move(tls)),
        observer_(observer),
        options_(options) {}

  static int64_t NowMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }

  Certificate PinnedCertificate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_.certificate;
  }

  // Closes the server and the payload source on every path.
  expected<void, LinkError> SendPayload(const PayloadJob& job) {
    using R = expected<void, LinkError>;
    struct Guard {
      const PayloadJob& job;
      ~Guard() {
        job.server->Close();
        if (job.payload != nullptr) job.payload->Close();
      }
    } guard{job};

    if (job.canceled->load(std::memory_order_acquire)) return R::success();

    auto conn = job.server->Accept(options_.payload_accept_timeout_ms);
    if (!conn.has_value()) {
      PEERLINK_LOG_ERROR("link", "payload of %s not fetched: %s",
                         job.type.c_str(), net::NetErrorName(conn.get_error()));
      return R::error(LinkError::kTransportIo);
    }
    TlsPeerPolicy policy;
    policy.pinned = PinnedCertificate();
    policy.require_client_cert = true;
    auto tls = TlsStream::Handshake(tls_, std::move(conn).value(),
                                    TlsRole::kServer, policy);
    if (!tls.has_value()) {
      PEERLINK_LOG_ERROR("link", "payload TLS for %s failed: %s",
                         job.type.c_str(), TlsErrorName(tls.get_error()));
      return R::error(tls.get_error() == TlsError::kCertificateMismatch
                          ? LinkError::kCertificateMismatch
                          : LinkError::kHandshakeFailure);
    }
    std::shared_ptr<TlsStream> out = tls.value();

    PEERLINK_LOG_INFO("link", "sending payload for %s", job.type.c_str());
    char buf[4096];
    int64_t sent = 0;
    int64_t last_report = -1;
    while (sent < job.size && !job.canceled->load(std::memory_order_acquire)) {
      size_t want = sizeof(buf);
      if (job.size - sent < static_cast<int64_t>(want)) {
        want = static_cast<size_t>(job.size - sent);
      }
      auto n = job.payload->Read(buf, want);
      if (!n.has_value() || n.value() == 0U) {
        PEERLINK_LOG_ERROR("link", "payload source of %s ended at %lld of %lld bytes",
                           job.type.c_str(), static_cast<long long>(sent),
                           static_cast<long long>(job.size));
        out->Close();
        return R::error(LinkError::kTransportIo);
      }
      auto w = out->WriteAll(buf, n.value());
      if (!w.has_value()) {
        out->Close();
        return R::error(LinkError::kTransportIo);
      }
      sent += static_cast<int64_t>(n.value());
      int64_t now = NowMs();
      if (last_report < 0 || now - last_report >= options_.progress_interval_ms) {
        job.callbacks.Progress(static_cast<int>(100 * sent / job.size));
        last_report = now;
      }
    }
    if (sent == job.size) {
      char extra = 0;
      auto n = job.payload->Read(&extra, 1U);
      if (!n.has_value() || n.value() != 0U) {
        PEERLINK_LOG_ERROR("link", "payload source of %s exceeds %lld bytes",
                           job.type.c_str(), static_cast<long long>(job.size));
        out->Close();
        return R::error(LinkError::kTransportIo);
      }
    }
    out->Close();
    PEERLINK_LOG_INFO("link", "finished payload (%lld bytes written)",
                      static_cast<long long>(sent));
    return R::success();
  }

  std::shared_ptr<Payload> OpenInboundPayload(const std::string& host,
                                              int32_t port, int64_t size) {
    auto sock = net::TcpClient::Connect(host, static_cast<uint16_t>(port),
                                        options_.payload_connect_timeout_ms);
    if (!sock.has_value()) {
      PEERLINK_LOG_ERROR("link", "payload connect to %s:%d failed: %s",
                         host.c_str(), port, net::NetErrorName(sock.get_error()));
      return nullptr;
    }
    TlsPeerPolicy policy;
    policy.pinned = PinnedCertificate();
    auto tls = TlsStream::Handshake(tls_, std::move(sock).value(),
                                    TlsRole::kClient, policy);
    if (!tls.has_value()) {
      PEERLINK_LOG_ERROR("link", "payload TLS to %s:%d failed: %s",
                         host.c_str(), port, TlsErrorName(tls.get_error()));
      return nullptr;
    }
    return std::make_shared<InboundPayload>(tls.value(), size);
  }

  void Deliver(TransferPacket& packet) {
    std::vector<PacketReceiver*> receivers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      receivers = receivers_;
    }
    if (receivers.empty()) {
      PEERLINK_LOG_DEBUG("link", "no receiver for %s", packet.Type().c_str());
    }
    for (PacketReceiver* r : receivers) r->OnPacketReceived(*this, packet);
  }

  void ReadLoop(std::shared_ptr<TlsStream> stream, uint64_t gen) {
    for (;;) {
      auto line = stream->ReadLine(PEERLINK_MAX_LINE_LENGTH);
      if (!line.has_value()) {
        PEERLINK_LOG_INFO("link", "stream of %s ended: %s",
                          DeviceId().c_str(), TlsErrorName(line.get_error()));
        break;
      }
      std::string& text = line.value();
      while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
      }
      if (text.empty()) continue;

      auto parsed = Deserialize(text);
      if (!parsed.has_value()) {
        PEERLINK_LOG_WARN("link", "malformed packet from %s, closing",
                          DeviceId().c_str());
        break;
      }
      const Packet& pkt = parsed.value();
      TransferPacket tp(pkt);
      if (pkt.HasPayload() && pkt.HasPayloadTransferInfo()) {
        const Json& info = pkt.PayloadTransferInfo();
        auto port = info.find("port");
        if (port != info.end() && port->is_number_integer()) {
          auto payload = OpenInboundPayload(stream->PeerHost(),
                                            port->get<int32_t>(),
                                            pkt.PayloadSize());
          if (payload != nullptr) tp.SetPayload(std::move(payload));
        }
      }
      Deliver(tp);
    }
    stream->Close();

    std::this_thread::sleep_for(
        std::chrono::milliseconds(options_.loss_grace_ms));
    if (generation_.load(std::memory_order_acquire) == gen) {
      PEERLINK_LOG_INFO("link", "no replacement stream for %s, link lost",
                        DeviceId().c_str());
      if (observer_ != nullptr) observer_->OnLinkLost(shared_from_this());
    }
  }

  mutable std::mutex mutex_;
  std::shared_ptr<TlsStream> stream_;
  DeviceInfo info_;
  std::atomic<uint64_t> generation_{0};
  std::vector<PacketReceiver*> receivers_;
  TaskPool& pool_;
  std::shared_ptr<TlsContext> tls_;
  LinkObserver* observer_;
  LinkOptions options_;
};

}  // namespace peerlink

#endif  // PEERLINK_LINK_HPP_
