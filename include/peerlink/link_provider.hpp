/**
 * @file link_provider.hpp
 * @brief LAN link provider: TCP listener, UDP and mDNS discovery, handshake
 *        driver and the device-id -> Link map.
 *
 * Two ways into a link:
 *
 *   TCP accept (kLocallyAccepted)        UDP identity (kRemotelyInitiated)
 *   rate limit by IP                     rate limit by IP
 *   read identity line (clear text)      admit identity, check tcpPort
 *   admit identity, check target         connect, send own identity
 *                    \                  /
 *                     downgrade guard, TLS (roles inverted)
 *                     secure identity (protocol >= 8)
 *                     AddOrUpdateLink
 *
 * At most one Link exists per device id. A second handshake for a known id
 * resets the existing Link with the new stream when the certificates match.
 */

#ifndef PEERLINK_LINK_PROVIDER_HPP_
#define PEERLINK_LINK_PROVIDER_HPP_

#include "peerlink/config.hpp"
#include "peerlink/device_info.hpp"
#include "peerlink/handshake.hpp"
#include "peerlink/link.hpp"
#include "peerlink/local_device.hpp"
#include "peerlink/log.hpp"
#include "peerlink/mdns.hpp"
#include "peerlink/net.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/rate_limiter.hpp"
#include "peerlink/task_pool.hpp"
#include "peerlink/tls.hpp"
#include "peerlink/trust_store.hpp"
#include "peerlink/udp_discovery.hpp"
#include "peerlink/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifndef PEERLINK_MAX_IDENTITY_SIZE
#define PEERLINK_MAX_IDENTITY_SIZE (512U * 1024U)
#endif

namespace peerlink {

// ============================================================================
// ProviderConfig
// ============================================================================

struct ProviderConfig {
  // [device]
  std::string device_name;
  DeviceType device_type = DeviceType::kDesktop;

  // [network]
  uint16_t udp_port = PEERLINK_UDP_PORT;
  uint16_t tcp_port_min = 1814;
  uint16_t tcp_port_max = 1864;
  bool tcp_prefer_ephemeral = false;
  bool trusted_network = true;
  std::vector<std::string> custom_hosts;

  // [discovery]
  bool udp_enabled = true;
  bool udp_listen = true;
  bool mdns_enabled = true;
  uint16_t mdns_port = PEERLINK_MDNS_PORT;
  int32_t mdns_query_interval_ms = 10000;
  int32_t broadcast_interval_ms = 0;
  int32_t broadcast_throttle_ms = 200;

  // [link]
  LinkOptions link;
  int32_t connect_timeout_ms = 10000;
  int32_t identity_timeout_ms = 10000;
  int32_t tls_timeout_ms = PEERLINK_TLS_HANDSHAKE_TIMEOUT_MS;
  int64_t rate_limit_window_ms = PEERLINK_RATE_LIMIT_WINDOW_MS;
  uint32_t rate_limit_max_entries = PEERLINK_RATE_LIMIT_MAX_ENTRIES;

  // [storage]
  std::string data_dir;

  // [log]
  std::string log_level = "info";

  /** @brief Read every known key; missing keys keep their defaults. */
  static ProviderConfig FromStore(const ConfigStore& store) {
    ProviderConfig c;
    c.device_name = store.GetString("device", "name", "");
    if (store.HasKey("device", "type")) {
      c.device_type = ParseDeviceType(store.GetString("device", "type"));
    }

    c.udp_port = store.GetPort("network", "udp_port", c.udp_port);
    c.tcp_port_min = store.GetPort("network", "tcp_port_min", c.tcp_port_min);
    c.tcp_port_max = store.GetPort("network", "tcp_port_max", c.tcp_port_max);
    c.tcp_prefer_ephemeral = store.GetBool("network", "tcp_prefer_ephemeral",
                                           c.tcp_prefer_ephemeral);
    c.trusted_network = store.GetBool("network", "trusted", c.trusted_network);
    c.custom_hosts = store.GetList("network", "custom_hosts");

    c.udp_enabled = store.GetBool("discovery", "udp", c.udp_enabled);
    c.udp_listen = store.GetBool("discovery", "udp_listen", c.udp_listen);
    c.mdns_enabled = store.GetBool("discovery", "mdns", c.mdns_enabled);
    c.mdns_port = store.GetPort("discovery", "mdns_port", c.mdns_port);
    c.mdns_query_interval_ms = store.GetInt(
        "discovery", "mdns_query_interval_ms", c.mdns_query_interval_ms);
    c.broadcast_interval_ms = store.GetInt(
        "discovery", "broadcast_interval_ms", c.broadcast_interval_ms);
    c.broadcast_throttle_ms = store.GetInt(
        "discovery", "broadcast_throttle_ms", c.broadcast_throttle_ms);

    LinkOptions& l = c.link;
    l.payload_port_min =
        store.GetPort("link", "payload_port_min", l.payload_port_min);
    l.payload_port_max =
        store.GetPort("link", "payload_port_max", l.payload_port_max);
    l.payload_prefer_ephemeral = store.GetBool(
        "link", "payload_prefer_ephemeral", l.payload_prefer_ephemeral);
    l.payload_accept_timeout_ms = store.GetInt(
        "link", "payload_timeout_ms", l.payload_accept_timeout_ms);
    l.payload_connect_timeout_ms = l.payload_accept_timeout_ms;
    l.loss_grace_ms = store.GetInt("link", "loss_grace_ms", l.loss_grace_ms);
    c.connect_timeout_ms =
        store.GetInt("link", "connect_timeout_ms", c.connect_timeout_ms);
    c.identity_timeout_ms =
        store.GetInt("link", "identity_timeout_ms", c.identity_timeout_ms);
    c.tls_timeout_ms = store.GetInt("link", "tls_timeout_ms", c.tls_timeout_ms);
    c.rate_limit_window_ms = store.GetInt(
        "link", "rate_limit_window_ms",
        static_cast<int32_t>(c.rate_limit_window_ms));

    c.data_dir = store.GetString("storage", "data_dir", "");
    c.log_level = store.GetString("log", "level", c.log_level.c_str());
    return c;
  }
};

// ============================================================================
// ConnectionReceiver
// ============================================================================

/** @brief Observer of link lifecycle events (the packet router). */
class ConnectionReceiver {
 public:
  virtual ~ConnectionReceiver() = default;
  /// New Link, called before its first packet is read.
  virtual void OnConnectionReceived(const std::shared_ptr<Link>& link) = 0;
  virtual void OnConnectionLost(const std::shared_ptr<Link>& link) = 0;
  virtual void OnDeviceInfoUpdated(const DeviceInfo& info) { (void)info; }
};

enum class ProviderError : uint8_t {
  kTlsContext = 0,
  kListenFailed,
  kAlreadyRunning,
};

// ============================================================================
// LinkProvider
// ============================================================================

class LinkProvider final : public LinkObserver {
 public:
  LinkProvider(LocalDevice& local, TrustStore& trust, TaskPool& pool,
               const ProviderConfig& cfg)
      : local_(local),
        trust_(trust),
        pool_(pool),
        config_(cfg),
        gate_(local.Id(), trust, cfg.rate_limit_window_ms,
              cfg.rate_limit_max_entries),
        ip_limiter_(cfg.rate_limit_window_ms, cfg.rate_limit_max_entries),
        udp_(pool, MakeUdpConfig(cfg)),
        mdns_(MakeMdnsConfig(cfg)) {
    gate_.SetTrustedNetwork(cfg.trusted_network);
  }

  ~LinkProvider() override { Stop(); }

  LinkProvider(const LinkProvider&) = delete;
  LinkProvider& operator=(const LinkProvider&) = delete;

  void AddReceiver(ConnectionReceiver* receiver) {
    std::lock_guard<std::mutex> lock(receivers_mutex_);
    receivers_.push_back(receiver);
  }

  void RemoveReceiver(ConnectionReceiver* receiver) {
    std::lock_guard<std::mutex> lock(receivers_mutex_);
    receivers_.erase(
        std::remove(receivers_.begin(), receivers_.end(), receiver),
        receivers_.end());
  }

  /**
   * @brief Bind the TCP listener, start discovery and send the first
   *        identity broadcast.
   */
  expected<void, ProviderError> Start() {
    using R = expected<void, ProviderError>;
    if (running_.load(std::memory_order_acquire)) {
      return R::error(ProviderError::kAlreadyRunning);
    }
    pool_.Restart();

    auto ctx = TlsContext::Create(local_.Cert(), local_.Key());
    if (!ctx.has_value()) {
      PEERLINK_LOG_ERROR("provider", "TLS context: %s",
                         TlsErrorName(ctx.get_error()));
      return R::error(ProviderError::kTlsContext);
    }
    tls_ctx_ = ctx.value();

    auto listener = net::TcpServer::ListenOnFreePort(
        config_.tcp_port_min, config_.tcp_port_max,
        config_.tcp_prefer_ephemeral);
    if (!listener.has_value()) {
      PEERLINK_LOG_ERROR("provider", "no free TCP port in %u-%u",
                         static_cast<unsigned>(config_.tcp_port_min),
                         static_cast<unsigned>(config_.tcp_port_max));
      return R::error(ProviderError::kListenFailed);
    }
    listener_ = std::move(listener).value();
    tcp_port_.store(listener_.LocalPort(), std::memory_order_release);
    PEERLINK_LOG_INFO("provider", "TCP listener on port %u",
                      static_cast<unsigned>(TcpPort()));

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });

    if (config_.udp_enabled) {
      udp_.SetDatagramCallback(&LinkProvider::OnDatagram, this);
      (void)udp_.Start();
    }
    if (config_.mdns_enabled) {
      mdns_.SetLocalService(local_.Info(), TcpPort());
      mdns_.SetResolvedCallback(&LinkProvider::OnMdnsResolved, this);
      auto rc = mdns_.Start(gate_.TrustedNetwork(), true);
      if (!rc.has_value()) {
        PEERLINK_LOG_WARN("provider", "mDNS unavailable (error %u)",
                          static_cast<unsigned>(rc.get_error()));
      }
    }
    if (config_.broadcast_interval_ms > 0) {
      announce_thread_ = std::thread([this]() { AnnounceLoop(); });
    }
    (void)Broadcast();
    return R::success();
  }

  /**
   * @brief Stop discovery and the listener, disconnect every link and join
   *        all background tasks.
   */
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    {
      std::lock_guard<std::mutex> lock(announce_mutex_);
      announce_cv_.notify_all();
    }
    if (announce_thread_.joinable()) announce_thread_.join();
    udp_.Stop();
    mdns_.Stop();
    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.Close();
    tcp_port_.store(0, std::memory_order_release);

    {
      // Streams are only installed under this lock while running_ is set.
      std::lock_guard<std::mutex> lock(links_mutex_);
      for (auto& kv : links_) kv.second->Disconnect();
    }
    pool_.Stop();
    PEERLINK_LOG_INFO("provider", "stopped");
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /**
   * @brief The network changed: re-evaluate trust, rebroadcast (throttled)
   *        and browse mDNS again.
   */
  void OnNetworkChange(bool trusted_network) {
    gate_.SetTrustedNetwork(trusted_network);
    mdns_.SetAdvertising(trusted_network);
    mdns_.RestartBrowsing();
    (void)Broadcast();
  }

  void OnNetworkChange() { OnNetworkChange(gate_.TrustedNetwork()); }

  /**
   * @brief Send our identity to @p host so that it dials back.
   * @param port UDP port of the peer; 0 uses the configured UDP port
   */
  bool ConnectTo(const std::string& host, uint16_t port = 0) {
    if (TcpPort() == 0) return false;
    const uint16_t dst = (port != 0) ? port : config_.udp_port;
    return udp_.SendTo(UdpIdentityLine(), {host}, dst) == 1U;
  }

  /**
   * @brief Send the identity broadcast to all targets unless one was sent
   *        less than the throttle interval ago.
   * @return false when throttled or not listening yet.
   */
  bool Broadcast() {
    if (!config_.udp_enabled || TcpPort() == 0) return false;
    const int64_t now = NowMs();
    int64_t last = last_broadcast_ms_.load(std::memory_order_acquire);
    if (last >= 0 && now - last < config_.broadcast_throttle_ms) {
      PEERLINK_LOG_DEBUG("provider", "broadcast throttled");
      return false;
    }
    if (!last_broadcast_ms_.compare_exchange_strong(last, now)) return false;

    std::vector<std::string> targets = BroadcastTargets();
    size_t sent = udp_.SendTo(UdpIdentityLine(), targets, config_.udp_port);
    PEERLINK_LOG_DEBUG("provider", "identity sent to %zu of %zu targets", sent,
                       targets.size());
    return true;
  }

  /** @brief Custom hosts, loopback, and the global broadcast on trusted nets. */
  std::vector<std::string> BroadcastTargets() const {
    std::vector<std::string> targets = trust_.CustomHosts();
    for (const auto& h : config_.custom_hosts) {
      if (std::find(targets.begin(), targets.end(), h) == targets.end()) {
        targets.push_back(h);
      }
    }
    targets.push_back("127.0.0.1");
    if (gate_.TrustedNetwork()) targets.push_back("255.255.255.255");
    return targets;
  }

  /** @brief Identity line sent over UDP: own identity plus tcpPort. */
  std::string UdpIdentityLine() const {
    return Serialize(local_.IdentityPacket().With("tcpPort",
                                                  static_cast<int>(TcpPort())));
  }

  /**
   * @brief Process one UDP identity datagram from @p source_ip: admit it,
   *        dial its tcpPort and run the handshake as TLS server.
   */
  void HandleUdpIdentity(const std::string& data, const std::string& source_ip) {
    HandshakeContext ctx(ConnectionOrigin::kRemotelyInitiated, source_ip);
    if (ip_limiter_.Check(source_ip)) {
      ctx.Abort(LinkError::kRateLimited);
      return;
    }
    auto admitted = gate_.Admit(data);
    if (!admitted.has_value()) {
      ctx.Abort(admitted.get_error());
      return;
    }
    Admission adm = admitted.value();
    const Packet& identity = adm.identity;
    ctx.SetDeviceId(identity.GetString("deviceId"));
    PEERLINK_LOG_INFO("provider", "identity broadcast from %s",
                      identity.GetString("deviceName").c_str());

    const int64_t port = identity.GetInt64("tcpPort", config_.tcp_port_min);
    if (port < config_.tcp_port_min || port > config_.tcp_port_max) {
      PEERLINK_LOG_ERROR("provider", "tcpPort %lld outside %u-%u",
                         static_cast<long long>(port),
                         static_cast<unsigned>(config_.tcp_port_min),
                         static_cast<unsigned>(config_.tcp_port_max));
      ctx.Abort(LinkError::kInvalidIdentity);
      return;
    }

    auto sock = net::TcpClient::Connect(source_ip, static_cast<uint16_t>(port),
                                        config_.connect_timeout_ms);
    if (!sock.has_value()) {
      PEERLINK_LOG_ERROR("provider", "connect to %s:%lld failed: %s",
                         source_ip.c_str(), static_cast<long long>(port),
                         net::NetErrorName(sock.get_error()));
      ctx.Abort(LinkError::kTransportIo);
      return;
    }
    net::TcpClient client = std::move(sock).value();
    client.SetKeepAlive();

    Packet mine = local_.IdentityPacket()
                      .With("targetDeviceId", identity.GetString("deviceId"))
                      .With("targetProtocolVersion",
                            identity.GetInt("protocolVersion", 0));
    auto sent = client.SendAll(Serialize(mine));
    if (!sent.has_value()) {
      ctx.Abort(LinkError::kTransportIo);
      return;
    }
    ctx.Transition(HandshakeState::kIdentityExchanged);
    RunHandshake(ctx, std::move(client), adm);
  }

  /** @brief Links currently in the map. */
  std::vector<std::shared_ptr<Link>> Links() const {
    std::lock_guard<std::mutex> lock(links_mutex_);
    std::vector<std::shared_ptr<Link>> out;
    out.reserve(links_.size());
    for (const auto& kv : links_) out.push_back(kv.second);
    return out;
  }

  std::shared_ptr<Link> FindLink(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(links_mutex_);
    auto it = links_.find(device_id);
    return (it != links_.end()) ? it->second : nullptr;
  }

  uint16_t TcpPort() const noexcept {
    return tcp_port_.load(std::memory_order_acquire);
  }

  IdentityGate& Gate() noexcept { return gate_; }
  const ProviderConfig& GetConfig() const noexcept { return config_; }

  /**
   * @brief Called by a Link whose read loop ended without replacement.
   * Removes the entry only if it still maps to @p link; idempotent.
   */
  void OnLinkLost(const std::shared_ptr<Link>& link) override {
    bool removed = false;
    {
      std::lock_guard<std::mutex> lock(links_mutex_);
      auto it = links_.find(link->DeviceId());
      if (it != links_.end() && it->second == link && !link->IsConnected()) {
        links_.erase(it);
        removed = true;
      }
    }
    if (!removed) return;
    PEERLINK_LOG_INFO("provider", "link to %s lost", link->DeviceId().c_str());
    for (ConnectionReceiver* r : ReceiversSnapshot()) r->OnConnectionLost(link);
  }

 private:
  static UdpDiscovery::Config MakeUdpConfig(const ProviderConfig& cfg) {
    UdpDiscovery::Config c;
    c.port = cfg.udp_port;
    c.listen = cfg.udp_listen;
    return c;
  }

  static MdnsDiscovery::Config MakeMdnsConfig(const ProviderConfig& cfg) {
    MdnsDiscovery::Config c;
    c.port = cfg.mdns_port;
    c.query_interval_ms = cfg.mdns_query_interval_ms;
    return c;
  }

  static int64_t NowMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }

  static void OnDatagram(const std::string& data, const std::string& source_ip,
                         void* ctx) {
    static_cast<LinkProvider*>(ctx)->HandleUdpIdentity(data, source_ip);
  }

  static void OnMdnsResolved(const mdns::ResolvedService& svc, void* ctx) {
    auto* self = static_cast<LinkProvider*>(ctx);
    if (self->FindLink(svc.device_id) != nullptr) return;
    PEERLINK_LOG_DEBUG("provider", "mDNS peer %s, sending identity to %s",
                       svc.device_id.c_str(), svc.host.c_str());
    (void)self->ConnectTo(svc.host);
  }

  std::vector<ConnectionReceiver*> ReceiversSnapshot() const {
    std::lock_guard<std::mutex> lock(receivers_mutex_);
    return receivers_;
  }

  void AnnounceLoop() {
    std::unique_lock<std::mutex> lock(announce_mutex_);
    while (running_.load(std::memory_order_acquire)) {
      announce_cv_.wait_for(
          lock, std::chrono::milliseconds(config_.broadcast_interval_ms),
          [this]() { return !running_.load(std::memory_order_acquire); });
      if (!running_.load(std::memory_order_acquire)) break;
      lock.unlock();
      (void)Broadcast();
      lock.lock();
    }
  }

  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      auto conn = listener_.Accept(250);
      if (!conn.has_value()) {
        if (conn.get_error() != net::NetError::kTimeout) {
          PEERLINK_LOG_WARN("provider", "accept failed: %s",
                            net::NetErrorName(conn.get_error()));
        }
        continue;
      }
      auto sock = std::make_shared<net::TcpClient>(std::move(conn).value());
      if (!pool_.Spawn([this, sock]() { HandleAccepted(std::move(*sock)); })) {
        sock->Close();
      }
    }
  }

  void HandleAccepted(net::TcpClient sock) {
    HandshakeContext ctx(ConnectionOrigin::kLocallyAccepted, sock.PeerHost());
    if (ip_limiter_.Check(ctx.PeerHost())) {
      ctx.Abort(LinkError::kRateLimited);
      return;
    }
    sock.SetKeepAlive();
    auto line = sock.ReadLine(PEERLINK_MAX_IDENTITY_SIZE,
                              config_.identity_timeout_ms);
    if (!line.has_value()) {
      PEERLINK_LOG_INFO("provider", "no identity from %s: %s",
                        ctx.PeerHost().c_str(),
                        net::NetErrorName(line.get_error()));
      ctx.Abort(LinkError::kTransportIo);
      return;
    }
    auto admitted = gate_.Admit(line.value());
    if (!admitted.has_value()) {
      ctx.Abort(admitted.get_error());
      return;
    }
    Admission adm = admitted.value();
    ctx.SetDeviceId(adm.identity.GetString("deviceId"));
    auto target = CheckTarget(adm.identity, local_.Id(), kProtocolVersion);
    if (!target.has_value()) {
      ctx.Abort(target.get_error());
      return;
    }
    ctx.Transition(HandshakeState::kIdentityExchanged);
    RunHandshake(ctx, std::move(sock), adm);
  }

  // Downgrade guard and TLS; completion continues on a fresh task.
  void RunHandshake(HandshakeContext ctx, net::TcpClient sock,
                    const Admission& adm) {
    auto guard = CheckDowngrade(adm, trust_);
    if (!guard.has_value()) {
      ctx.Abort(guard.get_error());
      sock.Close();
      return;
    }
    ctx.Transition(HandshakeState::kTlsHandshaking);
    TlsPeerPolicy policy;
    policy.pinned = adm.pinned;
    policy.require_client_cert = adm.trusted;
    auto tls = TlsStream::Handshake(tls_ctx_, std::move(sock),
                                    RoleFor(ctx.Origin()), policy,
                                    config_.tls_timeout_ms);
    if (!tls.has_value()) {
      ctx.Abort(tls.get_error() == TlsError::kCertificateMismatch
                    ? LinkError::kCertificateMismatch
                    : LinkError::kHandshakeFailure);
      return;
    }
    std::shared_ptr<TlsStream> stream = tls.value();
    if (!pool_.Spawn([this, ctx, stream, adm]() {
          CompleteHandshake(ctx, stream, adm);
        })) {
      stream->Close();
    }
  }

  void CompleteHandshake(HandshakeContext ctx,
                         const std::shared_ptr<TlsStream>& stream,
                         const Admission& adm) {
    Packet identity = adm.identity;
    if (NeedsSecureIdentity(identity.GetInt("protocolVersion", 0))) {
      auto written = stream->WriteAll(Serialize(local_.IdentityPacket()));
      if (!written.has_value()) {
        ctx.Abort(LinkError::kTransportIo);
        stream->Close();
        return;
      }
      auto line = stream->ReadLine(PEERLINK_MAX_IDENTITY_SIZE,
                                   config_.identity_timeout_ms);
      if (!line.has_value()) {
        ctx.Abort(LinkError::kTransportIo);
        stream->Close();
        return;
      }
      auto secure = CheckSecureIdentity(identity, line.value());
      if (!secure.has_value()) {
        ctx.Abort(secure.get_error());
        stream->Close();
        return;
      }
      identity = secure.value();
      ctx.Transition(HandshakeState::kSecureIdentityExchanged);
    }

    DeviceInfo info =
        DeviceInfo::FromIdentityPacketAndCert(identity, stream->PeerCertificate());
    PEERLINK_LOG_INFO("provider", "handshake as %s with %s (%s) using %s",
                      stream->Role() == TlsRole::kClient ? "client" : "server",
                      info.name.c_str(), info.id.c_str(), stream->CipherName());
    AddOrUpdateLink(ctx, stream, std::move(info));
  }

  // Serialized per provider: receivers see a new Link before its first
  // packet, and no other handshake can install a stream in between.
  void AddOrUpdateLink(HandshakeContext& ctx,
                       const std::shared_ptr<TlsStream>& stream,
                       DeviceInfo info) {
    std::lock_guard<std::mutex> establish(establish_mutex_);
    std::shared_ptr<Link> link;
    bool created = false;
    {
      std::lock_guard<std::mutex> lock(links_mutex_);
      if (!running_.load(std::memory_order_acquire)) {
        ctx.Abort(LinkError::kCanceled);
        stream->Close();
        return;
      }
      auto it = links_.find(info.id);
      if (it != links_.end()) {
        link = it->second;
        if (link->Info().certificate != info.certificate) {
          ctx.Abort(LinkError::kCertificateMismatch);
          stream->Close();
          return;
        }
        PEERLINK_LOG_DEBUG("provider", "reusing link for %s", info.id.c_str());
        (void)link->Reset(stream, info);
      } else {
        PEERLINK_LOG_DEBUG("provider", "new link for %s", info.id.c_str());
        link = Link::Create(info, pool_, tls_ctx_, this, config_.link);
        links_[info.id] = link;
        created = true;
      }
    }

    if (trust_.IsTrusted(info.id)) {
      auto rc = trust_.SetProtocolVersion(info.id, info.protocol_version);
      if (!rc.has_value()) {
        PEERLINK_LOG_WARN("provider", "could not persist protocol version");
      }
    }

    if (!created) {
      ctx.Transition(HandshakeState::kLinkEstablished);
      for (ConnectionReceiver* r : ReceiversSnapshot()) {
        r->OnDeviceInfoUpdated(info);
      }
      return;
    }

    for (ConnectionReceiver* r : ReceiversSnapshot()) {
      r->OnConnectionReceived(link);
    }
    {
      std::lock_guard<std::mutex> lock(links_mutex_);
      if (running_.load(std::memory_order_acquire)) {
        ctx.Transition(HandshakeState::kLinkEstablished);
        (void)link->Reset(stream, info);
        return;
      }
      // Stopped while receivers were attaching: the link never started.
      auto it = links_.find(info.id);
      if (it != links_.end() && it->second == link) links_.erase(it);
    }
    ctx.Abort(LinkError::kCanceled);
    stream->Close();
    for (ConnectionReceiver* r : ReceiversSnapshot()) {
      r->OnConnectionLost(link);
    }
  }

  LocalDevice& local_;
  TrustStore& trust_;
  TaskPool& pool_;
  ProviderConfig config_;
  IdentityGate gate_;
  RateLimiter<std::string> ip_limiter_;
  UdpDiscovery udp_;
  MdnsDiscovery mdns_;
  std::shared_ptr<TlsContext> tls_ctx_;

  net::TcpServer listener_;
  std::atomic<uint16_t> tcp_port_{0};
  std::thread accept_thread_;
  std::atomic<bool> running_{false};

  std::thread announce_thread_;
  std::mutex announce_mutex_;
  std::condition_variable announce_cv_;
  std::atomic<int64_t> last_broadcast_ms_{-1};

  std::mutex establish_mutex_;
  mutable std::mutex links_mutex_;
  std::map<std::string, std::shared_ptr<Link>> links_;

  mutable std::mutex receivers_mutex_;
  std::vector<ConnectionReceiver*> receivers_;
};

}  // namespace peerlink

#endif  // PEERLINK_LINK_PROVIDER_HPP_
