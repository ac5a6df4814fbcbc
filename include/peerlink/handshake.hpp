/**
 * @file handshake.hpp
 * @brief Link establishment policy: identity admission, TLS role selection,
 *        downgrade and target checks, secure identity re-exchange, and the
 *        per-candidate state record.
 *
 * State flow of one candidate connection:
 *
 *   kDiscovered -> kIdentityExchanged -> kTlsHandshaking
 *       -> [kSecureIdentityExchanged] -> kLinkEstablished
 *
 * Any step may end in kRejected (policy refusal) or kFailed (I/O, TLS).
 */

#ifndef PEERLINK_HANDSHAKE_HPP_
#define PEERLINK_HANDSHAKE_HPP_

#include "peerlink/certificate.hpp"
#include "peerlink/device_info.hpp"
#include "peerlink/link.hpp"
#include "peerlink/log.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/rate_limiter.hpp"
#include "peerlink/tls.hpp"
#include "peerlink/trust_store.hpp"
#include "peerlink/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace peerlink {

enum class HandshakeState : uint8_t {
  kDiscovered = 0,
  kIdentityExchanged,
  kTlsHandshaking,
  kSecureIdentityExchanged,
  kLinkEstablished,
  kRejected,
  kFailed,
};

inline const char* HandshakeStateName(HandshakeState s) noexcept {
  switch (s) {
    case HandshakeState::kDiscovered:              return "discovered";
    case HandshakeState::kIdentityExchanged:       return "identity-exchanged";
    case HandshakeState::kTlsHandshaking:          return "tls-handshaking";
    case HandshakeState::kSecureIdentityExchanged: return "secure-identity";
    case HandshakeState::kLinkEstablished:         return "established";
    case HandshakeState::kRejected:                return "rejected";
    case HandshakeState::kFailed:                  return "failed";
    default:                                       return "unknown";
  }
}

/** @brief How the TCP connection came to be. */
enum class ConnectionOrigin : uint8_t {
  kLocallyAccepted = 0,   ///< our TCP listener accepted it
  kRemotelyInitiated,     ///< we dialed after a UDP identity
};

/**
 * @brief TLS role for a connection origin.
 *
 * Roles are inverted relative to TCP: the side that accepted the TCP
 * connection acts as TLS client, the side that dialed acts as TLS server.
 */
inline TlsRole RoleFor(ConnectionOrigin origin) noexcept {
  return (origin == ConnectionOrigin::kLocallyAccepted) ? TlsRole::kClient
                                                        : TlsRole::kServer;
}

/** @brief Log level used when a candidate is dropped with @p error. */
inline log::Level LevelFor(LinkError error) noexcept {
  switch (error) {
    case LinkError::kMalformedPacket:
    case LinkError::kProtocolDowngrade:
    case LinkError::kTargetMismatch:
      return log::Level::kWarn;
    case LinkError::kInvalidIdentity:
    case LinkError::kSelfIdentity:
    case LinkError::kRateLimited:
      return log::Level::kDebug;
    case LinkError::kHandshakeFailure:
    case LinkError::kCertificateMismatch:
      return log::Level::kError;
    default:
      return log::Level::kInfo;
  }
}

// ============================================================================
// HandshakeContext
// ============================================================================

/** @brief State record of one candidate connection; logs every transition. */
class HandshakeContext {
 public:
  HandshakeContext(ConnectionOrigin origin, std::string peer_host)
      : origin_(origin), peer_host_(std::move(peer_host)) {}

  void Transition(HandshakeState next) {
    PEERLINK_LOG_DEBUG("handshake", "%s %s: %s -> %s", peer_host_.c_str(),
                       device_id_.c_str(), HandshakeStateName(state_),
                       HandshakeStateName(next));
    state_ = next;
  }

  /** @brief Terminal state for @p error, logged at its taxonomy level. */
  void Abort(LinkError error) {
    const bool policy = error != LinkError::kTransportIo &&
                        error != LinkError::kHandshakeFailure &&
                        error != LinkError::kCertificateMismatch;
    error_ = error;
    state_ = policy ? HandshakeState::kRejected : HandshakeState::kFailed;
    log::LogWrite(LevelFor(error), "handshake", __FILE__, __LINE__,
                  "%s %s %s: %s", origin_ == ConnectionOrigin::kLocallyAccepted
                                      ? "accepted"
                                      : "dialed",
                  peer_host_.c_str(), device_id_.c_str(),
                  LinkErrorName(error));
  }

  void SetDeviceId(const std::string& id) { device_id_ = id; }

  ConnectionOrigin Origin() const noexcept { return origin_; }
  HandshakeState State() const noexcept { return state_; }
  LinkError Error() const noexcept { return error_; }
  const std::string& PeerHost() const noexcept { return peer_host_; }
  const std::string& DeviceId() const noexcept { return device_id_; }

 private:
  ConnectionOrigin origin_;
  HandshakeState state_ = HandshakeState::kDiscovered;
  LinkError error_ = LinkError::kHandshakeFailure;
  std::string peer_host_;
  std::string device_id_;
};

// ============================================================================
// IdentityGate
// ============================================================================

/** @brief Outcome of admitting a pre-TLS identity packet. */
struct Admission {
  Packet identity;
  bool trusted = false;
  Certificate pinned;  ///< empty when not trusted
};

/**
 * @brief Admission checks applied to every pre-TLS identity, in order:
 *        parse, validate, self, device-id rate limit, trust.
 */
class IdentityGate {
 public:
  IdentityGate(std::string local_id, const TrustStore& trust,
               int64_t window_ms = PEERLINK_RATE_LIMIT_WINDOW_MS,
               uint32_t max_entries = PEERLINK_RATE_LIMIT_MAX_ENTRIES)
      : local_id_(std::move(local_id)),
        trust_(trust),
        limiter_(window_ms, max_entries) {}

  expected<Admission, LinkError> Admit(const std::string& line) {
    auto packet = Deserialize(line);
    if (!packet.has_value()) {
      return expected<Admission, LinkError>::error(LinkError::kMalformedPacket);
    }
    return Admit(packet.value());
  }

  expected<Admission, LinkError> Admit(const Packet& packet) {
    using R = expected<Admission, LinkError>;
    if (!IsValidIdentityPacket(packet)) return R::error(LinkError::kInvalidIdentity);
    const std::string id = packet.GetString("deviceId");
    if (id == local_id_) return R::error(LinkError::kSelfIdentity);
    if (limiter_.Check(id)) return R::error(LinkError::kRateLimited);

    Admission a;
    a.identity = packet;
    a.pinned = trust_.PinnedCertificate(id);
    a.trusted = trust_.IsTrusted(id);
    if (!a.trusted && !trusted_network_.load(std::memory_order_acquire)) {
      return R::error(LinkError::kUntrustedNetwork);
    }
    return R::success(std::move(a));
  }

  void SetTrustedNetwork(bool trusted) noexcept {
    trusted_network_.store(trusted, std::memory_order_release);
  }
  bool TrustedNetwork() const noexcept {
    return trusted_network_.load(std::memory_order_acquire);
  }

  const std::string& LocalId() const noexcept { return local_id_; }
  RateLimiter<std::string>& DeviceLimiter() noexcept { return limiter_; }

 private:
  std::string local_id_;
  const TrustStore& trust_;
  RateLimiter<std::string> limiter_;
  std::atomic<bool> trusted_network_{true};
};

// ============================================================================
// Checks
// ============================================================================

/**
 * @brief Refuse a trusted peer advertising a lower protocol version than the
 *        one persisted for it, or a trusted peer without a pinned certificate.
 */
inline expected<void, LinkError> CheckDowngrade(const Admission& admission,
                                                const TrustStore& trust) {
  using R = expected<void, LinkError>;
  if (!admission.trusted) return R::success();
  if (admission.pinned.Empty()) return R::error(LinkError::kHandshakeFailure);
  const std::string id = admission.identity.GetString("deviceId");
  const int32_t advertised = admission.identity.GetInt("protocolVersion", 0);
  if (trust.LastProtocolVersion(id) > advertised) {
    return R::error(LinkError::kProtocolDowngrade);
  }
  return R::success();
}

/**
 * @brief Directed identities must name us: targetDeviceId and
 *        targetProtocolVersion, when present, must match the local values.
 */
inline expected<void, LinkError> CheckTarget(const Packet& identity,
                                             const std::string& local_id,
                                             int32_t local_version) {
  using R = expected<void, LinkError>;
  if (identity.Has("targetDeviceId") &&
      identity.GetString("targetDeviceId") != local_id) {
    return R::error(LinkError::kTargetMismatch);
  }
  if (identity.Has("targetProtocolVersion") &&
      identity.GetInt("targetProtocolVersion", -1) != local_version) {
    return R::error(LinkError::kTargetMismatch);
  }
  return R::success();
}

/** @brief Whether identities are exchanged again once TLS is up. */
inline bool NeedsSecureIdentity(int32_t protocol_version) noexcept {
  return protocol_version >= kSecureIdentityMinVersion;
}

/**
 * @brief Validate the identity received over TLS against the clear-text one.
 * @return The secure identity; kMalformedPacket, kInvalidIdentity or
 *         kHandshakeFailure (id or version changed).
 */
inline expected<Packet, LinkError> CheckSecureIdentity(
    const Packet& pre_tls, const std::string& secure_line) {
  using R = expected<Packet, LinkError>;
  auto secure = Deserialize(secure_line);
  if (!secure.has_value()) return R::error(LinkError::kMalformedPacket);
  if (!IsValidIdentityPacket(secure.value())) {
    return R::error(LinkError::kInvalidIdentity);
  }
  if (secure.value().GetString("deviceId") != pre_tls.GetString("deviceId") ||
      secure.value().GetInt("protocolVersion", 0) !=
          pre_tls.GetInt("protocolVersion", 0)) {
    return R::error(LinkError::kHandshakeFailure);
  }
  return R::success(secure.value());
}

}  // namespace peerlink

#endif  // PEERLINK_HANDSHAKE_HPP_
