/**
 * @file test_handshake.cpp
 * @brief Tests for handshake.hpp: admission order, role inversion and the
 *        post-TLS checks.
 */

#include "peerlink/handshake.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using peerlink::Admission;
using peerlink::ConnectionOrigin;
using peerlink::HandshakeContext;
using peerlink::HandshakeState;
using peerlink::IdentityGate;
using peerlink::Json;
using peerlink::LinkError;
using peerlink::Packet;
using peerlink::TrustStore;

namespace {

const char* kLocalId = "0123456789abcdef0123456789abcdef";
const char* kPeerId = "fedcba9876543210fedcba9876543210";

Packet Identity(const std::string& id, int32_t version = 8) {
  Json body = Json::object();
  body["deviceId"] = id;
  body["deviceName"] = "Peer";
  body["deviceType"] = "phone";
  body["protocolVersion"] = version;
  return Packet::Create(peerlink::packet_type::kIdentity, std::move(body));
}

}  // namespace

TEST_CASE("handshake - TCP acceptor plays the TLS client", "[handshake]") {
  REQUIRE(peerlink::RoleFor(ConnectionOrigin::kLocallyAccepted) ==
          peerlink::TlsRole::kClient);
  REQUIRE(peerlink::RoleFor(ConnectionOrigin::kRemotelyInitiated) ==
          peerlink::TlsRole::kServer);
}

TEST_CASE("handshake - gate rejects malformed and invalid identities",
          "[handshake]") {
  TrustStore trust;
  IdentityGate gate(kLocalId, trust);

  auto garbage = gate.Admit(std::string("not json\n"));
  REQUIRE_FALSE(garbage.has_value());
  REQUIRE(garbage.get_error() == LinkError::kMalformedPacket);

  auto short_id = gate.Admit(Identity("abc"));
  REQUIRE_FALSE(short_id.has_value());
  REQUIRE(short_id.get_error() == LinkError::kInvalidIdentity);

  auto wrong_type = gate.Admit(Packet::Create("cconnect.ping"));
  REQUIRE_FALSE(wrong_type.has_value());
  REQUIRE(wrong_type.get_error() == LinkError::kInvalidIdentity);
}

TEST_CASE("handshake - gate rejects our own identity", "[handshake]") {
  TrustStore trust;
  IdentityGate gate(kLocalId, trust);
  auto r = gate.Admit(Identity(kLocalId));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == LinkError::kSelfIdentity);
}

TEST_CASE("handshake - gate rate limits repeated device ids", "[handshake]") {
  TrustStore trust;
  IdentityGate gate(kLocalId, trust, 60000, 255);

  auto first = gate.Admit(peerlink::Serialize(Identity(kPeerId)));
  REQUIRE(first.has_value());
  REQUIRE_FALSE(first.value().trusted);
  REQUIRE(first.value().pinned.Empty());

  auto second = gate.Admit(Identity(kPeerId));
  REQUIRE_FALSE(second.has_value());
  REQUIRE(second.get_error() == LinkError::kRateLimited);
}

TEST_CASE("handshake - untrusted network admits only trusted peers",
          "[handshake]") {
  peerlink::LocalDevice peer = test::MakeDevice("peer");
  REQUIRE_FALSE(peer.Cert().Empty());
  TrustStore trust;
  IdentityGate gate(kLocalId, trust, 0, 255);
  gate.SetTrustedNetwork(false);
  REQUIRE_FALSE(gate.TrustedNetwork());

  auto refused = gate.Admit(Identity(kPeerId));
  REQUIRE_FALSE(refused.has_value());
  REQUIRE(refused.get_error() == LinkError::kUntrustedNetwork);

  REQUIRE(trust.Trust(kPeerId, peer.Cert(), 8).has_value());
  auto admitted = gate.Admit(Identity(kPeerId));
  REQUIRE(admitted.has_value());
  REQUIRE(admitted.value().trusted);
  REQUIRE(admitted.value().pinned == peer.Cert());
}

TEST_CASE("handshake - downgrade check", "[handshake]") {
  peerlink::LocalDevice peer = test::MakeDevice("peer");
  TrustStore trust;
  REQUIRE(trust.Trust(kPeerId, peer.Cert(), 8).has_value());

  Admission a;
  a.identity = Identity(kPeerId, 7);

  SECTION("untrusted peers are never checked") {
    REQUIRE(peerlink::CheckDowngrade(a, trust).has_value());
  }

  SECTION("trusted peer without a pin fails") {
    a.trusted = true;
    auto r = peerlink::CheckDowngrade(a, trust);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == LinkError::kHandshakeFailure);
  }

  SECTION("lower version than persisted is refused") {
    a.trusted = true;
    a.pinned = peer.Cert();
    auto r = peerlink::CheckDowngrade(a, trust);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == LinkError::kProtocolDowngrade);
  }

  SECTION("version beyond int32 does not wrap into range") {
    a.trusted = true;
    a.pinned = peer.Cert();
    // 2^32 + 8 would read as 8 if truncated.
    a.identity = a.identity.With("protocolVersion", int64_t{4294967304});
    auto r = peerlink::CheckDowngrade(a, trust);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == LinkError::kProtocolDowngrade);
    REQUIRE_FALSE(peerlink::NeedsSecureIdentity(
        a.identity.GetInt("protocolVersion", 0)));
  }

  SECTION("same or higher version passes") {
    a.trusted = true;
    a.pinned = peer.Cert();
    a.identity = Identity(kPeerId, 8);
    REQUIRE(peerlink::CheckDowngrade(a, trust).has_value());
    a.identity = Identity(kPeerId, 9);
    REQUIRE(peerlink::CheckDowngrade(a, trust).has_value());
  }
}

TEST_CASE("handshake - target fields must name the local device",
          "[handshake]") {
  Packet plain = Identity(kPeerId);
  REQUIRE(peerlink::CheckTarget(plain, kLocalId, 8).has_value());

  Packet good = plain.With("targetDeviceId", std::string(kLocalId))
                    .With("targetProtocolVersion", 8);
  REQUIRE(peerlink::CheckTarget(good, kLocalId, 8).has_value());

  Packet as_string = plain.With("targetProtocolVersion", std::string("8"));
  REQUIRE(peerlink::CheckTarget(as_string, kLocalId, 8).has_value());

  auto other_id = peerlink::CheckTarget(
      plain.With("targetDeviceId", std::string(kPeerId)), kLocalId, 8);
  REQUIRE_FALSE(other_id.has_value());
  REQUIRE(other_id.get_error() == LinkError::kTargetMismatch);

  auto other_version = peerlink::CheckTarget(
      plain.With("targetProtocolVersion", 7), kLocalId, 8);
  REQUIRE_FALSE(other_version.has_value());
  REQUIRE(other_version.get_error() == LinkError::kTargetMismatch);
}

TEST_CASE("handshake - secure identity must match the clear-text one",
          "[handshake]") {
  REQUIRE(peerlink::NeedsSecureIdentity(8));
  REQUIRE_FALSE(peerlink::NeedsSecureIdentity(7));

  Packet pre = Identity(kPeerId, 8);

  auto same = peerlink::CheckSecureIdentity(
      pre, peerlink::Serialize(pre.With("deviceName", std::string("Renamed"))));
  REQUIRE(same.has_value());
  REQUIRE(same.value().GetString("deviceName") == "Renamed");

  auto bad_json = peerlink::CheckSecureIdentity(pre, "{");
  REQUIRE_FALSE(bad_json.has_value());
  REQUIRE(bad_json.get_error() == LinkError::kMalformedPacket);

  auto other_id = peerlink::CheckSecureIdentity(
      pre, peerlink::Serialize(Identity(kLocalId, 8)));
  REQUIRE_FALSE(other_id.has_value());
  REQUIRE(other_id.get_error() == LinkError::kHandshakeFailure);

  auto other_version = peerlink::CheckSecureIdentity(
      pre, peerlink::Serialize(Identity(kPeerId, 9)));
  REQUIRE_FALSE(other_version.has_value());
  REQUIRE(other_version.get_error() == LinkError::kHandshakeFailure);
}

TEST_CASE("handshake - context records transitions and aborts",
          "[handshake]") {
  HandshakeContext ctx(ConnectionOrigin::kLocallyAccepted, "127.0.0.1");
  REQUIRE(ctx.State() == HandshakeState::kDiscovered);
  ctx.SetDeviceId(kPeerId);
  ctx.Transition(HandshakeState::kIdentityExchanged);
  ctx.Transition(HandshakeState::kTlsHandshaking);
  REQUIRE(ctx.State() == HandshakeState::kTlsHandshaking);
  REQUIRE(ctx.DeviceId() == kPeerId);

  SECTION("policy refusals end in kRejected") {
    ctx.Abort(LinkError::kRateLimited);
    REQUIRE(ctx.State() == HandshakeState::kRejected);
    REQUIRE(ctx.Error() == LinkError::kRateLimited);
  }

  SECTION("TLS failures end in kFailed") {
    ctx.Abort(LinkError::kCertificateMismatch);
    REQUIRE(ctx.State() == HandshakeState::kFailed);
  }

  REQUIRE(std::string(peerlink::HandshakeStateName(ctx.State())) != "unknown");
}
