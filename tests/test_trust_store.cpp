/**
 * @file test_trust_store.cpp
 * @brief Tests for trust_store.hpp
 */

#include "peerlink/trust_store.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

const char* kPeer = "fedcba9876543210fedcba9876543210";

}  // namespace

TEST_CASE("trust store - in-memory trust and untrust", "[trust_store]") {
  peerlink::LocalDevice dev = test::MakeDevice("peer");
  REQUIRE_FALSE(dev.Cert().Empty());

  peerlink::TrustStore store;
  REQUIRE_FALSE(store.IsTrusted(kPeer));
  REQUIRE(store.PinnedCertificate(kPeer).Empty());
  REQUIRE(store.LastProtocolVersion(kPeer) == 0);

  REQUIRE(store.Trust(kPeer, dev.Cert(), 7).has_value());
  REQUIRE(store.IsTrusted(kPeer));
  REQUIRE(store.PinnedCertificate(kPeer) == dev.Cert());
  REQUIRE(store.LastProtocolVersion(kPeer) == 7);
  REQUIRE(store.TrustedDeviceIds().size() == 1U);

  REQUIRE(store.Untrust(kPeer).has_value());
  REQUIRE_FALSE(store.IsTrusted(kPeer));
}

TEST_CASE("trust store - empty certificate is rejected", "[trust_store]") {
  peerlink::TrustStore store;
  auto r = store.Trust(kPeer, peerlink::Certificate(), 8);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == peerlink::StoreError::kCertificate);
  REQUIRE_FALSE(store.IsTrusted(kPeer));
}

TEST_CASE("trust store - protocol version only tracked when trusted",
          "[trust_store]") {
  peerlink::LocalDevice dev = test::MakeDevice("peer");
  peerlink::TrustStore store;
  REQUIRE(store.SetProtocolVersion(kPeer, 8).has_value());
  REQUIRE(store.LastProtocolVersion(kPeer) == 0);
  REQUIRE(store.Trust(kPeer, dev.Cert(), 7).has_value());
  REQUIRE(store.SetProtocolVersion(kPeer, 8).has_value());
  REQUIRE(store.LastProtocolVersion(kPeer) == 8);
}

TEST_CASE("trust store - custom hosts are deduplicated", "[trust_store]") {
  peerlink::TrustStore store;
  REQUIRE(store.AddCustomHost("192.168.1.20").has_value());
  REQUIRE(store.AddCustomHost("192.168.1.20").has_value());
  REQUIRE(store.AddCustomHost("").has_value());
  REQUIRE(store.AddCustomHost("peer.lan").has_value());
  REQUIRE(store.CustomHosts().size() == 2U);
  REQUIRE(store.RemoveCustomHost("192.168.1.20").has_value());
  REQUIRE(store.CustomHosts().size() == 1U);
  REQUIRE(store.CustomHosts()[0] == "peer.lan");
}

TEST_CASE("trust store - persists to and reloads from disk", "[trust_store]") {
  test::TempDir dir;
  REQUIRE_FALSE(dir.Path().empty());
  peerlink::LocalDevice dev = test::MakeDevice("peer");
  {
    peerlink::TrustStore store(dir.Path());
    REQUIRE(store.Load().has_value());
    REQUIRE(store.Trust(kPeer, dev.Cert(), 8).has_value());
    REQUIRE(store.AddCustomHost("10.1.2.3").has_value());
  }
  peerlink::TrustStore reloaded(dir.Path());
  REQUIRE(reloaded.Load().has_value());
  REQUIRE(reloaded.IsTrusted(kPeer));
  REQUIRE(reloaded.PinnedCertificate(kPeer) == dev.Cert());
  REQUIRE(reloaded.LastProtocolVersion(kPeer) == 8);
  REQUIRE(reloaded.CustomHosts().size() == 1U);
}

TEST_CASE("trust store - corrupt file reports a parse error", "[trust_store]") {
  test::TempDir dir;
  REQUIRE(peerlink::file::WriteAll(
      peerlink::file::Join(dir.Path(), peerlink::TrustStore::kFileName),
      "{not json"));
  peerlink::TrustStore store(dir.Path());
  auto r = store.Load();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == peerlink::StoreError::kParse);
}
