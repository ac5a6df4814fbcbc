/**
 * @file test_mdns.cpp
 * @brief Tests for the mDNS codec and service extraction in mdns.hpp.
 */

#include "peerlink/mdns.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mdns = peerlink::mdns;

namespace {

const char* kPeerId = "fedcba9876543210fedcba9876543210";

mdns::ServiceInstance PeerService() {
  mdns::ServiceInstance svc;
  svc.instance = std::string(mdns::kInstancePrefix) + kPeerId;
  svc.host = svc.instance + ".local";
  svc.port = 1816;
  svc.txt = {std::string("id=") + kPeerId, "name=Phone", "type=phone"};
  return svc;
}

}  // namespace

TEST_CASE("mdns - query round trip", "[mdns]") {
  std::vector<uint8_t> q = mdns::BuildQuery();
  auto msg = mdns::ParseMessage(q.data(), q.size());
  REQUIRE(msg.has_value());
  REQUIRE_FALSE(msg.value().IsResponse());
  REQUIRE(msg.value().questions.size() == 1U);
  REQUIRE(msg.value().questions[0].name == mdns::kServiceType);
  REQUIRE(msg.value().questions[0].type == mdns::kTypePtr);
  REQUIRE(msg.value().records.empty());
}

TEST_CASE("mdns - announcement carries PTR, SRV and TXT", "[mdns]") {
  mdns::ServiceInstance svc = PeerService();
  std::vector<uint8_t> wire = mdns::BuildAnnouncement(svc);
  auto msg = mdns::ParseMessage(wire.data(), wire.size());
  REQUIRE(msg.has_value());
  REQUIRE(msg.value().IsResponse());
  REQUIRE(msg.value().records.size() == 3U);

  const mdns::Record& ptr = msg.value().records[0];
  REQUIRE(ptr.type == mdns::kTypePtr);
  REQUIRE(ptr.target == svc.FullName());

  const mdns::Record& srv = msg.value().records[1];
  REQUIRE(srv.type == mdns::kTypeSrv);
  REQUIRE(srv.port == 1816);
  REQUIRE(srv.target == svc.host);
  REQUIRE(srv.klass == mdns::kClassIn);

  const mdns::Record& txt = msg.value().records[2];
  REQUIRE(txt.type == mdns::kTypeTxt);
  REQUIRE(txt.txt.size() == 3U);
  REQUIRE(mdns::TxtValue(txt.txt, "name") == "Phone");
  REQUIRE(mdns::TxtValue(txt.txt, "missing").empty());
}

TEST_CASE("mdns - extract services from an announcement", "[mdns]") {
  mdns::ServiceInstance svc = PeerService();

  SECTION("without an A record the source address is used") {
    std::vector<uint8_t> wire = mdns::BuildAnnouncement(svc);
    auto msg = mdns::ParseMessage(wire.data(), wire.size());
    REQUIRE(msg.has_value());
    auto found = mdns::ExtractServices(msg.value(), "192.168.1.30");
    REQUIRE(found.size() == 1U);
    REQUIRE(found[0].device_id == kPeerId);
    REQUIRE(found[0].host == "192.168.1.30");
    REQUIRE(found[0].port == 1816);
  }

  SECTION("an A record for the SRV host wins") {
    svc.address = "10.1.2.3";
    std::vector<uint8_t> wire = mdns::BuildAnnouncement(svc);
    auto msg = mdns::ParseMessage(wire.data(), wire.size());
    REQUIRE(msg.has_value());
    REQUIRE(msg.value().records.size() == 4U);
    REQUIRE(msg.value().records[3].address == "10.1.2.3");
    auto found = mdns::ExtractServices(msg.value(), "192.168.1.30");
    REQUIRE(found.size() == 1U);
    REQUIRE(found[0].host == "10.1.2.3");
  }

  SECTION("device id falls back to the instance label") {
    svc.txt.clear();
    std::vector<uint8_t> wire = mdns::BuildAnnouncement(svc);
    auto msg = mdns::ParseMessage(wire.data(), wire.size());
    REQUIRE(msg.has_value());
    auto found = mdns::ExtractServices(msg.value(), "192.168.1.30");
    REQUIRE(found.size() == 1U);
    REQUIRE(found[0].device_id == kPeerId);
  }

  SECTION("other service types are ignored") {
    svc.service = "_other._tcp.local";
    std::vector<uint8_t> wire = mdns::BuildAnnouncement(svc);
    auto msg = mdns::ParseMessage(wire.data(), wire.size());
    REQUIRE(msg.has_value());
    REQUIRE(mdns::ExtractServices(msg.value(), "192.168.1.30").empty());
  }
}

TEST_CASE("mdns - service names compare case-insensitively", "[mdns]") {
  mdns::ServiceInstance svc = PeerService();
  svc.service = "_PeerLink._TCP.local";
  std::vector<uint8_t> wire = mdns::BuildAnnouncement(svc);
  auto msg = mdns::ParseMessage(wire.data(), wire.size());
  REQUIRE(msg.has_value());
  REQUIRE(mdns::ExtractServices(msg.value(), "192.168.1.30").size() == 1U);
}

TEST_CASE("mdns - truncated and malformed input", "[mdns]") {
  std::vector<uint8_t> wire = mdns::BuildAnnouncement(PeerService());

  SECTION("short header") {
    auto r = mdns::ParseMessage(wire.data(), 5);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == peerlink::MdnsError::kTruncated);
  }

  SECTION("cut inside a record") {
    auto r = mdns::ParseMessage(wire.data(), wire.size() - 3);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == peerlink::MdnsError::kTruncated);
  }

  SECTION("compression loop") {
    // Header with one question whose name points at itself.
    std::vector<uint8_t> loop = {0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0,
                                 0xC0, 12, 0, 12, 0, 1};
    auto r = mdns::ParseMessage(loop.data(), loop.size());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == peerlink::MdnsError::kBadName);
  }

  SECTION("reserved label bits") {
    std::vector<uint8_t> bad = {0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0,
                                0x40, 'a', 0, 0, 12, 0, 1};
    auto r = mdns::ParseMessage(bad.data(), bad.size());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == peerlink::MdnsError::kBadName);
  }
}
