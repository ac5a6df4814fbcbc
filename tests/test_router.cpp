/**
 * @file test_router.cpp
 * @brief Tests for router.hpp: plugin registration, dispatch by type, pair
 *        handling and outbound permission checks.
 */

#include "peerlink/router.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <set>
#include <string>
#include <vector>

using peerlink::DeviceInfo;
using peerlink::Json;
using peerlink::Link;
using peerlink::LinkError;
using peerlink::Packet;
using peerlink::PacketRouter;
using peerlink::Plugin;
using peerlink::SendCallbacks;
using peerlink::TransferPacket;

namespace {

const char* kPeerId = "fedcba9876543210fedcba9876543210";

class FakePlugin final : public Plugin {
 public:
  FakePlugin(std::string name, std::set<std::string> in,
             std::set<std::string> out, bool handles = true)
      : name_(std::move(name)),
        in_(std::move(in)),
        out_(std::move(out)),
        handles_(handles) {}

  const char* Name() const override { return name_.c_str(); }
  std::set<std::string> SupportedPacketTypes() const override { return in_; }
  std::set<std::string> OutgoingPacketTypes() const override { return out_; }

  bool OnPacketReceived(const std::string& device_id,
                        TransferPacket& packet) override {
    received.push_back(device_id + "/" + packet.Type());
    return handles_;
  }

  void OnDeviceConnected(const DeviceInfo& info) override {
    connected.push_back(info.id);
  }

  void OnDeviceDisconnected(const std::string& device_id) override {
    disconnected.push_back(device_id);
  }

  bool SendTo(const std::string& device_id, TransferPacket& packet,
              const SendCallbacks& cb) {
    return Send(device_id, packet, cb);
  }

  std::vector<std::string> received;
  std::vector<std::string> connected;
  std::vector<std::string> disconnected;

 private:
  std::string name_;
  std::set<std::string> in_;
  std::set<std::string> out_;
  bool handles_;
};

struct FailureRecord {
  int failures = 0;
  LinkError last = LinkError::kMalformedPacket;
};

void OnFailure(LinkError error, void* ctx) {
  auto* rec = static_cast<FailureRecord*>(ctx);
  ++rec->failures;
  rec->last = error;
}

SendCallbacks FailureCallbacks(FailureRecord* rec) {
  SendCallbacks cb;
  cb.on_failure = &OnFailure;
  cb.ctx = rec;
  return cb;
}

DeviceInfo PeerInfo() {
  DeviceInfo info;
  info.id = kPeerId;
  info.name = "Phone";
  info.protocol_version = 8;
  return info;
}

struct PairRecord {
  int calls = 0;
  std::string from;
};

bool OnPair(const DeviceInfo& from, TransferPacket& packet, void* ctx) {
  (void)packet;
  auto* rec = static_cast<PairRecord*>(ctx);
  ++rec->calls;
  rec->from = from.id;
  return true;
}

}  // namespace

TEST_CASE("router - plugin registration and capabilities", "[router]") {
  PacketRouter router;
  Plugin* ping = router.RegisterPlugin(std::unique_ptr<Plugin>(new FakePlugin(
      "ping", {"cconnect.ping"}, {"cconnect.ping"})));
  REQUIRE(ping != nullptr);
  Plugin* share = router.RegisterPlugin(std::unique_ptr<Plugin>(new FakePlugin(
      "share", {"cconnect.share.request"}, {"cconnect.share.request"})));
  REQUIRE(share != nullptr);

  Plugin* dup = router.RegisterPlugin(std::unique_ptr<Plugin>(
      new FakePlugin("ping", {"cconnect.other"}, {})));
  REQUIRE(dup == nullptr);
  REQUIRE(router.RegisterPlugin(nullptr) == nullptr);
  REQUIRE(router.PluginCount() == 2U);

  peerlink::Capabilities caps = router.GetCapabilities();
  const std::set<std::string> want = {"cconnect.ping",
                                          "cconnect.share.request"};
  REQUIRE(caps.incoming == want);
  REQUIRE(caps.outgoing == want);
}

TEST_CASE("router - inbound dispatch by packet type", "[router]") {
  peerlink::TaskPool pool;
  std::shared_ptr<Link> link = Link::Create(PeerInfo(), pool, nullptr, nullptr);
  PacketRouter router;
  auto* ping = static_cast<FakePlugin*>(router.RegisterPlugin(
      std::unique_ptr<Plugin>(new FakePlugin("ping", {"kdeconnect.ping"}, {}))));
  auto* audit = static_cast<FakePlugin*>(router.RegisterPlugin(
      std::unique_ptr<Plugin>(new FakePlugin("audit", {"cconnect.ping"}, {},
                                             false))));
  REQUIRE(ping != nullptr);
  REQUIRE(audit != nullptr);

  TransferPacket tp(Packet::Create("cconnect.ping"));
  REQUIRE(router.OnPacketReceived(*link, tp));
  REQUIRE(ping->received == std::vector<std::string>{
                                std::string(kPeerId) + "/cconnect.ping"});
  REQUIRE(audit->received.size() == 1U);

  TransferPacket other(Packet::Create("cconnect.battery"));
  REQUIRE_FALSE(router.OnPacketReceived(*link, other));
  REQUIRE(ping->received.size() == 1U);
  pool.Stop();
}

TEST_CASE("router - pair packets go to the pair handler", "[router]") {
  peerlink::TaskPool pool;
  std::shared_ptr<Link> link = Link::Create(PeerInfo(), pool, nullptr, nullptr);
  PacketRouter router;
  auto* pair_plugin = static_cast<FakePlugin*>(router.RegisterPlugin(
      std::unique_ptr<Plugin>(new FakePlugin("pairing", {"cconnect.pair"}, {}))));
  REQUIRE(pair_plugin != nullptr);

  Json body = Json::object();
  body["pair"] = true;

  SECTION("plugins see pair packets when no handler is set") {
    TransferPacket tp(Packet::Create(peerlink::packet_type::kPair, body));
    REQUIRE(router.OnPacketReceived(*link, tp));
    REQUIRE(pair_plugin->received.size() == 1U);
  }

  SECTION("the handler takes precedence over plugins") {
    PairRecord rec;
    router.SetPairHandler(&OnPair, &rec);
    TransferPacket tp(Packet::Create(peerlink::packet_type::kPair, body));
    REQUIRE(router.OnPacketReceived(*link, tp));
    REQUIRE(rec.calls == 1);
    REQUIRE(rec.from == kPeerId);
    REQUIRE(pair_plugin->received.empty());
  }
  pool.Stop();
}

TEST_CASE("router - connection lifecycle reaches plugins", "[router]") {
  peerlink::TaskPool pool;
  std::shared_ptr<Link> link = Link::Create(PeerInfo(), pool, nullptr, nullptr);
  PacketRouter router;
  auto* plugin = static_cast<FakePlugin*>(router.RegisterPlugin(
      std::unique_ptr<Plugin>(new FakePlugin("ping", {"cconnect.ping"}, {}))));

  router.OnConnectionReceived(link);
  REQUIRE(plugin->connected == std::vector<std::string>{kPeerId});
  REQUIRE(router.FindLink(kPeerId) == link);
  REQUIRE(router.ConnectedDevices() == std::vector<std::string>{kPeerId});

  // A stale link for the same device does not evict the current one.
  std::shared_ptr<Link> stale = Link::Create(PeerInfo(), pool, nullptr, nullptr);
  router.OnConnectionLost(stale);
  REQUIRE(router.FindLink(kPeerId) == link);
  REQUIRE(plugin->disconnected.empty());

  router.OnConnectionLost(link);
  REQUIRE(router.FindLink(kPeerId) == nullptr);
  REQUIRE(plugin->disconnected == std::vector<std::string>{kPeerId});
  REQUIRE(router.ConnectedDevices().empty());
  pool.Stop();
}

TEST_CASE("router - outbound routing", "[router]") {
  peerlink::TaskPool pool;
  PacketRouter router;
  auto* plugin = static_cast<FakePlugin*>(router.RegisterPlugin(
      std::unique_ptr<Plugin>(new FakePlugin("ping", {"cconnect.ping"},
                                             {"kdeconnect.ping"}))));
  REQUIRE(plugin != nullptr);

  SECTION("unknown device fails with kNotConnected") {
    FailureRecord rec;
    TransferPacket tp(Packet::Create("cconnect.ping"));
    REQUIRE_FALSE(router.SendPacket(kPeerId, tp, FailureCallbacks(&rec)));
    REQUIRE(rec.failures == 1);
    REQUIRE(rec.last == LinkError::kNotConnected);
  }

  SECTION("plugins may only send their outgoing types") {
    FailureRecord rec;
    TransferPacket tp(Packet::Create("cconnect.battery"));
    REQUIRE_FALSE(plugin->SendTo(kPeerId, tp, FailureCallbacks(&rec)));
    REQUIRE(rec.failures == 0);
  }

  SECTION("permitted type is routed to the device link") {
    std::shared_ptr<Link> link =
        Link::Create(PeerInfo(), pool, nullptr, nullptr);
    router.OnConnectionReceived(link);
    FailureRecord rec;
    TransferPacket tp(Packet::Create("cconnect.ping"));
    // The link has no stream yet, so the link itself reports the failure.
    REQUIRE_FALSE(plugin->SendTo(kPeerId, tp, FailureCallbacks(&rec)));
    REQUIRE(rec.failures == 1);
    REQUIRE(rec.last == LinkError::kNotConnected);
  }
  pool.Stop();
}

TEST_CASE("router - unregistered plugin cannot send", "[router]") {
  FakePlugin orphan("orphan", {}, {"cconnect.ping"});
  FailureRecord rec;
  TransferPacket tp(Packet::Create("cconnect.ping"));
  REQUIRE_FALSE(orphan.SendTo(kPeerId, tp, FailureCallbacks(&rec)));
  REQUIRE(rec.failures == 1);
  REQUIRE(rec.last == LinkError::kNotConnected);
}
