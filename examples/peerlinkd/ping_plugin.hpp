// Copyright (c) 2024 liudegui. MIT License.
//
// Ping plugin: logs every cconnect.ping and answers it once.

#ifndef PEERLINKD_PING_PLUGIN_HPP_
#define PEERLINKD_PING_PLUGIN_HPP_

#include "peerlink/log.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/router.hpp"
#include "peerlink/transfer_packet.hpp"

#include <atomic>
#include <cstdint>
#include <set>
#include <string>

class PingPlugin final : public peerlink::Plugin {
 public:
  const char* Name() const override { return "ping"; }

  std::set<std::string> SupportedPacketTypes() const override {
    return {peerlink::packet_type::kPing};
  }
  std::set<std::string> OutgoingPacketTypes() const override {
    return {peerlink::packet_type::kPing};
  }

  bool OnPacketReceived(const std::string& device_id,
                        peerlink::TransferPacket& tp) override {
    const peerlink::Packet& in = tp.packet();
    received_.fetch_add(1U, std::memory_order_relaxed);
    PEERLINK_LOG_INFO("ping", "ping from %s: %s", device_id.c_str(),
                      in.GetString("message", "(no message)").c_str());
    if (in.GetBool("reply", false)) return true;

    peerlink::TransferPacket reply(peerlink::Packet::Create(
        peerlink::packet_type::kPing,
        peerlink::Json{{"message", "pong"}, {"reply", true}}));
    if (!Send(device_id, reply)) {
      PEERLINK_LOG_WARN("ping", "could not answer %s", device_id.c_str());
    }
    return true;
  }

  void OnDeviceConnected(const peerlink::DeviceInfo& info) override {
    PEERLINK_LOG_INFO("ping", "%s (%s, protocol %d) is reachable",
                      info.name.c_str(), peerlink::DeviceTypeName(info.type),
                      info.protocol_version);
  }

  uint32_t Received() const noexcept {
    return received_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<uint32_t> received_{0};
};

#endif  // PEERLINKD_PING_PLUGIN_HPP_
