/**
 * @file device_info.hpp
 * @brief Remote/local device description and identity packet validation.
 */

#ifndef PEERLINK_DEVICE_INFO_HPP_
#define PEERLINK_DEVICE_INFO_HPP_

#include "peerlink/certificate.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/platform.hpp"

#include <cstdint>
#include <cstring>
#include <set>
#include <string>
#include <vector>

namespace peerlink {

// ============================================================================
// DeviceType
// ============================================================================

enum class DeviceType : uint8_t {
  kDesktop = 0,
  kLaptop,
  kPhone,
  kTablet,
  kTv,
};

/** @brief Parse a wire device type; unknown names map to kDesktop. */
inline DeviceType ParseDeviceType(const std::string& s) noexcept {
  if (s == "phone" || s == "smartphone") return DeviceType::kPhone;
  if (s == "tablet") return DeviceType::kTablet;
  if (s == "tv") return DeviceType::kTv;
  if (s == "laptop") return DeviceType::kLaptop;
  return DeviceType::kDesktop;
}

inline const char* DeviceTypeName(DeviceType type) noexcept {
  switch (type) {
    case DeviceType::kPhone:  return "phone";
    case DeviceType::kTablet: return "tablet";
    case DeviceType::kTv:     return "tv";
    case DeviceType::kLaptop: return "laptop";
    default:                  return "desktop";
  }
}

// ============================================================================
// Validation helpers
// ============================================================================

static constexpr size_t kMinDeviceIdLength = 32;
static constexpr size_t kMaxDeviceIdLength = 38;
static constexpr size_t kMaxDeviceNameLength = 32;

/** @brief True iff @p id matches ^[A-Za-z0-9_-]{32,38}$. */
inline bool IsValidDeviceId(const std::string& id) noexcept {
  if (id.size() < kMinDeviceIdLength || id.size() > kMaxDeviceIdLength) {
    return false;
  }
  for (char c : id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

namespace detail {

inline bool IsBlank(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

inline std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && IsBlank(s[begin])) ++begin;
  while (end > begin && IsBlank(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

}  // namespace detail

/**
 * @brief Strip characters in "',;:.!?()[]<> (and the double quote), trim,
 *        and cap the result at kMaxDeviceNameLength characters.
 */
inline std::string FilterDeviceName(const std::string& name) {
  static const char kInvalid[] = "\"',;:.!?()[]<>";
  std::string filtered;
  filtered.reserve(name.size());
  for (char c : name) {
    if (std::strchr(kInvalid, c) == nullptr || c == '\0') filtered.push_back(c);
  }
  filtered = detail::Trim(filtered);
  if (filtered.size() > kMaxDeviceNameLength) {
    filtered.resize(kMaxDeviceNameLength);
  }
  return filtered;
}

/** @brief Identity type, valid deviceId, non-blank deviceName. */
inline bool IsValidIdentityPacket(const Packet& packet) {
  if (packet.Type() != packet_type::kIdentity) return false;
  if (!IsValidDeviceId(packet.GetString("deviceId"))) return false;
  return !detail::Trim(packet.GetString("deviceName")).empty();
}

// ============================================================================
// DeviceInfo
// ============================================================================

struct DeviceInfo {
  std::string id;
  std::string name;
  DeviceType type = DeviceType::kDesktop;
  int32_t protocol_version = 0;
  std::set<std::string> incoming_capabilities;
  std::set<std::string> outgoing_capabilities;
  Certificate certificate;

  /** @brief Build from a validated identity packet plus the peer certificate. */
  static DeviceInfo FromIdentityPacketAndCert(const Packet& packet,
                                              const Certificate& cert) {
    DeviceInfo info;
    info.id = packet.GetString("deviceId");
    info.name = FilterDeviceName(packet.GetString("deviceName"));
    info.type = ParseDeviceType(packet.GetString("deviceType"));
    info.protocol_version = packet.GetInt("protocolVersion", 0);
    for (auto& cap : packet.GetStringList("incomingCapabilities")) {
      info.incoming_capabilities.insert(packet_type::Normalize(cap));
    }
    for (auto& cap : packet.GetStringList("outgoingCapabilities")) {
      info.outgoing_capabilities.insert(packet_type::Normalize(cap));
    }
    info.certificate = cert;
    return info;
  }

  Packet ToIdentityPacket() const {
    Json body = Json::object();
    body["deviceId"] = id;
    body["deviceName"] = name;
    body["deviceType"] = DeviceTypeName(type);
    body["protocolVersion"] = protocol_version;
    body["incomingCapabilities"] = std::vector<std::string>(
        incoming_capabilities.begin(), incoming_capabilities.end());
    body["outgoingCapabilities"] = std::vector<std::string>(
        outgoing_capabilities.begin(), outgoing_capabilities.end());
    return Packet::Create(packet_type::kIdentity, std::move(body));
  }
};

}  // namespace peerlink

#endif  // PEERLINK_DEVICE_INFO_HPP_
