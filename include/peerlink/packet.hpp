/**
 * @file packet.hpp
 * @brief Wire packet model and newline-delimited JSON codec.
 *
 * Wire form (one line per packet):
 *   {"id":1700000000000,"type":"cconnect.ping","body":{...}}\n
 * Packets carrying a payload additionally hold "payloadSize" and, once a
 * transport has negotiated it, "payloadTransferInfo".
 *
 * nlohmann/json is used in non-throwing mode throughout.
 */

#ifndef PEERLINK_PACKET_HPP_
#define PEERLINK_PACKET_HPP_

#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {

using Json = nlohmann::json;

// ============================================================================
// PacketError
// ============================================================================

enum class PacketError : uint8_t {
  kMalformedPacket = 0,
};

// ============================================================================
// Packet types
// ============================================================================

namespace packet_type {

static constexpr const char* kPrefix = "cconnect.";
static constexpr const char* kLegacyPrefix = "kdeconnect.";

static constexpr const char* kIdentity = "cconnect.identity";
static constexpr const char* kPair = "cconnect.pair";
static constexpr const char* kPing = "cconnect.ping";

/**
 * @brief Rewrite a legacy "kdeconnect." type into the current namespace.
 *        Other types are returned unchanged.
 */
inline std::string Normalize(const std::string& type) {
  static const std::string legacy(kLegacyPrefix);
  if (type.compare(0, legacy.size(), legacy) == 0) {
    return std::string(kPrefix) + type.substr(legacy.size());
  }
  return type;
}

}  // namespace packet_type

// ============================================================================
// Packet
// ============================================================================

/**
 * @brief Immutable wire packet.
 *
 * Body accessors never throw: a missing key or a value of the wrong JSON
 * type yields the supplied default.
 */
class Packet {
 public:
  Packet() = default;

  Packet(int64_t id, std::string type, Json body,
         int64_t payload_size = 0, Json transfer_info = Json::object())
      : id_(id),
        type_(packet_type::Normalize(type)),
        body_(body.is_object() ? std::move(body) : Json::object()),
        payload_size_(payload_size > 0 ? payload_size : 0),
        transfer_info_(transfer_info.is_object() ? std::move(transfer_info)
                                                 : Json::object()) {}

  /** @brief Create a packet stamped with the current wall-clock time. */
  static Packet Create(const std::string& type, Json body = Json::object(),
                       int64_t payload_size = 0) {
    return Packet(NowMs(), type, std::move(body), payload_size);
  }

  int64_t Id() const noexcept { return id_; }
  const std::string& Type() const noexcept { return type_; }
  const Json& Body() const noexcept { return body_; }
  int64_t PayloadSize() const noexcept { return payload_size_; }
  const Json& PayloadTransferInfo() const noexcept { return transfer_info_; }

  bool HasPayload() const noexcept { return payload_size_ > 0; }
  bool HasPayloadTransferInfo() const noexcept {
    return !transfer_info_.empty();
  }

  bool Has(const char* key) const { return body_.contains(key); }

  std::string GetString(const char* key,
                        const std::string& default_val = "") const {
    auto it = body_.find(key);
    if (it == body_.end() || !it->is_string()) return default_val;
    return it->get<std::string>();
  }

  int64_t GetInt64(const char* key, int64_t default_val = 0) const {
    auto it = body_.find(key);
    if (it == body_.end()) return default_val;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_string()) {
      // Some peers send numbers as strings (e.g. targetProtocolVersion).
      const std::string& s = it->get_ref<const std::string&>();
      char* end = nullptr;
      long long v = std::strtoll(s.c_str(), &end, 10);
      if (end != s.c_str() && *end == '\0') return static_cast<int64_t>(v);
    }
    return default_val;
  }

  /** @brief As GetInt64; values outside the int32_t range yield the default. */
  int32_t GetInt(const char* key, int32_t default_val = 0) const {
    const int64_t v = GetInt64(key, default_val);
    if (v < std::numeric_limits<int32_t>::min() ||
        v > std::numeric_limits<int32_t>::max()) {
      return default_val;
    }
    return static_cast<int32_t>(v);
  }

  bool GetBool(const char* key, bool default_val = false) const {
    auto it = body_.find(key);
    if (it == body_.end() || !it->is_boolean()) return default_val;
    return it->get<bool>();
  }

  /**
   * @brief Read a list of strings.
   *
   * Accepts a JSON array, or a string that itself holds a JSON array.
   * Non-string elements are skipped.
   */
  std::vector<std::string> GetStringList(const char* key) const {
    std::vector<std::string> out;
    auto it = body_.find(key);
    if (it == body_.end()) return out;
    Json arr;
    if (it->is_array()) {
      arr = *it;
    } else if (it->is_string()) {
      arr = Json::parse(it->get_ref<const std::string&>(), nullptr, false);
      if (arr.is_discarded() || !arr.is_array()) return out;
    } else {
      return out;
    }
    for (const auto& e : arr) {
      if (e.is_string()) out.push_back(e.get<std::string>());
    }
    return out;
  }

  /** @brief Copy of this packet with @p key set in the body. */
  template <typename T>
  Packet With(const char* key, T&& value) const {
    Packet p(*this);
    p.body_[key] = std::forward<T>(value);
    return p;
  }

  /** @brief Copy of this packet with a new payload transfer info object. */
  Packet WithTransferInfo(Json info) const {
    Packet p(*this);
    p.transfer_info_ = info.is_object() ? std::move(info) : Json::object();
    return p;
  }

  bool operator==(const Packet& other) const {
    return id_ == other.id_ && type_ == other.type_ &&
           body_ == other.body_ && payload_size_ == other.payload_size_ &&
           transfer_info_ == other.transfer_info_;
  }
  bool operator!=(const Packet& other) const { return !(*this == other); }

  static int64_t NowMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }

 private:
  int64_t id_ = 0;
  std::string type_;
  Json body_ = Json::object();
  int64_t payload_size_ = 0;
  Json transfer_info_ = Json::object();
};

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Encode a packet as one JSON line terminated by '\n'.
 *
 * payloadSize and payloadTransferInfo are only emitted for packets that carry
 * a payload. Forward slashes are not escaped. Invalid UTF-8 is replaced.
 */
inline std::string Serialize(const Packet& packet) {
  Json j = Json::object();
  j["id"] = packet.Id();
  j["type"] = packet.Type();
  j["body"] = packet.Body();
  if (packet.HasPayload()) {
    j["payloadSize"] = packet.PayloadSize();
    if (packet.HasPayloadTransferInfo()) {
      j["payloadTransferInfo"] = packet.PayloadTransferInfo();
    }
  }
  std::string out =
      j.dump(-1, ' ', false, Json::error_handler_t::replace);
  out.push_back('\n');
  return out;
}

/**
 * @brief Decode one JSON line.
 * @return Packet, or PacketError::kMalformedPacket on invalid JSON or a
 *         missing / ill-typed id, type or body.
 */
inline expected<Packet, PacketError> Deserialize(const std::string& line) {
  using R = expected<Packet, PacketError>;

  Json j = Json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return R::error(PacketError::kMalformedPacket);
  }

  auto id = j.find("id");
  auto type = j.find("type");
  auto body = j.find("body");
  if (id == j.end() || !id->is_number_integer() || type == j.end() ||
      !type->is_string() || body == j.end() || !body->is_object()) {
    return R::error(PacketError::kMalformedPacket);
  }

  int64_t payload_size = 0;
  auto size = j.find("payloadSize");
  if (size != j.end() && size->is_number_integer()) {
    payload_size = size->get<int64_t>();
  }

  Json transfer_info = Json::object();
  auto info = j.find("payloadTransferInfo");
  if (info != j.end() && info->is_object()) {
    transfer_info = *info;
  }

  return R::success(Packet(id->get<int64_t>(), type->get<std::string>(),
                           *body, payload_size, std::move(transfer_info)));
}

}  // namespace peerlink

#endif  // PEERLINK_PACKET_HPP_
