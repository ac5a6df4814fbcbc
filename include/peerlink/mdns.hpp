/**
 * @file mdns.hpp
 * @brief Minimal DNS-SD over multicast DNS: message codec, service
 *        advertiser and browser for "_peerlink._tcp.local".
 *
 * Each device advertises the instance "peerlink-<deviceId>" with SRV (port of
 * the TCP listener), TXT (id, name, type, protocol) and optionally A records.
 * The browser reports every resolved foreign instance through a callback;
 * the link provider answers it with a directed UDP identity.
 *
 * The socket layer uses POSIX multicast sockets directly (IP_ADD_MEMBERSHIP,
 * SO_REUSEPORT) so that the responder can share port 5353 with a system
 * daemon.
 */

#ifndef PEERLINK_MDNS_HPP_
#define PEERLINK_MDNS_HPP_

#include "peerlink/device_info.hpp"
#include "peerlink/log.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifndef PEERLINK_MDNS_GROUP
#define PEERLINK_MDNS_GROUP "224.0.0.251"
#endif

#ifndef PEERLINK_MDNS_PORT
#define PEERLINK_MDNS_PORT 5353
#endif

namespace peerlink {

enum class MdnsError : uint8_t {
  kTruncated = 0,
  kBadName,
  kSocketFailed,
  kBindFailed,
  kMulticastJoinFailed,
};

namespace mdns {

static constexpr const char* kServiceType = "_peerlink._tcp.local";
static constexpr const char* kInstancePrefix = "peerlink-";

static constexpr uint16_t kTypeA = 1;
static constexpr uint16_t kTypePtr = 12;
static constexpr uint16_t kTypeTxt = 16;
static constexpr uint16_t kTypeSrv = 33;
static constexpr uint16_t kTypeAny = 255;

static constexpr uint16_t kClassIn = 1;
static constexpr uint16_t kCacheFlush = 0x8000;
static constexpr uint16_t kFlagResponse = 0x8000;
static constexpr uint16_t kFlagAuthoritative = 0x0400;

struct Question {
  std::string name;
  uint16_t type = 0;
  uint16_t klass = kClassIn;
};

/** @brief Resource record; only the fields of its type are filled. */
struct Record {
  std::string name;
  uint16_t type = 0;
  uint16_t klass = kClassIn;
  uint32_t ttl = 0;
  std::string target;              ///< PTR, SRV
  uint16_t port = 0;               ///< SRV
  std::vector<std::string> txt;    ///< TXT
  std::string address;             ///< A, dotted quad
};

struct Message {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<Question> questions;
  std::vector<Record> records;  ///< answer, authority and additional sections

  bool IsResponse() const noexcept { return (flags & kFlagResponse) != 0; }
};

/** @brief Data advertised for one service instance. */
struct ServiceInstance {
  std::string instance;  ///< first label, e.g. "peerlink-<id>"
  std::string service = kServiceType;
  std::string host;      ///< e.g. "peerlink-<id>.local"
  uint16_t port = 0;
  std::vector<std::string> txt;
  std::string address;   ///< optional IPv4 for an A record
  uint32_t ttl = 120;

  std::string FullName() const { return instance + "." + service; }
};

/** @brief A foreign instance resolved from a response. */
struct ResolvedService {
  std::string instance;
  std::string device_id;
  std::string host;  ///< IPv4 address to contact
  uint16_t port = 0;
};

namespace detail {

inline bool NameEqual(const std::string& a, const std::string& b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
    char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
    if (ca != cb) return false;
  }
  return true;
}

class Writer {
 public:
  void U8(uint8_t v) { out_.push_back(v); }
  void U16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v >> 8));
    out_.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  void U32(uint32_t v) {
    U16(static_cast<uint16_t>(v >> 16));
    U16(static_cast<uint16_t>(v & 0xFFFF));
  }
  void Bytes(const void* p, size_t n) {
    const uint8_t* b = static_cast<const uint8_t*>(p);
    out_.insert(out_.end(), b, b + n);
  }

  /** Uncompressed label sequence; labels longer than 63 bytes are cut. */
  void Name(const std::string& name) {
    size_t start = 0;
    while (start < name.size()) {
      size_t dot = name.find('.', start);
      if (dot == std::string::npos) dot = name.size();
      size_t len = dot - start;
      if (len > 63U) len = 63U;
      if (len > 0U) {
        U8(static_cast<uint8_t>(len));
        Bytes(name.data() + start, len);
      }
      start = dot + 1;
    }
    U8(0);
  }

  size_t Size() const noexcept { return out_.size(); }

  /** Back-patch a 16-bit length at @p pos. */
  void PatchU16(size_t pos, uint16_t v) {
    out_[pos] = static_cast<uint8_t>(v >> 8);
    out_[pos + 1] = static_cast<uint8_t>(v & 0xFF);
  }

  std::vector<uint8_t> Take() { return std::move(out_); }

 private:
  std::vector<uint8_t> out_;
};

class Reader {
 public:
  Reader(const uint8_t* data, size_t len) noexcept : data_(data), len_(len) {}

  bool U8(uint8_t* v) noexcept {
    if (pos_ + 1 > len_) return false;
    *v = data_[pos_++];
    return true;
  }
  bool U16(uint16_t* v) noexcept {
    if (pos_ + 2 > len_) return false;
    *v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }
  bool U32(uint32_t* v) noexcept {
    uint16_t hi;
    uint16_t lo;
    if (!U16(&hi) || !U16(&lo)) return false;
    *v = (static_cast<uint32_t>(hi) << 16) | lo;
    return true;
  }

  /** Reads a possibly compressed name at the cursor. */
  expected<std::string, MdnsError> Name() {
    using R = expected<std::string, MdnsError>;
    std::string name;
    size_t pos = pos_;
    bool jumped = false;
    int jumps = 0;
    for (;;) {
      if (pos >= len_) return R::error(MdnsError::kTruncated);
      uint8_t len = data_[pos];
      if ((len & 0xC0) == 0xC0) {
        if (pos + 1 >= len_) return R::error(MdnsError::kTruncated);
        if (++jumps > 16) return R::error(MdnsError::kBadName);
        size_t target = (static_cast<size_t>(len & 0x3F) << 8) | data_[pos + 1];
        if (!jumped) pos_ = pos + 2;
        jumped = true;
        if (target >= len_) return R::error(MdnsError::kBadName);
        pos = target;
        continue;
      }
      if ((len & 0xC0) != 0) return R::error(MdnsError::kBadName);
      if (len == 0) {
        if (!jumped) pos_ = pos + 1;
        break;
      }
      if (pos + 1 + len > len_) return R::error(MdnsError::kTruncated);
      if (!name.empty()) name.push_back('.');
      name.append(reinterpret_cast<const char*>(data_ + pos + 1), len);
      if (name.size() > 255U) return R::error(MdnsError::kBadName);
      pos += 1U + len;
    }
    return R::success(std::move(name));
  }

  size_t Pos() const noexcept { return pos_; }
  void Seek(size_t pos) noexcept { pos_ = pos; }
  size_t Len() const noexcept { return len_; }
  const uint8_t* Data() const noexcept { return data_; }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_ = 0;
};

inline void WriteRecordHeader(Writer& w, const std::string& name, uint16_t type,
                              uint16_t klass, uint32_t ttl) {
  w.Name(name);
  w.U16(type);
  w.U16(klass);
  w.U32(ttl);
}

}  // namespace detail

// ============================================================================
// Codec
// ============================================================================

/** @brief PTR question for @p service. */
inline std::vector<uint8_t> BuildQuery(const std::string& service = kServiceType) {
  detail::Writer w;
  w.U16(0);  // id
  w.U16(0);  // flags: standard query
  w.U16(1);
  w.U16(0);
  w.U16(0);
  w.U16(0);
  w.Name(service);
  w.U16(kTypePtr);
  w.U16(kClassIn);
  return w.Take();
}

/**
 * @brief Unsolicited response: PTR answer plus SRV, TXT and (if an address
 *        is set) A additional records.
 */
inline std::vector<uint8_t> BuildAnnouncement(const ServiceInstance& svc) {
  detail::Writer w;
  const std::string full = svc.FullName();
  const bool with_a = !svc.address.empty();
  in_addr addr{};
  const bool addr_ok =
      with_a && ::inet_pton(AF_INET, svc.address.c_str(), &addr) == 1;

  w.U16(0);
  w.U16(kFlagResponse | kFlagAuthoritative);
  w.U16(0);
  w.U16(1);
  w.U16(0);
  w.U16(addr_ok ? 3 : 2);

  // PTR service -> instance
  detail::WriteRecordHeader(w, svc.service, kTypePtr, kClassIn, svc.ttl);
  size_t len_pos = w.Size();
  w.U16(0);
  size_t start = w.Size();
  w.Name(full);
  w.PatchU16(len_pos, static_cast<uint16_t>(w.Size() - start));

  // SRV instance -> host:port
  detail::WriteRecordHeader(w, full, kTypeSrv, kClassIn | kCacheFlush, svc.ttl);
  len_pos = w.Size();
  w.U16(0);
  start = w.Size();
  w.U16(0);  // priority
  w.U16(0);  // weight
  w.U16(svc.port);
  w.Name(svc.host);
  w.PatchU16(len_pos, static_cast<uint16_t>(w.Size() - start));

  // TXT
  detail::WriteRecordHeader(w, full, kTypeTxt, kClassIn | kCacheFlush, svc.ttl);
  len_pos = w.Size();
  w.U16(0);
  start = w.Size();
  if (svc.txt.empty()) w.U8(0);
  for (const auto& item : svc.txt) {
    size_t n = item.size() > 255U ? 255U : item.size();
    w.U8(static_cast<uint8_t>(n));
    w.Bytes(item.data(), n);
  }
  w.PatchU16(len_pos, static_cast<uint16_t>(w.Size() - start));

  if (addr_ok) {
    detail::WriteRecordHeader(w, svc.host, kTypeA, kClassIn | kCacheFlush,
                              svc.ttl);
    w.U16(4);
    w.Bytes(&addr.s_addr, 4);
  }
  return w.Take();
}

/** @brief Decode a DNS message; unknown record types keep only their header. */
inline expected<Message, MdnsError> ParseMessage(const uint8_t* data,
                                                 size_t len) {
  using R = expected<Message, MdnsError>;
  detail::Reader r(data, len);
  Message msg;
  uint16_t qd;
  uint16_t an;
  uint16_t ns;
  uint16_t ar;
  if (!r.U16(&msg.id) || !r.U16(&msg.flags) || !r.U16(&qd) || !r.U16(&an) ||
      !r.U16(&ns) || !r.U16(&ar)) {
    return R::error(MdnsError::kTruncated);
  }

  for (uint16_t i = 0; i < qd; ++i) {
    Question q;
    auto name = r.Name();
    if (!name.has_value()) return R::error(name.get_error());
    q.name = name.value();
    if (!r.U16(&q.type) || !r.U16(&q.klass)) {
      return R::error(MdnsError::kTruncated);
    }
    q.klass &= 0x7FFF;
    msg.questions.push_back(std::move(q));
  }

  const uint32_t total = static_cast<uint32_t>(an) + ns + ar;
  for (uint32_t i = 0; i < total; ++i) {
    Record rec;
    auto name = r.Name();
    if (!name.has_value()) return R::error(name.get_error());
    rec.name = name.value();
    uint16_t rdlen;
    if (!r.U16(&rec.type) || !r.U16(&rec.klass) || !r.U32(&rec.ttl) ||
        !r.U16(&rdlen)) {
      return R::error(MdnsError::kTruncated);
    }
    rec.klass &= 0x7FFF;
    const size_t rdata = r.Pos();
    if (rdata + rdlen > len) return R::error(MdnsError::kTruncated);

    if (rec.type == kTypePtr) {
      auto target = r.Name();
      if (!target.has_value()) return R::error(target.get_error());
      rec.target = target.value();
    } else if (rec.type == kTypeSrv) {
      uint16_t prio;
      uint16_t weight;
      if (!r.U16(&prio) || !r.U16(&weight) || !r.U16(&rec.port)) {
        return R::error(MdnsError::kTruncated);
      }
      auto target = r.Name();
      if (!target.has_value()) return R::error(target.get_error());
      rec.target = target.value();
    } else if (rec.type == kTypeTxt) {
      size_t p = rdata;
      while (p < rdata + rdlen) {
        size_t n = data[p];
        if (p + 1 + n > rdata + rdlen) return R::error(MdnsError::kTruncated);
        if (n > 0U) {
          rec.txt.emplace_back(reinterpret_cast<const char*>(data + p + 1), n);
        }
        p += 1 + n;
      }
    } else if (rec.type == kTypeA && rdlen == 4) {
      in_addr addr;
      std::memcpy(&addr.s_addr, data + rdata, 4);
      char buf[INET_ADDRSTRLEN];
      if (::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) != nullptr) {
        rec.address = buf;
      }
    }
    r.Seek(rdata + rdlen);
    msg.records.push_back(std::move(rec));
  }
  return R::success(std::move(msg));
}

/** @brief Value of "key=value" in a TXT list, empty when absent. */
inline std::string TxtValue(const std::vector<std::string>& txt,
                            const std::string& key) {
  for (const auto& item : txt) {
    if (item.size() > key.size() && item[key.size()] == '=' &&
        item.compare(0, key.size(), key) == 0) {
      return item.substr(key.size() + 1);
    }
  }
  return std::string();
}

/**
 * @brief Instances of @p service announced in @p msg.
 * @param source_ip Sender address, used when no A record is present
 */
inline std::vector<ResolvedService> ExtractServices(
    const Message& msg, const std::string& source_ip,
    const std::string& service = kServiceType) {
  std::vector<ResolvedService> out;
  for (const auto& ptr : msg.records) {
    if (ptr.type != kTypePtr || !detail::NameEqual(ptr.name, service)) continue;
    ResolvedService rs;
    rs.instance = ptr.target;
    rs.host = source_ip;
    std::string host_name;
    for (const auto& rec : msg.records) {
      if (!detail::NameEqual(rec.name, ptr.target)) continue;
      if (rec.type == kTypeSrv) {
        rs.port = rec.port;
        host_name = rec.target;
      } else if (rec.type == kTypeTxt) {
        rs.device_id = TxtValue(rec.txt, "id");
      }
    }
    if (!host_name.empty()) {
      for (const auto& rec : msg.records) {
        if (rec.type == kTypeA && !rec.address.empty() &&
            detail::NameEqual(rec.name, host_name)) {
          rs.host = rec.address;
          break;
        }
      }
    }
    if (rs.device_id.empty()) {
      const std::string prefix(kInstancePrefix);
      std::string label = ptr.target.substr(0, ptr.target.find('.'));
      if (label.compare(0, prefix.size(), prefix) == 0) {
        rs.device_id = label.substr(prefix.size());
      }
    }
    out.push_back(std::move(rs));
  }
  return out;
}

}  // namespace mdns

// ============================================================================
// MdnsDiscovery
// ============================================================================

class MdnsDiscovery {
 public:
  using ResolvedFn = void (*)(const mdns::ResolvedService& service, void* ctx);

  struct Config {
    const char* group = PEERLINK_MDNS_GROUP;
    uint16_t port = PEERLINK_MDNS_PORT;
    int32_t query_interval_ms = 10000;
    int32_t announce_interval_ms = 60000;
    int32_t poll_interval_ms = 250;
  };

  explicit MdnsDiscovery() : MdnsDiscovery(Config{}) {}
  explicit MdnsDiscovery(const Config& cfg) : config_(cfg) {}
  ~MdnsDiscovery() { Stop(); }

  MdnsDiscovery(const MdnsDiscovery&) = delete;
  MdnsDiscovery& operator=(const MdnsDiscovery&) = delete;

  /** @brief Describe the local service; call before Start(). */
  void SetLocalService(const DeviceInfo& self, uint16_t tcp_port) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_id_ = self.id;
    svc_.instance = std::string(mdns::kInstancePrefix) + self.id;
    svc_.host = svc_.instance + ".local";
    svc_.port = tcp_port;
    svc_.txt = {"id=" + self.id, "name=" + self.name,
                std::string("type=") + DeviceTypeName(self.type),
                "protocol=" + std::to_string(self.protocol_version)};
  }

  void SetResolvedCallback(ResolvedFn fn, void* ctx) noexcept {
    on_resolved_ = fn;
    resolved_ctx_ = ctx;
  }

  expected<void, MdnsError> Start(bool advertise, bool browse) {
    using R = expected<void, MdnsError>;
    if (running_.load(std::memory_order_acquire)) return R::success();

    sockfd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd_ < 0) return R::error(MdnsError::kSocketFailed);
    int opt = 1;
    (void)::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_REUSEPORT
    (void)::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt));
#endif
    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    bind_addr.sin_port = htons(config_.port);
    if (::bind(sockfd_, reinterpret_cast<sockaddr*>(&bind_addr),
               sizeof(bind_addr)) < 0) {
      CloseSocket();
      return R::error(MdnsError::kBindFailed);
    }
    ip_mreq mreq{};
    if (::inet_pton(AF_INET, config_.group, &mreq.imr_multiaddr) != 1) {
      CloseSocket();
      return R::error(MdnsError::kMulticastJoinFailed);
    }
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (::setsockopt(sockfd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq,
                     sizeof(mreq)) < 0) {
      CloseSocket();
      return R::error(MdnsError::kMulticastJoinFailed);
    }
    unsigned char ttl = 255;
    unsigned char loop = 1;
    (void)::setsockopt(sockfd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    (void)::setsockopt(sockfd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop,
                       sizeof(loop));

    advertise_.store(advertise, std::memory_order_release);
    browse_.store(browse, std::memory_order_release);
    next_query_ms_.store(0, std::memory_order_release);
    next_announce_ms_.store(0, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { Loop(); });
    PEERLINK_LOG_INFO("mdns", "started (advertise=%d browse=%d)",
                      advertise ? 1 : 0, browse ? 1 : 0);
    return R::success();
  }

  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    if (thread_.joinable()) thread_.join();
    CloseSocket();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief Advertising is only allowed on trusted networks. */
  void SetAdvertising(bool on) noexcept {
    const bool was = advertise_.exchange(on, std::memory_order_acq_rel);
    if (on && !was) next_announce_ms_.store(0, std::memory_order_release);
  }
  bool IsAdvertising() const noexcept {
    return advertise_.load(std::memory_order_acquire);
  }

  /** @brief Query again right away (after a network change). */
  void RestartBrowsing() noexcept {
    next_query_ms_.store(0, std::memory_order_release);
  }

 private:
  static int64_t NowMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }

  void CloseSocket() noexcept {
    if (sockfd_ >= 0) {
      ::close(sockfd_);
      sockfd_ = -1;
    }
  }

  void SendToGroup(const std::vector<uint8_t>& msg) {
    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.group, &dst.sin_addr) != 1) return;
    if (::sendto(sockfd_, msg.data(), msg.size(), 0,
                 reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
      PEERLINK_LOG_DEBUG("mdns", "sendto failed: %s", std::strerror(errno));
    }
  }

  void Announce() {
    std::vector<uint8_t> msg;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (svc_.instance.empty()) return;
      msg = mdns::BuildAnnouncement(svc_);
    }
    SendToGroup(msg);
  }

  void Loop() {
    std::vector<uint8_t> buf(9000);
    while (running_.load(std::memory_order_acquire)) {
      const int64_t now = NowMs();
      if (browse_.load(std::memory_order_acquire) &&
          now >= next_query_ms_.load(std::memory_order_acquire)) {
        SendToGroup(mdns::BuildQuery());
        next_query_ms_.store(now + config_.query_interval_ms,
                             std::memory_order_release);
      }
      if (advertise_.load(std::memory_order_acquire) &&
          now >= next_announce_ms_.load(std::memory_order_acquire)) {
        Announce();
        next_announce_ms_.store(now + config_.announce_interval_ms,
                                std::memory_order_release);
      }

      pollfd pfd{};
      pfd.fd = sockfd_;
      pfd.events = POLLIN;
      int rc = ::poll(&pfd, 1, config_.poll_interval_ms);
      if (rc <= 0) continue;

      sockaddr_in from{};
      socklen_t from_len = sizeof(from);
      ssize_t n = ::recvfrom(sockfd_, buf.data(), buf.size(), 0,
                             reinterpret_cast<sockaddr*>(&from), &from_len);
      if (n <= 0) continue;
      char host[INET_ADDRSTRLEN] = {0};
      (void)::inet_ntop(AF_INET, &from.sin_addr, host, sizeof(host));
      auto msg = mdns::ParseMessage(buf.data(), static_cast<size_t>(n));
      if (!msg.has_value()) continue;
      HandleMessage(msg.value(), host);
    }
  }

  void HandleMessage(const mdns::Message& msg, const std::string& source) {
    if (!msg.IsResponse()) {
      if (!advertise_.load(std::memory_order_acquire)) return;
      for (const auto& q : msg.questions) {
        if ((q.type == mdns::kTypePtr || q.type == mdns::kTypeAny) &&
            mdns::detail::NameEqual(q.name, mdns::kServiceType)) {
          Announce();
          return;
        }
      }
      return;
    }
    if (!browse_.load(std::memory_order_acquire) || on_resolved_ == nullptr) {
      return;
    }
    std::string local_id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      local_id = local_id_;
    }
    for (const auto& svc : mdns::ExtractServices(msg, source)) {
      if (!local_id.empty() && svc.instance.find(local_id) != std::string::npos) {
        continue;
      }
      PEERLINK_LOG_DEBUG("mdns", "resolved %s at %s", svc.instance.c_str(),
                         svc.host.c_str());
      on_resolved_(svc, resolved_ctx_);
    }
  }

  Config config_;
  int sockfd_ = -1;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> advertise_{false};
  std::atomic<bool> browse_{false};
  std::atomic<int64_t> next_query_ms_{0};
  std::atomic<int64_t> next_announce_ms_{0};
  std::mutex mutex_;
  std::string local_id_;
  mdns::ServiceInstance svc_;
  ResolvedFn on_resolved_ = nullptr;
  void* resolved_ctx_ = nullptr;
};

}  // namespace peerlink

#endif  // PEERLINK_MDNS_HPP_
