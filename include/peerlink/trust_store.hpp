/**
 * @file trust_store.hpp
 * @brief Pinned peer certificates, last seen protocol versions and custom
 *        broadcast hosts, persisted as trusted_devices.json.
 *
 * File layout:
 * @code
 * {
 *   "devices": {
 *     "<deviceId>": {"certificate": "-----BEGIN...", "protocolVersion": 8}
 *   },
 *   "customHosts": ["192.168.1.20"]
 * }
 * @endcode
 *
 * With an empty directory the store lives in memory only. All operations are
 * thread-safe.
 */

#ifndef PEERLINK_TRUST_STORE_HPP_
#define PEERLINK_TRUST_STORE_HPP_

#include "peerlink/certificate.hpp"
#include "peerlink/file_util.hpp"
#include "peerlink/log.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/vocabulary.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace peerlink {

enum class StoreError : uint8_t {
  kIo = 0,
  kParse,
  kCertificate,
};

class TrustStore {
 public:
  static constexpr const char* kFileName = "trusted_devices.json";

  /** @param dir Data directory; empty keeps everything in memory. */
  explicit TrustStore(std::string dir = std::string()) : dir_(std::move(dir)) {}

  TrustStore(const TrustStore&) = delete;
  TrustStore& operator=(const TrustStore&) = delete;

  /**
   * @brief Read the store file. A missing file yields an empty store.
   */
  expected<void, StoreError> Load() {
    using R = expected<void, StoreError>;
    if (dir_.empty()) return R::success();
    std::string text;
    const std::string path = file::Join(dir_, kFileName);
    if (!file::Exists(path)) return R::success();
    if (!file::ReadAll(path, &text)) return R::error(StoreError::kIo);

    Json j = Json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return R::error(StoreError::kParse);

    std::map<std::string, Entry> devices;
    std::vector<std::string> hosts;
    auto devs = j.find("devices");
    if (devs != j.end() && devs->is_object()) {
      for (auto it = devs->begin(); it != devs->end(); ++it) {
        if (!it->is_object()) continue;
        auto pem = it->find("certificate");
        if (pem == it->end() || !pem->is_string()) continue;
        auto cert = Certificate::FromPem(pem->get<std::string>());
        if (!cert.has_value()) {
          PEERLINK_LOG_WARN("trust", "dropping unreadable certificate of %s",
                            it.key().c_str());
          continue;
        }
        Entry e;
        e.certificate = cert.value();
        auto ver = it->find("protocolVersion");
        if (ver != it->end() && ver->is_number_integer()) {
          e.protocol_version = ver->get<int32_t>();
        }
        devices[it.key()] = e;
      }
    }
    auto list = j.find("customHosts");
    if (list != j.end() && list->is_array()) {
      for (const auto& h : *list) {
        if (h.is_string()) hosts.push_back(h.get<std::string>());
      }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(devices);
    custom_hosts_ = std::move(hosts);
    return R::success();
  }

  expected<void, StoreError> Save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SaveLocked();
  }

  bool IsTrusted(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.find(device_id) != devices_.end();
  }

  /** @brief Pin @p cert for @p device_id (replaces any previous pin). */
  expected<void, StoreError> Trust(const std::string& device_id,
                                   const Certificate& cert,
                                   int32_t protocol_version) {
    if (cert.Empty()) {
      return expected<void, StoreError>::error(StoreError::kCertificate);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& e = devices_[device_id];
    e.certificate = cert;
    e.protocol_version = protocol_version;
    PEERLINK_LOG_INFO("trust", "trusted %s (%s)", device_id.c_str(),
                      cert.Sha256Fingerprint().c_str());
    return SaveLocked();
  }

  expected<void, StoreError> Untrust(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.erase(device_id) == 0U) {
      return expected<void, StoreError>::success();
    }
    PEERLINK_LOG_INFO("trust", "untrusted %s", device_id.c_str());
    return SaveLocked();
  }

  /** @return Pinned certificate, or an empty one if not trusted. */
  Certificate PinnedCertificate(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    return (it != devices_.end()) ? it->second.certificate : Certificate();
  }

  /** @return Persisted protocol version, 0 when unknown. */
  int32_t LastProtocolVersion(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    return (it != devices_.end()) ? it->second.protocol_version : 0;
  }

  /** @brief No-op for devices that are not trusted. */
  expected<void, StoreError> SetProtocolVersion(const std::string& device_id,
                                                int32_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end() || it->second.protocol_version == version) {
      return expected<void, StoreError>::success();
    }
    it->second.protocol_version = version;
    return SaveLocked();
  }

  std::vector<std::string> CustomHosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custom_hosts_;
  }

  expected<void, StoreError> AddCustomHost(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (host.empty() || std::find(custom_hosts_.begin(), custom_hosts_.end(),
                                  host) != custom_hosts_.end()) {
      return expected<void, StoreError>::success();
    }
    custom_hosts_.push_back(host);
    return SaveLocked();
  }

  expected<void, StoreError> RemoveCustomHost(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(custom_hosts_.begin(), custom_hosts_.end(), host);
    if (it == custom_hosts_.end()) return expected<void, StoreError>::success();
    custom_hosts_.erase(it);
    return SaveLocked();
  }

  std::vector<std::string> TrustedDeviceIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& kv : devices_) ids.push_back(kv.first);
    return ids;
  }

 private:
  struct Entry {
    Certificate certificate;
    int32_t protocol_version = 0;
  };

  expected<void, StoreError> SaveLocked() const {
    using R = expected<void, StoreError>;
    if (dir_.empty()) return R::success();
    Json devices = Json::object();
    for (const auto& kv : devices_) {
      Json e = Json::object();
      e["certificate"] = kv.second.certificate.ToPem();
      e["protocolVersion"] = kv.second.protocol_version;
      devices[kv.first] = std::move(e);
    }
    Json j = Json::object();
    j["devices"] = std::move(devices);
    j["customHosts"] = custom_hosts_;
    if (!file::MakeDirectories(dir_) ||
        !file::WriteAll(file::Join(dir_, kFileName), j.dump(2) + "\n", 0600)) {
      PEERLINK_LOG_ERROR("trust", "failed to write %s", kFileName);
      return R::error(StoreError::kIo);
    }
    return R::success();
  }

  std::string dir_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> devices_;
  std::vector<std::string> custom_hosts_;
};

}  // namespace peerlink

#endif  // PEERLINK_TRUST_STORE_HPP_
