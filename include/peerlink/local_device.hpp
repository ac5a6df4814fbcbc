/**
 * @file local_device.hpp
 * @brief Identity of this device: id, name, type, capabilities, key and
 *        self-signed certificate.
 *
 * Data directory layout:
 *   device.json       {"deviceId": ..., "deviceName": ..., "deviceType": ...}
 *   certificate.pem   X.509, CN = deviceId
 *   private_key.pem   RSA-2048 (mode 0600)
 */

#ifndef PEERLINK_LOCAL_DEVICE_HPP_
#define PEERLINK_LOCAL_DEVICE_HPP_

#include "peerlink/certificate.hpp"
#include "peerlink/device_info.hpp"
#include "peerlink/file_util.hpp"
#include "peerlink/log.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <openssl/rand.h>

#include <set>
#include <string>
#include <utility>

namespace peerlink {

/** @brief Random UUID (version 4) in lowercase hex without dashes. */
inline std::string GenerateDeviceId() {
  unsigned char raw[16];
  if (RAND_bytes(raw, sizeof(raw)) != 1) return std::string();
  raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40);
  raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80);
  static const char kHex[] = "0123456789abcdef";
  std::string id;
  id.reserve(32);
  for (unsigned char b : raw) {
    id.push_back(kHex[b >> 4]);
    id.push_back(kHex[b & 0x0F]);
  }
  return id;
}

class LocalDevice {
 public:
  LocalDevice() = default;

  /** @brief Fresh in-memory identity (nothing persisted). */
  static expected<LocalDevice, CertError> Generate(const std::string& name,
                                                   DeviceType type) {
    using R = expected<LocalDevice, CertError>;
    LocalDevice dev;
    dev.id_ = GenerateDeviceId();
    if (dev.id_.empty()) return R::error(CertError::kKeyGenerationFailed);
    dev.name_ = FilterDeviceName(name);
    dev.type_ = type;
    auto rc = dev.RegenerateCredentials();
    if (!rc.has_value()) return R::error(rc.get_error());
    return R::success(std::move(dev));
  }

  /**
   * @brief Load the identity from @p dir, creating whatever is missing.
   *
   * A non-empty @p name overrides the stored name. The key pair is
   * regenerated when the certificate CN does not match the id or the
   * certificate is no longer valid.
   */
  static expected<LocalDevice, CertError> LoadOrCreate(const std::string& dir,
                                                       const std::string& name,
                                                       DeviceType type) {
    using R = expected<LocalDevice, CertError>;
    if (!file::MakeDirectories(dir)) {
      PEERLINK_LOG_ERROR("device", "cannot create data directory %s",
                         dir.c_str());
      return R::error(CertError::kIoFailed);
    }
    LocalDevice dev;
    dev.dir_ = dir;
    dev.type_ = type;

    std::string text;
    if (file::ReadAll(file::Join(dir, "device.json"), &text)) {
      Json j = Json::parse(text, nullptr, false);
      if (!j.is_discarded() && j.is_object()) {
        auto id = j.find("deviceId");
        if (id != j.end() && id->is_string()) dev.id_ = id->get<std::string>();
        auto nm = j.find("deviceName");
        if (nm != j.end() && nm->is_string()) {
          dev.name_ = nm->get<std::string>();
        }
        auto ty = j.find("deviceType");
        if (ty != j.end() && ty->is_string()) {
          dev.type_ = ParseDeviceType(ty->get<std::string>());
        }
      }
    }
    if (!IsValidDeviceId(dev.id_)) {
      dev.id_ = GenerateDeviceId();
      if (dev.id_.empty()) return R::error(CertError::kKeyGenerationFailed);
      PEERLINK_LOG_INFO("device", "generated device id %s", dev.id_.c_str());
    }
    if (!name.empty()) dev.name_ = FilterDeviceName(name);
    if (dev.name_.empty()) dev.name_ = "peerlink";

    bool need_new = true;
    std::string cert_pem;
    std::string key_pem;
    if (file::ReadAll(file::Join(dir, "certificate.pem"), &cert_pem) &&
        file::ReadAll(file::Join(dir, "private_key.pem"), &key_pem)) {
      auto cert = Certificate::FromPem(cert_pem);
      auto key = PrivateKey::FromPem(key_pem);
      if (cert.has_value() && key.has_value()) {
        if (cert.value().CommonName() != dev.id_) {
          PEERLINK_LOG_WARN("device", "certificate CN does not match id");
        } else if (!cert.value().IsCurrentlyValid()) {
          PEERLINK_LOG_WARN("device", "certificate expired");
        } else {
          dev.cert_ = cert.value();
          dev.key_ = key.value();
          need_new = false;
        }
      }
    }
    if (need_new) {
      auto rc = dev.RegenerateCredentials();
      if (!rc.has_value()) return R::error(rc.get_error());
      if (!file::WriteAll(file::Join(dir, "private_key.pem"), dev.key_.ToPem(),
                          0600) ||
          !file::WriteAll(file::Join(dir, "certificate.pem"),
                          dev.cert_.ToPem())) {
        return R::error(CertError::kIoFailed);
      }
    }
    if (!dev.SaveDescriptor()) return R::error(CertError::kIoFailed);
    PEERLINK_LOG_INFO("device", "local device %s (%s), cert %s",
                      dev.id_.c_str(), dev.name_.c_str(),
                      dev.cert_.Sha256Fingerprint().c_str());
    return R::success(std::move(dev));
  }

  const std::string& Id() const noexcept { return id_; }
  const std::string& Name() const noexcept { return name_; }
  DeviceType Type() const noexcept { return type_; }
  const Certificate& Cert() const noexcept { return cert_; }
  const PrivateKey& Key() const noexcept { return key_; }
  const std::string& DataDir() const noexcept { return dir_; }

  void SetCapabilities(std::set<std::string> incoming,
                       std::set<std::string> outgoing) {
    incoming_ = std::move(incoming);
    outgoing_ = std::move(outgoing);
  }

  DeviceInfo Info() const {
    DeviceInfo info;
    info.id = id_;
    info.name = name_;
    info.type = type_;
    info.protocol_version = kProtocolVersion;
    info.incoming_capabilities = incoming_;
    info.outgoing_capabilities = outgoing_;
    info.certificate = cert_;
    return info;
  }

  Packet IdentityPacket() const { return Info().ToIdentityPacket(); }

 private:
  expected<void, CertError> RegenerateCredentials() {
    auto key = PrivateKey::GenerateRsa(2048);
    if (!key.has_value()) return expected<void, CertError>::error(key.get_error());
    auto cert = GenerateSelfSigned(key.value(), id_);
    if (!cert.has_value()) {
      return expected<void, CertError>::error(cert.get_error());
    }
    key_ = key.value();
    cert_ = cert.value();
    return expected<void, CertError>::success();
  }

  bool SaveDescriptor() const {
    Json j = Json::object();
    j["deviceId"] = id_;
    j["deviceName"] = name_;
    j["deviceType"] = DeviceTypeName(type_);
    return file::WriteAll(file::Join(dir_, "device.json"), j.dump(2) + "\n");
  }

  std::string id_;
  std::string name_;
  DeviceType type_ = DeviceType::kDesktop;
  std::set<std::string> incoming_;
  std::set<std::string> outgoing_;
  Certificate cert_;
  PrivateKey key_;
  std::string dir_;
};

}  // namespace peerlink

#endif  // PEERLINK_LOCAL_DEVICE_HPP_
