/**
 * @file certificate.hpp
 * @brief OpenSSL X.509 certificate and private key wrappers, self-signed
 *        identity generation and fingerprints.
 */

#ifndef PEERLINK_CERTIFICATE_HPP_
#define PEERLINK_CERTIFICATE_HPP_

#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>

namespace peerlink {

enum class CertError : uint8_t {
  kInvalidPem = 0,
  kKeyGenerationFailed,
  kCertificateGenerationFailed,
  kIoFailed,
};

// ============================================================================
// Certificate
// ============================================================================

/**
 * @brief Shared, reference-counted handle to an X509 certificate.
 *
 * Copies share the underlying X509 (X509_up_ref). An empty Certificate holds
 * nullptr.
 */
class Certificate {
 public:
  Certificate() noexcept = default;

  /** @brief Take ownership of one reference to @p x509. */
  explicit Certificate(X509* x509) noexcept : x509_(x509) {}

  Certificate(const Certificate& other) noexcept : x509_(other.x509_) {
    if (x509_ != nullptr) X509_up_ref(x509_);
  }

  Certificate(Certificate&& other) noexcept : x509_(other.x509_) {
    other.x509_ = nullptr;
  }

  Certificate& operator=(Certificate other) noexcept {
    std::swap(x509_, other.x509_);
    return *this;
  }

  ~Certificate() {
    if (x509_ != nullptr) X509_free(x509_);
  }

  static expected<Certificate, CertError> FromPem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (bio == nullptr) {
      return expected<Certificate, CertError>::error(CertError::kInvalidPem);
    }
    X509* x509 = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (x509 == nullptr) {
      return expected<Certificate, CertError>::error(CertError::kInvalidPem);
    }
    return expected<Certificate, CertError>::success(Certificate(x509));
  }

  std::string ToPem() const {
    if (x509_ == nullptr) return {};
    BIO* bio = BIO_new(BIO_s_mem());
    if (bio == nullptr) return {};
    std::string out;
    if (PEM_write_bio_X509(bio, x509_) == 1) {
      char* data = nullptr;
      long len = BIO_get_mem_data(bio, &data);
      if (len > 0) out.assign(data, static_cast<size_t>(len));
    }
    BIO_free(bio);
    return out;
  }

  /** @brief SHA-256 over the DER encoding, as "AB:CD:..." uppercase hex. */
  std::string Sha256Fingerprint() const {
    if (x509_ == nullptr) return {};
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (X509_digest(x509_, EVP_sha256(), md, &md_len) != 1) return {};
    std::string out;
    out.reserve(md_len * 3U);
    char hex[4];
    for (unsigned int i = 0; i < md_len; ++i) {
      (void)std::snprintf(hex, sizeof(hex), i == 0 ? "%02X" : ":%02X", md[i]);
      out += hex;
    }
    return out;
  }

  std::string CommonName() const {
    if (x509_ == nullptr) return {};
    X509_NAME* name = X509_get_subject_name(x509_);
    char buf[256];
    int len = X509_NAME_get_text_by_NID(name, NID_commonName, buf, sizeof(buf));
    return (len > 0) ? std::string(buf, static_cast<size_t>(len)) : std::string();
  }

  /** @brief True if the current time lies within notBefore..notAfter. */
  bool IsCurrentlyValid() const noexcept {
    if (x509_ == nullptr) return false;
    return X509_cmp_current_time(X509_get0_notBefore(x509_)) < 0 &&
           X509_cmp_current_time(X509_get0_notAfter(x509_)) > 0;
  }

  bool Empty() const noexcept { return x509_ == nullptr; }
  X509* get() const noexcept { return x509_; }

  bool operator==(const Certificate& other) const noexcept {
    if (x509_ == other.x509_) return true;
    if (x509_ == nullptr || other.x509_ == nullptr) return false;
    return X509_cmp(x509_, other.x509_) == 0;
  }
  bool operator!=(const Certificate& other) const noexcept {
    return !(*this == other);
  }

 private:
  X509* x509_ = nullptr;
};

// ============================================================================
// PrivateKey
// ============================================================================

class PrivateKey {
 public:
  PrivateKey() noexcept = default;
  explicit PrivateKey(EVP_PKEY* pkey) noexcept : pkey_(pkey) {}

  PrivateKey(const PrivateKey& other) noexcept : pkey_(other.pkey_) {
    if (pkey_ != nullptr) EVP_PKEY_up_ref(pkey_);
  }

  PrivateKey(PrivateKey&& other) noexcept : pkey_(other.pkey_) {
    other.pkey_ = nullptr;
  }

  PrivateKey& operator=(PrivateKey other) noexcept {
    std::swap(pkey_, other.pkey_);
    return *this;
  }

  ~PrivateKey() {
    if (pkey_ != nullptr) EVP_PKEY_free(pkey_);
  }

  /** @brief Generate an RSA key of @p bits bits. */
  static expected<PrivateKey, CertError> GenerateRsa(int bits = 2048) {
    using R = expected<PrivateKey, CertError>;
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (ctx == nullptr) return R::error(CertError::kKeyGenerationFailed);
    EVP_PKEY* pkey = nullptr;
    bool ok = EVP_PKEY_keygen_init(ctx) == 1 &&
              EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) == 1 &&
              EVP_PKEY_keygen(ctx, &pkey) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok || pkey == nullptr) {
      return R::error(CertError::kKeyGenerationFailed);
    }
    return R::success(PrivateKey(pkey));
  }

  static expected<PrivateKey, CertError> FromPem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (bio == nullptr) {
      return expected<PrivateKey, CertError>::error(CertError::kInvalidPem);
    }
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (pkey == nullptr) {
      return expected<PrivateKey, CertError>::error(CertError::kInvalidPem);
    }
    return expected<PrivateKey, CertError>::success(PrivateKey(pkey));
  }

  std::string ToPem() const {
    if (pkey_ == nullptr) return {};
    BIO* bio = BIO_new(BIO_s_mem());
    if (bio == nullptr) return {};
    std::string out;
    if (PEM_write_bio_PrivateKey(bio, pkey_, nullptr, nullptr, 0, nullptr,
                                 nullptr) == 1) {
      char* data = nullptr;
      long len = BIO_get_mem_data(bio, &data);
      if (len > 0) out.assign(data, static_cast<size_t>(len));
    }
    BIO_free(bio);
    return out;
  }

  bool Empty() const noexcept { return pkey_ == nullptr; }
  EVP_PKEY* get() const noexcept { return pkey_; }

 private:
  EVP_PKEY* pkey_ = nullptr;
};

// ============================================================================
// Self-signed identity certificate
// ============================================================================

#ifndef PEERLINK_CERT_ORGANIZATION
#define PEERLINK_CERT_ORGANIZATION "peerlink"
#endif

#ifndef PEERLINK_CERT_ORGANIZATIONAL_UNIT
#define PEERLINK_CERT_ORGANIZATIONAL_UNIT "peerlink device"
#endif

/**
 * @brief Create a self-signed certificate for @p key with CN = @p device_id.
 *
 * Validity runs from one year in the past to ten years in the future so that
 * peers with skewed clocks still accept it. Signed with SHA-256.
 */
inline expected<Certificate, CertError> GenerateSelfSigned(
    const PrivateKey& key, const std::string& device_id) {
  using R = expected<Certificate, CertError>;
  X509* x509 = X509_new();
  if (x509 == nullptr) return R::error(CertError::kCertificateGenerationFailed);
  Certificate cert(x509);

  constexpr long kYearSeconds = 365L * 24L * 3600L;
  unsigned char serial_bytes[4];
  if (RAND_bytes(serial_bytes, sizeof(serial_bytes)) != 1) {
    return R::error(CertError::kCertificateGenerationFailed);
  }
  uint32_t serial = 0;
  for (size_t i = 0; i < 4U; ++i) serial = (serial << 8) | serial_bytes[i];
  serial &= 0x7FFFFFFFU;

  X509_NAME* name = X509_get_subject_name(x509);
  auto add_entry = [name](const char* field, const std::string& value) {
    return X509_NAME_add_entry_by_txt(
               name, field, MBSTRING_UTF8,
               reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1,
               0) == 1;
  };

  bool ok = X509_set_version(x509, 2) == 1 &&
            ASN1_INTEGER_set(X509_get_serialNumber(x509),
                             static_cast<long>(serial)) == 1 &&
            X509_gmtime_adj(X509_getm_notBefore(x509), -kYearSeconds) !=
                nullptr &&
            X509_gmtime_adj(X509_getm_notAfter(x509), 10L * kYearSeconds) !=
                nullptr &&
            add_entry("CN", device_id) &&
            add_entry("O", PEERLINK_CERT_ORGANIZATION) &&
            add_entry("OU", PEERLINK_CERT_ORGANIZATIONAL_UNIT) &&
            X509_set_issuer_name(x509, name) == 1 &&
            X509_set_pubkey(x509, key.get()) == 1 &&
            X509_sign(x509, key.get(), EVP_sha256()) > 0;
  if (!ok) return R::error(CertError::kCertificateGenerationFailed);
  return R::success(std::move(cert));
}

}  // namespace peerlink

#endif  // PEERLINK_CERTIFICATE_HPP_
