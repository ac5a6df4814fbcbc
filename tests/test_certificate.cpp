/**
 * @file test_certificate.cpp
 * @brief Tests for certificate.hpp
 */

#include "peerlink/certificate.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

const char* kId = "0123456789abcdef0123456789abcdef";

struct Credentials {
  peerlink::PrivateKey key;
  peerlink::Certificate cert;
};

Credentials Make(const std::string& cn) {
  Credentials c;
  auto key = peerlink::PrivateKey::GenerateRsa(2048);
  REQUIRE(key.has_value());
  c.key = key.value();
  auto cert = peerlink::GenerateSelfSigned(c.key, cn);
  REQUIRE(cert.has_value());
  c.cert = cert.value();
  return c;
}

}  // namespace

TEST_CASE("certificate - self-signed carries the device id", "[certificate]") {
  Credentials c = Make(kId);
  REQUIRE_FALSE(c.cert.Empty());
  REQUIRE(c.cert.CommonName() == kId);
  REQUIRE(c.cert.IsCurrentlyValid());
}

TEST_CASE("certificate - PEM round trip keeps identity", "[certificate]") {
  Credentials c = Make(kId);
  std::string pem = c.cert.ToPem();
  REQUIRE(pem.find("BEGIN CERTIFICATE") != std::string::npos);
  auto back = peerlink::Certificate::FromPem(pem);
  REQUIRE(back.has_value());
  REQUIRE(back.value() == c.cert);
  REQUIRE(back.value().Sha256Fingerprint() == c.cert.Sha256Fingerprint());

  auto key = peerlink::PrivateKey::FromPem(c.key.ToPem());
  REQUIRE(key.has_value());
  REQUIRE_FALSE(key.value().Empty());
}

TEST_CASE("certificate - fingerprint format", "[certificate]") {
  Credentials c = Make(kId);
  std::string fp = c.cert.Sha256Fingerprint();
  REQUIRE(fp.size() == 32U * 3U - 1U);
  for (size_t i = 2; i < fp.size(); i += 3) REQUIRE(fp[i] == ':');
  for (char ch : fp) {
    bool ok = ch == ':' || (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'F');
    REQUIRE(ok);
  }
}

TEST_CASE("certificate - distinct keys give distinct certificates",
          "[certificate]") {
  Credentials a = Make(kId);
  Credentials b = Make(kId);
  REQUIRE(a.cert != b.cert);
  REQUIRE(a.cert.Sha256Fingerprint() != b.cert.Sha256Fingerprint());
  peerlink::Certificate copy = a.cert;
  REQUIRE(copy == a.cert);
}

TEST_CASE("certificate - invalid PEM and empty handles", "[certificate]") {
  auto bad = peerlink::Certificate::FromPem("-----BEGIN CERTIFICATE-----\nxx");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error() == peerlink::CertError::kInvalidPem);
  REQUIRE_FALSE(peerlink::PrivateKey::FromPem("nope").has_value());

  peerlink::Certificate empty;
  REQUIRE(empty.Empty());
  REQUIRE(empty.ToPem().empty());
  REQUIRE(empty.Sha256Fingerprint().empty());
  REQUIRE_FALSE(empty.IsCurrentlyValid());
  REQUIRE(empty == peerlink::Certificate());
}
