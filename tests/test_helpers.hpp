/**
 * @file test_helpers.hpp
 * @brief Shared fixtures: scratch directories and cached local identities.
 */

#ifndef PEERLINK_TESTS_TEST_HELPERS_HPP_
#define PEERLINK_TESTS_TEST_HELPERS_HPP_

#include "peerlink/device_info.hpp"
#include "peerlink/local_device.hpp"
#include "peerlink/net.hpp"
#include "peerlink/tls.hpp"

#include <cstdlib>
#include <dirent.h>
#include <memory>
#include <string>
#include <thread>
#include <sys/stat.h>
#include <unistd.h>

namespace test {

/** @brief mkdtemp() directory removed (one level deep) on destruction. */
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/peerlink_test_XXXXXX";
    const char* p = ::mkdtemp(tmpl);
    path_ = (p != nullptr) ? p : "";
  }

  ~TempDir() {
    if (path_.empty()) return;
    DIR* d = ::opendir(path_.c_str());
    if (d != nullptr) {
      while (struct dirent* e = ::readdir(d)) {
        std::string name = e->d_name;
        if (name == "." || name == "..") continue;
        (void)::unlink((path_ + "/" + name).c_str());
      }
      ::closedir(d);
    }
    (void)::rmdir(path_.c_str());
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& Path() const noexcept { return path_; }

 private:
  std::string path_;
};

/** @brief In-memory identity; RSA key generation dominates test time. */
inline peerlink::LocalDevice MakeDevice(const std::string& name) {
  auto dev = peerlink::LocalDevice::Generate(name, peerlink::DeviceType::kLaptop);
  return dev.has_value() ? std::move(dev).value() : peerlink::LocalDevice();
}

/** @brief Identity plus the TLS context built from it. */
struct Endpoint {
  peerlink::LocalDevice device;
  std::shared_ptr<peerlink::TlsContext> ctx;
};

inline Endpoint MakeEndpoint(const std::string& name) {
  Endpoint ep;
  ep.device = MakeDevice(name);
  auto ctx = peerlink::TlsContext::Create(ep.device.Cert(), ep.device.Key());
  if (ctx.has_value()) ep.ctx = std::move(ctx).value();
  return ep;
}

/** @brief Both ends of one loopback TCP connection. */
struct TcpPair {
  peerlink::net::TcpClient client;
  peerlink::net::TcpClient server;
};

inline TcpPair ConnectLoopback() {
  TcpPair pair;
  auto listener = peerlink::net::TcpServer::Listen(0);
  if (!listener.has_value()) return pair;
  peerlink::net::TcpServer acc = std::move(listener).value();
  auto c = peerlink::net::TcpClient::Connect("127.0.0.1", acc.LocalPort(), 1000);
  if (!c.has_value()) return pair;
  pair.client = std::move(c).value();
  auto a = acc.Accept(1000);
  if (a.has_value()) pair.server = std::move(a).value();
  return pair;
}

/** @brief Established TLS session; @c client belongs to @p client_ep. */
struct TlsPair {
  std::shared_ptr<peerlink::TlsStream> client;
  std::shared_ptr<peerlink::TlsStream> server;
};

/**
 * @brief Loopback TLS session with both certificates pinned.
 * Members are null when any step failed.
 */
inline TlsPair HandshakeLoopback(const Endpoint& client_ep,
                                 const Endpoint& server_ep) {
  TlsPair out;
  TcpPair tcp = ConnectLoopback();
  if (!tcp.client.IsOpen() || !tcp.server.IsOpen()) return out;

  peerlink::TlsPeerPolicy server_policy;
  server_policy.pinned = client_ep.device.Cert();
  server_policy.require_client_cert = true;
  std::thread server_thread([&]() {
    auto r = peerlink::TlsStream::Handshake(
        server_ep.ctx, std::move(tcp.server), peerlink::TlsRole::kServer,
        server_policy, 3000);
    if (r.has_value()) out.server = r.value();
  });

  peerlink::TlsPeerPolicy client_policy;
  client_policy.pinned = server_ep.device.Cert();
  auto r = peerlink::TlsStream::Handshake(
      client_ep.ctx, std::move(tcp.client), peerlink::TlsRole::kClient,
      client_policy, 3000);
  server_thread.join();
  if (r.has_value()) out.client = r.value();
  return out;
}

}  // namespace test

#endif  // PEERLINK_TESTS_TEST_HELPERS_HPP_
