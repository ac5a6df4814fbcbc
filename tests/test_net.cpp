/**
 * @file test_net.cpp
 * @brief Tests for net.hpp (sockpp integration layer).
 */

#include "peerlink/net.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

using namespace peerlink::net;

TEST_CASE("net - TCP connect, accept and line exchange", "[net][tcp]") {
  auto server_r = TcpServer::Listen(0);
  REQUIRE(server_r.has_value());
  TcpServer server = std::move(server_r).value();
  const uint16_t port = server.LocalPort();
  REQUIRE(port > 0);

  std::atomic<bool> client_ok{false};
  std::thread client([port, &client_ok]() {
    auto c = TcpClient::Connect("127.0.0.1", port, 1000);
    if (!c.has_value()) return;
    TcpClient sock = std::move(c).value();
    if (!sock.SendAll("{\"hello\":1}\nrest").has_value()) return;
    auto reply = sock.ReadLine(64, 2000);
    client_ok.store(reply.has_value() && reply.value() == "ok\n");
  });

  auto accepted = server.Accept(2000);
  REQUIRE(accepted.has_value());
  TcpClient peer = std::move(accepted).value();
  REQUIRE(peer.PeerHost() == "127.0.0.1");
  peer.SetKeepAlive();

  auto line = peer.ReadLine(64, 2000);
  REQUIRE(line.has_value());
  REQUIRE(line.value() == "{\"hello\":1}\n");

  // Bytes after the newline stay in the socket.
  char rest[8] = {};
  size_t got = 0;
  while (got < 4) {
    int n = static_cast<int>(::recv(peer.Fd(), rest + got, 4 - got, 0));
    if (n <= 0) break;
    got += static_cast<size_t>(n);
  }
  REQUIRE(std::string(rest, got) == "rest");

  REQUIRE(peer.SendAll("ok\n").has_value());
  client.join();
  REQUIRE(client_ok.load());
}

TEST_CASE("net - ReadLine reports timeout and line limit", "[net][tcp]") {
  auto server_r = TcpServer::Listen(0);
  REQUIRE(server_r.has_value());
  TcpServer server = std::move(server_r).value();

  auto c = TcpClient::Connect("127.0.0.1", server.LocalPort(), 1000);
  REQUIRE(c.has_value());
  TcpClient client = std::move(c).value();
  auto a = server.Accept(1000);
  REQUIRE(a.has_value());
  TcpClient peer = std::move(a).value();

  auto timed_out = peer.ReadLine(64, 50);
  REQUIRE_FALSE(timed_out.has_value());
  REQUIRE(timed_out.get_error() == NetError::kTimeout);

  REQUIRE(client.SendAll("0123456789\n").has_value());
  auto too_long = peer.ReadLine(4, 1000);
  REQUIRE_FALSE(too_long.has_value());
  REQUIRE(too_long.get_error() == NetError::kLineTooLong);

  auto rest = peer.ReadLine(64, 1000);
  REQUIRE(rest.has_value());
  REQUIRE(rest.value() == "456789\n");

  client.Close();
  auto eof = peer.ReadLine(64, 1000);
  REQUIRE_FALSE(eof.has_value());
  REQUIRE(eof.get_error() == NetError::kClosed);
}

TEST_CASE("net - Accept times out without clients", "[net][tcp]") {
  auto server_r = TcpServer::Listen(0);
  REQUIRE(server_r.has_value());
  auto r = server_r.value().Accept(20);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == NetError::kTimeout);
}

TEST_CASE("net - ListenOnFreePort skips ports in use", "[net][tcp]") {
  auto first_r = TcpServer::Listen(0);
  REQUIRE(first_r.has_value());
  TcpServer first = std::move(first_r).value();
  const uint16_t taken = first.LocalPort();
  REQUIRE(taken < 65535);

  auto second = TcpServer::ListenOnFreePort(taken, taken, false);
  REQUIRE_FALSE(second.has_value());
  REQUIRE(second.get_error() == NetError::kListenFailed);

  auto eph = TcpServer::ListenOnFreePort(taken, taken, true);
  REQUIRE(eph.has_value());
  REQUIRE(eph.value().LocalPort() != taken);
}

TEST_CASE("net - connect to closed port fails", "[net][tcp]") {
  uint16_t port = 0;
  {
    auto s = TcpServer::Listen(0);
    REQUIRE(s.has_value());
    port = s.value().LocalPort();
  }
  auto c = TcpClient::Connect("127.0.0.1", port, 500);
  REQUIRE_FALSE(c.has_value());
  REQUIRE(c.get_error() == NetError::kConnectFailed);
}

TEST_CASE("net - UDP datagram on loopback", "[net][udp]") {
  auto rx_r = UdpPeer::Bind(0);
  REQUIRE(rx_r.has_value());
  UdpPeer rx = std::move(rx_r).value();
  auto tx_r = UdpPeer::Create();
  REQUIRE(tx_r.has_value());
  UdpPeer tx = std::move(tx_r).value();

  const std::string msg = "identity";
  auto sent = tx.SendTo(msg.data(), msg.size(), "127.0.0.1", rx.LocalPort());
  REQUIRE(sent.has_value());
  REQUIRE(sent.value() == msg.size());

  char buf[64];
  std::string from;
  auto got = rx.RecvFrom(buf, sizeof(buf), &from, 1000);
  REQUIRE(got.has_value());
  REQUIRE(std::string(buf, got.value()) == msg);
  REQUIRE(from == "127.0.0.1");

  auto idle = rx.RecvFrom(buf, sizeof(buf), nullptr, 20);
  REQUIRE_FALSE(idle.has_value());
  REQUIRE(idle.get_error() == NetError::kTimeout);
}
