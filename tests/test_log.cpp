/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "peerlink/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("log - default level depends on build type", "[log]") {
#ifdef NDEBUG
  REQUIRE(peerlink::log::GetLevel() == peerlink::log::Level::kInfo);
#else
  REQUIRE(peerlink::log::GetLevel() == peerlink::log::Level::kDebug);
#endif
}

TEST_CASE("log - SetLevel round trip", "[log]") {
  auto prev = peerlink::log::GetLevel();
  peerlink::log::SetLevel(peerlink::log::Level::kError);
  REQUIRE(peerlink::log::GetLevel() == peerlink::log::Level::kError);
  peerlink::log::SetLevel(prev);
}

TEST_CASE("log - Init and Shutdown", "[log]") {
  REQUIRE_FALSE(peerlink::log::IsInitialized());
  peerlink::log::Init();
  REQUIRE(peerlink::log::IsInitialized());
  peerlink::log::Shutdown();
  REQUIRE_FALSE(peerlink::log::IsInitialized());
}

TEST_CASE("log - ParseLevel names and fallback", "[log]") {
  using peerlink::log::Level;
  using peerlink::log::ParseLevel;
  REQUIRE(ParseLevel("debug", Level::kOff) == Level::kDebug);
  REQUIRE(ParseLevel("info", Level::kOff) == Level::kInfo);
  REQUIRE(ParseLevel("warn", Level::kOff) == Level::kWarn);
  REQUIRE(ParseLevel("error", Level::kOff) == Level::kError);
  REQUIRE(ParseLevel("off", Level::kDebug) == Level::kOff);
  REQUIRE(ParseLevel("verbose", Level::kWarn) == Level::kWarn);
  REQUIRE(ParseLevel(nullptr, Level::kInfo) == Level::kInfo);
}

TEST_CASE("log - macros run at every level", "[log]") {
  auto prev = peerlink::log::GetLevel();
  peerlink::log::SetLevel(peerlink::log::Level::kDebug);
  PEERLINK_LOG_DEBUG("test", "debug %d", 1);
  PEERLINK_LOG_INFO("test", "info %s", "msg");
  PEERLINK_LOG_WARN("test", "warn");
  PEERLINK_LOG_ERROR("test", "error %d %d", 1, 2);
  peerlink::log::SetLevel(peerlink::log::Level::kOff);
  PEERLINK_LOG_ERROR("test", "filtered");
  peerlink::log::SetLevel(prev);
  SUCCEED();
}

TEST_CASE("log - long message is truncated safely", "[log]") {
  std::string big(4096, 'x');
  PEERLINK_LOG_INFO("test", "%s", big.c_str());
  SUCCEED();
}
