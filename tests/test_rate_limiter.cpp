/**
 * @file test_rate_limiter.cpp
 * @brief Tests for rate_limiter.hpp
 */

#include "peerlink/rate_limiter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

int64_t FakeClock(void* ctx) { return *static_cast<int64_t*>(ctx); }

}  // namespace

TEST_CASE("rate limiter - first event passes, repeat inside window is dropped",
          "[rate_limiter]") {
  int64_t now = 10000;
  peerlink::RateLimiter<std::string> limiter(1000, 255);
  limiter.SetClock(&FakeClock, &now);

  REQUIRE_FALSE(limiter.Check("10.0.0.2"));
  now += 999;
  REQUIRE(limiter.Check("10.0.0.2"));
  REQUIRE_FALSE(limiter.Check("10.0.0.3"));
  now += 1;
  REQUIRE_FALSE(limiter.Check("10.0.0.2"));
}

TEST_CASE("rate limiter - dropped events do not extend the window",
          "[rate_limiter]") {
  int64_t now = 0;
  peerlink::RateLimiter<std::string> limiter(1000, 255);
  limiter.SetClock(&FakeClock, &now);
  REQUIRE_FALSE(limiter.Check("a"));
  now = 500;
  REQUIRE(limiter.Check("a"));
  now = 1000;
  REQUIRE_FALSE(limiter.Check("a"));
}

TEST_CASE("rate limiter - stale entries are evicted past the bound",
          "[rate_limiter]") {
  int64_t now = 0;
  peerlink::RateLimiter<int> limiter(100, 4);
  limiter.SetClock(&FakeClock, &now);
  for (int i = 0; i < 4; ++i) REQUIRE_FALSE(limiter.Check(i));
  REQUIRE(limiter.Size() == 4U);

  now = 1000;
  REQUIRE_FALSE(limiter.Check(99));
  REQUIRE(limiter.Size() == 1U);
}

TEST_CASE("rate limiter - fresh entries survive eviction", "[rate_limiter]") {
  int64_t now = 0;
  peerlink::RateLimiter<int> limiter(1000, 2);
  limiter.SetClock(&FakeClock, &now);
  REQUIRE_FALSE(limiter.Check(1));
  REQUIRE_FALSE(limiter.Check(2));
  REQUIRE_FALSE(limiter.Check(3));
  REQUIRE(limiter.Size() == 3U);
}

TEST_CASE("rate limiter - zero window never drops", "[rate_limiter]") {
  peerlink::RateLimiter<std::string> limiter(0, 255);
  REQUIRE_FALSE(limiter.Check("x"));
  REQUIRE_FALSE(limiter.Check("x"));
}

TEST_CASE("rate limiter - concurrent checks admit one per key",
          "[rate_limiter]") {
  peerlink::RateLimiter<std::string> limiter(60000, 255);
  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      if (!limiter.Check("same")) admitted.fetch_add(1);
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(admitted.load() == 1);
  limiter.Clear();
  REQUIRE(limiter.Size() == 0U);
}
