/**
 * @file test_task_pool.cpp
 * @brief Tests for task_pool.hpp
 */

#include "peerlink/task_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

TEST_CASE("task pool - Stop joins every spawned task", "[task_pool]") {
  peerlink::TaskPool pool;
  std::atomic<int> done{0};
  for (int i = 0; i < 16; ++i) {
    REQUIRE(pool.Spawn([&done]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      done.fetch_add(1);
    }));
  }
  pool.Stop();
  REQUIRE(done.load() == 16);
  REQUIRE(pool.Size() == 0U);
  REQUIRE(pool.IsStopped());
}

TEST_CASE("task pool - Spawn is refused after Stop until Restart",
          "[task_pool]") {
  peerlink::TaskPool pool;
  pool.Stop();
  std::atomic<bool> ran{false};
  REQUIRE_FALSE(pool.Spawn([&ran]() { ran.store(true); }));
  pool.Restart();
  REQUIRE_FALSE(pool.IsStopped());
  REQUIRE(pool.Spawn([&ran]() { ran.store(true); }));
  pool.Stop();
  REQUIRE(ran.load());
}

TEST_CASE("task pool - finished tasks are reaped on the next Spawn",
          "[task_pool]") {
  peerlink::TaskPool pool;
  std::atomic<int> done{0};
  for (int i = 0; i < 4; ++i) {
    REQUIRE(pool.Spawn([&done]() { done.fetch_add(1); }));
  }
  for (int i = 0; i < 200 && done.load() < 4; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  REQUIRE(done.load() == 4);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(pool.Spawn([]() {}));
  REQUIRE(pool.Size() == 1U);
  pool.Stop();
}

TEST_CASE("task pool - tasks may spawn further tasks", "[task_pool]") {
  peerlink::TaskPool pool;
  std::atomic<int> depth{0};
  REQUIRE(pool.Spawn([&pool, &depth]() {
    depth.fetch_add(1);
    (void)pool.Spawn([&depth]() { depth.fetch_add(1); });
  }));
  for (int i = 0; i < 200 && depth.load() < 2; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  pool.Stop();
  REQUIRE(depth.load() == 2);
}
