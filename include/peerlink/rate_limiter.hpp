/**
 * @file rate_limiter.hpp
 * @brief Per-key connection throttle with lazy, bounded eviction.
 */

#ifndef PEERLINK_RATE_LIMITER_HPP_
#define PEERLINK_RATE_LIMITER_HPP_

#include "peerlink/platform.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#ifndef PEERLINK_RATE_LIMIT_WINDOW_MS
#define PEERLINK_RATE_LIMIT_WINDOW_MS 1000
#endif

#ifndef PEERLINK_RATE_LIMIT_MAX_ENTRIES
#define PEERLINK_RATE_LIMIT_MAX_ENTRIES 255U
#endif

namespace peerlink {

/// Monotonic millisecond clock; replaceable for tests.
using RateClockFn = int64_t (*)(void* ctx);

/**
 * @brief Remembers when each key was last let through.
 *
 * Check(key) answers "should this event be discarded?": true while the key
 * was accepted less than window_ms ago, otherwise the key is stamped with the
 * current time and false is returned. Once the ledger holds more than
 * max_entries keys, every write also sweeps entries older than the window.
 *
 * Thread-safe.
 */
template <typename Key = std::string>
class RateLimiter {
 public:
  explicit RateLimiter(int64_t window_ms = PEERLINK_RATE_LIMIT_WINDOW_MS,
                       uint32_t max_entries = PEERLINK_RATE_LIMIT_MAX_ENTRIES)
      : window_ms_(window_ms), max_entries_(max_entries) {}

  void SetClock(RateClockFn fn, void* ctx) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = fn;
    clock_ctx_ = ctx;
  }

  bool Check(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = Now();
    auto it = last_.find(key);
    if (it != last_.end() && it->second + window_ms_ > now) {
      return true;
    }
    last_[key] = now;
    if (last_.size() > max_entries_) {
      for (auto e = last_.begin(); e != last_.end();) {
        if (e->second + window_ms_ < now) {
          e = last_.erase(e);
        } else {
          ++e;
        }
      }
    }
    return false;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_.size();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_.clear();
  }

  int64_t WindowMs() const noexcept { return window_ms_; }

 private:
  int64_t Now() const noexcept {
    if (clock_ != nullptr) return clock_(clock_ctx_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }

  const int64_t window_ms_;
  const uint32_t max_entries_;
  RateClockFn clock_ = nullptr;
  void* clock_ctx_ = nullptr;
  mutable std::mutex mutex_;
  std::unordered_map<Key, int64_t> last_;
};

}  // namespace peerlink

#endif  // PEERLINK_RATE_LIMITER_HPP_
