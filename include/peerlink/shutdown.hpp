/**
 * @file shutdown.hpp
 * @brief Signal-driven shutdown for the daemon: SIGINT/SIGTERM wake a
 *        blocked WaitForShutdown(), which then runs cleanup steps LIFO.
 *
 * The handler only writes one byte to a pipe, so it stays
 * async-signal-safe.
 */

#ifndef PEERLINK_SHUTDOWN_HPP_
#define PEERLINK_SHUTDOWN_HPP_

#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <unistd.h>

#ifndef PEERLINK_SHUTDOWN_MAX_CALLBACKS
#define PEERLINK_SHUTDOWN_MAX_CALLBACKS 16U
#endif

namespace peerlink {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Cleanup step; @p signo is 0 after Quit().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

inline ShutdownManager*& ShutdownInstance() {
  static ShutdownManager* instance = nullptr;
  return instance;
}

}  // namespace detail

/**
 * @brief Process-wide shutdown coordinator; at most one active instance.
 *
 * @code
 *   peerlink::ShutdownManager shutdown;
 *   shutdown.Register(&StopProvider, &provider);
 *   shutdown.InstallSignalHandlers();
 *   shutdown.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  ShutdownManager() noexcept {
    if (detail::ShutdownInstance() != nullptr) return;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::ShutdownInstance() == this) {
      detail::ShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  /** @brief False for a second instance or when pipe(2) failed. */
  bool IsValid() const noexcept { return valid_; }

  /** @brief Add a cleanup step; steps run in reverse registration order. */
  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx = nullptr) noexcept {
    using R = expected<void, ShutdownError>;
    if (!valid_) return R::error(ShutdownError::kAlreadyInstantiated);
    if (fn == nullptr || count_ >= PEERLINK_SHUTDOWN_MAX_CALLBACKS) {
      return R::error(ShutdownError::kCallbacksFull);
    }
    entries_[count_].fn = fn;
    entries_[count_].ctx = ctx;
    ++count_;
    return R::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    using R = expected<void, ShutdownError>;
    if (!valid_) return R::error(ShutdownError::kAlreadyInstantiated);

    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return R::error(ShutdownError::kSignalInstallFailed);
    }
    // Peers vanishing mid-write must not kill the daemon.
    struct sigaction ign;
    ign.sa_handler = SIG_IGN;
    ::sigemptyset(&ign.sa_mask);
    ign.sa_flags = 0;
    (void)::sigaction(SIGPIPE, &ign, nullptr);
    return R::success();
  }

  /** @brief Request shutdown from code; wakes WaitForShutdown(). */
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /** @brief Block until a signal or Quit(), then run the cleanup steps. */
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0) {
      uint8_t byte = 0;
      while (::read(pipe_fd_[0], &byte, 1) < 0 && errno == EINTR) {
      }
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = count_; i > 0U; --i) {
      entries_[i - 1U].fn(signo, entries_[i - 1U].ctx);
    }
    count_ = 0;
  }

  bool IsShutdownRequested() const noexcept {
    return requested_.load(std::memory_order_acquire);
  }

  uint32_t CallbackCount() const noexcept { return count_; }

 private:
  struct Entry {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  static void OnSignal(int signo) {
    ShutdownManager* self = detail::ShutdownInstance();
    if (self == nullptr) return;
    self->requested_.store(true, std::memory_order_release);
    self->signo_.store(signo, std::memory_order_relaxed);
    self->Wake();
  }

  void Wake() noexcept {
    if (pipe_fd_[1] < 0) return;
    const uint8_t byte = 1;
    // The pipe holds up to 64 KiB; a failed write means a wakeup is queued.
    (void)::write(pipe_fd_[1], &byte, 1);
  }

  Entry entries_[PEERLINK_SHUTDOWN_MAX_CALLBACKS];
  uint32_t count_ = 0;
  int pipe_fd_[2] = {-1, -1};
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  bool valid_ = false;
};

}  // namespace peerlink

#endif  // PEERLINK_SHUTDOWN_HPP_
