/**
 * @file task_pool.hpp
 * @brief Unbounded background task spawner.
 *
 * Every task gets its own thread: link read loops, accept loops and handshake
 * continuations block on I/O for long periods and must not starve each other.
 * Finished threads are reaped on the next Spawn(); Stop() joins everything.
 */

#ifndef PEERLINK_TASK_POOL_HPP_
#define PEERLINK_TASK_POOL_HPP_

#include "peerlink/log.hpp"
#include "peerlink/platform.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace peerlink {

class TaskPool {
 public:
  using Task = std::function<void()>;

  TaskPool() = default;
  ~TaskPool() { Stop(); }

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;

  /**
   * @brief Run @p task on a new thread.
   * @return false once Stop() has been called.
   */
  bool Spawn(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return false;
    ReapLocked();
    workers_.emplace_back();
    Worker& w = workers_.back();
    std::shared_ptr<std::atomic<bool>> done = w.done;
    w.thread = std::thread([task, done]() {
      task();
      done->store(true, std::memory_order_release);
    });
    return true;
  }

  /**
   * @brief Refuse new tasks and join every running one.
   *
   * Callers close the sockets their tasks block on before calling this.
   * Must not be called from a pool thread.
   */
  void Stop() {
    std::list<Worker> workers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
      workers.swap(workers_);
    }
    for (auto& w : workers) {
      if (w.thread.joinable()) w.thread.join();
    }
  }

  /** @brief Re-enable Spawn() after Stop(). */
  void Restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = false;
  }

  bool IsStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

  /** @brief Number of tasks not yet reaped (running or just finished). */
  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
  }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done =
        std::make_shared<std::atomic<bool>>(false);
  };

  void ReapLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load(std::memory_order_acquire)) {
        if (it->thread.joinable()) it->thread.join();
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  mutable std::mutex mutex_;
  std::list<Worker> workers_;
  bool stopped_ = false;
};

}  // namespace peerlink

#endif  // PEERLINK_TASK_POOL_HPP_
