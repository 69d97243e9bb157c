#pragma once
/**
 * @file cancel.hpp
 * @brief One-shot cancellation flag shared between a caller and the engine.
 *
 * @details
 * The caller keeps the token, the engine polls it at its safe points:
 *   - while queued for a bus turn (the scheduler registers a wake-up listener),
 *   - after each completed attempt, before any retransmission.
 *
 * A token never resets. Use a fresh one per request.
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>

namespace cctalk {

class CancelToken {
public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  /// Raise the flag and wake whoever is blocked on it. Idempotent.
  void cancel() {
    std::function<void()> fn;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (flag_.exchange(true)) return;
      fn = listener_;
      if (fn) ++in_flight_;
    }
    if (!fn) return;
    fn();
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    idle_.notify_all();
  }

  bool cancelled() const { return flag_.load(); }

  /**
   * @brief Install the wake-up hook used by blocking waits.
   *
   * At most one listener at a time; a request is only ever blocked in one
   * place. Returns false (and installs nothing) if already cancelled.
   */
  bool set_listener(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (flag_.load()) return false;
    listener_ = std::move(fn);
    return true;
  }

  /**
   * @brief Remove the listener and wait until no call to it is still running.
   *
   * After this returns the listener's captures may be destroyed. Do not call
   * it while holding a lock the listener takes.
   */
  void clear_listener() {
    std::unique_lock<std::mutex> lock(mutex_);
    listener_ = nullptr;
    idle_.wait(lock, [this] { return in_flight_ == 0; });
  }

private:
  std::atomic<bool>       flag_{false};
  std::mutex              mutex_;
  std::condition_variable idle_;
  std::function<void()>   listener_;
  unsigned                in_flight_{0};
};

/// Null-safe query used throughout the engine.
inline bool is_cancelled(const CancelToken* t) { return t && t->cancelled(); }

} // namespace cctalk
