// ============================================================================
// bus_scheduler.cpp — implementation for bus_scheduler.hpp
// ============================================================================
//
// Lock order: BusScheduler::mutex_ before CancelToken's internal mutex.
// CancelToken::cancel() runs the listener outside its own lock, so the
// listener may take mutex_ without inverting that order. clear_listener()
// waits for a running listener, so it is called only after mutex_ is dropped.

#include "cctalk/bus_scheduler.hpp"
#include "cctalk/log.hpp"

#include <algorithm>

namespace cctalk {

TurnGuard& TurnGuard::operator=(TurnGuard&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

void TurnGuard::release() {
  if (owner_) {
    BusScheduler* s = owner_;
    owner_ = nullptr;
    s->release_turn();
  }
}

TurnGuard BusScheduler::acquire_turn(CancelToken* cancel) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (is_cancelled(cancel)) return TurnGuard{};

  const uint64_t ticket = next_ticket_++;
  queue_.push_back(ticket);

  if (cancel) {
    // Wake every waiter; each re-checks its own token and position.
    bool armed = cancel->set_listener([this] {
      std::lock_guard<std::mutex> g(mutex_);
      cv_.notify_all();
    });
    if (!armed) {
      queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
      cv_.notify_all();
      return TurnGuard{};
    }
  }

  cv_.wait(lock, [&] {
    return is_cancelled(cancel) || (!held_ && queue_.front() == ticket);
  });

  const bool granted = !is_cancelled(cancel);
  if (granted) {
    queue_.pop_front();
    held_ = true;
  } else {
    queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
    cv_.notify_all();                  // the head may have changed
  }
  lock.unlock();

  // The listener captures this; it must be finished before we return.
  if (cancel) cancel->clear_listener();

  if (!granted) {
    CCTALK_LOG(Debug, "scheduler", "event=cancelled_while_queued ticket=" << ticket);
    return TurnGuard{};
  }
  return TurnGuard{this};
}

void BusScheduler::release_turn() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = false;
  }
  cv_.notify_all();
}

bool BusScheduler::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_;
}

std::size_t BusScheduler::waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace cctalk
