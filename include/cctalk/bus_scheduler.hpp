/**
 * @file bus_scheduler.hpp
 * @brief Serializes access to the shared ccTalk line: one turn, FIFO waiters.
 *
 * @details
 * A ccTalk bus is half-duplex and carries no request ids, so only one
 * request may be in flight. Every caller (ad-hoc commands, the poll loop)
 * takes a turn before touching the transport and gives it back afterwards.
 *
 * Waiters queue in arrival order and block on a condition variable; the
 * turn passes to the queue head only. A waiter whose CancelToken fires
 * leaves the queue and gets an empty guard.
 *
 * @code
 *   cctalk::TurnGuard turn = scheduler.acquire_turn(&token);
 *   if (!turn.owns_turn()) return ProtocolError::Cancelled;
 *   correlator.send_and_await(...);
 *   // released when turn goes out of scope
 * @endcode
 */
#ifndef CCTALK_BUS_SCHEDULER_HPP
#define CCTALK_BUS_SCHEDULER_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "cctalk/cancel.hpp"

namespace cctalk {

class BusScheduler;

/// Scoped ownership of the bus turn. Move-only; releases on destruction.
class TurnGuard {
public:
  TurnGuard() = default;
  ~TurnGuard() { release(); }

  TurnGuard(TurnGuard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
  TurnGuard& operator=(TurnGuard&& other) noexcept;

  TurnGuard(const TurnGuard&) = delete;
  TurnGuard& operator=(const TurnGuard&) = delete;

  bool owns_turn() const { return owner_ != nullptr; }
  explicit operator bool() const { return owns_turn(); }

  /// Give the turn back early. Safe to call more than once.
  void release();

private:
  friend class BusScheduler;
  explicit TurnGuard(BusScheduler* owner) : owner_(owner) {}

  BusScheduler* owner_{nullptr};
};

class BusScheduler {
public:
  BusScheduler() = default;
  BusScheduler(const BusScheduler&) = delete;
  BusScheduler& operator=(const BusScheduler&) = delete;

  /**
   * @brief Block until this caller holds the bus.
   *
   * @param cancel Optional. Firing it while queued removes the caller from
   *               the queue; the returned guard then does not own the turn.
   *               An already cancelled token returns at once.
   */
  TurnGuard acquire_turn(CancelToken* cancel = nullptr);

  bool        busy() const;
  std::size_t waiting() const;

private:
  friend class TurnGuard;
  void release_turn();

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<uint64_t>    queue_;          // tickets, arrival order
  uint64_t                next_ticket_{0};
  bool                    held_{false};
};

} // namespace cctalk

#endif // CCTALK_BUS_SCHEDULER_HPP
