/**
 * @page cctalk-poll-loop Device Poll Loop
 * @file poll_loop.hpp
 * @brief Background liveness polling with per-device health records.
 *
 * @details
 * PURPOSE
 * -------
 * Walks a fixed list of device addresses, sends each a status command through
 * the normal bus path (BusScheduler turn + Correlator), and keeps one
 * DeviceRecord per address. Callers read copies; only the loop writes.
 *
 * ROUND
 * -----
 *   round start
 *     for addr in addresses:            (configured order)
 *        turn = acquire_turn(stop_token)  -> stop requested? leave
 *        send_and_await(addr, status_header, status_payload)
 *        apply_outcome(record, result)
 *        release turn, wait spacing
 *   sleep until round start + interval
 *
 * HEALTH
 * ------
 *   reply (ACK, NACK or BUSY)             -> Alive, failures reset, last_seen = now
 *   failure, failures <  threshold        -> health unchanged
 *   failure, failures >= threshold        -> Unresponsive
 *
 * Transitions are logged at info level and handed to the optional observer
 * (called on the loop thread, without internal locks held).
 *
 * STOPPING
 * --------
 * stop() wakes every wait the loop can be in. A request already on the wire
 * completes its current attempt first; the loop never abandons a turn
 * half-way. Per-device errors never leave the loop except as record state.
 */
#ifndef CCTALK_POLL_LOOP_HPP
#define CCTALK_POLL_LOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "cctalk/bus_scheduler.hpp"
#include "cctalk/cancel.hpp"
#include "cctalk/commands.hpp"
#include "cctalk/correlator.hpp"
#include "cctalk/errors.hpp"

namespace cctalk {

enum class Health : uint8_t { Unknown = 0, Alive, Unresponsive };

const char* to_string(Health h);

struct DeviceRecord {
  uint8_t  address{0};
  std::optional<std::chrono::system_clock::time_point> last_seen;
  uint32_t consecutive_failures{0};
  Health   health{Health::Unknown};
  ProtocolError last_error{ProtocolError::None};
  uint64_t total_polls{0};
  uint64_t total_failures{0};
};

struct PollConfig {
  std::vector<uint8_t>      addresses;
  std::chrono::milliseconds interval{200};        ///< round start to round start
  std::chrono::milliseconds spacing{0};           ///< pause between devices
  uint32_t                  failure_threshold{3};
  uint8_t                   status_header{HDR_SIMPLE_POLL};
  Bytes                     status_payload;
  RequestOptions            request;
};

/**
 * @brief Fold one poll result into a record. Pure apart from its arguments.
 *
 * @return true when the record's health changed.
 */
bool apply_outcome(DeviceRecord& rec, ProtocolError outcome, uint32_t failure_threshold,
                   std::chrono::system_clock::time_point now);

/// Called with the updated record and the health it had before.
using HealthObserver = std::function<void(const DeviceRecord& rec, Health previous)>;

class PollLoop {
public:
  PollLoop(BusScheduler& bus, Correlator& correlator, PollConfig cfg);
  ~PollLoop();

  PollLoop(const PollLoop&) = delete;
  PollLoop& operator=(const PollLoop&) = delete;

  /// Install before start(); not synchronized with a running loop.
  void set_observer(HealthObserver obs) { observer_ = std::move(obs); }

  /**
   * @brief Run one full round on the calling thread.
   * @return false if a stop request cut the round short.
   */
  bool poll_once();

  /// Start the background thread. Returns false if already running.
  bool start();

  /// Request stop, wake the loop and join it. Idempotent. Not callable from the observer.
  void stop();

  bool running() const { return running_.load(); }

  /// Copy of one record. Returns false for addresses not in the config.
  bool device_status(uint8_t address, DeviceRecord& out) const;

  /// Copies of all records in address order.
  std::vector<DeviceRecord> snapshot() const;

  /// Completed rounds since construction.
  uint64_t rounds() const { return rounds_.load(); }

  const PollConfig& config() const { return cfg_; }

private:
  void run();
  bool poll_device(uint8_t address);
  bool sleep_for(std::chrono::milliseconds d);       // false if woken by stop()
  bool stop_requested() const;

  BusScheduler& bus_;
  Correlator&   correlator_;
  PollConfig    cfg_;
  HealthObserver observer_;

  mutable std::mutex               records_mutex_;
  std::map<uint8_t, DeviceRecord>  records_;

  std::mutex                   wake_mutex_;
  std::condition_variable      wake_cv_;
  bool                         stop_{false};
  std::unique_ptr<CancelToken> stop_token_;

  std::mutex            lifecycle_mutex_;      // start() / stop()
  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> rounds_{0};
};

} // namespace cctalk

#endif // CCTALK_POLL_LOOP_HPP
