// ============================================================================
// poll_loop.cpp — implementation for poll_loop.hpp
// For the round structure see the matching .hpp. For usage, check tests/test_poll_loop.cpp.
// ============================================================================

#include "cctalk/poll_loop.hpp"
#include "cctalk/log.hpp"

namespace cctalk {

using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

const char* to_string(Health h) {
  switch (h) {
    case Health::Unknown:      return "unknown";
    case Health::Alive:        return "alive";
    case Health::Unresponsive: return "unresponsive";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// apply_outcome()
// ---------------
// A NACK or BUSY reply still proves the device is on the bus, so it counts as
// seen. Its code is kept in last_error for the operator.
// ---------------------------------------------------------------------------
bool apply_outcome(DeviceRecord& rec, ProtocolError outcome, uint32_t failure_threshold,
                   std::chrono::system_clock::time_point now) {
  const Health before = rec.health;
  ++rec.total_polls;
  rec.last_error = outcome;

  const bool answered = outcome == ProtocolError::None ||
                        outcome == ProtocolError::Nack ||
                        outcome == ProtocolError::Busy;
  if (answered) {
    rec.health = Health::Alive;
    rec.consecutive_failures = 0;
    rec.last_seen = now;
  } else {
    ++rec.total_failures;
    ++rec.consecutive_failures;
    if (rec.consecutive_failures >= failure_threshold) rec.health = Health::Unresponsive;
  }
  return rec.health != before;
}

PollLoop::PollLoop(BusScheduler& bus, Correlator& correlator, PollConfig cfg)
: bus_(bus), correlator_(correlator), cfg_(std::move(cfg)),
  stop_token_(std::make_unique<CancelToken>()) {
  for (uint8_t a : cfg_.addresses) {
    DeviceRecord r;
    r.address = a;
    records_.emplace(a, r);
  }
}

PollLoop::~PollLoop() { stop(); }

bool PollLoop::start() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  if (thread_.joinable()) return false;
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_ = false;
  }
  stop_token_ = std::make_unique<CancelToken>();   // tokens never reset
  running_ = true;
  thread_ = std::thread([this] { run(); });
  CCTALK_LOG(Info, "poll", "event=start devices=" << cfg_.addresses.size()
                           << " interval_ms=" << cfg_.interval.count());
  return true;
}

void PollLoop::stop() {
  std::lock_guard<std::mutex> life(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_ = true;
  }
  wake_cv_.notify_all();
  stop_token_->cancel();
  if (thread_.joinable()) {
    thread_.join();
    CCTALK_LOG(Info, "poll", "event=stop rounds=" << rounds_.load());
  }
  running_ = false;
}

bool PollLoop::stop_requested() const {
  return stop_token_->cancelled();
}

void PollLoop::run() {
  while (!stop_requested()) {
    const auto round_start = Clock::now();
    if (!poll_once()) break;

    auto elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - round_start);
    if (elapsed < cfg_.interval && !sleep_for(cfg_.interval - elapsed)) break;
  }
  running_ = false;
}

bool PollLoop::poll_once() {
  bool first = true;
  for (uint8_t addr : cfg_.addresses) {
    if (!first && cfg_.spacing.count() > 0 && !sleep_for(cfg_.spacing)) return false;
    first = false;
    if (!poll_device(addr)) return false;
  }
  ++rounds_;
  return true;
}

// ---------------------------------------------------------------------------
// poll_device()
// -------------
// One turn, one request, one record update. Returns false only on stop.
// ---------------------------------------------------------------------------
bool PollLoop::poll_device(uint8_t address) {
  ProtocolError result;
  {
    TurnGuard turn = bus_.acquire_turn(stop_token_.get());
    if (!turn.owns_turn()) return false;

    Reply reply;
    result = correlator_.send_and_await(address, cfg_.status_header,
                                        cfg_.status_payload.data(),
                                        cfg_.status_payload.size(),
                                        cfg_.request, stop_token_.get(), reply);
  }
  if (result == ProtocolError::Cancelled) return false;

  DeviceRecord copy;
  Health before;
  bool changed;
  {
    std::lock_guard<std::mutex> lock(records_mutex_);
    DeviceRecord& rec = records_[address];
    rec.address = address;
    before  = rec.health;
    changed = apply_outcome(rec, result, cfg_.failure_threshold,
                            std::chrono::system_clock::now());
    copy = rec;
  }

  if (result != ProtocolError::None) {
    CCTALK_LOG(Debug, "poll", "event=poll_failed addr=" << unsigned(address)
                              << " failures=" << copy.consecutive_failures
                              << " reason=" << to_string(result));
  }
  if (changed) {
    CCTALK_LOG(Info, "poll", "event=health addr=" << unsigned(address)
                             << " from=" << to_string(before)
                             << " to=" << to_string(copy.health)
                             << " reason=" << to_string(result));
    if (observer_) observer_(copy, before);
  }
  return true;
}

bool PollLoop::sleep_for(milliseconds d) {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  return !wake_cv_.wait_for(lock, d, [this] { return stop_; });
}

bool PollLoop::device_status(uint8_t address, DeviceRecord& out) const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  auto it = records_.find(address);
  if (it == records_.end()) return false;
  out = it->second;
  return true;
}

std::vector<DeviceRecord> PollLoop::snapshot() const {
  std::lock_guard<std::mutex> lock(records_mutex_);
  std::vector<DeviceRecord> v;
  v.reserve(records_.size());
  for (const auto& kv : records_) v.push_back(kv.second);
  return v;
}

} // namespace cctalk
