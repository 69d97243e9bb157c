/**
 * @page cctalk-host Host API
 * @file host.hpp
 * @brief Caller-facing entry point: one transport, one bus, one correlator.
 *
 * @details
 * PURPOSE
 * -------
 * Host binds the pieces every caller needs and enforces the one rule that
 * keeps a ccTalk bus sane: nobody touches the transport without holding the
 * bus turn. Any number of threads may call send_command() concurrently; they
 * are served in arrival order, one request at a time. A poll loop started
 * from the same Host shares that queue.
 *
 * EXAMPLE
 * -------
 * @code
 *   cctalk::transport::LinuxSerial tty("/dev/ttyUSB0", 9600);
 *   if (!tty.open()) { ... }
 *
 *   cctalk::HostConfig cfg;              // Sum8, host address 1
 *   cctalk::Host host(tty, cfg);
 *
 *   cctalk::Reply r;
 *   auto e = host.send_command(2, cctalk::HDR_REQUEST_MANUFACTURER_ID, {}, r);
 *   if (e == cctalk::ProtocolError::None) std::cout << cctalk::describe_reply(r) << "\n";
 *
 *   cctalk::PollConfig pc;
 *   pc.addresses = {2, 3, 40};
 *   cctalk::PollHandle poll = host.start_poll_loop(pc);
 *   ...
 *   poll.stop();
 * @endcode
 *
 * The transport must outlive the Host, and the Host must outlive every
 * PollHandle it returned.
 */
#ifndef CCTALK_HOST_HPP
#define CCTALK_HOST_HPP

#include <memory>
#include <vector>

#include "cctalk/bus_scheduler.hpp"
#include "cctalk/cancel.hpp"
#include "cctalk/config.hpp"
#include "cctalk/correlator.hpp"
#include "cctalk/poll_loop.hpp"
#include "cctalk/transport/transport_base.hpp"

namespace cctalk {

/// Owns a running poll loop. Move-only; stops the loop on destruction.
class PollHandle {
public:
  PollHandle() = default;
  explicit PollHandle(std::unique_ptr<PollLoop> loop) : loop_(std::move(loop)) {}
  ~PollHandle() { stop(); }

  PollHandle(PollHandle&&) noexcept = default;
  PollHandle& operator=(PollHandle&& other) noexcept {
    if (this != &other) { stop(); loop_ = std::move(other.loop_); }
    return *this;
  }

  bool valid() const { return loop_ != nullptr; }
  bool running() const { return loop_ && loop_->running(); }

  bool device_status(uint8_t address, DeviceRecord& out) const {
    return loop_ && loop_->device_status(address, out);
  }

  std::vector<DeviceRecord> snapshot() const {
    return loop_ ? loop_->snapshot() : std::vector<DeviceRecord>{};
  }

  uint64_t rounds() const { return loop_ ? loop_->rounds() : 0; }

  void stop() { if (loop_) loop_->stop(); }

private:
  std::unique_ptr<PollLoop> loop_;
};

class Host {
public:
  /// Only host_address, checksum and request are used; transport is already open.
  Host(transport::ITransport& link, const HostConfig& cfg);

  Host(const Host&) = delete;
  Host& operator=(const Host&) = delete;

  /**
   * @brief Send one command and wait for its reply, queueing for the bus first.
   *
   * @param cancel Optional. Honoured while queued and between attempts.
   * @return ProtocolError::None with @p out filled, or the terminal error.
   */
  ProtocolError send_command(uint8_t destination, uint8_t header, const Bytes& payload,
                             const RequestOptions& opt, CancelToken* cancel, Reply& out);

  /// As above with the configured default request options and no cancellation.
  ProtocolError send_command(uint8_t destination, uint8_t header, const Bytes& payload,
                             Reply& out) {
    return send_command(destination, header, payload, defaults_, nullptr, out);
  }

  /// Start a background poll loop sharing this Host's bus.
  PollHandle start_poll_loop(const PollConfig& cfg, HealthObserver observer = {});

  uint8_t host_address() const { return correlator_.host_address(); }
  ChecksumType checksum_type() const { return correlator_.codec().checksum_type(); }
  const RequestOptions& default_options() const { return defaults_; }
  BusScheduler& scheduler() { return bus_; }

private:
  transport::ITransport& link_;
  BusScheduler           bus_;
  Correlator             correlator_;
  RequestOptions         defaults_;
};

} // namespace cctalk

#endif // CCTALK_HOST_HPP
