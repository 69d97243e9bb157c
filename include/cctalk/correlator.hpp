/**
 * @page cctalk-correlator Request/Response Correlator
 * @file correlator.hpp
 * @brief One request out, one reply back, with deadlines and bounded retries.
 *
 * @details
 * PURPOSE
 * -------
 * ccTalk has no sequence numbers. A reply belongs to a request purely because
 * it is the next block on the line after the request was sent. The correlator
 * owns that pairing for exactly one request at a time:
 *
 *   Idle -> Sent -> AwaitingReply -> { Resolved | TimedOut | ChecksumFailed |
 *                                      TransportError | Cancelled | Nacked }
 *
 * ATTEMPT CYCLE
 * -------------
 *   1. Discard stale input (late replies from earlier timed-out attempts).
 *   2. Write the encoded block. Partial writes are continued until the whole
 *      block is enqueued.
 *   3. With local_echo, read back our own block from the shared wire and
 *      compare it byte for byte.
 *   4. Accumulate input until a block decodes or the attempt deadline passes.
 *   5. A reply must be addressed to the host; under Sum8 it must also come
 *      from the device we addressed.
 *
 * RETRIES
 * -------
 * Timeout, ChecksumMismatch and MalformedFrame retransmit the *same* bytes,
 * up to max_retries extra attempts. NACK / BUSY retry only with
 * retry_on_nack. Transport failures never retry. Non-idempotent commands set
 * idempotent = false and get exactly one attempt.
 *
 * CANCELLATION
 * ------------
 * The cancel token is checked before the first attempt and between attempts.
 * A running attempt is always completed (block fully written, reply window
 * drained). If that attempt succeeded the reply is returned; otherwise the
 * call resolves Cancelled.
 *
 * THREADING
 * ---------
 * Not thread-safe. Callers hold a BusScheduler turn for the whole call.
 */
#ifndef CCTALK_CORRELATOR_HPP
#define CCTALK_CORRELATOR_HPP

#include <chrono>
#include <cstdint>

#include "cctalk/cancel.hpp"
#include "cctalk/errors.hpp"
#include "cctalk/packet.hpp"
#include "cctalk/transport/transport_base.hpp"

namespace cctalk {

/// Per-request timing and retry policy.
struct RequestOptions {
  std::chrono::milliseconds timeout{100};      ///< per attempt, measured after the write
  unsigned                  max_retries{2};    ///< extra attempts after the first
  std::chrono::milliseconds retry_delay{0};    ///< pause before a retransmission
  bool                      local_echo{false}; ///< expect our own block back first
  bool                      retry_on_nack{false};
  bool                      idempotent{true};  ///< false: never retransmit
};

enum class RequestState : uint8_t {
  Idle = 0,
  Sent,
  AwaitingReply,
  Resolved,
  TimedOut,
  ChecksumFailed,
  TransportError,
  Cancelled,
  Nacked
};

const char* to_string(RequestState s);

/// The one in-flight request on the bus.
struct PendingRequest {
  uint8_t      destination{0};
  Frame        frame;               ///< retransmitted verbatim
  unsigned     attempt{0};          ///< 1-based once the first write starts
  RequestState state{RequestState::Idle};
};

class Correlator {
public:
  Correlator(transport::ITransport& link, PacketCodec codec,
             uint8_t host_address = DEFAULT_HOST_ADDRESS);

  /**
   * @brief Send one command and wait for its reply.
   *
   * @param destination Device address (0 = broadcast).
   * @param header      Command header.
   * @param payload     Data bytes (may be null when @p len is 0).
   * @param len         0..252.
   * @param opt         Timeout / retry policy.
   * @param cancel      Optional token, see CANCELLATION above.
   * @param out         Receives the reply on success. For Nack / Busy it
   *                    holds the refusal block.
   * @return ProtocolError::None on success, otherwise the terminal outcome.
   */
  ProtocolError send_and_await(uint8_t destination, uint8_t header,
                               const uint8_t* payload, std::size_t len,
                               const RequestOptions& opt, const CancelToken* cancel,
                               Reply& out);

  ProtocolError send_and_await(uint8_t destination, const Command& cmd,
                               const RequestOptions& opt, const CancelToken* cancel,
                               Reply& out) {
    return send_and_await(destination, cmd.header(), cmd.payload().data(),
                          cmd.payload().size(), opt, cancel, out);
  }

  uint8_t host_address() const { return host_; }
  const PacketCodec& codec() const { return codec_; }

  /// State and attempt count of the most recent request (diagnostics, tests).
  RequestState last_state() const { return last_.state; }
  unsigned     last_attempts() const { return last_.attempt; }

private:
  ProtocolError discard_stale();
  ProtocolError write_block(const Frame& frame, std::chrono::milliseconds budget);
  ProtocolError await_reply(const PendingRequest& req, const RequestOptions& opt,
                            Reply& out);
  ProtocolError check_reply(const PendingRequest& req, const Reply& r) const;

  transport::ITransport& link_;
  PacketCodec            codec_;
  uint8_t                host_;
  PendingRequest         last_;
};

} // namespace cctalk

#endif // CCTALK_CORRELATOR_HPP
