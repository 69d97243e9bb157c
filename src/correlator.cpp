// ============================================================================
// correlator.cpp — implementation for correlator.hpp
// For the attempt cycle see the matching .hpp. For usage, check tests/test_correlator.cpp.
// ============================================================================

#include "cctalk/correlator.hpp"
#include "cctalk/commands.hpp"
#include "cctalk/log.hpp"

#include <algorithm>
#include <thread>

namespace cctalk {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;
using transport::RxResult;
using transport::TxResult;

namespace {

// Back-off while the driver reports its output queue full.
constexpr milliseconds BUSY_BACKOFF{1};

// A line that never falls silent is not drained forever; the attempt proceeds.
constexpr int MAX_DRAIN_READS = 16;

ProtocolError from_rx(RxResult r) {
  return r == RxResult::Closed ? ProtocolError::TransportClosed
                               : ProtocolError::TransportError;
}

RequestState state_for(ProtocolError e) {
  switch (e) {
    case ProtocolError::None:             return RequestState::Resolved;
    case ProtocolError::Timeout:          return RequestState::TimedOut;
    case ProtocolError::ChecksumMismatch:
    case ProtocolError::MalformedFrame:   return RequestState::ChecksumFailed;
    case ProtocolError::Nack:
    case ProtocolError::Busy:             return RequestState::Nacked;
    case ProtocolError::Cancelled:        return RequestState::Cancelled;
    default:                              return RequestState::TransportError;
  }
}

} // namespace

const char* to_string(RequestState s) {
  switch (s) {
    case RequestState::Idle:           return "idle";
    case RequestState::Sent:           return "sent";
    case RequestState::AwaitingReply:  return "awaiting_reply";
    case RequestState::Resolved:       return "resolved";
    case RequestState::TimedOut:       return "timed_out";
    case RequestState::ChecksumFailed: return "checksum_failed";
    case RequestState::TransportError: return "transport_error";
    case RequestState::Cancelled:      return "cancelled";
    case RequestState::Nacked:         return "nacked";
  }
  return "unknown";
}

Correlator::Correlator(transport::ITransport& link, PacketCodec codec, uint8_t host_address)
: link_(link), codec_(codec), host_(host_address) {}

// ---------------------------------------------------------------------------
// send_and_await()
// ----------------
// Drives the attempt loop. Each iteration is one full attempt; the decision
// to retransmit is taken only here.
// ---------------------------------------------------------------------------
ProtocolError Correlator::send_and_await(uint8_t destination, uint8_t header,
                                         const uint8_t* payload, std::size_t len,
                                         const RequestOptions& opt, const CancelToken* cancel,
                                         Reply& out) {
  last_ = PendingRequest{};
  last_.destination = destination;

  EncodeError ee = codec_.encode(destination, host_, header, payload, len, last_.frame);
  if (ee != EncodeError::None) {
    CCTALK_LOG(Warn, "correlator", "event=reject dst=" << unsigned(destination)
                                   << " header=" << unsigned(header)
                                   << " reason=" << to_string(ee));
    return to_protocol_error(ee);
  }

  if (is_cancelled(cancel)) {
    last_.state = RequestState::Cancelled;
    return ProtocolError::Cancelled;
  }
  if (link_.is_closed()) {
    last_.state = RequestState::TransportError;
    return ProtocolError::TransportClosed;
  }

  const unsigned max_attempts = (opt.idempotent ? opt.max_retries : 0u) + 1u;

  for (;;) {
    ++last_.attempt;

    ProtocolError e = discard_stale();
    if (e == ProtocolError::None) {
      last_.state = RequestState::Sent;
      CCTALK_LOG(Trace, "correlator", "SEND: " << to_hex(last_.frame.data(), last_.frame.size()));
      e = write_block(last_.frame, opt.timeout);
    }
    if (e == ProtocolError::None) {
      last_.state = RequestState::AwaitingReply;
      e = await_reply(last_, opt, out);
    }

    if (e == ProtocolError::None) {
      last_.state = RequestState::Resolved;
      return e;
    }

    last_.state = state_for(e);
    if (e == ProtocolError::TransportError || e == ProtocolError::TransportClosed) {
      CCTALK_LOG(Warn, "correlator", "event=transport_failure dst=" << unsigned(destination)
                                     << " attempt=" << last_.attempt
                                     << " reason=" << to_string(e));
      return e;
    }

    if (is_cancelled(cancel)) {
      last_.state = RequestState::Cancelled;
      CCTALK_LOG(Debug, "correlator", "event=cancelled dst=" << unsigned(destination)
                                      << " attempt=" << last_.attempt);
      return ProtocolError::Cancelled;
    }

    const bool refusal = (e == ProtocolError::Nack || e == ProtocolError::Busy);
    const bool retryable = refusal ? opt.retry_on_nack : is_transient(e);
    if (!retryable || last_.attempt >= max_attempts) {
      CCTALK_LOG(Debug, "correlator", "event=failed dst=" << unsigned(destination)
                                      << " header=" << unsigned(header)
                                      << " attempts=" << last_.attempt
                                      << " reason=" << to_string(e));
      return e;
    }

    CCTALK_LOG(Debug, "correlator", "event=retry dst=" << unsigned(destination)
                                    << " attempt=" << (last_.attempt + 1)
                                    << " reason=" << to_string(e));
    if (opt.retry_delay.count() > 0) std::this_thread::sleep_for(opt.retry_delay);
    if (is_cancelled(cancel)) {
      last_.state = RequestState::Cancelled;
      return ProtocolError::Cancelled;
    }
  }
}

// ---------------------------------------------------------------------------
// discard_stale()
// ---------------
// Anything already buffered belongs to nobody: a late reply to an earlier
// attempt, or line noise. Drop it without waiting.
// ---------------------------------------------------------------------------
ProtocolError Correlator::discard_stale() {
  Bytes junk;
  for (int i = 0; i < MAX_DRAIN_READS; ++i) {
    std::size_t before = junk.size();
    RxResult r = link_.read_available(junk, milliseconds(0));
    if (r == RxResult::Closed || r == RxResult::Error) return from_rx(r);
    if (r == RxResult::None || junk.size() == before) break;
  }
  if (!junk.empty()) {
    CCTALK_LOG(Debug, "correlator", "event=discard_stale bytes=" << junk.size()
                                    << " data=" << to_hex(junk.data(), junk.size(), 0));
  }
  return ProtocolError::None;
}

// ---------------------------------------------------------------------------
// write_block()
// -------------
// Continue partial writes until the block is enqueued. A driver that stays
// Busy past the attempt budget turns into a Timeout for this attempt.
// ---------------------------------------------------------------------------
ProtocolError Correlator::write_block(const Frame& frame, milliseconds budget) {
  const auto deadline = Clock::now() + budget;
  std::size_t sent = 0;

  while (sent < frame.size()) {
    std::size_t n = 0;
    TxResult r = link_.write(frame.data() + sent, frame.size() - sent, n);
    switch (r) {
      case TxResult::Ok:
        sent += std::min(n, frame.size() - sent);
        if (n > 0) continue;
        break;                                   // accepted nothing: back off
      case TxResult::Busy:
        break;
      case TxResult::Closed:
        return ProtocolError::TransportClosed;
      case TxResult::Error:
        return ProtocolError::TransportError;
    }
    if (Clock::now() >= deadline) return ProtocolError::Timeout;
    std::this_thread::sleep_for(BUSY_BACKOFF);
  }
  return ProtocolError::None;
}

// ---------------------------------------------------------------------------
// await_reply()
// -------------
// Accumulate until a block is complete or the window closes. Never returns
// before the window closes unless a block completed or the transport failed:
// the line must be quiet before the next attempt starts.
// ---------------------------------------------------------------------------
ProtocolError Correlator::await_reply(const PendingRequest& req, const RequestOptions& opt,
                                      Reply& out) {
  const auto deadline = Clock::now() + opt.timeout;
  std::size_t echo_left = opt.local_echo ? req.frame.size() : 0;
  Bytes rx;

  for (;;) {
    auto now = Clock::now();
    if (now >= deadline) {
      if (!rx.empty()) {
        CCTALK_LOG(Debug, "correlator", "event=partial dst=" << unsigned(req.destination)
                                        << " bytes=" << rx.size()
                                        << " data=" << to_hex(rx.data(), rx.size(), 0));
      }
      return ProtocolError::Timeout;
    }

    auto wait = std::chrono::duration_cast<milliseconds>(deadline - now);
    if (wait.count() == 0) wait = milliseconds(1);
    RxResult r = link_.read_available(rx, wait);
    if (r == RxResult::Closed || r == RxResult::Error) return from_rx(r);
    if (r == RxResult::None) continue;

    if (echo_left) {
      if (rx.size() < echo_left) continue;
      if (!std::equal(req.frame.begin(), req.frame.end(), rx.begin())) {
        CCTALK_LOG(Warn, "correlator", "event=echo_mismatch dst=" << unsigned(req.destination)
                                       << " got=" << to_hex(rx.data(), echo_left, 0));
        return ProtocolError::MalformedFrame;
      }
      rx.erase(rx.begin(), rx.begin() + static_cast<std::ptrdiff_t>(echo_left));
      echo_left = 0;
    }

    std::size_t need = PacketCodec::expected_frame_size(rx.data(), rx.size());
    if (need > MAX_BLOCK_LENGTH) return ProtocolError::MalformedFrame;
    if (need == 0 || rx.size() < need) continue;
    if (rx.size() > need) {
      CCTALK_LOG(Debug, "correlator", "event=trailing_bytes bytes=" << (rx.size() - need));
    }

    CCTALK_LOG(Trace, "correlator", "RECV: " << to_hex(rx.data(), need));

    DecodeError de = codec_.decode(rx.data(), need, out);
    if (de == DecodeError::ChecksumMismatch) return ProtocolError::ChecksumMismatch;
    if (de != DecodeError::None)             return ProtocolError::MalformedFrame;

    return check_reply(req, out);
  }
}

ProtocolError Correlator::check_reply(const PendingRequest& req, const Reply& r) const {
  if (r.destination != host_) {
    CCTALK_LOG(Debug, "correlator", "event=foreign_reply dst=" << unsigned(r.destination)
                                    << " host=" << unsigned(host_));
    return ProtocolError::MalformedFrame;
  }
  if (r.has_source && req.destination != BROADCAST_ADDRESS && r.source != req.destination) {
    CCTALK_LOG(Debug, "correlator", "event=wrong_source src=" << unsigned(r.source)
                                    << " expected=" << unsigned(req.destination));
    return ProtocolError::MalformedFrame;
  }
  if (r.header == HDR_NACK) return ProtocolError::Nack;
  if (r.header == HDR_BUSY) return ProtocolError::Busy;
  return ProtocolError::None;
}

} // namespace cctalk
