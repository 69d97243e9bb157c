/**
 * @file errors.hpp
 * @brief Error taxonomy for the ccTalk host engine.
 *
 * @details
 * Three small enums, one per layer:
 *   - EncodeError   : caller misuse caught while building a frame. Never retried.
 *   - DecodeError   : structural verdicts from the codec. The correlator decides
 *                     what to do with them; the codec never retries anything.
 *   - ProtocolError : the definitive outcome of one send_and_await() call.
 *
 * No exceptions are thrown by the engine. Every operation that can fail returns
 * one of these codes and writes its result through an out-parameter.
 */
#ifndef CCTALK_ERRORS_HPP
#define CCTALK_ERRORS_HPP

#include <cstdint>

namespace cctalk {

enum class EncodeError : uint8_t {
  None = 0,
  PayloadTooLarge,
  InvalidAddress
};

enum class DecodeError : uint8_t {
  None = 0,
  Incomplete,        ///< Need more bytes. Internal only, never surfaced to callers.
  ChecksumMismatch,
  MalformedFrame
};

/**
 * @brief Terminal outcome of a request.
 *
 * | code             | class          | retried?                       |
 * |------------------|----------------|--------------------------------|
 * | PayloadTooLarge  | caller misuse  | no                             |
 * | InvalidAddress   | caller misuse  | no                             |
 * | ChecksumMismatch | transient      | yes, up to max_retries         |
 * | MalformedFrame   | transient      | yes, up to max_retries         |
 * | Timeout          | transient      | yes, up to max_retries         |
 * | Nack / Busy      | device refusal | only with retry_on_nack        |
 * | TransportError   | fatal          | no                             |
 * | TransportClosed  | fatal          | no                             |
 * | Cancelled        | caller         | no                             |
 */
enum class ProtocolError : uint8_t {
  None = 0,
  PayloadTooLarge,
  InvalidAddress,
  ChecksumMismatch,
  MalformedFrame,
  Timeout,
  Nack,
  Busy,
  TransportError,
  TransportClosed,
  Cancelled
};

const char* to_string(EncodeError e);
const char* to_string(DecodeError e);
const char* to_string(ProtocolError e);

/// Map a codec-level build failure onto the caller-facing taxonomy.
ProtocolError to_protocol_error(EncodeError e);

/// True for errors the correlator may answer with a retransmission.
inline bool is_transient(ProtocolError e) {
  return e == ProtocolError::ChecksumMismatch ||
         e == ProtocolError::MalformedFrame ||
         e == ProtocolError::Timeout;
}

} // namespace cctalk

#endif // CCTALK_ERRORS_HPP
