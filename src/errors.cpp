// ============================================================================
// errors.cpp — string renderings for errors.hpp
// Names are lowercase snake_case so they drop straight into key=value logs.
// ============================================================================

#include "cctalk/errors.hpp"

namespace cctalk {

const char* to_string(EncodeError e) {
  switch (e) {
    case EncodeError::None:            return "none";
    case EncodeError::PayloadTooLarge: return "payload_too_large";
    case EncodeError::InvalidAddress:  return "invalid_address";
  }
  return "unknown";
}

const char* to_string(DecodeError e) {
  switch (e) {
    case DecodeError::None:             return "none";
    case DecodeError::Incomplete:       return "incomplete";
    case DecodeError::ChecksumMismatch: return "checksum_mismatch";
    case DecodeError::MalformedFrame:   return "malformed_frame";
  }
  return "unknown";
}

const char* to_string(ProtocolError e) {
  switch (e) {
    case ProtocolError::None:             return "ok";
    case ProtocolError::PayloadTooLarge:  return "payload_too_large";
    case ProtocolError::InvalidAddress:   return "invalid_address";
    case ProtocolError::ChecksumMismatch: return "checksum_mismatch";
    case ProtocolError::MalformedFrame:   return "malformed_frame";
    case ProtocolError::Timeout:          return "timeout";
    case ProtocolError::Nack:             return "nack";
    case ProtocolError::Busy:             return "busy";
    case ProtocolError::TransportError:   return "transport_error";
    case ProtocolError::TransportClosed:  return "transport_closed";
    case ProtocolError::Cancelled:        return "cancelled";
  }
  return "unknown";
}

ProtocolError to_protocol_error(EncodeError e) {
  switch (e) {
    case EncodeError::None:            return ProtocolError::None;
    case EncodeError::PayloadTooLarge: return ProtocolError::PayloadTooLarge;
    case EncodeError::InvalidAddress:  return ProtocolError::InvalidAddress;
  }
  return ProtocolError::InvalidAddress;
}

} // namespace cctalk
