// ============================================================================
// packet.cpp — implementation for packet.hpp
// For the wire layout see the matching .hpp. For usage, check tests/test_packet.cpp.
// ============================================================================

#include "cctalk/packet.hpp"

namespace cctalk {

// ---------------------------------------------------------------------------
// encode()
// --------
// Order of checks matters: address misuse is reported before payload size so
// a caller fixing one error does not immediately trip over the other.
// ---------------------------------------------------------------------------
EncodeError PacketCodec::encode(uint8_t destination, uint8_t source, uint8_t header,
                                const uint8_t* payload, std::size_t len, Frame& out) const {
  out.clear();

  if (source == BROADCAST_ADDRESS) return EncodeError::InvalidAddress;
  if (len > MAX_DATA_LENGTH)       return EncodeError::PayloadTooLarge;
  if (len > 0 && payload == nullptr) return EncodeError::PayloadTooLarge;

  out.push_back(destination);
  out.push_back(static_cast<uint8_t>(len));
  out.push_back(source);
  out.push_back(header);
  for (std::size_t i = 0; i < len; ++i) out.push_back(payload[i]);

  if (type_ == ChecksumType::Sum8) {
    out.push_back(sum8(out.data(), out.size()));
  } else {
    // CRC input skips the source slot; the slot is then overwritten with crc_lo.
    uint16_t crc = crc16(out.data(), 2);                                   // dst, len
    crc = crc16(out.data() + HEADER_OFFSET, out.size() - HEADER_OFFSET, crc); // hdr, data
    out[SOURCE_OFFSET] = static_cast<uint8_t>(crc & 0xFF);
    out.push_back(static_cast<uint8_t>(crc >> 8));
  }
  return EncodeError::None;
}

std::size_t PacketCodec::expected_frame_size(const uint8_t* bytes, std::size_t len) {
  if (len <= LENGTH_OFFSET) return 0;
  return static_cast<std::size_t>(bytes[LENGTH_OFFSET]) + FRAME_OVERHEAD;
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Structural checks first (length byte sane, exact size), integrity second.
// A checksum is only meaningful once we know which bytes belong to the block.
// ---------------------------------------------------------------------------
DecodeError PacketCodec::decode(const uint8_t* bytes, std::size_t len, Reply& out) const {
  out = Reply{};

  std::size_t need = expected_frame_size(bytes, len);
  if (need == 0) return DecodeError::Incomplete;
  if (need > MAX_BLOCK_LENGTH) return DecodeError::MalformedFrame;
  if (len < need) return DecodeError::Incomplete;
  if (len > need) return DecodeError::MalformedFrame;

  const std::size_t data_len = bytes[LENGTH_OFFSET];
  const std::size_t chk_at   = DATA_OFFSET + data_len;

  if (type_ == ChecksumType::Sum8) {
    uint8_t acc = 0;
    for (std::size_t i = 0; i < need; ++i) acc = static_cast<uint8_t>(acc + bytes[i]);
    if (acc != 0) return DecodeError::ChecksumMismatch;
    out.source     = bytes[SOURCE_OFFSET];
    out.has_source = true;
  } else {
    uint16_t crc = crc16(bytes, 2);
    crc = crc16(bytes + HEADER_OFFSET, chk_at - HEADER_OFFSET, crc);
    uint16_t got = static_cast<uint16_t>((bytes[chk_at] << 8) | bytes[SOURCE_OFFSET]);
    if (crc != got) return DecodeError::ChecksumMismatch;
    out.source     = 0;
    out.has_source = false;
  }

  out.destination = bytes[DESTINATION_OFFSET];
  out.header      = bytes[HEADER_OFFSET];
  out.data.assign(bytes + DATA_OFFSET, bytes + chk_at);
  out.checksum_ok = true;
  return DecodeError::None;
}

} // namespace cctalk
