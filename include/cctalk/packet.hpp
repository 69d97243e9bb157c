/**
 * @page cctalk-packet ccTalk Packet Codec
 * @file packet.hpp
 * @brief Frame layout, encode and decode for ccTalk blocks.
 *
 * @details
 * PURPOSE
 * -------
 * The codec is the only place that knows where bytes sit inside a ccTalk block.
 * It turns (destination, source, header, payload) into wire bytes and turns wire
 * bytes back into a Reply. It has no clock, no transport and no retry policy:
 * every call is deterministic and returns immediately.
 *
 * WIRE LAYOUT
 * -----------
 *   offset  0        1        2        3        4 .. 4+len-1   4+len
 *         [dst]    [len]    [src]    [hdr]     [data...]      [chk]
 *
 *   - len counts data bytes only (0..252). A block is len + 5 bytes.
 *   - Under Crc16 the src slot carries the CRC low byte and chk the high byte.
 *
 * STREAMING
 * ---------
 * decode() wants exactly one block. Stream readers call expected_frame_size()
 * on their accumulation buffer; once it returns a size and that many bytes are
 * buffered, they slice the block off and decode it. Short input yields
 * DecodeError::Incomplete and never blocks.
 *
 * EXAMPLE
 * -------
 * @code
 *   cctalk::PacketCodec codec(cctalk::ChecksumType::Sum8);
 *   cctalk::Frame f;
 *   codec.encode(2, 1, cctalk::HDR_SIMPLE_POLL, nullptr, 0, f);
 *   // f == 02 00 01 FE FF
 * @endcode
 */
#ifndef CCTALK_PACKET_HPP
#define CCTALK_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "etl/vector.h"

#include "cctalk/checksum.hpp"
#include "cctalk/errors.hpp"

namespace cctalk {

/// @name Block geometry
///@{
static constexpr std::size_t DESTINATION_OFFSET = 0;
static constexpr std::size_t LENGTH_OFFSET      = 1;
static constexpr std::size_t SOURCE_OFFSET      = 2;
static constexpr std::size_t HEADER_OFFSET      = 3;
static constexpr std::size_t DATA_OFFSET        = 4;

static constexpr std::size_t FRAME_OVERHEAD   = 5;     ///< dst + len + src + hdr + chk
static constexpr std::size_t MAX_DATA_LENGTH  = 252;   ///< Standard framing payload cap
static constexpr std::size_t MAX_BLOCK_LENGTH = MAX_DATA_LENGTH + FRAME_OVERHEAD;
///@}

static constexpr uint8_t BROADCAST_ADDRESS    = 0;
static constexpr uint8_t DEFAULT_HOST_ADDRESS = 1;

/// Host-side byte buffer. Unbounded; validated at encode time.
using Bytes = std::vector<uint8_t>;

/// One encoded block. Fixed capacity, lives on the stack.
using Frame = etl::vector<uint8_t, MAX_BLOCK_LENGTH>;

/// Decoded reply data.
using Payload = etl::vector<uint8_t, MAX_DATA_LENGTH>;

/**
 * @brief An opcode plus its payload. Immutable once constructed.
 *
 * The payload is not length-checked here; PacketCodec::encode() rejects
 * oversize payloads with EncodeError::PayloadTooLarge.
 */
class Command {
public:
  explicit Command(uint8_t header, Bytes payload = {})
  : header_(header), payload_(std::move(payload)) {}

  uint8_t header() const { return header_; }
  const Bytes& payload() const { return payload_; }

private:
  uint8_t header_;
  Bytes   payload_;
};

/**
 * @brief A decoded block.
 *
 * @note has_source is false for Crc16 blocks, whose source slot carries CRC
 *       bits. source is then reported as 0.
 */
struct Reply {
  uint8_t destination{0};
  uint8_t source{0};
  bool    has_source{true};
  uint8_t header{0};
  Payload data;
  bool    checksum_ok{false};
};

/**
 * @class PacketCodec
 * @brief Stateless ccTalk block codec bound to one checksum algorithm.
 */
class PacketCodec {
public:
  explicit PacketCodec(ChecksumType type = ChecksumType::Sum8) : type_(type) {}

  ChecksumType checksum_type() const { return type_; }

  /**
   * @brief Build one block.
   *
   * @param destination 0..255 (0 is broadcast).
   * @param source      1..255. 0 is rejected with InvalidAddress.
   * @param header      ccTalk header (command opcode).
   * @param payload     Data bytes, may be null when @p len is 0.
   * @param len         0..MAX_DATA_LENGTH, otherwise PayloadTooLarge.
   * @param out         Receives the block. Cleared first; untouched content on failure
   *                    is unspecified.
   */
  EncodeError encode(uint8_t destination, uint8_t source, uint8_t header,
                     const uint8_t* payload, std::size_t len, Frame& out) const;

  EncodeError encode(uint8_t destination, uint8_t source, const Command& cmd,
                     Frame& out) const {
    return encode(destination, source, cmd.header(),
                  cmd.payload().data(), cmd.payload().size(), out);
  }

  /**
   * @brief Validate and decode exactly one block.
   *
   * @retval DecodeError::None             @p out holds the reply, checksum_ok is true.
   * @retval DecodeError::Incomplete       fewer bytes than the block needs.
   * @retval DecodeError::MalformedFrame   declared length above 252, or trailing bytes
   *                                       beyond the declared block.
   * @retval DecodeError::ChecksumMismatch integrity check failed.
   */
  DecodeError decode(const uint8_t* bytes, std::size_t len, Reply& out) const;

  /**
   * @brief Total block size implied by a buffer's length byte.
   *
   * @return 0 while the length byte has not arrived yet, otherwise len + 5.
   *         Values above MAX_BLOCK_LENGTH mean the length byte is garbage.
   */
  static std::size_t expected_frame_size(const uint8_t* bytes, std::size_t len);

private:
  ChecksumType type_;
};

} // namespace cctalk

#endif // CCTALK_PACKET_HPP
