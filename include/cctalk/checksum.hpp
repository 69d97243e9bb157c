/**
 * @file checksum.hpp
 * @brief ccTalk block checksums: 8-bit simple checksum and CRC-16/CCITT.
 *
 * @details
 * WHERE THE BYTES GO
 * ------------------
 *   Sum8  : [dst][len][src][hdr][data...][chk]
 *           chk makes the 8-bit sum of the whole block zero.
 *
 *   Crc16 : [dst][len][crc_lo][hdr][data...][crc_hi]
 *           CRC covers dst, len, hdr and data (the source slot is not part of
 *           the input, it *carries* the low CRC byte). Polynomial 0x1021,
 *           initial value 0, no reflection, no final xor.
 *
 * Device families pick one or the other; the engine selects it once at
 * construction and never mixes them on one bus.
 */
#ifndef CCTALK_CHECKSUM_HPP
#define CCTALK_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>

namespace cctalk {

enum class ChecksumType : uint8_t {
  Sum8 = 0,
  Crc16 = 1
};

const char* to_string(ChecksumType t);

/**
 * @brief Simple checksum of a block.
 *
 * Sums @p n bytes starting at @p block and returns the value that brings the
 * total to zero modulo 256. Pass the block without its trailing checksum byte.
 */
uint8_t sum8(const uint8_t* block, std::size_t n);

/**
 * @brief CRC-16/CCITT (XModem variant) over @p n bytes.
 *
 * Bitwise; no lookup table. Frames are short and the bus runs at 9600 baud.
 */
uint16_t crc16(const uint8_t* data, std::size_t n, uint16_t crc = 0);

} // namespace cctalk

#endif // CCTALK_CHECKSUM_HPP
