// ============================================================================
// checksum.cpp — implementation for checksum.hpp
// ============================================================================

#include "cctalk/checksum.hpp"

namespace cctalk {

const char* to_string(ChecksumType t) {
  return t == ChecksumType::Crc16 ? "crc16" : "sum8";
}

uint8_t sum8(const uint8_t* block, std::size_t n) {
  uint8_t acc = 0;
  for (std::size_t i = 0; i < n; ++i) acc = static_cast<uint8_t>(acc + block[i]);
  return static_cast<uint8_t>(0x100 - acc);   // 0 stays 0 after truncation
}

uint16_t crc16(const uint8_t* data, std::size_t n, uint16_t crc) {
  for (std::size_t i = 0; i < n; ++i) {
    crc ^= static_cast<uint16_t>(data[i]) << 8;
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else              crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

} // namespace cctalk
