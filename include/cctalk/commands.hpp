/**
 * @page cctalk-commands ccTalk Generic Headers
 * @file commands.hpp
 * @brief Generic ccTalk header catalog and one-line reply rendering.
 *
 * @details
 * PURPOSE
 * -------
 * ccTalk calls its opcode byte the *header*. This file names the handful of
 * generic headers the engine and the CLI care about (polling, identification,
 * the ACK/NACK/BUSY reply headers) and renders replies as grep-friendly
 * `key=value` lines. Device-family payload encodings (coin tables, hopper
 * dispense blocks, bill routing) are deliberately absent: this layer stops at
 * framing.
 *
 * REPLY HEADERS
 * -------------
 * A device answers with header 0 (ACK / reply) plus data. Two special headers
 * signal refusal: NACK (5) and BUSY (6). The correlator maps those to
 * ProtocolError::Nack and ProtocolError::Busy.
 *
 * EXAMPLE
 * -------
 *   Request:  02 00 01 F6 07      (dst=2, Request Manufacturer Id)
 *   Reply:    01 03 02 00 57 48 4D 0E
 *   describe_reply() -> "status=ok src=2 dst=1 header=0 len=3 data=57484D ascii=\"WHM\""
 *
 * MAINTENANCE
 * -----------
 * Headers are part of the wire contract. Add names, never renumber.
 */
#ifndef CCTALK_COMMANDS_HPP
#define CCTALK_COMMANDS_HPP

#include <cstdint>
#include <string>

#include "cctalk/packet.hpp"

namespace cctalk {

// =============================== Headers ===============================
enum : uint8_t {
  HDR_REPLY                      = 0,    /**< ACK / reply carrying data. */
  HDR_RESET_DEVICE               = 1,    /**< Soft reset. Not idempotent in effect; do not retry blindly. */
  HDR_NACK                       = 5,    /**< Device refused the command. */
  HDR_BUSY                       = 6,    /**< Device cannot act right now. */

  HDR_REQUEST_SOFTWARE_REVISION  = 241,  /**< ASCII revision string. */
  HDR_REQUEST_SERIAL_NUMBER      = 242,  /**< 3 bytes, LSB first. */
  HDR_REQUEST_PRODUCT_CODE       = 244,  /**< ASCII product code. */
  HDR_REQUEST_EQUIPMENT_CATEGORY = 245,  /**< ASCII category, e.g. "Coin Acceptor". */
  HDR_REQUEST_MANUFACTURER_ID    = 246,  /**< ASCII manufacturer abbreviation. */
  HDR_REQUEST_STATUS             = 248,  /**< 1 status byte. */
  HDR_ADDRESS_POLL               = 253,  /**< MDCES broadcast; replies are bare address bytes. */
  HDR_SIMPLE_POLL                = 254   /**< Liveness check; empty ACK expected. */
};

/**
 * @brief Human name of a header, or "header_<n>" for unnamed values.
 */
std::string header_name(uint8_t header);

/**
 * @brief Resolve a CLI token to a header value.
 *
 * Accepts a catalog name ("simple_poll", "request_status", ...) or a number in
 * decimal / 0x-hex.
 *
 * @return false if the token is neither.
 */
bool parse_header(const std::string& token, uint8_t& out);

/**
 * @brief Parse "01 02 ff" / "01,02,0xff" / "0102ff" into bytes.
 *
 * @return false on a malformed token, @p err names it.
 */
bool parse_hex_bytes(const std::string& text, Bytes& out, std::string& err);

/**
 * @brief Render a reply as one line of key=value pairs.
 *
 * Always begins with "status=ok", "status=nack" or "status=busy" so shell
 * scripts can switch on the first token.
 */
std::string describe_reply(const Reply& r);

} // namespace cctalk

#endif // CCTALK_COMMANDS_HPP
