#pragma once
/**
 * @file transport_factory.hpp
 * @brief Build a connected transport from configuration.
 */

#include "cctalk/transport/transport_base.hpp"

#include <memory>
#include <string>

namespace cctalk::transport {

enum class TransportKind : uint8_t { Serial = 0, Socket = 1 };

const char* to_string(TransportKind k);
bool parse_transport_kind(const std::string& s, TransportKind& out);

struct TransportConfig {
  TransportKind kind{TransportKind::Serial};
  std::string   path;               ///< tty path, or socket path (empty = /tmp/cctalk.sock)
  int           baud{9600};         ///< serial only
  int           boot_delay_ms{0};   ///< serial only
};

/**
 * @brief Open the configured channel.
 *
 * @return A ready transport, or nullptr with @p err set to a short
 *         `reason detail` string (e.g. "open_failed /dev/ttyUSB0: Permission denied").
 */
std::unique_ptr<ITransport> open_transport(const TransportConfig& cfg, std::string& err);

} // namespace cctalk::transport
