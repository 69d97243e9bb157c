/**
 * @file config.hpp
 * @brief HostConfig: every tunable of the engine, loadable from JSON.
 *
 * @details
 * File format (every key optional, defaults shown):
 * @code
 *   {
 *     "host_address": 1,
 *     "checksum": "sum8",              // or "crc16"
 *     "timeout_ms": 100,
 *     "max_retries": 2,
 *     "retry_delay_ms": 0,
 *     "retry_on_nack": false,
 *     "local_echo": false,
 *     "idempotent": true,
 *     "poll": {
 *       "addresses": [2, 3, 40],
 *       "interval_ms": 200,
 *       "spacing_ms": 0,
 *       "failure_threshold": 3,
 *       "header": 254,                 // number or catalog name ("simple_poll")
 *       "payload": "",                 // hex bytes
 *       "timeout_ms": 100,             // overrides the top-level request options
 *       "max_retries": 2
 *     },
 *     "transport": { "kind": "serial", "path": "/dev/ttyUSB0", "baud": 9600 },
 *     "log_level": "info"
 *   }
 * @endcode
 *
 * Loading never throws: JSON errors are caught at this boundary and returned
 * as a message. Values are validated after parsing; the CLI validates again
 * after applying its flag overrides.
 */
#ifndef CCTALK_CONFIG_HPP
#define CCTALK_CONFIG_HPP

#include <string>

#include "cctalk/checksum.hpp"
#include "cctalk/correlator.hpp"
#include "cctalk/log.hpp"
#include "cctalk/packet.hpp"
#include "cctalk/poll_loop.hpp"
#include "cctalk/transport/transport_factory.hpp"

namespace cctalk {

struct HostConfig {
  uint8_t                    host_address{DEFAULT_HOST_ADDRESS};
  ChecksumType               checksum{ChecksumType::Sum8};
  RequestOptions             request;
  PollConfig                 poll;
  transport::TransportConfig transport;
  log::Level                 log_level{log::Level::Info};
};

bool parse_checksum(const std::string& s, ChecksumType& out);

/// Reject values the engine cannot run with. @p err names the offending key.
bool validate_config(const HostConfig& cfg, std::string& err);

/// Apply a JSON document on top of @p cfg, then validate.
bool parse_config(const std::string& text, HostConfig& cfg, std::string& err);

/// Read @p path and hand it to parse_config().
bool load_config(const std::string& path, HostConfig& cfg, std::string& err);

} // namespace cctalk

#endif // CCTALK_CONFIG_HPP
