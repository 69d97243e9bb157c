#pragma once
/**
 * @file log.hpp
 * @brief Line-oriented key=value logging for the engine and the CLI.
 *
 * @details
 * Every record is one line:
 *
 *     level=warn component=correlator event=retry dst=2 attempt=2 reason=timeout
 *
 * The same shape the CLI prints on stdout/stderr (`status=error reason=...`),
 * so shell tools can grep either. Lines are written under a mutex; the poll
 * loop thread and caller threads never interleave mid-line.
 *
 * Usage:
 * @code
 *   cctalk::log::set_level(cctalk::log::Level::Debug);
 *   CCTALK_LOG(Info, "poll", "event=health addr=" << int(a) << " state=alive");
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

namespace cctalk {
namespace log {

enum class Level : uint8_t { Trace = 0, Debug, Info, Warn, Error, Off };

void  set_level(Level lvl);
Level level();

/// Redirect output (default std::cerr). The stream must outlive all logging.
void set_sink(std::ostream& os);

bool enabled(Level lvl);

/// Write one preformatted record. Adds the "level=... component=..." prefix.
void write(Level lvl, const char* component, const std::string& body);

const char* to_string(Level lvl);

/// "trace|debug|info|warn|error|off" -> Level. Returns false on unknown names.
bool parse_level(const std::string& name, Level& out);

} // namespace log

/// Uppercase hex: "02 00 01 FE FF". Pass sep = 0 for "020001FEFF".
std::string to_hex(const uint8_t* data, std::size_t n, char sep = ' ');

} // namespace cctalk

/// Format lazily: the stream expression is only evaluated when the level is on.
#define CCTALK_LOG(LVL, COMPONENT, EXPR)                                        \
  do {                                                                          \
    if (::cctalk::log::enabled(::cctalk::log::Level::LVL)) {                    \
      std::ostringstream cctalk_log_os_;                                        \
      cctalk_log_os_ << EXPR;                                                   \
      ::cctalk::log::write(::cctalk::log::Level::LVL, COMPONENT,                \
                           cctalk_log_os_.str());                               \
    }                                                                           \
  } while (0)
