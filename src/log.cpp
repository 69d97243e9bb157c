// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "cctalk/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace cctalk {
namespace log {

namespace {
std::atomic<Level> g_level{Level::Info};
std::ostream*      g_sink = &std::cerr;
std::mutex         g_mutex;            // guards g_sink and the write itself
} // namespace

void  set_level(Level lvl) { g_level.store(lvl); }
Level level()              { return g_level.load(); }

void set_sink(std::ostream& os) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_sink = &os;
}

bool enabled(Level lvl) {
  Level cur = g_level.load();
  return cur != Level::Off && lvl >= cur;
}

void write(Level lvl, const char* component, const std::string& body) {
  std::lock_guard<std::mutex> lock(g_mutex);
  (*g_sink) << "level=" << to_string(lvl)
            << " component=" << (component ? component : "-")
            << ' ' << body << '\n';
  g_sink->flush();
}

const char* to_string(Level lvl) {
  switch (lvl) {
    case Level::Trace: return "trace";
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "info";
}

bool parse_level(const std::string& name, Level& out) {
  static const Level all[] = {Level::Trace, Level::Debug, Level::Info,
                              Level::Warn,  Level::Error, Level::Off};
  for (Level l : all) {
    if (name == to_string(l)) { out = l; return true; }
  }
  return false;
}

} // namespace log

std::string to_hex(const uint8_t* data, std::size_t n, char sep) {
  static const char* DIGITS = "0123456789ABCDEF";
  std::string s;
  s.reserve(n * 3);
  for (std::size_t i = 0; i < n; ++i) {
    if (i && sep) s.push_back(sep);
    s.push_back(DIGITS[data[i] >> 4]);
    s.push_back(DIGITS[data[i] & 0x0F]);
  }
  return s;
}

} // namespace cctalk
