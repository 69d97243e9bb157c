// ============================================================================
// config.cpp — implementation for config.hpp
// nlohmann::json exceptions stop here; callers only see bool + message.
// ============================================================================

#include "cctalk/config.hpp"
#include "cctalk/commands.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace cctalk {

namespace {

// ---------------------------------------------------------------------------
// Typed field readers. Each returns false with err set; a missing key is not
// an error and leaves the target untouched.
// ---------------------------------------------------------------------------
bool read_int(const json& j, const char* key, int64_t lo, int64_t hi,
              int64_t& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_integer()) { err = std::string(key) + ": expected integer"; return false; }
  int64_t x = v.get<int64_t>();
  if (x < lo || x > hi) {
    err = std::string(key) + ": out of range " + std::to_string(lo) + ".." + std::to_string(hi);
    return false;
  }
  out = x;
  return true;
}

bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_boolean()) { err = std::string(key) + ": expected boolean"; return false; }
  out = v.get<bool>();
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, bool& present,
                 std::string& err) {
  present = j.contains(key);
  if (!present) return true;
  const json& v = j.at(key);
  if (!v.is_string()) { err = std::string(key) + ": expected string"; return false; }
  out = v.get<std::string>();
  return true;
}

bool read_ms(const json& j, const char* key, std::chrono::milliseconds& out, std::string& err) {
  int64_t v = out.count();
  if (!read_int(j, key, 0, 3600000, v, err)) return false;
  out = std::chrono::milliseconds(v);
  return true;
}

// Request options live at the top level and may be overridden inside "poll".
bool read_request(const json& j, RequestOptions& r, std::string& err) {
  int64_t retries = r.max_retries;
  if (!read_ms(j, "timeout_ms", r.timeout, err)) return false;
  if (!read_int(j, "max_retries", 0, 255, retries, err)) return false;
  if (!read_ms(j, "retry_delay_ms", r.retry_delay, err)) return false;
  if (!read_bool(j, "retry_on_nack", r.retry_on_nack, err)) return false;
  if (!read_bool(j, "local_echo", r.local_echo, err)) return false;
  if (!read_bool(j, "idempotent", r.idempotent, err)) return false;
  r.max_retries = static_cast<unsigned>(retries);
  return true;
}

bool read_poll(const json& j, PollConfig& p, std::string& err) {
  if (!j.is_object()) { err = "poll: expected object"; return false; }

  if (j.contains("addresses")) {
    const json& a = j.at("addresses");
    if (!a.is_array()) { err = "poll.addresses: expected array"; return false; }
    p.addresses.clear();
    for (const json& e : a) {
      if (!e.is_number_integer() || e.get<int64_t>() < 0 || e.get<int64_t>() > 255) {
        err = "poll.addresses: expected integers 0..255";
        return false;
      }
      p.addresses.push_back(static_cast<uint8_t>(e.get<int64_t>()));
    }
  }

  int64_t threshold = p.failure_threshold;
  if (!read_ms(j, "interval_ms", p.interval, err)) return false;
  if (!read_ms(j, "spacing_ms", p.spacing, err)) return false;
  if (!read_int(j, "failure_threshold", 0, 1000000, threshold, err)) return false;
  p.failure_threshold = static_cast<uint32_t>(threshold);

  if (j.contains("header")) {
    const json& h = j.at("header");
    uint8_t hdr = 0;
    bool ok = false;
    if (h.is_number_integer()) {
      int64_t v = h.get<int64_t>();
      ok = v >= 0 && v <= 255;
      hdr = static_cast<uint8_t>(v);
    } else if (h.is_string()) {
      ok = parse_header(h.get<std::string>(), hdr);
    }
    if (!ok) { err = "poll.header: expected 0..255 or a header name"; return false; }
    p.status_header = hdr;
  }

  std::string hex;
  bool present = false;
  if (!read_string(j, "payload", hex, present, err)) return false;
  if (present) {
    std::string perr;
    if (!parse_hex_bytes(hex, p.status_payload, perr)) { err = "poll.payload: " + perr; return false; }
  }

  return read_request(j, p.request, err);
}

bool read_transport(const json& j, transport::TransportConfig& t, std::string& err) {
  if (!j.is_object()) { err = "transport: expected object"; return false; }

  std::string kind;
  bool present = false;
  if (!read_string(j, "kind", kind, present, err)) return false;
  if (present && !transport::parse_transport_kind(kind, t.kind)) {
    err = "transport.kind: expected serial or socket";
    return false;
  }
  if (!read_string(j, "path", t.path, present, err)) return false;

  int64_t baud = t.baud, delay = t.boot_delay_ms;
  if (!read_int(j, "baud", 1, 4000000, baud, err)) return false;
  if (!read_int(j, "boot_delay_ms", 0, 60000, delay, err)) return false;
  t.baud = static_cast<int>(baud);
  t.boot_delay_ms = static_cast<int>(delay);
  return true;
}

} // namespace

bool parse_checksum(const std::string& s, ChecksumType& out) {
  if (s == "sum8")  { out = ChecksumType::Sum8;  return true; }
  if (s == "crc16") { out = ChecksumType::Crc16; return true; }
  return false;
}

bool validate_config(const HostConfig& cfg, std::string& err) {
  if (cfg.host_address == BROADCAST_ADDRESS) { err = "host_address: must be 1..255"; return false; }
  if (cfg.request.timeout.count() <= 0)      { err = "timeout_ms: must be > 0"; return false; }
  if (cfg.poll.request.timeout.count() <= 0) { err = "poll.timeout_ms: must be > 0"; return false; }
  if (cfg.poll.failure_threshold == 0)       { err = "poll.failure_threshold: must be >= 1"; return false; }
  if (cfg.poll.status_payload.size() > MAX_DATA_LENGTH) {
    err = "poll.payload: longer than 252 bytes";
    return false;
  }

  std::set<uint8_t> seen;
  for (uint8_t a : cfg.poll.addresses) {
    if (a == BROADCAST_ADDRESS)   { err = "poll.addresses: 0 is broadcast, not a device"; return false; }
    if (a == cfg.host_address)    { err = "poll.addresses: contains the host address"; return false; }
    if (!seen.insert(a).second)   { err = "poll.addresses: duplicate " + std::to_string(a); return false; }
  }
  return true;
}

bool parse_config(const std::string& text, HostConfig& cfg, std::string& err) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::exception& e) {
    err = std::string("parse: ") + e.what();
    return false;
  }
  if (!j.is_object()) { err = "parse: top level must be an object"; return false; }

  HostConfig c = cfg;

  int64_t host = c.host_address;
  if (!read_int(j, "host_address", 0, 255, host, err)) return false;
  c.host_address = static_cast<uint8_t>(host);

  std::string s;
  bool present = false;
  if (!read_string(j, "checksum", s, present, err)) return false;
  if (present && !parse_checksum(s, c.checksum)) { err = "checksum: expected sum8 or crc16"; return false; }

  // Top-level request keys apply to both ad-hoc commands and polling.
  if (!read_request(j, c.request, err)) return false;
  if (!read_request(j, c.poll.request, err)) return false;
  if (j.contains("poll") && !read_poll(j.at("poll"), c.poll, err)) return false;
  if (j.contains("transport") && !read_transport(j.at("transport"), c.transport, err)) return false;

  if (!read_string(j, "log_level", s, present, err)) return false;
  if (present && !log::parse_level(s, c.log_level)) { err = "log_level: unknown level " + s; return false; }

  if (!validate_config(c, err)) return false;
  cfg = c;
  return true;
}

bool load_config(const std::string& path, HostConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open: cannot read " + path; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

} // namespace cctalk
