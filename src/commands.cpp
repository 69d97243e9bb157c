// ============================================================================
// commands.cpp — implementation for commands.hpp
// For the header catalog see the matching .hpp. For usage, check tests/test_commands.cpp.
// ============================================================================

#include "cctalk/commands.hpp"
#include "cctalk/log.hpp"          // to_hex()

#include <cctype>                  // isxdigit / tolower for token parsing
#include <cstdlib>                 // strtol: predictable, exception-free number parsing
#include <sstream>                 // std::ostringstream for describe_reply

namespace cctalk {

namespace {

struct NamedHeader {
  uint8_t     value;
  const char* name;
};

const NamedHeader CATALOG[] = {
  {HDR_REPLY,                      "reply"},
  {HDR_RESET_DEVICE,               "reset_device"},
  {HDR_NACK,                       "nack"},
  {HDR_BUSY,                       "busy"},
  {HDR_REQUEST_SOFTWARE_REVISION,  "request_software_revision"},
  {HDR_REQUEST_SERIAL_NUMBER,      "request_serial_number"},
  {HDR_REQUEST_PRODUCT_CODE,       "request_product_code"},
  {HDR_REQUEST_EQUIPMENT_CATEGORY, "request_equipment_category"},
  {HDR_REQUEST_MANUFACTURER_ID,    "request_manufacturer_id"},
  {HDR_REQUEST_STATUS,             "request_status"},
  {HDR_ADDRESS_POLL,               "address_poll"},
  {HDR_SIMPLE_POLL,                "simple_poll"},
};

// ---------------------------------------------------------------------------
// parse_u8()
// ----------
// strtol with base 0 so "254", "0xFE" and "0376" all work. Rejects trailing junk
// and anything outside 0..255.
// ---------------------------------------------------------------------------
bool parse_u8(const std::string& s, uint8_t& out, int base = 0) {
  if (s.empty()) return false;
  char* e = nullptr;
  long v = std::strtol(s.c_str(), &e, base);
  if (!e || *e) return false;
  if (v < 0 || v > 255) return false;
  out = static_cast<uint8_t>(v);
  return true;
}

std::string lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

std::string header_name(uint8_t header) {
  for (const auto& h : CATALOG) {
    if (h.value == header) return h.name;
  }
  return "header_" + std::to_string(unsigned(header));
}

bool parse_header(const std::string& token, uint8_t& out) {
  std::string t = lower(token);
  for (const auto& h : CATALOG) {
    if (t == h.name) { out = h.value; return true; }
  }
  return parse_u8(t, out);
}

// ---------------------------------------------------------------------------
// parse_hex_bytes()
// -----------------
// Separators (space, comma, colon) split tokens. A token is either one byte
// ("ff", "0xff") or an unbroken run of hex pairs ("0102ff").
// ---------------------------------------------------------------------------
bool parse_hex_bytes(const std::string& text, Bytes& out, std::string& err) {
  out.clear();
  std::string tok;

  auto flush = [&]() -> bool {
    if (tok.empty()) return true;
    std::string t = tok;
    tok.clear();
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) t = t.substr(2);
    for (char c : t) {
      if (!std::isxdigit(static_cast<unsigned char>(c))) { err = "bad_hex_token"; return false; }
    }
    if (t.size() <= 2) {
      uint8_t b = 0;
      if (!parse_u8(t, b, 16)) { err = "bad_hex_token"; return false; }
      out.push_back(b);
      return true;
    }
    if (t.size() % 2 != 0) { err = "odd_hex_length"; return false; }
    for (std::size_t i = 0; i < t.size(); i += 2) {
      uint8_t b = 0;
      if (!parse_u8(t.substr(i, 2), b, 16)) { err = "bad_hex_token"; return false; }
      out.push_back(b);
    }
    return true;
  };

  for (char c : text) {
    if (c == ' ' || c == ',' || c == ':' || c == '\t') {
      if (!flush()) return false;
    } else {
      tok.push_back(c);
    }
  }
  return flush();
}

std::string describe_reply(const Reply& r) {
  std::ostringstream os;

  if      (r.header == HDR_NACK) os << "status=nack";
  else if (r.header == HDR_BUSY) os << "status=busy";
  else                           os << "status=ok";

  if (r.has_source) os << " src=" << unsigned(r.source);
  os << " dst=" << unsigned(r.destination)
     << " header=" << unsigned(r.header)
     << " len=" << r.data.size();

  if (!r.data.empty()) {
    os << " data=" << to_hex(r.data.data(), r.data.size(), 0);

    // Identification replies are ASCII; show them when every byte is printable.
    bool printable = true;
    for (uint8_t b : r.data) {
      if (b < 0x20 || b > 0x7E || b == '"') { printable = false; break; }
    }
    if (printable) {
      os << " ascii=\"" << std::string(r.data.begin(), r.data.end()) << "\"";
    }
  }
  return os.str();
}

} // namespace cctalk
