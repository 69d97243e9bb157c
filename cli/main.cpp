/**
 * @file main.cpp
 * @brief cctalk-cli: one-shot commands and bus polling from the shell.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); layer them over an optional JSON config file.
 *  - Open the transport (tty or Unix socket) and build a cctalk::Host on it.
 *  - One-shot mode: send one command, print the reply (pretty | json).
 *  - Poll mode: run the poll loop for N rounds / T ms / until SIGINT, print
 *    device health, optionally write it atomically to a JSON status file.
 *
 * Exit codes:
 *  0 success, 1 transport open failure, 2 usage/config error,
 *  3 timeout, 4 any other protocol error.
 *
 * Examples:
 *  cctalk-cli --dev /dev/ttyUSB0 --dest 2 --header simple_poll
 *  cctalk-cli --sock /tmp/cctalk.sock --dest 40 --header 246 --format json
 *  cctalk-cli --dev /dev/ttyUSB0 --poll 2,3,40 --duration-ms 5000 --status-file s.json
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "cctalk/commands.hpp"
#include "cctalk/config.hpp"
#include "cctalk/host.hpp"
#include "cctalk/log.hpp"
#include "cctalk/transport/transport_factory.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace cctalk;

namespace {

constexpr int EXIT_OK        = 0;
constexpr int EXIT_OPEN      = 1;
constexpr int EXIT_USAGE     = 2;
constexpr int EXIT_TIMEOUT   = 3;
constexpr int EXIT_PROTOCOL  = 4;

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted = true; }

// ---------- small utilities ----------

int usage_error(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return EXIT_USAGE;
}

// "2,3,40" or "2 3 40" -> {2,3,40}
bool parse_address_list(const std::string& s, std::vector<uint8_t>& out) {
  out.clear();
  std::string tok;
  auto flush = [&]() -> bool {
    if (tok.empty()) return true;
    char* e = nullptr;
    long v = std::strtol(tok.c_str(), &e, 0);
    tok.clear();
    if (!e || *e || v < 1 || v > 255) return false;
    out.push_back(static_cast<uint8_t>(v));
    return true;
  };
  for (char c : s) {
    if (c == ',' || c == ' ') { if (!flush()) return false; }
    else tok.push_back(c);
  }
  return flush() && !out.empty();
}

int64_t epoch_ms(const std::optional<std::chrono::system_clock::time_point>& t) {
  using namespace std::chrono;
  if (!t) return 0;
  return duration_cast<milliseconds>(t->time_since_epoch()).count();
}

json reply_to_json(const Reply& r, ProtocolError e) {
  json j;
  j["status"] = to_string(e);
  j["dst"]    = r.destination;
  if (r.has_source) j["src"] = r.source;
  j["header"] = r.header;
  j["header_name"] = header_name(r.header);
  j["data"]   = to_hex(r.data.data(), r.data.size(), 0);
  j["len"]    = r.data.size();
  return j;
}

json record_to_json(const DeviceRecord& d) {
  json j;
  j["address"]              = d.address;
  j["health"]               = to_string(d.health);
  j["consecutive_failures"] = d.consecutive_failures;
  j["total_polls"]          = d.total_polls;
  j["total_failures"]       = d.total_failures;
  j["last_error"]           = to_string(d.last_error);
  j["last_seen_ms"]         = epoch_ms(d.last_seen);
  return j;
}

std::string record_line(const DeviceRecord& d) {
  std::string s = "addr=" + std::to_string(d.address) +
                  " health=" + to_string(d.health) +
                  " failures=" + std::to_string(d.consecutive_failures) +
                  " polls=" + std::to_string(d.total_polls) +
                  " failed=" + std::to_string(d.total_failures) +
                  " last_error=" + to_string(d.last_error);
  if (d.last_seen) s += " last_seen_ms=" + std::to_string(epoch_ms(d.last_seen));
  return s;
}

bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

// The line belongs to the poll thread; its outcome reaches us through the records.
bool saw_transport_closed(const std::vector<DeviceRecord>& records) {
  for (const auto& d : records) {
    if (d.last_error == ProtocolError::TransportClosed) return true;
  }
  return false;
}

int exit_code_for(ProtocolError e) {
  if (e == ProtocolError::None)    return EXIT_OK;
  if (e == ProtocolError::Timeout) return EXIT_TIMEOUT;
  return EXIT_PROTOCOL;
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  // Transport
  std::string opt_dev;
  int         opt_baud = 0;
  std::string opt_sock;
  std::string opt_config;

  // Protocol
  int  opt_host = 0;
  bool opt_crc16 = false;
  int  opt_timeout_ms = -1;
  int  opt_retries = -1;
  int  opt_retry_delay_ms = -1;
  bool opt_no_echo = false;
  bool opt_retry_nack = false;
  std::string opt_log_level;

  // One-shot
  int         opt_dest = -1;
  std::string opt_header;
  std::string opt_data;
  std::string opt_format = "pretty";

  // Poll
  std::string opt_poll;
  uint64_t    opt_rounds = 0;
  int64_t     opt_duration_ms = 0;
  int64_t     opt_interval_ms = -1;
  int64_t     opt_threshold = -1;
  std::string opt_status_file;

  CLI::App app{"ccTalk host command-line tool"};

  app.add_option("--dev", opt_dev, "Serial device, e.g. /dev/ttyUSB0");
  app.add_option("--baud", opt_baud, "Serial baud rate (default 9600)");
  app.add_option("--sock", opt_sock, "Unix socket bridging the bus (e.g. /tmp/cctalk.sock)");
  app.add_option("--config", opt_config, "JSON configuration file")->check(CLI::ExistingFile);

  app.add_option("--host", opt_host, "Host address 1..255")->check(CLI::Range(1, 255));
  app.add_flag("--crc16", opt_crc16, "Use CRC-16 checksums instead of the simple checksum");
  app.add_option("--timeout", opt_timeout_ms, "Per-attempt reply timeout in ms")->check(CLI::Range(1, 3600000));
  app.add_option("--retries", opt_retries, "Retransmissions after the first attempt")->check(CLI::Range(0, 255));
  app.add_option("--retry-delay", opt_retry_delay_ms, "Pause before a retransmission in ms")->check(CLI::Range(0, 3600000));
  app.add_flag("--no-echo", opt_no_echo, "Bus does not echo our own transmission");
  app.add_flag("--retry-nack", opt_retry_nack, "Retry NACK / BUSY replies");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off")
     ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));

  app.add_option("--dest", opt_dest, "Destination address 0..255")->check(CLI::Range(0, 255));
  app.add_option("--header", opt_header, "Header number or name (e.g. simple_poll)");
  app.add_option("--data", opt_data, "Payload hex bytes, e.g. \"01 02 ff\"");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));

  app.add_option("--poll", opt_poll, "Poll these addresses, e.g. 2,3,40");
  app.add_option("--rounds", opt_rounds, "Stop after N poll rounds");
  app.add_option("--duration-ms", opt_duration_ms, "Stop polling after T ms")->check(CLI::NonNegativeNumber);
  app.add_option("--interval-ms", opt_interval_ms, "Poll round interval in ms")->check(CLI::Range(int64_t{0}, int64_t{3600000}));
  app.add_option("--threshold", opt_threshold, "Failures before a device is unresponsive")->check(CLI::Range(int64_t{1}, int64_t{1000000}));
  app.add_option("--status-file", opt_status_file, "Write final device records here (JSON)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    int rc = app.exit(e);
    return rc == 0 ? EXIT_OK : EXIT_USAGE;
  }

  // Defaults -> config file -> flags. A physical ccTalk line echoes what we send.
  HostConfig cfg;
  cfg.request.local_echo = true;
  cfg.poll.request = cfg.request;

  std::string err;
  if (!opt_config.empty() && !load_config(opt_config, cfg, err)) {
    return usage_error("bad_config detail=\"" + err + "\"");
  }

  auto override_request = [&](RequestOptions& r) {
    if (opt_timeout_ms >= 0)     r.timeout = std::chrono::milliseconds(opt_timeout_ms);
    if (opt_retries >= 0)        r.max_retries = static_cast<unsigned>(opt_retries);
    if (opt_retry_delay_ms >= 0) r.retry_delay = std::chrono::milliseconds(opt_retry_delay_ms);
    if (opt_no_echo)             r.local_echo = false;
    if (opt_retry_nack)          r.retry_on_nack = true;
  };
  override_request(cfg.request);
  override_request(cfg.poll.request);

  if (opt_host)  cfg.host_address = static_cast<uint8_t>(opt_host);
  if (opt_crc16) cfg.checksum = ChecksumType::Crc16;
  if (!opt_log_level.empty()) log::parse_level(opt_log_level, cfg.log_level);

  if (!opt_dev.empty()) {
    cfg.transport.kind = transport::TransportKind::Serial;
    cfg.transport.path = opt_dev;
  } else if (!opt_sock.empty()) {
    cfg.transport.kind = transport::TransportKind::Socket;
    cfg.transport.path = opt_sock;
  }
  if (opt_baud) cfg.transport.baud = opt_baud;

  const bool poll_mode = !opt_poll.empty();
  if (poll_mode) {
    if (!parse_address_list(opt_poll, cfg.poll.addresses)) return usage_error("bad_poll_list");
    if (opt_interval_ms >= 0) cfg.poll.interval = std::chrono::milliseconds(opt_interval_ms);
    if (opt_threshold > 0)    cfg.poll.failure_threshold = static_cast<uint32_t>(opt_threshold);
  } else if (opt_dest < 0 || opt_header.empty()) {
    return usage_error("need --dest and --header, or --poll");
  }

  if (!validate_config(cfg, err)) return usage_error("bad_config detail=\"" + err + "\"");
  log::set_level(cfg.log_level);

  uint8_t header = 0;
  Bytes payload;
  if (!poll_mode) {
    if (!parse_header(opt_header, header)) return usage_error("bad_header");
    if (!parse_hex_bytes(opt_data, payload, err)) return usage_error(err);
    if (payload.size() > MAX_DATA_LENGTH) return usage_error("payload_too_large");
  }

  // Writes to a socket whose peer vanished must fail, not kill the process.
  std::signal(SIGPIPE, SIG_IGN);

  auto link = transport::open_transport(cfg.transport, err);
  if (!link) {
    std::cerr << "status=error reason=" << err << "\n";
    return cfg.transport.path.empty() && cfg.transport.kind == transport::TransportKind::Serial
               ? EXIT_USAGE : EXIT_OPEN;
  }

  Host host(*link, cfg);

  // ---------- one-shot ----------
  if (!poll_mode) {
    Reply reply;
    ProtocolError e = host.send_command(static_cast<uint8_t>(opt_dest), header, payload, reply);
    const bool have_reply = e == ProtocolError::None || e == ProtocolError::Nack ||
                            e == ProtocolError::Busy;

    if (opt_format == "json") {
      json j = have_reply ? reply_to_json(reply, e) : json{{"status", to_string(e)}};
      std::cout << j.dump(2) << "\n";
    } else if (have_reply) {
      std::cout << describe_reply(reply) << "\n";
    }
    if (e != ProtocolError::None) {
      std::cerr << "status=error reason=" << to_string(e)
                << " dst=" << opt_dest << " header=" << unsigned(header) << "\n";
    }
    return exit_code_for(e);
  }

  // ---------- poll ----------
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  PollHandle poll = host.start_poll_loop(cfg.poll, [&](const DeviceRecord& d, Health prev) {
    if (opt_format == "pretty") {
      std::cout << "event=health from=" << to_string(prev) << " " << record_line(d) << std::endl;
    }
  });

  const auto started = std::chrono::steady_clock::now();
  bool link_lost = false;
  while (!g_interrupted) {
    if (opt_rounds && poll.rounds() >= opt_rounds) break;
    if (opt_duration_ms &&
        std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(opt_duration_ms)) {
      break;
    }
    if (saw_transport_closed(poll.snapshot())) {
      link_lost = true;
      std::cerr << "status=error reason=transport_closed\n";
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  poll.stop();

  std::vector<DeviceRecord> records = poll.snapshot();
  json arr = json::array();
  for (const auto& d : records) arr.push_back(record_to_json(d));

  if (opt_format == "json") {
    std::cout << arr.dump(2) << "\n";
  } else {
    for (const auto& d : records) std::cout << record_line(d) << "\n";
  }

  if (!opt_status_file.empty() && !atomic_write_json(opt_status_file, arr)) {
    std::cerr << "status=error reason=status_file_write path=" << opt_status_file << "\n";
    return EXIT_PROTOCOL;
  }
  return link_lost ? EXIT_PROTOCOL : EXIT_OK;
}
