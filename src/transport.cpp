// ============================================================================
// transport.cpp — result names and the open_transport() factory
// ============================================================================

#include "cctalk/transport/transport_factory.hpp"
#include "cctalk/transport/transport_linux_serial.hpp"
#include "cctalk/transport/transport_unix_socket.hpp"
#include "cctalk/log.hpp"

#include <cerrno>
#include <cstring>

namespace cctalk::transport {

const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:     return "ok";
    case TxResult::Busy:   return "busy";
    case TxResult::Error:  return "error";
    case TxResult::Closed: return "closed";
  }
  return "unknown";
}

const char* to_string(RxResult r) {
  switch (r) {
    case RxResult::None:   return "none";
    case RxResult::Ok:     return "ok";
    case RxResult::Error:  return "error";
    case RxResult::Closed: return "closed";
  }
  return "unknown";
}

const char* to_string(TransportKind k) {
  return k == TransportKind::Socket ? "socket" : "serial";
}

bool parse_transport_kind(const std::string& s, TransportKind& out) {
  if (s == "serial") { out = TransportKind::Serial; return true; }
  if (s == "socket") { out = TransportKind::Socket; return true; }
  return false;
}

std::unique_ptr<ITransport> open_transport(const TransportConfig& cfg, std::string& err) {
  err.clear();

  if (cfg.kind == TransportKind::Socket) {
    std::string path = cfg.path.empty() ? DEFAULT_SOCKET_PATH : cfg.path;
    auto sock = std::make_unique<UnixSocket>(path);
    if (!sock->open()) {
      err = "open_failed " + path + ": " + std::strerror(errno);
      return nullptr;
    }
    CCTALK_LOG(Info, "transport", "event=open kind=socket path=" << path);
    return sock;
  }

  if (cfg.path.empty()) {
    err = "no_device";
    return nullptr;
  }
  unsigned speed = 0;
  if (!baud_to_speed(cfg.baud, speed)) {
    err = "bad_baud " + std::to_string(cfg.baud);
    return nullptr;
  }
  auto tty = std::make_unique<LinuxSerial>(cfg.path, cfg.baud);
  if (!tty->open(cfg.boot_delay_ms)) {
    err = "open_failed " + cfg.path + ": " + std::strerror(errno);
    return nullptr;
  }
  CCTALK_LOG(Info, "transport", "event=open kind=serial path=" << cfg.path
                                << " baud=" << cfg.baud);
  return tty;
}

} // namespace cctalk::transport
