#pragma once
/**
 * @file transport_unix_socket.hpp
 * @brief ccTalk bus reached through a Unix domain socket (header-only).
 *
 * Useful when another process owns the serial port and bridges it onto a
 * socket, and for bench setups with a software device simulator.
 */

#include "cctalk/transport/transport_fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>

namespace cctalk::transport {

static constexpr const char* DEFAULT_SOCKET_PATH = "/tmp/cctalk.sock";

class UnixSocket : public FdTransport {
public:
  explicit UnixSocket(const std::string& path = DEFAULT_SOCKET_PATH) : path_(path) {}

  /**
   * @brief Connect (blocking) and switch the socket to non-blocking mode.
   * @return false on any failure; errno describes it.
   */
  bool open() {
    sockaddr_un addr{};
    if (path_.empty() || path_.size() >= sizeof(addr.sun_path)) {
      errno = ENAMETOOLONG;
      return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path_.c_str(), path_.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK) != 0) {
      int saved = errno;
      ::close(fd);
      errno = saved;
      return false;
    }
    adopt(fd);
    return true;
  }

  const std::string& path() const { return path_; }

  const char* name() const override { return "unix-socket"; }

private:
  std::string path_;
};

} // namespace cctalk::transport
