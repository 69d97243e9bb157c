#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport for a ccTalk bus (header-only, termios, non-blocking).
 *
 * Depends on: serial_io.hpp (raw 8N1 setup) and FdTransport (poll/read/write).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "cctalk/serial_io.hpp"
#include "cctalk/transport/transport_fd.hpp"

#include <string>

namespace cctalk::transport {

static constexpr int DEFAULT_BAUD = 9600;

class LinuxSerial : public FdTransport {
public:
  explicit LinuxSerial(const std::string& dev_path = {}, int baud = DEFAULT_BAUD)
  : dev_path_(dev_path), baud_(baud) {}

  /**
   * @brief Open the configured device raw 8N1.
   * @return false if the path is empty, the baud is unsupported or the open
   *         fails; errno describes the failure.
   */
  bool open(int boot_delay_ms = 0) {
    if (dev_path_.empty()) return false;
    int fd = open_serial(dev_path_, baud_, boot_delay_ms);
    adopt(fd);
    return fd >= 0;
  }

  const std::string& path() const { return dev_path_; }
  int baud() const { return baud_; }

  const char* name() const override { return "linux-serial"; }

private:
  std::string dev_path_;
  int baud_{DEFAULT_BAUD};
};

} // namespace cctalk::transport
