// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp. Used by LinuxSerial.
// ============================================================================

#include "cctalk/serial_io.hpp"

#include <cerrno>
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <termios.h>       // termios struct + raw mode helpers
#include <unistd.h>        // ::close, usleep

namespace cctalk {

namespace {

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// 8N1 raw mode at the given speed.
// - VMIN=0, VTIME=0: reads never block; FdTransport waits with poll().
// - No hardware flow control: ccTalk uses a single data line.
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t speed) {
  termios tio{};
  if (tcgetattr(fd, &tio) != 0) return false;

  cfmakeraw(&tio);
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cflag &= ~CSTOPB;              // one stop bit
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  tcflush(fd, TCIOFLUSH);
  return true;
}

} // namespace

bool baud_to_speed(int baud, unsigned& out) {
  switch (baud) {
    case 1200:   out = B1200;   return true;
    case 2400:   out = B2400;   return true;
    case 4800:   out = B4800;   return true;
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
#ifdef B230400
    case 230400: out = B230400; return true;
#endif
    default:     return false;
  }
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open, configure, settle, flush. Any failure closes the fd again so the
// caller never owns a half-configured descriptor.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
  unsigned speed = 0;
  if (!baud_to_speed(baud, speed)) {
    errno = EINVAL;
    return -1;
  }

  int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) return -1;

  if (!set_raw(fd, static_cast<speed_t>(speed))) {
    int saved = errno;
    ::close(fd);
    errno = saved;
    return -1;
  }

  if (boot_delay_ms > 0) {
    usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);              // drop adapter reset chatter
  }
  return fd;
}

void flush_serial(int fd) {
  if (fd >= 0) tcflush(fd, TCIOFLUSH);
}

void close_serial(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace cctalk
