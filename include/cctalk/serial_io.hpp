/**
 * @page cctalk-serial-io-hdr Serial I/O helpers
 * @file serial_io.hpp
 * @brief Open a Linux TTY raw 8N1 for a ccTalk bus.
 *
 * @details
 * PURPOSE
 * -------
 * The minimal POSIX surface LinuxSerial needs: acquire a descriptor, put the
 * line into raw mode at the bus speed, drop whatever the adapter buffered
 * before we arrived, release it again. Framing, timing and retries live above
 * this layer (PacketCodec, Correlator).
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   LinuxSerial::open() -> open_serial() -> FdTransport (poll/read/write)
 *                                        \-> close_serial() on teardown
 *
 * OPERATIONAL NOTES
 * -----------------
 * - ccTalk buses run at 9600 baud, 8N1, no flow control. Some USB bridges
 *   expose faster rates; the table below covers the common ones.
 * - Prefer /dev/serial/by-id/... paths for stable device naming.
 * - The runtime user needs access to the tty (dialout group or udev rule).
 * - Do not share one descriptor between threads without external
 *   serialization; the engine serializes through BusScheduler.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = cctalk::open_serial("/dev/ttyUSB0", 9600);
 *   if (fd < 0) { // handle open failure }
 *   ...
 *   cctalk::close_serial(fd);
 * @endcode
 */
#pragma once
#include <string>

namespace cctalk {

/**
 * @brief Map an integer baud rate to its termios constant.
 *
 * @return true and sets @p out for supported rates (1200..230400), false otherwise.
 */
bool baud_to_speed(int baud, unsigned& out);

/**
 * @brief Open a TTY device and configure it for raw, non-blocking I/O.
 *
 * What it does:
 *   - Opens @p dev with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Raw 8N1, no echo, no line discipline, no hardware flow control.
 *   - Sets the baud rate; unsupported values fail the open.
 *   - Optionally sleeps @p boot_delay_ms for adapters that reset on open.
 *   - Flushes both driver buffers.
 *
 * @return File descriptor (>= 0) on success, -1 on failure (errno preserved
 *         from the failing call).
 */
int open_serial(const std::string& dev, int baud = 9600, int boot_delay_ms = 0);

/// Discard unread input and unsent output. No-op for negative fds.
void flush_serial(int fd);

/// Close a descriptor from open_serial(). No-op for negative fds.
void close_serial(int fd);

} // namespace cctalk
