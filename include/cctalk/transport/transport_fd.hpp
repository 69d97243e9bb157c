#pragma once
/**
 * @file transport_fd.hpp
 * @brief ITransport over a non-blocking POSIX file descriptor (header-only).
 *
 * Shared by LinuxSerial (tty) and UnixSocket (AF_UNIX stream). Waits with
 * poll(2), never spins. EOF, POLLHUP and hard I/O errors latch the channel
 * closed; after that every call reports Closed.
 *
 * I/O calls belong to whoever holds the bus turn. is_closed() alone may be
 * called from any thread.
 *
 * Depends on: poll.h, unistd.h. Linux/POSIX only.
 */

#include "cctalk/transport/transport_base.hpp"

#include <atomic>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace cctalk::transport {

class FdTransport : public ITransport {
public:
  FdTransport() = default;

  /// Take ownership of an already configured, non-blocking descriptor.
  explicit FdTransport(int fd) : fd_(fd), closed_(fd < 0) {}

  ~FdTransport() override { close(); }

  FdTransport(const FdTransport&) = delete;
  FdTransport& operator=(const FdTransport&) = delete;

  void close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    closed_ = true;
  }

  int fd() const { return fd_; }

  TxResult write(const uint8_t* data, std::size_t len, std::size_t& written) override {
    written = 0;
    if (closed_) return TxResult::Closed;
    if (!data || !len) return TxResult::Ok;

    for (;;) {
      ssize_t w = ::write(fd_, data, len);
      if (w >= 0) { written = static_cast<std::size_t>(w); return TxResult::Ok; }
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return TxResult::Busy;
      if (errno == EPIPE || errno == ECONNRESET || errno == EIO) {
        closed_ = true;
        return TxResult::Closed;
      }
      return TxResult::Error;
    }
  }

  RxResult read_available(std::vector<uint8_t>& out,
                          std::chrono::milliseconds max_wait) override {
    if (closed_) return RxResult::Closed;

    pollfd pfd{fd_, POLLIN, 0};
    int wait_ms = max_wait.count() < 0 ? 0 : static_cast<int>(max_wait.count());
    int pr = ::poll(&pfd, 1, wait_ms);
    if (pr == 0) return RxResult::None;
    if (pr < 0)  return errno == EINTR ? RxResult::None : RxResult::Error;

    if (pfd.revents & POLLNVAL) { closed_ = true; return RxResult::Closed; }

    // Drain everything the kernel holds right now. A hangup may still leave
    // bytes behind; deliver those before reporting Closed on the next call.
    std::size_t got = 0;
    uint8_t chunk[256];
    for (;;) {
      ssize_t r = ::read(fd_, chunk, sizeof(chunk));
      if (r > 0) {
        out.insert(out.end(), chunk, chunk + r);
        got += static_cast<std::size_t>(r);
        continue;
      }
      if (r == 0) { closed_ = true; break; }              // EOF
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      if (errno == EIO || errno == ECONNRESET) { closed_ = true; break; }
      return got ? RxResult::Ok : RxResult::Error;
    }

    if (got) return RxResult::Ok;
    if (closed_ || (pfd.revents & (POLLHUP | POLLERR))) {
      closed_ = true;
      return RxResult::Closed;
    }
    return RxResult::None;
  }

  bool is_closed() const override { return closed_.load(); }

  const char* name() const override { return "fd"; }

protected:
  /// Replace the owned descriptor (closing the old one). fd < 0 leaves it closed.
  void adopt(int fd) {
    close();
    fd_ = fd;
    closed_ = fd < 0;
  }

private:
  int               fd_{-1};
  std::atomic<bool> closed_{true};
};

} // namespace cctalk::transport
