#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal duplex byte-channel contract the ccTalk engine talks through.
 *
 * The engine never opens ports, sets baud rates or reconnects sockets. It only
 * writes bytes, reads whatever has arrived, and asks whether the channel died.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cctalk::transport {

// Return codes kept simple: the correlator maps them, nothing else interprets them.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2, Closed=3 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2, Closed=3 };

const char* to_string(TxResult r);
const char* to_string(RxResult r);

/**
 * @brief Transport trait every channel implements.
 *
 * Contract:
 *  - write(data,len,written) pushes bytes out. @p written reports how many were
 *    accepted. Ok with written < len is a partial write: call again with the
 *    rest. Busy means nothing could be enqueued right now.
 *  - read_available(out,max_wait) appends whatever bytes are available, waiting
 *    at most max_wait for the first one. RxResult::None means nothing arrived.
 *  - is_closed() turns true once the peer hung up or the channel failed. It
 *    never turns false again; the owner must open a new channel.
 *  - name() is a short identifier for logs.
 *
 * Callers serialize access (see BusScheduler). Implementations need not be
 * thread-safe.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult    write(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual RxResult    read_available(std::vector<uint8_t>& out,
                                     std::chrono::milliseconds max_wait) = 0;
  virtual bool        is_closed() const = 0;
  virtual const char* name() const = 0;
};

} // namespace cctalk::transport
