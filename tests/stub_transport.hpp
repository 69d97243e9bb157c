// tests/stub_transport.hpp
// Scriptable in-memory ITransport for the engine tests.
//
// Every complete block the engine writes is recorded, optionally echoed back,
// and answered by either a responder callback or the next scripted reply.
// read_available() sleeps the full max_wait when nothing is buffered, which
// is what a quiet serial line looks like to the correlator.
#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cctalk/packet.hpp"
#include "cctalk/transport/transport_base.hpp"

namespace cctalk::test {

using transport::RxResult;
using transport::TxResult;

class StubTransport : public transport::ITransport {
public:
  using Responder = std::function<std::optional<Bytes>(const Bytes& block)>;

  // ---------- scripting ----------

  /// Answer the next written block with @p bytes (nullopt = stay silent).
  void script_reply(std::optional<Bytes> bytes) {
    std::lock_guard<std::mutex> lock(m_);
    script_.push_back(std::move(bytes));
  }

  /// Computes the answer for each block; takes precedence over the script.
  void set_responder(Responder r) {
    std::lock_guard<std::mutex> lock(m_);
    responder_ = std::move(r);
  }

  /// Bytes already waiting on the line, before anything is written.
  void inject(const Bytes& bytes) {
    std::lock_guard<std::mutex> lock(m_);
    rx_.insert(rx_.end(), bytes.begin(), bytes.end());
  }

  void set_echo(bool on)                { std::lock_guard<std::mutex> l(m_); echo_ = on; }
  void set_max_write_chunk(std::size_t n) { std::lock_guard<std::mutex> l(m_); max_write_ = n; }
  void set_max_read_chunk(std::size_t n)  { std::lock_guard<std::mutex> l(m_); max_read_ = n; }
  void set_on_write(std::function<void()> fn) { std::lock_guard<std::mutex> l(m_); on_write_ = std::move(fn); }
  void close_now()                      { std::lock_guard<std::mutex> l(m_); closed_ = true; }

  // ---------- inspection ----------

  std::vector<Bytes> blocks() const       { std::lock_guard<std::mutex> l(m_); return blocks_; }
  std::size_t write_calls() const         { std::lock_guard<std::mutex> l(m_); return write_calls_; }
  std::vector<std::string> events() const { std::lock_guard<std::mutex> l(m_); return events_; }

  // ---------- ITransport ----------

  TxResult write(const uint8_t* data, std::size_t len, std::size_t& written) override {
    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(m_);
      written = 0;
      if (closed_) return TxResult::Closed;
      ++write_calls_;
      hook = on_write_;

      std::size_t n = max_write_ ? std::min(len, max_write_) : len;
      tx_.insert(tx_.end(), data, data + n);
      written = n;
      collect_blocks();
    }
    if (hook) hook();
    return TxResult::Ok;
  }

  RxResult read_available(Bytes& out, std::chrono::milliseconds max_wait) override {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (closed_ && rx_.empty()) return RxResult::Closed;
      if (!rx_.empty()) return deliver(out);
    }
    if (max_wait.count() > 0) std::this_thread::sleep_for(max_wait);

    std::lock_guard<std::mutex> lock(m_);
    if (!rx_.empty()) return deliver(out);
    return closed_ ? RxResult::Closed : RxResult::None;
  }

  bool is_closed() const override { std::lock_guard<std::mutex> l(m_); return closed_; }
  const char* name() const override { return "stub"; }

private:
  // Slice complete blocks off the write buffer and answer each one.
  void collect_blocks() {
    for (;;) {
      std::size_t need = PacketCodec::expected_frame_size(tx_.data(), tx_.size());
      if (need == 0 || tx_.size() < need) return;

      Bytes block(tx_.begin(), tx_.begin() + static_cast<std::ptrdiff_t>(need));
      tx_.erase(tx_.begin(), tx_.begin() + static_cast<std::ptrdiff_t>(need));
      blocks_.push_back(block);
      events_.push_back("W" + std::to_string(block[0]));
      last_dst_ = block[0];

      if (echo_) rx_.insert(rx_.end(), block.begin(), block.end());

      std::optional<Bytes> answer;
      if (responder_) {
        answer = responder_(block);
      } else if (!script_.empty()) {
        answer = script_.front();
        script_.pop_front();
      }
      if (answer) rx_.insert(rx_.end(), answer->begin(), answer->end());
    }
  }

  RxResult deliver(Bytes& out) {
    std::size_t n = max_read_ ? std::min(max_read_, rx_.size()) : rx_.size();
    out.insert(out.end(), rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(n));
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(n));
    if (rx_.empty()) events_.push_back("R" + std::to_string(last_dst_));
    return RxResult::Ok;
  }

  mutable std::mutex m_;
  Bytes tx_, rx_;
  std::deque<std::optional<Bytes>> script_;
  Responder responder_;
  std::function<void()> on_write_;
  bool echo_{false};
  bool closed_{false};
  std::size_t max_write_{0}, max_read_{0};
  std::size_t write_calls_{0};
  std::vector<Bytes> blocks_;
  std::vector<std::string> events_;
  unsigned last_dst_{0};
};

/// Build a Sum8 block from a device to the host.
inline Bytes device_block(uint8_t host, uint8_t device, uint8_t header, const Bytes& data = {},
                          ChecksumType type = ChecksumType::Sum8) {
  PacketCodec codec(type);
  Frame f;
  codec.encode(host, device, header, data.data(), data.size(), f);
  return Bytes(f.begin(), f.end());
}

} // namespace cctalk::test
