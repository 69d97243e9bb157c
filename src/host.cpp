// ============================================================================
// host.cpp — implementation for host.hpp
// ============================================================================

#include "cctalk/host.hpp"
#include "cctalk/log.hpp"

namespace cctalk {

Host::Host(transport::ITransport& link, const HostConfig& cfg)
: link_(link),
  correlator_(link, PacketCodec(cfg.checksum), cfg.host_address),
  defaults_(cfg.request) {
  CCTALK_LOG(Debug, "host", "event=init transport=" << link_.name()
                            << " host=" << unsigned(cfg.host_address)
                            << " checksum=" << to_string(cfg.checksum));
}

ProtocolError Host::send_command(uint8_t destination, uint8_t header, const Bytes& payload,
                                 const RequestOptions& opt, CancelToken* cancel, Reply& out) {
  TurnGuard turn = bus_.acquire_turn(cancel);
  if (!turn.owns_turn()) return ProtocolError::Cancelled;
  return correlator_.send_and_await(destination, header, payload.data(), payload.size(),
                                    opt, cancel, out);
}

PollHandle Host::start_poll_loop(const PollConfig& cfg, HealthObserver observer) {
  auto loop = std::make_unique<PollLoop>(bus_, correlator_, cfg);
  if (observer) loop->set_observer(std::move(observer));
  loop->start();
  return PollHandle(std::move(loop));
}

} // namespace cctalk
