#include <doctest/doctest.h>
#include "cctalk/poll_loop.hpp"
#include "cctalk/host.hpp"
#include "cctalk/transport/transport_fd.hpp"
#include "stub_transport.hpp"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace cctalk;
using namespace cctalk::test;
using namespace std::chrono_literals;

static PollConfig quick_poll(std::vector<uint8_t> addrs, uint32_t threshold = 3) {
    PollConfig pc;
    pc.addresses = std::move(addrs);
    pc.interval = 5ms;
    pc.failure_threshold = threshold;
    pc.request.timeout = 10ms;
    pc.request.max_retries = 0;
    return pc;
}

TEST_CASE("apply_outcome: success makes a device alive and resets failures") {
    DeviceRecord rec;
    rec.address = 5;
    rec.consecutive_failures = 2;
    auto now = std::chrono::system_clock::now();

    CHECK(apply_outcome(rec, ProtocolError::None, 3, now));
    CHECK(rec.health == Health::Alive);
    CHECK(rec.consecutive_failures == 0);
    REQUIRE(rec.last_seen.has_value());
    CHECK(*rec.last_seen == now);
    CHECK(rec.total_polls == 1);
    CHECK(rec.total_failures == 0);

    CHECK_FALSE(apply_outcome(rec, ProtocolError::None, 3, now));
}

TEST_CASE("apply_outcome: unknown device stays unknown below the threshold") {
    DeviceRecord rec;
    auto now = std::chrono::system_clock::now();

    CHECK_FALSE(apply_outcome(rec, ProtocolError::Timeout, 2, now));
    CHECK(rec.health == Health::Unknown);
    CHECK(rec.last_error == ProtocolError::Timeout);
    CHECK_FALSE(rec.last_seen.has_value());

    CHECK(apply_outcome(rec, ProtocolError::ChecksumMismatch, 2, now));
    CHECK(rec.health == Health::Unresponsive);
    CHECK(rec.total_failures == 2);
}

TEST_CASE("apply_outcome: a refusal still proves the device is present") {
    DeviceRecord rec;
    rec.health = Health::Unresponsive;
    rec.consecutive_failures = 7;
    CHECK(apply_outcome(rec, ProtocolError::Busy, 3, std::chrono::system_clock::now()));
    CHECK(rec.health == Health::Alive);
    CHECK(rec.consecutive_failures == 0);
    CHECK(rec.last_error == ProtocolError::Busy);
}

TEST_CASE("Device 5: two answers then three silences flips on the third failure") {
    StubTransport link;
    std::atomic<int> polls{0};
    link.set_responder([&](const Bytes& block) -> std::optional<Bytes> {
        if (polls++ < 2) return device_block(1, block[0], HDR_REPLY);
        return std::nullopt;
    });

    BusScheduler bus;
    Correlator corr(link, PacketCodec());
    PollLoop loop(bus, corr, quick_poll({5}, 3));

    std::vector<Health> seen;
    DeviceRecord rec;
    REQUIRE(loop.device_status(5, rec));
    seen.push_back(rec.health);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(loop.poll_once());
        REQUIRE(loop.device_status(5, rec));
        seen.push_back(rec.health);
    }

    CHECK(seen == std::vector<Health>{Health::Unknown, Health::Alive, Health::Alive,
                                      Health::Alive, Health::Alive, Health::Unresponsive});
    CHECK(rec.consecutive_failures == 3);
    CHECK(rec.total_polls == 5);
    CHECK(rec.total_failures == 3);
    CHECK(rec.last_error == ProtocolError::Timeout);
    CHECK(loop.rounds() == 5);
}

TEST_CASE("Observer sees every health transition once") {
    StubTransport link;
    std::atomic<bool> answer{true};
    link.set_responder([&](const Bytes& block) -> std::optional<Bytes> {
        if (answer) return device_block(1, block[0], HDR_REPLY);
        return std::nullopt;
    });

    BusScheduler bus;
    Correlator corr(link, PacketCodec());
    PollLoop loop(bus, corr, quick_poll({2}, 1));

    std::vector<std::pair<Health, Health>> transitions;
    loop.set_observer([&](const DeviceRecord& d, Health prev) {
        transitions.emplace_back(prev, d.health);
    });

    loop.poll_once();          // unknown -> alive
    loop.poll_once();          // no change
    answer = false;
    loop.poll_once();          // alive -> unresponsive
    loop.poll_once();          // no change
    answer = true;
    loop.poll_once();          // unresponsive -> alive

    REQUIRE(transitions.size() == 3);
    CHECK(transitions[0] == std::make_pair(Health::Unknown, Health::Alive));
    CHECK(transitions[1] == std::make_pair(Health::Alive, Health::Unresponsive));
    CHECK(transitions[2] == std::make_pair(Health::Unresponsive, Health::Alive));
}

TEST_CASE("Round walks addresses in configured order") {
    StubTransport link;
    link.set_responder([](const Bytes& block) {
        return std::optional<Bytes>(device_block(1, block[0], HDR_REPLY));
    });

    BusScheduler bus;
    Correlator corr(link, PacketCodec());
    PollLoop loop(bus, corr, quick_poll({40, 2, 3}));
    REQUIRE(loop.poll_once());

    auto blocks = link.blocks();
    REQUIRE(blocks.size() == 3);
    CHECK(blocks[0][0] == 40);
    CHECK(blocks[1][0] == 2);
    CHECK(blocks[2][0] == 3);

    auto snap = loop.snapshot();
    REQUIRE(snap.size() == 3);
    for (const auto& d : snap) CHECK(d.health == Health::Alive);

    DeviceRecord rec;
    CHECK_FALSE(loop.device_status(9, rec));
}

TEST_CASE("Background loop runs rounds until stopped") {
    StubTransport link;
    link.set_responder([](const Bytes& block) {
        return std::optional<Bytes>(device_block(1, block[0], HDR_REPLY));
    });

    HostConfig cfg;
    Host host(link, cfg);
    PollHandle poll = host.start_poll_loop(quick_poll({2, 3}));
    REQUIRE(poll.valid());

    for (int i = 0; i < 500 && poll.rounds() < 3; ++i) std::this_thread::sleep_for(2ms);
    CHECK(poll.rounds() >= 3);
    CHECK(poll.running());

    poll.stop();
    CHECK_FALSE(poll.running());
    uint64_t after = poll.rounds();
    std::this_thread::sleep_for(20ms);
    CHECK(poll.rounds() == after);

    DeviceRecord rec;
    REQUIRE(poll.device_status(2, rec));
    CHECK(rec.health == Health::Alive);
}

TEST_CASE("Ad-hoc commands interleave with a running poll loop") {
    StubTransport link;
    link.set_responder([](const Bytes& block) {
        return std::optional<Bytes>(device_block(1, block[0], HDR_REPLY, {block[3]}));
    });

    HostConfig cfg;
    cfg.request.timeout = 50ms;
    Host host(link, cfg);
    PollHandle poll = host.start_poll_loop(quick_poll({2}));

    for (int i = 0; i < 5; ++i) {
        Reply r;
        CHECK(host.send_command(7, HDR_REQUEST_STATUS, {}, r) == ProtocolError::None);
        CHECK(r.source == 7);
        REQUIRE(r.data.size() == 1);
        CHECK(r.data[0] == HDR_REQUEST_STATUS);
    }
    poll.stop();

    auto ev = link.events();
    for (std::size_t i = 0; i + 1 < ev.size(); i += 2) {
        CHECK(ev[i][0] == 'W');
        CHECK(ev[i + 1][0] == 'R');
    }
}

TEST_CASE("Stop interrupts a long interval promptly") {
    StubTransport link;
    link.set_responder([](const Bytes& block) {
        return std::optional<Bytes>(device_block(1, block[0], HDR_REPLY));
    });

    BusScheduler bus;
    Correlator corr(link, PacketCodec());
    PollConfig pc = quick_poll({2});
    pc.interval = 10s;
    PollLoop loop(bus, corr, pc);
    REQUIRE(loop.start());
    CHECK_FALSE(loop.start());

    for (int i = 0; i < 500 && loop.rounds() < 1; ++i) std::this_thread::sleep_for(1ms);
    auto t0 = std::chrono::steady_clock::now();
    loop.stop();
    CHECK(std::chrono::steady_clock::now() - t0 < 1s);
    CHECK(loop.rounds() == 1);
}

TEST_CASE("Stop during an attempt lets it finish, sends nothing more and records nothing") {
    StubTransport link;
    std::atomic<int> writes{0};
    link.set_on_write([&] { ++writes; });

    HostConfig cfg;
    Host host(link, cfg);
    PollConfig pc = quick_poll({2});
    pc.request.timeout = 50ms;
    pc.request.max_retries = 3;
    PollHandle poll = host.start_poll_loop(pc);

    for (int i = 0; i < 500 && writes.load() < 1; ++i) std::this_thread::sleep_for(1ms);
    REQUIRE(writes.load() == 1);
    poll.stop();

    CHECK(link.blocks().size() == 1);
    CHECK_FALSE(host.scheduler().busy());
    CHECK(poll.rounds() == 0);

    DeviceRecord rec;
    REQUIRE(poll.device_status(2, rec));
    CHECK(rec.total_polls == 0);
    CHECK(rec.consecutive_failures == 0);
    CHECK(rec.health == Health::Unknown);
}

TEST_CASE("Peer hang-up under a running poll loop shows up as TransportClosed") {
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
    ::fcntl(sv[0], F_SETFL, ::fcntl(sv[0], F_GETFL) | O_NONBLOCK);
    transport::FdTransport link(sv[0]);

    HostConfig cfg;
    Host host(link, cfg);
    PollHandle poll = host.start_poll_loop(quick_poll({2}));

    // Another thread watches the flag while the poll thread owns the line.
    std::atomic<bool> watching{true};
    std::atomic<bool> seen_closed{false};
    std::thread watcher([&] {
        while (watching) {
            if (link.is_closed()) seen_closed = true;
            std::this_thread::sleep_for(1ms);
        }
    });

    std::this_thread::sleep_for(20ms);
    ::close(sv[1]);

    DeviceRecord rec;
    for (int i = 0; i < 500; ++i) {
        if (poll.device_status(2, rec) && rec.last_error == ProtocolError::TransportClosed) break;
        std::this_thread::sleep_for(2ms);
    }
    poll.stop();
    watching = false;
    watcher.join();

    CHECK(rec.last_error == ProtocolError::TransportClosed);
    CHECK(seen_closed.load());
    CHECK(link.is_closed());
}
