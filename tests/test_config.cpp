#include <doctest/doctest.h>
#include "cctalk/config.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace cctalk;
using namespace std::chrono_literals;

TEST_CASE("Empty object keeps every default") {
    HostConfig cfg;
    std::string err;
    REQUIRE(parse_config("{}", cfg, err));
    CHECK(cfg.host_address == 1);
    CHECK(cfg.checksum == ChecksumType::Sum8);
    CHECK(cfg.request.timeout == 100ms);
    CHECK(cfg.request.max_retries == 2);
    CHECK(cfg.poll.failure_threshold == 3);
    CHECK(cfg.poll.status_header == HDR_SIMPLE_POLL);
    CHECK(cfg.transport.baud == 9600);
}

TEST_CASE("Full document is applied") {
    const char* text = R"({
      "host_address": 2,
      "checksum": "crc16",
      "timeout_ms": 150,
      "max_retries": 4,
      "retry_delay_ms": 10,
      "retry_on_nack": true,
      "local_echo": true,
      "poll": {
        "addresses": [3, 40],
        "interval_ms": 500,
        "spacing_ms": 5,
        "failure_threshold": 2,
        "header": "request_status",
        "payload": "01 02",
        "timeout_ms": 80
      },
      "transport": { "kind": "socket", "path": "/tmp/bus.sock" },
      "log_level": "debug"
    })";

    HostConfig cfg;
    std::string err;
    REQUIRE_MESSAGE(parse_config(text, cfg, err), err);

    CHECK(cfg.host_address == 2);
    CHECK(cfg.checksum == ChecksumType::Crc16);
    CHECK(cfg.request.timeout == 150ms);
    CHECK(cfg.request.max_retries == 4);
    CHECK(cfg.request.retry_delay == 10ms);
    CHECK(cfg.request.retry_on_nack);
    CHECK(cfg.request.local_echo);

    CHECK(cfg.poll.addresses == std::vector<uint8_t>{3, 40});
    CHECK(cfg.poll.interval == 500ms);
    CHECK(cfg.poll.spacing == 5ms);
    CHECK(cfg.poll.failure_threshold == 2);
    CHECK(cfg.poll.status_header == HDR_REQUEST_STATUS);
    CHECK(cfg.poll.status_payload == Bytes{0x01, 0x02});
    // Poll inherits the top-level request options and overrides the timeout.
    CHECK(cfg.poll.request.timeout == 80ms);
    CHECK(cfg.poll.request.max_retries == 4);

    CHECK(cfg.transport.kind == transport::TransportKind::Socket);
    CHECK(cfg.transport.path == "/tmp/bus.sock");
    CHECK(cfg.log_level == log::Level::Debug);
}

TEST_CASE("Invalid values are rejected and leave the config untouched") {
    struct Bad { const char* json; const char* key; };
    const Bad cases[] = {
        {R"({"host_address": 0})",                      "host_address"},
        {R"({"host_address": 300})",                    "host_address"},
        {R"({"checksum": "md5"})",                      "checksum"},
        {R"({"timeout_ms": -5})",                       "timeout_ms"},
        {R"({"timeout_ms": 0})",                        "timeout_ms"},
        {R"({"max_retries": "two"})",                   "max_retries"},
        {R"({"poll": {"addresses": [2, 256]}})",        "poll.addresses"},
        {R"({"poll": {"addresses": [0]}})",             "poll.addresses"},
        {R"({"poll": {"addresses": [2, 2]}})",          "poll.addresses"},
        {R"({"poll": {"addresses": [1]}})",             "poll.addresses"},
        {R"({"poll": {"failure_threshold": 0}})",       "poll.failure_threshold"},
        {R"({"poll": {"header": "nonsense"}})",         "poll.header"},
        {R"({"poll": {"payload": "zz"}})",              "poll.payload"},
        {R"({"transport": {"kind": "carrier_pigeon"}})", "transport.kind"},
        {R"({"log_level": "loud"})",                    "log_level"},
    };

    for (const auto& c : cases) {
        CAPTURE(c.json);
        HostConfig cfg;
        std::string err;
        CHECK_FALSE(parse_config(c.json, cfg, err));
        CHECK(err.find(c.key) != std::string::npos);
        CHECK(cfg.host_address == 1);
    }
}

TEST_CASE("Broken JSON is an error, not an exception") {
    HostConfig cfg;
    std::string err;
    CHECK_FALSE(parse_config("{ \"host_address\": ", cfg, err));
    CHECK(err.rfind("parse:", 0) == 0);
    CHECK_FALSE(parse_config("[1, 2, 3]", cfg, err));
}

TEST_CASE("load_config reads a file") {
    const std::string path = "test_config_tmp.json";
    {
        std::ofstream out(path);
        out << R"({"host_address": 9, "poll": {"addresses": [2]}})";
    }
    HostConfig cfg;
    std::string err;
    CHECK(load_config(path, cfg, err));
    CHECK(cfg.host_address == 9);
    std::remove(path.c_str());

    CHECK_FALSE(load_config("does/not/exist.json", cfg, err));
    CHECK(err.rfind("open:", 0) == 0);
}

TEST_CASE("parse_checksum") {
    ChecksumType t = ChecksumType::Sum8;
    CHECK(parse_checksum("crc16", t));
    CHECK(t == ChecksumType::Crc16);
    CHECK_FALSE(parse_checksum("CRC16", t));
}

TEST_CASE("Layering a document keeps poll request options it does not mention") {
    HostConfig cfg;
    cfg.poll.request.timeout = 70ms;
    cfg.poll.request.local_echo = true;
    std::string err;

    REQUIRE(parse_config(R"({"host_address": 2})", cfg, err));
    CHECK(cfg.poll.request.timeout == 70ms);
    CHECK(cfg.poll.request.local_echo);

    REQUIRE(parse_config(R"({"max_retries": 5})", cfg, err));
    CHECK(cfg.request.max_retries == 5);
    CHECK(cfg.poll.request.max_retries == 5);
    CHECK(cfg.poll.request.timeout == 70ms);
    CHECK(cfg.poll.request.local_echo);
}
