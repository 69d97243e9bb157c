#include <doctest/doctest.h>
#include "cctalk/commands.hpp"
#include "cctalk/errors.hpp"

#include <string>

using namespace cctalk;

TEST_CASE("Header names round-trip through parse_header") {
    CHECK(header_name(HDR_SIMPLE_POLL) == "simple_poll");
    CHECK(header_name(HDR_REQUEST_MANUFACTURER_ID) == "request_manufacturer_id");
    CHECK(header_name(123) == "header_123");

    uint8_t h = 0;
    CHECK(parse_header("simple_poll", h));
    CHECK(h == HDR_SIMPLE_POLL);
    CHECK(parse_header("Request_Status", h));
    CHECK(h == HDR_REQUEST_STATUS);
    CHECK(parse_header("0xF6", h));
    CHECK(h == 246);
    CHECK(parse_header("241", h));
    CHECK(h == 241);

    CHECK_FALSE(parse_header("256", h));
    CHECK_FALSE(parse_header("dispense_everything", h));
    CHECK_FALSE(parse_header("", h));
}

TEST_CASE("Hex payload parsing accepts the usual spellings") {
    Bytes out;
    std::string err;

    CHECK(parse_hex_bytes("01 02 ff", out, err));
    CHECK(out == Bytes{0x01, 0x02, 0xFF});

    CHECK(parse_hex_bytes("0x01,0x02:0A", out, err));
    CHECK(out == Bytes{0x01, 0x02, 0x0A});

    CHECK(parse_hex_bytes("0102ff", out, err));
    CHECK(out == Bytes{0x01, 0x02, 0xFF});

    CHECK(parse_hex_bytes("", out, err));
    CHECK(out.empty());
}

TEST_CASE("Hex payload parsing reports bad input") {
    Bytes out;
    std::string err;

    CHECK_FALSE(parse_hex_bytes("0g", out, err));
    CHECK(err == "bad_hex_token");

    CHECK_FALSE(parse_hex_bytes("01020", out, err));
    CHECK(err == "odd_hex_length");
}

TEST_CASE("describe_reply renders one key=value line") {
    Reply r;
    r.destination = 1;
    r.source = 2;
    r.header = HDR_REPLY;
    for (char c : std::string("WHM")) r.data.push_back(uint8_t(c));
    r.checksum_ok = true;

    std::string s = describe_reply(r);
    CHECK(s == "status=ok src=2 dst=1 header=0 len=3 data=57484D ascii=\"WHM\"");

    r.header = HDR_NACK;
    r.data.clear();
    CHECK(describe_reply(r) == "status=nack src=2 dst=1 header=5 len=0");

    r.has_source = false;
    r.header = HDR_BUSY;
    CHECK(describe_reply(r) == "status=busy dst=1 header=6 len=0");
}

TEST_CASE("Error names are snake_case") {
    CHECK(std::string(to_string(ProtocolError::None)) == "ok");
    CHECK(std::string(to_string(ProtocolError::Timeout)) == "timeout");
    CHECK(std::string(to_string(ProtocolError::ChecksumMismatch)) == "checksum_mismatch");
    CHECK(std::string(to_string(DecodeError::Incomplete)) == "incomplete");
    CHECK(std::string(to_string(EncodeError::PayloadTooLarge)) == "payload_too_large");
    CHECK(to_protocol_error(EncodeError::InvalidAddress) == ProtocolError::InvalidAddress);
    CHECK(is_transient(ProtocolError::Timeout));
    CHECK_FALSE(is_transient(ProtocolError::Nack));
    CHECK_FALSE(is_transient(ProtocolError::TransportClosed));
}
