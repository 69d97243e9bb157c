#include <doctest/doctest.h>
#include "cctalk/checksum.hpp"

#include <vector>

using namespace cctalk;

TEST_CASE("Simple checksum brings the block sum to zero") {
    const uint8_t poll[] = {2, 0, 1, 242};
    CHECK(sum8(poll, sizeof(poll)) == 11);

    const uint8_t reply[] = {1, 3, 2, 0, 78, 97, 188};
    CHECK(sum8(reply, sizeof(reply)) == 143);

    const uint8_t with_data[] = {2, 0, 1, 246};
    uint8_t chk = sum8(with_data, sizeof(with_data));
    uint8_t total = 0;
    for (uint8_t b : with_data) total = uint8_t(total + b);
    CHECK(uint8_t(total + chk) == 0);
}

TEST_CASE("Simple checksum of an all-zero block is zero") {
    const uint8_t zeros[] = {0, 0, 0, 0};
    CHECK(sum8(zeros, sizeof(zeros)) == 0);
}

TEST_CASE("CRC-16/CCITT over dst, len, hdr") {
    const uint8_t a[] = {40, 0, 1};
    CHECK(crc16(a, sizeof(a)) == 0x3F46);

    const uint8_t b[] = {1, 0, 0};
    CHECK(crc16(b, sizeof(b)) == 0x3730);
}

TEST_CASE("CRC-16 can be computed incrementally") {
    const uint8_t all[] = {40, 0, 1, 0xAA, 0x55};
    uint16_t whole = crc16(all, sizeof(all));
    uint16_t parts = crc16(all, 2);
    parts = crc16(all + 2, 3, parts);
    CHECK(whole == parts);
}

TEST_CASE("Checksum type names") {
    CHECK(std::string(to_string(ChecksumType::Sum8)) == "sum8");
    CHECK(std::string(to_string(ChecksumType::Crc16)) == "crc16");
}
