/**
 * @file test_checksum.cpp
 * @brief Unit tests for the 16-bit wrapping checksum.
 */

#include <catch2/catch_test_macros.hpp>
#include <ch8pack/checksum.hpp>

#include <vector>

using namespace ch8pack;

TEST_CASE("Checksum basics", "[checksum]") {
    SECTION("empty") {
        Checksum checksum;
        REQUIRE(checksum.value() == 0);
        REQUIRE(compute_checksum(nullptr, 0) == 0);
    }

    SECTION("plain sum") {
        const std::uint8_t data[] = {0x01, 0x02, 0x03, 0xFF};
        REQUIRE(compute_checksum(data, 4) == 0x0105);
    }

    SECTION("little-endian bytes") {
        const std::uint8_t data[] = {0xFF, 0xFF, 0x10};
        Checksum checksum;
        checksum.update(data, 3);
        REQUIRE(checksum.value() == 0x020E);
        auto bytes = checksum.to_bytes();
        REQUIRE(bytes[0] == 0x0E);
        REQUIRE(bytes[1] == 0x02);
    }
}

TEST_CASE("Checksum wraps modulo 65536", "[checksum]") {
    std::vector<std::uint8_t> data(300, 0xFF);

    std::uint32_t plain = 0;
    for (auto b : data) {
        plain += b;
    }
    REQUIRE(plain > 0xFFFFU);

    REQUIRE(compute_checksum(data.data(), data.size()) == (plain & 0xFFFFU));
    REQUIRE(compute_checksum(data.data(), data.size()) == 0x2AD4);
}

TEST_CASE("Checksum over several ranges", "[checksum]") {
    std::vector<std::uint8_t> a = {0x10, 0x20};
    std::vector<std::uint8_t> b = {0x30};
    std::vector<std::uint8_t> joined = {0x10, 0x20, 0x30};

    Checksum checksum;
    checksum.update(a);
    checksum.update(b);
    REQUIRE(checksum.value() == compute_checksum(joined.data(), joined.size()));

    checksum.reset();
    REQUIRE(checksum.value() == 0);
}
