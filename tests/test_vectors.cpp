/**
 * @file test_vectors.cpp
 * @brief Known-answer package vectors.
 *
 * Complete variable files checked byte for byte, including header filler,
 * trailer tag and checksum.
 */

#include <catch2/catch_test_macros.hpp>
#include <ch8pack/ch8pack.hpp>

#include <vector>

using namespace ch8pack;

using Bytes = std::vector<std::uint8_t>;

static Bytes header_prefix(const char* signature, const char* folder, const char* name) {
    Bytes out(signature, signature + 8);
    out.insert(out.end(), {0x01, 0x00});

    Bytes folder_field(8, 0x00);
    for (std::size_t i = 0; folder[i] != '\0' && i < 8; ++i) {
        folder_field[i] = static_cast<std::uint8_t>(folder[i]);
    }
    out.insert(out.end(), folder_field.begin(), folder_field.end());

    out.insert(out.end(), 40, 0x00);
    out.insert(out.end(), {0x01, 0x00, 0x52, 0x00, 0x00, 0x00});

    Bytes name_field(8, 0x00);
    for (std::size_t i = 0; name[i] != '\0' && i < 8; ++i) {
        name_field[i] = static_cast<std::uint8_t>(name[i]);
    }
    out.insert(out.end(), name_field.begin(), name_field.end());

    out.insert(out.end(), {0x1C, 0x00, 0x00, 0x00});
    return out;
}

TEST_CASE("Single literal package", "[vectors]") {
    PackOptions options;
    options.calculator = Calculator::TI89;
    options.folder = "main";
    options.name = "game";

    Bytes expected = header_prefix("**TI89**", "main", "game");
    expected.insert(expected.end(), {
        0x64, 0x00, 0x00, 0x00,             // file size 100
        0xA5, 0x5A, 0x00, 0x00, 0x00, 0x00, // filler
        0x00, 0x0A,                         // datasize 10
        0x01, 0x00, 0x00,                   // version
        0x41,                               // payload
        0x00, 0x63, 0x68, 0x38, 0x00, 0xF8, // trailer
        0x47, 0x02,                         // checksum 0x0247
    });

    const Bytes rom = {0x41};
    Bytes file;
    REQUIRE(pack(rom.data(), rom.size(), options, file) == Error::Ok);
    REQUIRE(file.size() == 100);
    REQUIRE(file == expected);
}

TEST_CASE("Empty ROM package", "[vectors]") {
    PackOptions options;
    options.name = "game";

    Bytes file;
    REQUIRE(pack(nullptr, 0, options, file) == Error::Ok);
    REQUIRE(file.size() == 99);

    const Bytes tail = {
        0x63, 0x00, 0x00, 0x00,             // file size 99
        0xA5, 0x5A, 0x00, 0x00, 0x00, 0x00, // filler
        0x00, 0x09,                         // datasize 9
        0x01, 0x00, 0x00,                   // version
        0x00, 0x63, 0x68, 0x38, 0x00, 0xF8, // trailer
        0x05, 0x02,                         // checksum 0x0205
    };
    REQUIRE(Bytes(file.begin() + 76, file.end()) == tail);
}

TEST_CASE("TI-92 Plus package with a back-reference", "[vectors]") {
    PackOptions options;
    options.calculator = Calculator::TI92Plus;
    options.folder = "games";
    options.name = "breakout";

    Bytes expected = header_prefix("**TI92P*", "games", "breakout");
    expected.insert(expected.end(), {
        0x67, 0x00, 0x00, 0x00,             // file size 103
        0xA5, 0x5A, 0x00, 0x00, 0x00, 0x00, // filler
        0x00, 0x0D,                         // datasize 13
        0x01, 0x00, 0x00,                   // version
        0x41, 0xFF, 0x07, 0x00,             // 'A' then copy 7 from 1 back
        0x00, 0x63, 0x68, 0x38, 0x00, 0xF8, // trailer
        0x50, 0x03,                         // checksum 0x0350
    });

    const Bytes rom(8, 0x41);
    Bytes file;
    REQUIRE(pack(rom.data(), rom.size(), options, file) == Error::Ok);
    REQUIRE(file == expected);
}

TEST_CASE("V200 package matches TI-92 Plus bytes", "[vectors]") {
    const Bytes rom = {0x00, 0xE0, 0xA2, 0x2A, 0x60, 0x0C, 0x00, 0xE0, 0xA2, 0x2A};

    PackOptions ti92;
    ti92.calculator = Calculator::TI92Plus;
    ti92.name = "demo";
    PackOptions v200 = ti92;
    v200.calculator = Calculator::V200;

    Bytes a;
    Bytes b;
    REQUIRE(pack(rom.data(), rom.size(), ti92, a) == Error::Ok);
    REQUIRE(pack(rom.data(), rom.size(), v200, b) == Error::Ok);
    REQUIRE(a == b);
}
