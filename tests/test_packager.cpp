/**
 * @file test_packager.cpp
 * @brief Unit tests for package assembly, pack() and unpack().
 */

#include <catch2/catch_test_macros.hpp>
#include <ch8pack/ch8pack.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

using namespace ch8pack;
namespace fs = std::filesystem;

using Bytes = std::vector<std::uint8_t>;

struct PackageScratchDir {
    fs::path path;

    PackageScratchDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("ch8pack_pkg_" + std::to_string(rd()));
        fs::create_directories(path);
    }

    ~PackageScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

static Bytes read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_raw(const std::string& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

static Bytes sample_rom() {
    Bytes rom;
    for (int i = 0; i < 600; ++i) {
        rom.push_back(static_cast<std::uint8_t>((i % 13) * 19));
    }
    return rom;
}

static Bytes packed(const Bytes& rom, const PackOptions& options) {
    Bytes out;
    REQUIRE(pack(rom.data(), rom.size(), options, out) == Error::Ok);
    return out;
}

TEST_CASE("Package layout", "[packager]") {
    HeaderBytes header{};
    Bytes payload = {0x41, 0xFF, 0x00};
    REQUIRE(build_header(header, Calculator::TI89, "main", "demo", payload.size()) == Error::Ok);

    Bytes file;
    assemble_package(header, payload, file);

    REQUIRE(file.size() == HEADER_SIZE + payload.size() + TRAILER_SIZE + CHECKSUM_SIZE);
    REQUIRE(file.size() == file_size_for(payload.size()));
    REQUIRE(std::equal(header.begin(), header.end(), file.begin()));
    REQUIRE(std::equal(payload.begin(), payload.end(), file.begin() + HEADER_SIZE));
    REQUIRE(std::equal(TRAILER, TRAILER + TRAILER_SIZE, file.begin() + HEADER_SIZE + 3));

    SECTION("checksum starts at the datasize field") {
        std::uint32_t sum = 0;
        for (std::size_t i = header_layout::DATASIZE_OFFSET; i < file.size() - 2; ++i) {
            sum += file[i];
        }
        REQUIRE(file[file.size() - 2] == (sum & 0xFFU));
        REQUIRE(file[file.size() - 1] == ((sum >> 8) & 0xFFU));

        auto checksum = package_checksum(header, payload);
        REQUIRE(checksum[0] == file[file.size() - 2]);
        REQUIRE(checksum[1] == file[file.size() - 1]);
    }

    SECTION("bytes before the datasize field are not covered") {
        HeaderBytes renamed = header;
        renamed[header_layout::NAME_OFFSET] = 'X';
        REQUIRE(package_checksum(renamed, payload) == package_checksum(header, payload));
    }
}

TEST_CASE("Pack in memory", "[packager]") {
    PackOptions options;
    options.name = "demo";

    SECTION("summary") {
        Bytes rom = sample_rom();
        Bytes out;
        PackSummary summary;
        REQUIRE(pack(rom.data(), rom.size(), options, out, &summary) == Error::Ok);
        REQUIRE(summary.rom_size == rom.size());
        REQUIRE(summary.file_size == out.size());
        REQUIRE(summary.payload_size == out.size() - HEADER_SIZE - TRAILER_SIZE - CHECKSUM_SIZE);
        REQUIRE(summary.stats.back_references > 0);
    }

    SECTION("oversized ROM") {
        Bytes rom(MAX_ROM_SIZE + 1, 0x00);
        Bytes out = {0x01};
        REQUIRE(pack(rom.data(), rom.size(), options, out) == Error::InvalidSize);
        REQUIRE(out.empty());
    }
}

TEST_CASE("Unpack recovers the ROM", "[packager]") {
    Bytes rom = sample_rom();

    for (Calculator calc : {Calculator::TI89, Calculator::TI92Plus, Calculator::V200}) {
        PackOptions options;
        options.calculator = calc;
        options.folder = "games";
        options.name = "sample";

        Bytes file = packed(rom, options);
        HeaderInfo info;
        Bytes restored;
        REQUIRE(unpack(file.data(), file.size(), info, restored) == Error::Ok);
        REQUIRE(restored == rom);
        REQUIRE(info.folder == "games");
        REQUIRE(info.name == "sample");
        REQUIRE(info.file_size == file.size());
        REQUIRE(info.calculator == (calc == Calculator::TI89 ? Calculator::TI89
                                                             : Calculator::TI92Plus));
    }
}

TEST_CASE("Unpack rejects damaged packages", "[packager]") {
    PackOptions options;
    options.name = "sample";
    Bytes file = packed(sample_rom(), options);
    HeaderInfo info;
    Bytes rom;

    SECTION("too short") {
        REQUIRE(unpack(file.data(), HEADER_SIZE + TRAILER_SIZE + 1, info, rom) ==
                Error::InvalidData);
    }

    SECTION("truncated") {
        file.pop_back();
        REQUIRE(unpack(file.data(), file.size(), info, rom) == Error::InvalidData);
    }

    SECTION("payload byte flipped") {
        file[HEADER_SIZE + 2] ^= 0x01;
        REQUIRE(unpack(file.data(), file.size(), info, rom) == Error::InvalidData);
    }

    SECTION("checksum flipped") {
        file.back() ^= 0x80;
        REQUIRE(unpack(file.data(), file.size(), info, rom) == Error::InvalidData);
    }

    SECTION("trailer changed") {
        file[file.size() - CHECKSUM_SIZE - 3] = 'x';
        REQUIRE(unpack(file.data(), file.size(), info, rom) == Error::InvalidData);
    }

    SECTION("bad signature") {
        file[0] = 'X';
        REQUIRE(unpack(file.data(), file.size(), info, rom) == Error::InvalidData);
    }

    SECTION("newer format version") {
        // Keep the checksum consistent so only the version is wrong
        file[header_layout::VERSION_OFFSET + 1] = 1;
        auto stored = static_cast<std::uint16_t>(file[file.size() - 2] | (file[file.size() - 1] << 8));
        stored = static_cast<std::uint16_t>(stored + 1);
        file[file.size() - 2] = static_cast<std::uint8_t>(stored & 0xFFU);
        file[file.size() - 1] = static_cast<std::uint8_t>(stored >> 8);
        REQUIRE(unpack(file.data(), file.size(), info, rom) == Error::InvalidData);
    }
}

TEST_CASE("Pack and unpack files", "[packager]") {
    PackageScratchDir dir;
    std::error_code ec;
    PackOptions options;
    options.name = default_var_name(dir.file("pong.ch8"));

    SECTION("round trip through disk") {
        Bytes rom = sample_rom();
        write_raw(dir.file("pong.ch8"), rom);
        const std::string out = package_path(dir.file("pong.ch8"), "", options.calculator);

        PackSummary summary;
        REQUIRE(pack_file(dir.file("pong.ch8"), out, options, ec, &summary) == Error::Ok);
        REQUIRE(out == dir.file("pong.89y"));
        REQUIRE(fs::file_size(out) == summary.file_size);
        REQUIRE(read_all(out) == packed(rom, options));

        HeaderInfo info;
        REQUIRE(unpack_file(out, dir.file("restored.ch8"), info, ec) == Error::Ok);
        REQUIRE(info.name == "pong");
        REQUIRE(read_all(dir.file("restored.ch8")) == rom);
    }

    SECTION("oversized ROM produces no output") {
        write_raw(dir.file("big.ch8"), Bytes(MAX_ROM_SIZE + 1, 0x00));
        REQUIRE(pack_file(dir.file("big.ch8"), dir.file("big.89y"), options, ec) ==
                Error::InvalidSize);
        REQUIRE_FALSE(fs::exists(dir.file("big.89y")));
        REQUIRE(std::distance(fs::directory_iterator(dir.path), fs::directory_iterator()) == 1);
    }

    SECTION("missing ROM") {
        PackSummary summary;
        REQUIRE(pack_file(dir.file("none.ch8"), dir.file("none.89y"), options, ec, &summary) ==
                Error::IoError);
        REQUIRE_FALSE(summary.input_read);
        REQUIRE(ec == std::errc::no_such_file_or_directory);
        REQUIRE_FALSE(fs::exists(dir.file("none.89y")));
    }

    SECTION("directory given as the ROM") {
        PackSummary summary;
        REQUIRE(pack_file(dir.path.string(), dir.file("dir.89y"), options, ec, &summary) ==
                Error::IoError);
        REQUIRE(ec == std::errc::is_a_directory);
        REQUIRE_FALSE(summary.input_read);
        REQUIRE_FALSE(fs::exists(dir.file("dir.89y")));
    }

    SECTION("empty ROM with an unwritable destination is a write error") {
        write_raw(dir.file("empty.ch8"), {});
        PackSummary summary;
        REQUIRE(pack_file(dir.file("empty.ch8"), dir.file("missing/empty.89y"), options, ec,
                          &summary) == Error::IoError);
        REQUIRE(ec);
        REQUIRE(summary.input_read);
        REQUIRE(summary.rom_size == 0);
    }

    SECTION("unwritable destination") {
        write_raw(dir.file("pong.ch8"), sample_rom());
        REQUIRE(pack_file(dir.file("pong.ch8"), dir.file("missing/pong.89y"), options, ec) ==
                Error::IoError);
        REQUIRE(ec);
    }

    SECTION("damaged package is not extracted") {
        Bytes file = packed(sample_rom(), options);
        file.back() ^= 0x01;
        write_raw(dir.file("bad.89y"), file);

        HeaderInfo info;
        REQUIRE(unpack_file(dir.file("bad.89y"), dir.file("bad.ch8"), info, ec) ==
                Error::InvalidData);
        REQUIRE_FALSE(fs::exists(dir.file("bad.ch8")));
    }
}

#if !CH8PACK_NO_EXCEPTIONS

TEST_CASE("Throwing pack and unpack", "[packager][exceptions]") {
    PackOptions options;
    options.name = "demo";

    SECTION("round trip") {
        Bytes rom = sample_rom();
        HeaderInfo info;
        REQUIRE(unpack(pack(rom, options), &info) == rom);
        REQUIRE(info.name == "demo");
    }

    SECTION("oversized ROM") {
        Bytes rom(MAX_ROM_SIZE + 1, 0x00);
        REQUIRE_THROWS_AS(pack(rom, options), InvalidSizeException);
    }

    SECTION("damaged package") {
        Bytes file = pack(sample_rom(), options);
        file[0] = 0;
        REQUIRE_THROWS_AS(unpack(file), InvalidDataException);
    }

    SECTION("error code carried by the exception") {
        try {
            throw_if_error(Error::Overflow, "header");
            FAIL("no exception thrown");
        } catch (const Ch8PackException& e) {
            REQUIRE(e.code() == Error::Overflow);
        }
        REQUIRE_NOTHROW(throw_if_error(Error::Ok, "ok"));
    }

    SECTION("I/O exception keeps the system error") {
        auto ec = std::make_error_code(std::errc::permission_denied);
        REQUIRE_THROWS_AS(throw_if_error(Error::IoError, "write", ec), IoException);
        try {
            throw_if_error(Error::IoError, "write", ec);
        } catch (const IoException& e) {
            REQUIRE(e.error_code() == ec);
            REQUIRE(e.code() == Error::IoError);
        }
    }
}

#endif // !CH8PACK_NO_EXCEPTIONS
