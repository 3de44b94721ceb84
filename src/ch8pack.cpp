/**
 * @file ch8pack.cpp
 * @brief High-level ROM packaging API.
 */

#include <ch8pack/ch8pack.hpp>

#include <cstring>

namespace ch8pack {

// Compress and fill the header; shared by the in-memory and file paths
static Error build_package(const std::uint8_t* rom, std::size_t rom_size,
                           const PackOptions& options, HeaderBytes& header,
                           std::vector<std::uint8_t>& payload, PackSummary* summary) {
    if (rom_size > MAX_ROM_SIZE) {
        return Error::InvalidSize;
    }

    Compressor compressor;
    auto result = compressor.compress(rom, rom_size, payload);
    if (result != Error::Ok) {
        return result;
    }

    result = build_header(header, options.calculator, options.folder, options.name,
                          payload.size());
    if (result != Error::Ok) {
        return result;
    }

    if (summary != nullptr) {
        summary->rom_size = rom_size;
        summary->payload_size = payload.size();
        summary->file_size = file_size_for(payload.size());
        summary->stats = compressor.stats();
    }
    return Error::Ok;
}

Error pack(const std::uint8_t* rom, std::size_t rom_size, const PackOptions& options,
           std::vector<std::uint8_t>& output, PackSummary* summary) {
    output.clear();

    HeaderBytes header{};
    std::vector<std::uint8_t> payload;
    auto result = build_package(rom, rom_size, options, header, payload, summary);
    if (result != Error::Ok) {
        return result;
    }

    assemble_package(header, payload, output);
    return Error::Ok;
}

Error pack_file(const std::string& input_path, const std::string& output_path,
                const PackOptions& options, std::error_code& ec, PackSummary* summary) {
    if (summary != nullptr) {
        summary->input_read = false;
    }

    std::vector<std::uint8_t> rom;
    auto result = read_file(input_path, rom, ec, MAX_ROM_SIZE);
    if (result != Error::Ok) {
        return result;
    }
    if (summary != nullptr) {
        summary->input_read = true;
    }

    HeaderBytes header{};
    std::vector<std::uint8_t> payload;
    result = build_package(rom.data(), rom.size(), options, header, payload, summary);
    if (result != Error::Ok) {
        return result;
    }

    return write_package(output_path, header, payload, ec);
}

Error unpack(const std::uint8_t* data, std::size_t size, HeaderInfo& info,
             std::vector<std::uint8_t>& rom) {
    rom.clear();

    constexpr std::size_t overhead = HEADER_SIZE + TRAILER_SIZE + CHECKSUM_SIZE;
    if (data == nullptr || size < overhead) {
        return Error::InvalidData;
    }

    auto result = parse_header(data, size, info);
    if (result != Error::Ok) {
        return result;
    }

    const std::size_t payload_size = size - overhead;
    if (info.file_size != size || info.data_size != data_size_for(payload_size)) {
        return Error::InvalidData;
    }

    const std::uint8_t* payload = &data[HEADER_SIZE];
    const std::uint8_t* trailer = payload + payload_size;
    if (std::memcmp(trailer, TRAILER, TRAILER_SIZE) != 0) {
        return Error::InvalidData;
    }

    // Everything from the datasize field up to the stored checksum
    const std::size_t checked = size - header_layout::DATASIZE_OFFSET - CHECKSUM_SIZE;
    const std::uint16_t expected = compute_checksum(&data[header_layout::DATASIZE_OFFSET], checked);
    const std::uint16_t stored =
        static_cast<std::uint16_t>(data[size - 2] | (data[size - 1] << 8));
    if (expected != stored) {
        return Error::InvalidData;
    }

    if (info.version_major != FORMAT_VERSION_MAJOR ||
        info.version_minor > FORMAT_VERSION_MINOR) {
        return Error::InvalidData;
    }

    return decompress(payload, payload_size, rom, MAX_ROM_SIZE);
}

Error unpack_file(const std::string& input_path, const std::string& output_path,
                  HeaderInfo& info, std::error_code& ec) {
    std::vector<std::uint8_t> package;
    auto result = read_file(input_path, package, ec,
                            file_size_for(2U * MAX_ROM_SIZE));
    if (result == Error::InvalidSize) {
        // Larger than any package of a valid ROM
        return Error::InvalidData;
    }
    if (result != Error::Ok) {
        return result;
    }

    std::vector<std::uint8_t> rom;
    result = unpack(package.data(), package.size(), info, rom);
    if (result != Error::Ok) {
        return result;
    }

    AtomicFile file(output_path);
    result = file.open(ec);
    if (result != Error::Ok) {
        return result;
    }
    result = file.write(rom.data(), rom.size(), ec);
    if (result != Error::Ok) {
        return result;
    }
    return file.commit(ec);
}

#if !CH8PACK_NO_EXCEPTIONS

std::vector<std::uint8_t> pack(const std::vector<std::uint8_t>& rom, const PackOptions& options) {
    std::vector<std::uint8_t> output;
    throw_if_error(pack(rom.data(), rom.size(), options, output), "pack");
    return output;
}

std::vector<std::uint8_t> unpack(const std::vector<std::uint8_t>& package, HeaderInfo* info) {
    HeaderInfo local;
    std::vector<std::uint8_t> rom;
    throw_if_error(unpack(package.data(), package.size(), info != nullptr ? *info : local, rom),
                   "unpack");
    return rom;
}

#endif // !CH8PACK_NO_EXCEPTIONS

} // namespace ch8pack
