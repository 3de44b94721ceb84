/**
 * @file header.cpp
 * @brief Calculator variable header.
 */

#include <ch8pack/header.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>

namespace ch8pack {

static constexpr const char* SIGNATURE_TI89 = "**TI89**";
static constexpr const char* SIGNATURE_TI92P = "**TI92P*";

// Copy up to size bytes, zero filling the rest
static void copy_clipped(std::uint8_t* dest, std::size_t size, std::string_view src) noexcept {
    const std::size_t n = std::min(size, src.size());
    std::memset(dest, 0, size);
    if (n > 0) {
        std::memcpy(dest, src.data(), n);
    }
}

static std::string read_clipped(const std::uint8_t* src, std::size_t size) {
    std::size_t n = 0;
    while (n < size && src[n] != 0) {
        ++n;
    }
    return std::string(reinterpret_cast<const char*>(src), n);
}

const char* calculator_name(Calculator calculator) noexcept {
    switch (calculator) {
    case Calculator::TI89:
        return "ti89";
    case Calculator::TI92Plus:
        return "ti92p";
    case Calculator::V200:
        return "v200";
    default:
        return "unknown";
    }
}

bool parse_calculator(std::string_view name, Calculator& calculator) noexcept {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    if (lower == "ti89") {
        calculator = Calculator::TI89;
    } else if (lower == "ti92p") {
        calculator = Calculator::TI92Plus;
    } else if (lower == "v200") {
        calculator = Calculator::V200;
    } else {
        return false;
    }
    return true;
}

const char* file_extension(Calculator calculator) noexcept {
    switch (calculator) {
    case Calculator::TI89:
        return ".89y";
    case Calculator::TI92Plus:
        return ".9xy";
    case Calculator::V200:
        return ".v2y";
    default:
        return "";
    }
}

const char* signature(Calculator calculator) noexcept {
    return calculator == Calculator::TI89 ? SIGNATURE_TI89 : SIGNATURE_TI92P;
}

Error build_header(HeaderBytes& header, Calculator calculator, std::string_view folder,
                   std::string_view name, std::size_t payload_size,
                   std::size_t extension_length) noexcept {
    using namespace header_layout;

    const std::size_t file_size = file_size_for(payload_size, extension_length);
    const std::size_t data_size = data_size_for(payload_size, extension_length);
    if (data_size > std::numeric_limits<std::uint16_t>::max() ||
        file_size > std::numeric_limits<std::uint32_t>::max()) {
        return Error::Overflow;
    }

    header.fill(0);

    std::memcpy(&header[SIGNATURE_OFFSET], signature(calculator), SIGNATURE_SIZE);
    std::memcpy(&header[FILL1_OFFSET], FILL1, sizeof(FILL1));
    copy_clipped(&header[FOLDER_OFFSET], NAME_LENGTH, folder);
    std::memcpy(&header[FILL2_OFFSET], FILL2, sizeof(FILL2));
    copy_clipped(&header[NAME_OFFSET], NAME_LENGTH, name);
    std::memcpy(&header[FILL3_OFFSET], FILL3, sizeof(FILL3));

    // File size is the one little-endian field
    for (std::size_t i = 0; i < 4; ++i) {
        header[FILE_SIZE_OFFSET + i] = static_cast<std::uint8_t>((file_size >> (8U * i)) & 0xFFU);
    }

    std::memcpy(&header[FILL4_OFFSET], FILL4, sizeof(FILL4));

    header[DATASIZE_OFFSET] = static_cast<std::uint8_t>(data_size >> 8);
    header[DATASIZE_OFFSET + 1] = static_cast<std::uint8_t>(data_size & 0xFFU);

    header[VERSION_OFFSET] = FORMAT_VERSION_MAJOR;
    header[VERSION_OFFSET + 1] = FORMAT_VERSION_MINOR;
    header[VERSION_OFFSET + 2] = FORMAT_VERSION_PATCH;

    return Error::Ok;
}

Error parse_header(const std::uint8_t* data, std::size_t size, HeaderInfo& info) {
    using namespace header_layout;

    if (data == nullptr || size < HEADER_SIZE) {
        return Error::InvalidData;
    }

    if (std::memcmp(&data[SIGNATURE_OFFSET], SIGNATURE_TI89, SIGNATURE_SIZE) == 0) {
        info.calculator = Calculator::TI89;
    } else if (std::memcmp(&data[SIGNATURE_OFFSET], SIGNATURE_TI92P, SIGNATURE_SIZE) == 0) {
        info.calculator = Calculator::TI92Plus;
    } else {
        return Error::InvalidData;
    }

    info.folder = read_clipped(&data[FOLDER_OFFSET], NAME_LENGTH);
    info.name = read_clipped(&data[NAME_OFFSET], NAME_LENGTH);

    info.file_size = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        info.file_size |= static_cast<std::uint32_t>(data[FILE_SIZE_OFFSET + i]) << (8U * i);
    }

    info.data_size = static_cast<std::uint16_t>((data[DATASIZE_OFFSET] << 8) |
                                                data[DATASIZE_OFFSET + 1]);

    info.version_major = data[VERSION_OFFSET];
    info.version_minor = data[VERSION_OFFSET + 1];
    info.version_patch = data[VERSION_OFFSET + 2];

    return Error::Ok;
}

} // namespace ch8pack
