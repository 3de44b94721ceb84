/**
 * @file header.hpp
 * @brief Calculator variable header.
 *
 * The 91-byte header the calculator's link software expects in front of
 * an OTH variable. Multi-byte filler and the datasize field are
 * big-endian; the nested file size field is little-endian.
 *
 * | Offset | Size | Field                                   |
 * |--------|------|-----------------------------------------|
 * |      0 |    8 | Signature ("**TI89**" / "**TI92P*")     |
 * |      8 |    2 | 0x01 0x00                               |
 * |     10 |    8 | Folder name, zero padded                |
 * |     18 |   40 | Description, zero                       |
 * |     58 |    6 | 0x01 0x00 0x52 0x00 0x00 0x00           |
 * |     64 |    8 | Variable name, zero padded              |
 * |     72 |    4 | 0x1C 0x00 0x00 0x00                     |
 * |     76 |    4 | File size (LE)                          |
 * |     80 |    6 | 0xA5 0x5A 0x00 0x00 0x00 0x00           |
 * |     86 |    2 | Datasize (BE), checksum starts here     |
 * |     88 |    3 | Format version major, minor, patch      |
 */

#ifndef CH8PACK_HEADER_HPP
#define CH8PACK_HEADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <string>
#include <string_view>

namespace ch8pack {

/**
 * @brief Target calculator.
 */
enum class Calculator : std::uint8_t {
    TI89,
    TI92Plus,
    V200
};

namespace header_layout {
inline constexpr std::size_t SIGNATURE_OFFSET = 0U;
inline constexpr std::size_t SIGNATURE_SIZE = 8U;
inline constexpr std::size_t FILL1_OFFSET = 8U;
inline constexpr std::size_t FOLDER_OFFSET = 10U;
inline constexpr std::size_t DESCRIPTION_OFFSET = 18U;
inline constexpr std::size_t DESCRIPTION_SIZE = 40U;
inline constexpr std::size_t FILL2_OFFSET = 58U;
inline constexpr std::size_t NAME_OFFSET = 64U;
inline constexpr std::size_t FILL3_OFFSET = 72U;
inline constexpr std::size_t FILE_SIZE_OFFSET = 76U;
inline constexpr std::size_t FILL4_OFFSET = 80U;
inline constexpr std::size_t DATASIZE_OFFSET = 86U;
inline constexpr std::size_t VERSION_OFFSET = 88U;

inline constexpr std::uint8_t FILL1[2] = {0x01U, 0x00U};
inline constexpr std::uint8_t FILL2[6] = {0x01U, 0x00U, 0x52U, 0x00U, 0x00U, 0x00U};
inline constexpr std::uint8_t FILL3[4] = {0x1CU, 0x00U, 0x00U, 0x00U};
inline constexpr std::uint8_t FILL4[6] = {0xA5U, 0x5AU, 0x00U, 0x00U, 0x00U, 0x00U};

static_assert(VERSION_OFFSET + 3U == HEADER_SIZE, "header layout must span 91 bytes");
} // namespace header_layout

using HeaderBytes = std::array<std::uint8_t, HEADER_SIZE>;

/**
 * @brief Decoded header fields.
 */
struct HeaderInfo {
    Calculator calculator = Calculator::TI89;
    std::string folder;
    std::string name;
    std::uint32_t file_size = 0;
    std::uint16_t data_size = 0;
    std::uint8_t version_major = 0;
    std::uint8_t version_minor = 0;
    std::uint8_t version_patch = 0;
};

/**
 * @brief Value of the file size field for a payload.
 *
 * Covers header, payload, trailer and checksum.
 */
constexpr std::size_t file_size_for(std::size_t payload_size,
                                    std::size_t extension_length = PAYLOAD_EXTENSION_LENGTH) noexcept {
    return HEADER_SIZE + payload_size + 5U + extension_length;
}

/**
 * @brief Value of the datasize field for a payload.
 *
 * Covers version triple, payload and trailer.
 */
constexpr std::size_t data_size_for(std::size_t payload_size,
                                    std::size_t extension_length = PAYLOAD_EXTENSION_LENGTH) noexcept {
    return payload_size + 3U + extension_length + 3U;
}

/// Short lowercase name ("ti89", "ti92p", "v200")
const char* calculator_name(Calculator calculator) noexcept;

/// Parse a calculator name, case-insensitively
bool parse_calculator(std::string_view name, Calculator& calculator) noexcept;

/// Host file extension, including the dot (".89y", ".9xy", ".v2y")
const char* file_extension(Calculator calculator) noexcept;

/// 8-byte header signature; the TI-92 Plus and V200 share one
const char* signature(Calculator calculator) noexcept;

/**
 * @brief Fill a header for a compressed payload.
 *
 * Names are clipped to NAME_LENGTH bytes and zero padded; their content is
 * not checked.
 *
 * @param[out] header Header bytes (fully overwritten)
 * @param calculator Target calculator
 * @param folder On-calculator folder
 * @param name On-calculator variable name
 * @param payload_size Compressed payload length
 * @param extension_length Length of the on-calculator type extension
 * @return Error::Ok, or Error::Overflow if a size does not fit its field
 */
Error build_header(HeaderBytes& header, Calculator calculator, std::string_view folder,
                   std::string_view name, std::size_t payload_size,
                   std::size_t extension_length = PAYLOAD_EXTENSION_LENGTH) noexcept;

/**
 * @brief Decode the fields of a header.
 *
 * @param data At least HEADER_SIZE bytes
 * @param size Available bytes
 * @param[out] info Decoded fields
 * @return Error::Ok, or Error::InvalidData for a short buffer or unknown
 *         signature
 */
Error parse_header(const std::uint8_t* data, std::size_t size, HeaderInfo& info);

} // namespace ch8pack

#endif // CH8PACK_HEADER_HPP
