/**
 * @file ch8pack.hpp
 * @brief High-level ROM packaging API.
 *
 * Converts a CHIP-8 ROM image into a TI-89 / TI-92 Plus / V200 variable
 * the on-calculator interpreter can decompress and run, and reads such a
 * variable back.
 */

#ifndef CH8PACK_HPP
#define CH8PACK_HPP

#include "checksum.hpp"
#include "compressor.hpp"
#include "config.hpp"
#include "decompressor.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "file_io.hpp"
#include "header.hpp"
#include "naming.hpp"
#include "packager.hpp"
#include "token.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace ch8pack {

/**
 * @brief Where and how a ROM is stored on the calculator.
 */
struct PackOptions {
    Calculator calculator = Calculator::TI89;
    std::string folder = DEFAULT_FOLDER; ///< Clipped to NAME_LENGTH bytes
    std::string name;                    ///< Clipped to NAME_LENGTH bytes
};

/**
 * @brief Sizes reported after packaging.
 */
struct PackSummary {
    std::size_t rom_size = 0;
    std::size_t payload_size = 0;
    std::size_t file_size = 0;
    CompressStats stats;
    bool input_read = false; ///< Set by pack_file(); an IoError after this is a write error
};

/**
 * @brief Package a ROM image in memory.
 *
 * @param rom ROM bytes
 * @param rom_size ROM length
 * @param options Target calculator and names
 * @param[out] output Complete variable file
 * @param[out] summary Optional sizes and compression counters
 * @return Error::Ok on success
 * @return Error::InvalidSize if rom_size > MAX_ROM_SIZE
 * @return Error::Overflow if the payload does not fit the header fields
 */
Error pack(const std::uint8_t* rom, std::size_t rom_size, const PackOptions& options,
           std::vector<std::uint8_t>& output, PackSummary* summary = nullptr);

/**
 * @brief Read a ROM file and write its package.
 *
 * Nothing is written unless the whole conversion succeeds.
 *
 * @param input_path ROM file
 * @param output_path Package file
 * @param options Target calculator and names
 * @param[out] ec Operating system error on Error::IoError
 * @param[out] summary Optional sizes and compression counters
 * @return Error::Ok, Error::InvalidSize, Error::Overflow or Error::IoError
 */
Error pack_file(const std::string& input_path, const std::string& output_path,
                const PackOptions& options, std::error_code& ec,
                PackSummary* summary = nullptr);

/**
 * @brief Validate a variable file and recover its ROM.
 *
 * Checks what the calculator relies on: signature, both size fields,
 * trailer, checksum and format version.
 *
 * @param data Variable file bytes
 * @param size File length
 * @param[out] info Header fields
 * @param[out] rom Decompressed ROM image
 * @return Error::Ok, or Error::InvalidData / Error::Overflow for a bad file
 */
Error unpack(const std::uint8_t* data, std::size_t size, HeaderInfo& info,
             std::vector<std::uint8_t>& rom);

/**
 * @brief Read a variable file and write the ROM it contains.
 */
Error unpack_file(const std::string& input_path, const std::string& output_path,
                  HeaderInfo& info, std::error_code& ec);

#if !CH8PACK_NO_EXCEPTIONS

/**
 * @brief Package a ROM image, throwing on failure.
 *
 * @throws InvalidSizeException if the ROM exceeds MAX_ROM_SIZE
 * @throws OverflowException if the payload does not fit the header
 */
std::vector<std::uint8_t> pack(const std::vector<std::uint8_t>& rom, const PackOptions& options);

/**
 * @brief Recover the ROM from a variable file, throwing on failure.
 *
 * @throws InvalidDataException for a malformed or corrupted file
 */
std::vector<std::uint8_t> unpack(const std::vector<std::uint8_t>& package,
                                 HeaderInfo* info = nullptr);

#endif // !CH8PACK_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace ch8pack

#endif // CH8PACK_HPP
