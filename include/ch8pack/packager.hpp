/**
 * @file packager.hpp
 * @brief Assembly of the calculator variable file.
 *
 * File layout: header (91) || compressed payload || trailer (6) ||
 * checksum (2, little-endian). The checksum covers the header from the
 * datasize field onward, the payload and the trailer.
 */

#ifndef CH8PACK_PACKAGER_HPP
#define CH8PACK_PACKAGER_HPP

#include "checksum.hpp"
#include "config.hpp"
#include "error.hpp"
#include "header.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace ch8pack {

/**
 * @brief Checksum of a package in file byte order.
 *
 * @param header Filled header
 * @param payload Compressed payload
 * @return Two checksum bytes, low byte first
 */
std::array<std::uint8_t, CHECKSUM_SIZE> package_checksum(
    const HeaderBytes& header, const std::vector<std::uint8_t>& payload) noexcept;

/**
 * @brief Build the complete file in memory.
 *
 * @param header Filled header
 * @param payload Compressed payload
 * @param[out] output File bytes (replaced)
 */
void assemble_package(const HeaderBytes& header, const std::vector<std::uint8_t>& payload,
                      std::vector<std::uint8_t>& output);

/**
 * @brief Write the complete file to disk.
 *
 * Either every byte reaches `path` or nothing is left there; see
 * AtomicFile.
 *
 * @param path Destination file
 * @param header Filled header
 * @param payload Compressed payload
 * @param[out] ec Operating system error on Error::IoError
 * @return Error::Ok or Error::IoError
 */
Error write_package(const std::string& path, const HeaderBytes& header,
                    const std::vector<std::uint8_t>& payload, std::error_code& ec);

} // namespace ch8pack

#endif // CH8PACK_PACKAGER_HPP
