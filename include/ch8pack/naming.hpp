/**
 * @file naming.hpp
 * @brief Default variable names and output paths.
 */

#ifndef CH8PACK_NAMING_HPP
#define CH8PACK_NAMING_HPP

#include "header.hpp"

#include <string>
#include <string_view>

namespace ch8pack {

/**
 * @brief Remove a trailing ".ch8", then a trailing ".rom".
 */
std::string strip_rom_suffix(std::string_view path);

/**
 * @brief Default on-calculator name: base filename without ROM suffixes.
 *
 * "roms/pong.ch8" → "pong". Clipping to 8 bytes happens in the header.
 */
std::string default_var_name(std::string_view input_path);

/**
 * @brief Output path for a package.
 *
 * The calculator's extension is appended to `output`, or to the input path
 * without its ROM suffixes when `output` is empty.
 */
std::string package_path(std::string_view input_path, std::string_view output,
                         Calculator calculator);

/**
 * @brief Output path for a ROM extracted from a package.
 *
 * A known package extension is replaced by ".ch8"; otherwise ".ch8" is
 * appended.
 */
std::string extracted_rom_path(std::string_view package_path);

} // namespace ch8pack

#endif // CH8PACK_NAMING_HPP
