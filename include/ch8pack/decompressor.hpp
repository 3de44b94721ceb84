/**
 * @file decompressor.hpp
 * @brief Decoder for the escape-byte compressed stream.
 *
 * Follows the interpreter's loader: a byte other than the flag is copied;
 * the flag followed by a byte whose low six bits are zero is a literal
 * flag byte; anything else after the flag is a back-reference whose copy
 * runs one byte at a time so it may read bytes it has just written.
 * Unlike the loader, malformed streams are rejected instead of read past.
 */

#ifndef CH8PACK_DECOMPRESSOR_HPP
#define CH8PACK_DECOMPRESSOR_HPP

#include "config.hpp"
#include "error.hpp"
#include "token.hpp"

#include <vector>

namespace ch8pack {

/**
 * @brief Split a compressed stream into tokens.
 *
 * @param src Compressed bytes
 * @param size Compressed length
 * @param[out] tokens Receives the tokens (replaced)
 * @return Error::Ok, or Error::InvalidData for a truncated token
 */
Error decode_tokens(const std::uint8_t* src, std::size_t size, std::vector<Token>& tokens);

/**
 * @brief Decompress a stream back to the ROM image.
 *
 * @param src Compressed bytes
 * @param size Compressed length
 * @param[out] output Receives the decoded bytes (replaced)
 * @param max_output Largest acceptable decoded size
 * @return Error::Ok on success
 * @return Error::InvalidData for a truncated token or a reference before
 *         the start of the output
 * @return Error::Overflow if the output would exceed max_output
 */
Error decompress(const std::uint8_t* src, std::size_t size, std::vector<std::uint8_t>& output,
                 std::size_t max_output = MAX_ROM_SIZE);

} // namespace ch8pack

#endif // CH8PACK_DECOMPRESSOR_HPP
