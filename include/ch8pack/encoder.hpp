/**
 * @file encoder.hpp
 * @brief Escape-byte serialization of compressed tokens.
 *
 * Wire format:
 * - Literal b != 0xFF      → b
 * - Literal 0xFF           → 0xFF 0x00
 * - BackReference(o, n)    → 0xFF ((o >> 8) << 6 | n) (o & 0xFF)
 *
 * The length field of a back-reference is never zero, which is what
 * distinguishes it from an escaped literal.
 */

#ifndef CH8PACK_ENCODER_HPP
#define CH8PACK_ENCODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "token.hpp"

#include <vector>

namespace ch8pack {

/**
 * @brief Cost of emitting bytes as literals.
 *
 * @param data Bytes to measure
 * @param size Number of bytes
 * @return Encoded size: 2 per flag byte, 1 per other byte
 */
std::size_t literal_cost(const std::uint8_t* data, std::size_t size) noexcept;

/**
 * @brief Append a literal, escaping the flag byte.
 */
void append_literal(std::vector<std::uint8_t>& output, std::uint8_t byte);

/**
 * @brief Append a back-reference token.
 *
 * @param output Destination stream
 * @param offset Distance back minus one (0 to MAX_MATCH_OFFSET)
 * @param length Copy length (1 to MAX_MATCH_LENGTH)
 * @return Error::Ok on success, Error::InvalidArg if out of range
 */
Error append_back_reference(std::vector<std::uint8_t>& output, std::size_t offset,
                            std::size_t length);

/**
 * @brief Serialize a token sequence.
 *
 * @param tokens Tokens in stream order
 * @param[out] output Receives the encoded bytes (appended)
 * @return Error::Ok on success
 */
Error encode_tokens(const std::vector<Token>& tokens, std::vector<std::uint8_t>& output);

} // namespace ch8pack

#endif // CH8PACK_ENCODER_HPP
