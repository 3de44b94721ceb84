/**
 * @file token.hpp
 * @brief Tokens of the compressed stream.
 *
 * The compressor works on a tagged sequence of literals and
 * back-references; encoder.hpp turns that sequence into the escape-byte
 * wire format.
 */

#ifndef CH8PACK_TOKEN_HPP
#define CH8PACK_TOKEN_HPP

#include "config.hpp"

namespace ch8pack {

enum class TokenKind : std::uint8_t {
    Literal,
    BackReference
};

/**
 * @brief A literal byte or a back-reference into already decoded output.
 *
 * A back-reference copies `length` bytes starting `offset + 1` bytes before
 * the current output position. The copy may overlap the bytes it produces.
 */
struct Token {
    TokenKind kind = TokenKind::Literal;
    std::uint8_t value = 0;   ///< Literal byte
    std::uint16_t offset = 0; ///< Distance back minus one (0-1023)
    std::uint8_t length = 0;  ///< Copy length (1-63)

    static constexpr Token literal(std::uint8_t byte) noexcept {
        Token token;
        token.value = byte;
        return token;
    }

    static constexpr Token back_reference(std::uint16_t offset, std::uint8_t length) noexcept {
        Token token;
        token.kind = TokenKind::BackReference;
        token.offset = offset;
        token.length = length;
        return token;
    }

    [[nodiscard]] constexpr bool is_literal() const noexcept {
        return kind == TokenKind::Literal;
    }

    /// Number of source bytes the token stands for
    [[nodiscard]] constexpr std::size_t source_length() const noexcept {
        return is_literal() ? 1U : length;
    }

    /// Number of bytes the token occupies in the compressed stream
    [[nodiscard]] constexpr std::size_t encoded_size() const noexcept {
        if (!is_literal()) {
            return BACKREF_SIZE;
        }
        return value == COMPRESS_FLAG ? 2U : 1U;
    }

    bool operator==(const Token&) const = default;
};

} // namespace ch8pack

#endif // CH8PACK_TOKEN_HPP
