/**
 * @file decompressor.cpp
 * @brief Decoder for the escape-byte compressed stream.
 */

#include <ch8pack/decompressor.hpp>

namespace ch8pack {

Error decode_tokens(const std::uint8_t* src, std::size_t size, std::vector<Token>& tokens) {
    tokens.clear();
    if (src == nullptr && size != 0) {
        return Error::InvalidArg;
    }

    std::size_t i = 0;
    while (i < size) {
        if (src[i] != COMPRESS_FLAG) {
            tokens.push_back(Token::literal(src[i]));
            ++i;
            continue;
        }

        if (i + 1 >= size) {
            return Error::InvalidData;
        }

        const std::uint8_t control = src[i + 1];
        const auto length = static_cast<std::uint8_t>(control & 0x3FU);
        if (length == 0) {
            tokens.push_back(Token::literal(COMPRESS_FLAG));
            i += 2;
            continue;
        }

        if (i + 2 >= size) {
            return Error::InvalidData;
        }

        auto offset = static_cast<std::uint16_t>(((control & 0xC0U) << 2) | src[i + 2]);
        tokens.push_back(Token::back_reference(offset, length));
        i += BACKREF_SIZE;
    }

    return Error::Ok;
}

Error decompress(const std::uint8_t* src, std::size_t size, std::vector<std::uint8_t>& output,
                 std::size_t max_output) {
    output.clear();

    std::vector<Token> tokens;
    auto result = decode_tokens(src, size, tokens);
    if (result != Error::Ok) {
        return result;
    }

    for (const Token& token : tokens) {
        if (output.size() + token.source_length() > max_output) {
            return Error::Overflow;
        }

        if (token.is_literal()) {
            output.push_back(token.value);
            continue;
        }

        const std::size_t distance = static_cast<std::size_t>(token.offset) + 1U;
        if (distance > output.size()) {
            return Error::InvalidData;
        }

        // Byte by byte: the source range may overlap what is being written
        for (std::size_t j = 0; j < token.length; ++j) {
            const std::uint8_t byte = output[output.size() - distance];
            output.push_back(byte);
        }
    }

    return Error::Ok;
}

} // namespace ch8pack
