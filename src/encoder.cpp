/**
 * @file encoder.cpp
 * @brief Escape-byte serialization of compressed tokens.
 */

#include <ch8pack/encoder.hpp>

namespace ch8pack {

std::size_t literal_cost(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t cost = 0;
    for (std::size_t i = 0; i < size; ++i) {
        cost += (data[i] == COMPRESS_FLAG) ? 2U : 1U;
    }
    return cost;
}

void append_literal(std::vector<std::uint8_t>& output, std::uint8_t byte) {
    if (byte == COMPRESS_FLAG) {
        output.push_back(COMPRESS_FLAG);
        output.push_back(0x00U);
    } else {
        output.push_back(byte);
    }
}

Error append_back_reference(std::vector<std::uint8_t>& output, std::size_t offset,
                            std::size_t length) {
    if (offset > MAX_MATCH_OFFSET || length == 0 || length > MAX_MATCH_LENGTH) {
        return Error::InvalidArg;
    }

    // High two offset bits share a byte with the 6-bit length
    output.push_back(COMPRESS_FLAG);
    output.push_back(static_cast<std::uint8_t>(((offset & 0x300U) >> 2) | length));
    output.push_back(static_cast<std::uint8_t>(offset & 0xFFU));
    return Error::Ok;
}

Error encode_tokens(const std::vector<Token>& tokens, std::vector<std::uint8_t>& output) {
    for (const Token& token : tokens) {
        if (token.is_literal()) {
            append_literal(output, token.value);
            continue;
        }

        auto result = append_back_reference(output, token.offset, token.length);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

} // namespace ch8pack
