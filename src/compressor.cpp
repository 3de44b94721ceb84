/**
 * @file compressor.cpp
 * @brief Greedy sliding-window compressor.
 */

#include <ch8pack/compressor.hpp>
#include <ch8pack/encoder.hpp>

#include <algorithm>

namespace ch8pack {

Match find_longest_match(const std::uint8_t* src, std::size_t size, std::size_t pos) noexcept {
    Match best;
    const std::size_t window_start = (pos > WINDOW_SIZE) ? pos - WINDOW_SIZE : 0U;

    for (std::size_t j = window_start; j < pos; ++j) {
        if (src[j] != src[pos]) {
            continue;
        }

        // src[j + len] never passes src[pos + len], so only the tail bounds the run
        std::size_t len = 0;
        while (pos + len < size && src[j + len] == src[pos + len]) {
            ++len;
        }

        // Strictly longer only: the first candidate keeps ties
        if (len > best.length) {
            best.position = j;
            best.length = len;
        }
    }

    return best;
}

Error Compressor::tokenize(const std::uint8_t* src, std::size_t size,
                           std::vector<Token>& tokens) {
    reset();
    tokens.clear();

    if (size > MAX_ROM_SIZE) {
        return Error::InvalidSize;
    }
    if (src == nullptr && size != 0) {
        return Error::InvalidArg;
    }

    std::size_t pos = 0;
    while (pos < size) {
        Match match = find_longest_match(src, size, pos);
        std::size_t len = std::min(match.length, MAX_MATCH_LENGTH);

        if (literal_cost(&src[pos], len) > BACKREF_THRESHOLD) {
            auto offset = static_cast<std::uint16_t>(pos - match.position - 1U);
            tokens.push_back(Token::back_reference(offset, static_cast<std::uint8_t>(len)));
            ++stats_.back_references;
            stats_.matched_bytes += len;
            pos += len;
        } else {
            tokens.push_back(Token::literal(src[pos]));
            ++stats_.literals;
            if (src[pos] == COMPRESS_FLAG) {
                ++stats_.escaped_literals;
            }
            ++pos;
        }
    }

    return Error::Ok;
}

Error Compressor::compress(const std::uint8_t* src, std::size_t size,
                           std::vector<std::uint8_t>& output) {
    output.clear();

    std::vector<Token> tokens;
    auto result = tokenize(src, size, tokens);
    if (result != Error::Ok) {
        return result;
    }

    return encode_tokens(tokens, output);
}

Error compress(const std::vector<std::uint8_t>& rom, std::vector<std::uint8_t>& output) {
    Compressor compressor;
    return compressor.compress(rom.data(), rom.size(), output);
}

} // namespace ch8pack
