/**
 * @file compressor.hpp
 * @brief Greedy sliding-window compressor.
 *
 * Produces a stream the interpreter's decompression routine can decode:
 * literals with the flag byte escaped, and 3-byte back-references into
 * the preceding 1024 bytes.
 *
 * The parse is greedy and single pass. At each position every earlier
 * byte in the window equal to the current byte is tried; the longest
 * match wins and, among equal lengths, the first one found (the one
 * furthest back). Match length is measured without the 63-byte cap and
 * may run past the current position into the bytes being produced.
 */

#ifndef CH8PACK_COMPRESSOR_HPP
#define CH8PACK_COMPRESSOR_HPP

#include "config.hpp"
#include "error.hpp"
#include "token.hpp"

#include <vector>

namespace ch8pack {

/**
 * @brief Longest match found for one position.
 */
struct Match {
    std::size_t position = 0; ///< Index of the match start in the source
    std::size_t length = 0;   ///< Uncapped match length (0 = no candidate)
};

/**
 * @brief Counters collected while compressing.
 */
struct CompressStats {
    std::size_t literals = 0;         ///< Literal tokens
    std::size_t escaped_literals = 0; ///< Literal tokens equal to the flag byte
    std::size_t back_references = 0;  ///< Back-reference tokens
    std::size_t matched_bytes = 0;    ///< Source bytes covered by back-references
};

/**
 * @brief Find the longest earlier match for `src[pos]`.
 *
 * @param src Source bytes
 * @param size Source length
 * @param pos Current position (must be < size)
 * @return Best match; ties resolve to the earliest window index
 */
Match find_longest_match(const std::uint8_t* src, std::size_t size, std::size_t pos) noexcept;

/**
 * @brief ROM image compressor.
 */
class Compressor {
public:
    Compressor() noexcept = default;

    /**
     * @brief Parse a ROM image into tokens.
     *
     * @param src ROM bytes
     * @param size ROM length (at most MAX_ROM_SIZE)
     * @param[out] tokens Receives the token sequence (replaced)
     * @return Error::Ok, Error::InvalidSize if size > MAX_ROM_SIZE,
     *         Error::InvalidArg if src is null with a non-zero size
     */
    Error tokenize(const std::uint8_t* src, std::size_t size, std::vector<Token>& tokens);

    /**
     * @brief Compress a ROM image to the escape-byte wire format.
     *
     * @param src ROM bytes
     * @param size ROM length (at most MAX_ROM_SIZE)
     * @param[out] output Receives the compressed stream (replaced)
     * @return Error::Ok on success
     */
    Error compress(const std::uint8_t* src, std::size_t size, std::vector<std::uint8_t>& output);

    /**
     * @brief Counters for the last tokenize()/compress() call.
     */
    [[nodiscard]] const CompressStats& stats() const noexcept { return stats_; }

    void reset() noexcept { stats_ = CompressStats{}; }

private:
    CompressStats stats_;
};

/**
 * @brief Compress a ROM image with a temporary Compressor.
 */
Error compress(const std::vector<std::uint8_t>& rom, std::vector<std::uint8_t>& output);

} // namespace ch8pack

#endif // CH8PACK_COMPRESSOR_HPP
