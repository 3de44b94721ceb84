/**
 * @file checksum.hpp
 * @brief 16-bit wrapping byte-sum checksum.
 *
 * The variable file checksum is the sum of every byte from the header's
 * datasize field through the end of the trailer, modulo 65536, stored
 * little-endian after the trailer.
 */

#ifndef CH8PACK_CHECKSUM_HPP
#define CH8PACK_CHECKSUM_HPP

#include "config.hpp"

#include <array>
#include <vector>

namespace ch8pack {

/**
 * @brief Running checksum over several byte ranges.
 */
class Checksum {
public:
    constexpr Checksum() noexcept = default;

    void update(const std::uint8_t* data, std::size_t size) noexcept {
        for (std::size_t i = 0; i < size; ++i) {
            sum_ = static_cast<std::uint16_t>(sum_ + data[i]);
        }
    }

    void update(const std::vector<std::uint8_t>& data) noexcept {
        update(data.data(), data.size());
    }

    void reset() noexcept { sum_ = 0; }

    [[nodiscard]] std::uint16_t value() const noexcept { return sum_; }

    /**
     * @brief Checksum in file byte order (little-endian).
     */
    [[nodiscard]] std::array<std::uint8_t, CHECKSUM_SIZE> to_bytes() const noexcept {
        return {static_cast<std::uint8_t>(sum_ & 0xFFU),
                static_cast<std::uint8_t>(sum_ >> 8)};
    }

private:
    std::uint16_t sum_ = 0;
};

/**
 * @brief Checksum of a single byte range.
 */
std::uint16_t compute_checksum(const std::uint8_t* data, std::size_t size) noexcept;

} // namespace ch8pack

#endif // CH8PACK_CHECKSUM_HPP
