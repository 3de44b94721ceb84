/**
 * @file checksum.cpp
 * @brief 16-bit wrapping byte-sum checksum.
 */

#include <ch8pack/checksum.hpp>

namespace ch8pack {

std::uint16_t compute_checksum(const std::uint8_t* data, std::size_t size) noexcept {
    Checksum checksum;
    checksum.update(data, size);
    return checksum.value();
}

} // namespace ch8pack
