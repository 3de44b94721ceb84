/**
 * @file packager.cpp
 * @brief Assembly of the calculator variable file.
 */

#include <ch8pack/file_io.hpp>
#include <ch8pack/packager.hpp>

namespace ch8pack {

std::array<std::uint8_t, CHECKSUM_SIZE> package_checksum(
    const HeaderBytes& header, const std::vector<std::uint8_t>& payload) noexcept {
    Checksum checksum;
    checksum.update(&header[header_layout::DATASIZE_OFFSET],
                    HEADER_SIZE - header_layout::DATASIZE_OFFSET);
    checksum.update(payload);
    checksum.update(TRAILER, TRAILER_SIZE);
    return checksum.to_bytes();
}

void assemble_package(const HeaderBytes& header, const std::vector<std::uint8_t>& payload,
                      std::vector<std::uint8_t>& output) {
    const auto checksum = package_checksum(header, payload);

    output.clear();
    output.reserve(HEADER_SIZE + payload.size() + TRAILER_SIZE + CHECKSUM_SIZE);
    output.insert(output.end(), header.begin(), header.end());
    output.insert(output.end(), payload.begin(), payload.end());
    output.insert(output.end(), TRAILER, TRAILER + TRAILER_SIZE);
    output.insert(output.end(), checksum.begin(), checksum.end());
}

Error write_package(const std::string& path, const HeaderBytes& header,
                    const std::vector<std::uint8_t>& payload, std::error_code& ec) {
    const auto checksum = package_checksum(header, payload);

    AtomicFile file(path);
    auto result = file.open(ec);
    if (result != Error::Ok) {
        return result;
    }

    const struct {
        const std::uint8_t* data;
        std::size_t size;
    } segments[] = {
        {header.data(), header.size()},
        {payload.data(), payload.size()},
        {TRAILER, TRAILER_SIZE},
        {checksum.data(), checksum.size()},
    };

    for (const auto& segment : segments) {
        result = file.write(segment.data, segment.size, ec);
        if (result != Error::Ok) {
            return result;
        }
    }

    return file.commit(ec);
}

} // namespace ch8pack
