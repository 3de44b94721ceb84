/**
 * @file file_io.cpp
 * @brief ROM reading and all-or-nothing file output.
 */

#include <ch8pack/file_io.hpp>

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <utility>

#include <unistd.h>

namespace ch8pack {

// Streams leave errno set on open/read/write failures; fall back to EIO
static std::error_code last_error() noexcept {
    const int err = errno;
    return std::error_code(err != 0 ? err : EIO, std::generic_category());
}

// `<path>.part.<pid>.<n>`, unique per process and per writer
static std::string make_temp_path(const std::string& path) {
    static std::atomic<unsigned> counter{0};
    return path + ".part." + std::to_string(static_cast<long>(::getpid())) + "." +
           std::to_string(counter.fetch_add(1));
}

Error read_file(const std::string& path, std::vector<std::uint8_t>& data, std::error_code& ec,
                std::size_t max_size) {
    data.clear();
    ec.clear();

    // A directory opens as a stream on Linux and reports a bogus size
    std::error_code status_ec;
    if (std::filesystem::is_directory(path, status_ec)) {
        ec = std::make_error_code(std::errc::is_a_directory);
        return Error::IoError;
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        ec = last_error();
        return Error::IoError;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        ec = last_error();
        return Error::IoError;
    }
    if (static_cast<std::size_t>(size) > max_size) {
        return Error::InvalidSize;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        ec = last_error();
        data.clear();
        return Error::IoError;
    }

    return Error::Ok;
}

AtomicFile::AtomicFile(std::string path)
    : path_(std::move(path)), temp_path_(make_temp_path(path_)) {}

AtomicFile::~AtomicFile() {
    if (!committed_) {
        discard();
    }
}

Error AtomicFile::open(std::error_code& ec) {
    ec.clear();
    if (opened_ || committed_) {
        return Error::InvalidArg;
    }

    errno = 0;
    stream_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!stream_) {
        ec = last_error();
        return Error::IoError;
    }

    opened_ = true;
    return Error::Ok;
}

Error AtomicFile::write(const std::uint8_t* data, std::size_t size, std::error_code& ec) {
    ec.clear();
    if (!opened_ || committed_) {
        return Error::InvalidArg;
    }

    errno = 0;
    stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!stream_) {
        ec = last_error();
        return Error::IoError;
    }
    return Error::Ok;
}

Error AtomicFile::commit(std::error_code& ec) {
    ec.clear();
    if (!opened_ || committed_) {
        return Error::InvalidArg;
    }

    errno = 0;
    stream_.flush();
    stream_.close();
    if (stream_.fail()) {
        ec = last_error();
        return Error::IoError;
    }

    std::filesystem::rename(temp_path_, path_, ec);
    if (ec) {
        return Error::IoError;
    }

    committed_ = true;
    return Error::Ok;
}

void AtomicFile::discard() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }
    if (opened_) {
        std::error_code ignored;
        std::filesystem::remove(temp_path_, ignored);
    }
}

} // namespace ch8pack
