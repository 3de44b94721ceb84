/**
 * @file file_io.hpp
 * @brief ROM reading and all-or-nothing file output.
 *
 * Failures are reported as Error::IoError with the operating system's
 * error passed back unchanged through a std::error_code.
 */

#ifndef CH8PACK_FILE_IO_HPP
#define CH8PACK_FILE_IO_HPP

#include "config.hpp"
#include "error.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace ch8pack {

/**
 * @brief Read a whole file.
 *
 * @param path File to read
 * @param[out] data File contents
 * @param[out] ec Operating system error on Error::IoError
 * @param max_size Largest accepted file; larger files are rejected
 *        before their contents are read
 * @return Error::Ok, Error::IoError or Error::InvalidSize
 *
 * A directory is an Error::IoError with std::errc::is_a_directory.
 */
Error read_file(const std::string& path, std::vector<std::uint8_t>& data, std::error_code& ec,
                std::size_t max_size = MAX_ROM_SIZE);

/**
 * @brief Output file that only appears under its name once committed.
 *
 * Bytes go to a temporary `<path>.part.<pid>.<n>` beside the target, so
 * an existing file of any other name is never touched; commit() flushes,
 * closes and renames it over `path`. If the object is destroyed before a successful commit the
 * temporary file is removed, so a failed conversion leaves nothing at
 * either location.
 */
class AtomicFile {
public:
    explicit AtomicFile(std::string path);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    /**
     * @brief Create the temporary file.
     */
    Error open(std::error_code& ec);

    /**
     * @brief Append bytes to the temporary file.
     */
    Error write(const std::uint8_t* data, std::size_t size, std::error_code& ec);

    /**
     * @brief Flush, close and move the temporary file to its final path.
     */
    Error commit(std::error_code& ec);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& temp_path() const noexcept { return temp_path_; }
    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    void discard() noexcept;

    std::string path_;
    std::string temp_path_;
    std::ofstream stream_;
    bool opened_ = false;
    bool committed_ = false;
};

} // namespace ch8pack

#endif // CH8PACK_FILE_IO_HPP
