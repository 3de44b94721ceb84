/**
 * @file config.hpp
 * @brief ch8pack compile-time configuration.
 *
 * Constants describing the compressed stream, the calculator variable
 * layout and the limits imposed by the on-calculator interpreter.
 */

#ifndef CH8PACK_CONFIG_HPP
#define CH8PACK_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace ch8pack {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;

/// Package format version written into every header. The interpreter
/// rejects a different major or a newer minor.
inline constexpr std::uint8_t FORMAT_VERSION_MAJOR = 1U;
inline constexpr std::uint8_t FORMAT_VERSION_MINOR = 0U;
inline constexpr std::uint8_t FORMAT_VERSION_PATCH = 0U;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Largest ROM image accepted for packaging (bytes)
inline constexpr std::size_t MAX_ROM_SIZE = 0x1000U;

/// Interpreter memory available to a loaded ROM (programs start at 0x200)
inline constexpr std::size_t DEVICE_LOAD_LIMIT = 0x1000U - 0x200U;

/// Byte introducing a back-reference; literal occurrences are escaped
inline constexpr std::uint8_t COMPRESS_FLAG = 0xFFU;

/// Number of preceding bytes searched for a match
inline constexpr std::size_t WINDOW_SIZE = 1024U;

/// Largest encodable back-reference offset (10 bits)
inline constexpr std::size_t MAX_MATCH_OFFSET = WINDOW_SIZE - 1U;

/// Largest encodable back-reference length (6 bits)
inline constexpr std::size_t MAX_MATCH_LENGTH = 63U;

/// A match is only referenced when its literal encoding exceeds this cost
inline constexpr std::size_t BACKREF_THRESHOLD = 3U;

/// Encoded size of a back-reference token
inline constexpr std::size_t BACKREF_SIZE = 3U;

inline constexpr std::size_t HEADER_SIZE = 91U;
inline constexpr std::size_t TRAILER_SIZE = 6U;
inline constexpr std::size_t CHECKSUM_SIZE = 2U;

/// Folder and variable names are clipped to this many bytes
inline constexpr std::size_t NAME_LENGTH = 8U;

inline constexpr const char* DEFAULT_FOLDER = "main";

/// On-calculator type extension stored in the trailer
inline constexpr const char* PAYLOAD_EXTENSION = "ch8";
inline constexpr std::size_t PAYLOAD_EXTENSION_LENGTH = 3U;

/// Trailing tag marking the variable as an OTH file of type "ch8"
inline constexpr std::uint8_t TRAILER[TRAILER_SIZE] = {0x00U, 'c', 'h', '8', 0x00U, 0xF8U};

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define CH8PACK_NO_EXCEPTIONS=1 to build without the exception layer.
 * @{
 */
#ifndef CH8PACK_NO_EXCEPTIONS
#define CH8PACK_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace ch8pack

#endif // CH8PACK_CONFIG_HPP
