/**
 * @file error.hpp
 * @brief ch8pack error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * The core API reports through Error codes; the exception classes back
 * the throwing convenience overloads and are removed by
 * CH8PACK_NO_EXCEPTIONS=1.
 */

#ifndef CH8PACK_ERROR_HPP
#define CH8PACK_ERROR_HPP

#include "config.hpp"

#if !CH8PACK_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#include <system_error>
#endif

namespace ch8pack {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument
    InvalidSize = -2, ///< ROM image larger than MAX_ROM_SIZE
    Overflow = -3,    ///< Value does not fit its field or buffer
    InvalidData = -4, ///< Invalid/corrupted package or stream
    IoError = -5      ///< Underlying read or write failed
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::InvalidSize:
        return "Invalid input size";
    case Error::Overflow:
        return "Field overflow";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    case Error::IoError:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

#if !CH8PACK_NO_EXCEPTIONS

/**
 * @brief Base exception for ch8pack errors.
 */
class Ch8PackException : public std::runtime_error {
public:
    explicit Ch8PackException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public Ch8PackException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Ch8PackException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for ROM images exceeding MAX_ROM_SIZE.
 */
class InvalidSizeException : public Ch8PackException {
public:
    explicit InvalidSizeException(const std::string& message)
        : Ch8PackException(message, Error::InvalidSize) {}
};

/**
 * @brief Exception for header field overflow.
 */
class OverflowException : public Ch8PackException {
public:
    explicit OverflowException(const std::string& message)
        : Ch8PackException(message, Error::Overflow) {}
};

/**
 * @brief Exception for invalid/corrupted data.
 */
class InvalidDataException : public Ch8PackException {
public:
    explicit InvalidDataException(const std::string& message)
        : Ch8PackException(message, Error::InvalidData) {}
};

/**
 * @brief Exception for read/write failures, keeping the system error.
 */
class IoException : public Ch8PackException {
public:
    IoException(const std::string& message, std::error_code ec)
        : Ch8PackException(message + ": " + ec.message(), Error::IoError), ec_(ec) {}

    const std::error_code& error_code() const noexcept {
        return ec_;
    }

private:
    std::error_code ec_;
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Result of a core operation
 * @param context Prefix for the exception message
 * @param ec System error attached to Error::IoError
 */
inline void throw_if_error(Error error, const std::string& context,
                           std::error_code ec = {}) {
    const std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::Ok:
        return;
    case Error::InvalidSize:
        throw InvalidSizeException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::InvalidData:
        throw InvalidDataException(message);
    case Error::IoError:
        throw IoException(context, ec);
    case Error::InvalidArg:
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !CH8PACK_NO_EXCEPTIONS

} // namespace ch8pack

#endif // CH8PACK_ERROR_HPP
