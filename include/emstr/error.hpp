/**
 * @file error.hpp
 * @brief emstr error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef EMSTR_ERROR_HPP
#define EMSTR_ERROR_HPP

#include "config.hpp"

#if !EMSTR_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace emstr {

/**
 * @brief Error codes returned by every fallible encoding operation.
 */
enum class Error {
    Ok = 0,            ///< Success
    BufferLength = -1, ///< Destination buffer smaller than the encoded length
    InvalidUtf8 = -2   ///< Encoded bytes are not valid UTF-8 text
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
    case Error::BufferLength:
        return "Buffer too small";
    case Error::InvalidUtf8:
        return "Invalid UTF-8";
    default:
        return "Unknown error";
    }
}

#if !EMSTR_NO_EXCEPTIONS

/**
 * @brief Base exception for emstr errors.
 */
class EmstrException : public std::runtime_error {
public:
    explicit EmstrException(const std::string& message, Error code = Error::BufferLength)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for an undersized destination buffer.
 */
class BufferLengthException : public EmstrException {
public:
    explicit BufferLengthException(const std::string& message)
        : EmstrException(message, Error::BufferLength) {}
};

/**
 * @brief Exception for encoded bytes that are not valid text.
 */
class InvalidUtf8Exception : public EmstrException {
public:
    explicit InvalidUtf8Exception(const std::string& message)
        : EmstrException(message, Error::InvalidUtf8) {}
};

/**
 * @brief Raise the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code returned by an encoding operation
 */
inline void throw_if_error(Error error) {
    switch (error) {
    case Error::Ok:
        return;
    case Error::BufferLength:
        throw BufferLengthException(error_string(error));
    case Error::InvalidUtf8:
        throw InvalidUtf8Exception(error_string(error));
    default:
        throw EmstrException(error_string(error), error);
    }
}

#endif // !EMSTR_NO_EXCEPTIONS

} // namespace emstr

#endif // EMSTR_ERROR_HPP
