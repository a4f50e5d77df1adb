/**
 * @file text.hpp
 * @brief Verbatim encoding of characters and text slices.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Supported text forms:
 * - char: one byte
 * - std::string_view: size() bytes
 * - const char* / char*: bytes up to the terminating NUL (nullptr is empty)
 * - char[N]: bytes up to the first NUL or N, so string literals drop
 *   their terminator
 */

#ifndef EMSTR_TEXT_HPP
#define EMSTR_TEXT_HPP

#include "config.hpp"
#include "encode.hpp"
#include "error.hpp"
#include <cstring>
#include <string_view>

namespace emstr {

namespace detail {

/**
 * @brief Copy a byte range to the start of the buffer.
 */
inline Error write_bytes(const char* data, std::size_t n, char* buffer, std::size_t size,
                         std::size_t& written) noexcept {
    if (size < n) [[unlikely]] {
        return Error::BufferLength;
    }
    if (n > 0) {
        std::memcpy(buffer, data, n);
    }
    written = n;
    return Error::Ok;
}

inline std::size_t bounded_length(const char* data, std::size_t max_size) noexcept {
    std::size_t n = 0;
    while (n < max_size && data[n] != '\0') {
        ++n;
    }
    return n;
}

} // namespace detail

template <>
struct Encode<char> {
    static std::size_t length(char) noexcept {
        return 1;
    }

    static Error write(char value, char* buffer, std::size_t size, std::size_t& written) noexcept {
        if (size < 1) [[unlikely]] {
            return Error::BufferLength;
        }
        buffer[0] = value;
        written = 1;
        return Error::Ok;
    }
};

template <>
struct Encode<std::string_view> {
    static std::size_t length(std::string_view value) noexcept {
        return value.size();
    }

    static Error write(std::string_view value, char* buffer, std::size_t size,
                       std::size_t& written) noexcept {
        return detail::write_bytes(value.data(), value.size(), buffer, size, written);
    }
};

template <>
struct Encode<const char*> {
    static std::size_t length(const char* value) noexcept {
        return (value != nullptr) ? std::strlen(value) : 0U;
    }

    static Error write(const char* value, char* buffer, std::size_t size,
                       std::size_t& written) noexcept {
        return detail::write_bytes(value, length(value), buffer, size, written);
    }
};

template <>
struct Encode<char*> : Encode<const char*> {};

template <std::size_t N>
struct Encode<char[N], void> {
    static std::size_t length(const char (&value)[N]) noexcept {
        return detail::bounded_length(value, N);
    }

    static Error write(const char (&value)[N], char* buffer, std::size_t size,
                       std::size_t& written) noexcept {
        return detail::write_bytes(value, length(value), buffer, size, written);
    }
};

} // namespace emstr

#endif // EMSTR_TEXT_HPP
