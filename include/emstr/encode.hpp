/**
 * @file encode.hpp
 * @brief The two-phase encoding contract.
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
 * Every encodable value exposes two operations:
 * - length: the exact number of bytes the value occupies when written
 * - write: encode into a caller buffer of at least that many bytes
 *
 * Callers size a buffer once (usually a stack array) from length() and
 * never reallocate. The Encode<T> trait maps a type to its implementation.
 * Primitive types are covered by specializations in integer.hpp and
 * text.hpp; wrapper classes (Hex, Fractional, Pad, Join) and user types
 * become encodable by providing the member functions
 *
 * @code
 * std::size_t length() const noexcept;
 * Error write(char* buffer, std::size_t size, std::size_t& written) const noexcept;
 * @endcode
 *
 * @par Write Semantics
 * - Output starts at offset 0 of the buffer
 * - On success, written == length() and Error::Ok is returned
 * - If size < length(), Error::BufferLength is returned, nothing is
 *   written and written is left untouched
 */

#ifndef EMSTR_ENCODE_HPP
#define EMSTR_ENCODE_HPP

#include "config.hpp"
#include "error.hpp"
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace emstr {

/**
 * @brief Encoding trait, specialized per encodable type.
 *
 * @tparam T Value type (cv-unqualified)
 * @tparam Enable SFINAE slot for partial specializations
 *
 * Specializations provide:
 * - static std::size_t length(const T&) noexcept
 * - static Error write(const T&, char*, std::size_t, std::size_t&) noexcept
 */
template <typename T, typename Enable = void>
struct Encode;

/**
 * @brief Encode trait for types with length()/write() members.
 */
template <typename T>
struct Encode<T, std::void_t<decltype(std::declval<const T&>().length()),
                            decltype(std::declval<const T&>().write(
                                std::declval<char*>(), std::size_t{},
                                std::declval<std::size_t&>()))>> {
    static std::size_t length(const T& value) noexcept {
        return value.length();
    }

    static Error write(const T& value, char* buffer, std::size_t size,
                       std::size_t& written) noexcept {
        return value.write(buffer, size, written);
    }
};

/**
 * @brief Encode trait for borrowed values, delegates to the referenced type.
 */
template <typename T>
struct Encode<std::reference_wrapper<T>, void> {
    using Inner = Encode<std::remove_cv_t<T>>;

    static std::size_t length(const std::reference_wrapper<T>& ref) noexcept {
        return Inner::length(ref.get());
    }

    static Error write(const std::reference_wrapper<T>& ref, char* buffer, std::size_t size,
                       std::size_t& written) noexcept {
        return Inner::write(ref.get(), buffer, size, written);
    }
};

/**
 * @brief True when Encode<T> is specialized for T.
 */
template <typename T, typename = void>
struct is_encodable : std::false_type {};

template <typename T>
struct is_encodable<T, std::void_t<decltype(Encode<std::remove_cv_t<T>>::length(
                           std::declval<const T&>()))>> : std::true_type {};

template <typename T>
inline constexpr bool is_encodable_v = is_encodable<T>::value;

/**
 * @brief Get the exact encoded length of a value.
 *
 * @param value Encodable value
 * @return Number of bytes write() will produce
 */
template <typename T>
[[nodiscard]] std::size_t encoded_length(const T& value) noexcept {
    static_assert(is_encodable_v<T>, "type does not implement the encoding contract");
    return Encode<std::remove_cv_t<T>>::length(value);
}

/**
 * @brief Encode a value into a buffer.
 *
 * @param value Encodable value
 * @param buffer Destination buffer
 * @param size Destination capacity in bytes
 * @param[out] written Number of bytes written
 * @return Error::Ok on success, Error::BufferLength if size < length
 */
template <typename T>
Error encode(const T& value, char* buffer, std::size_t size, std::size_t& written) noexcept {
    static_assert(is_encodable_v<T>, "type does not implement the encoding contract");
    return Encode<std::remove_cv_t<T>>::write(value, buffer, size, written);
}

/**
 * @brief Check that a byte range is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 *
 * @param data Bytes to check
 * @param size Number of bytes
 * @return true if the range is valid UTF-8
 */
[[nodiscard]] bool is_valid_utf8(const char* data, std::size_t size) noexcept;

/**
 * @brief Encode a value and view the result as text.
 *
 * @param value Encodable value
 * @param buffer Destination buffer
 * @param size Destination capacity in bytes
 * @param[out] out View over the written bytes
 * @return Error::Ok on success, Error::BufferLength if size < length,
 *         Error::InvalidUtf8 if the written bytes are not valid text
 */
template <typename T>
Error encode_str(const T& value, char* buffer, std::size_t size, std::string_view& out) noexcept {
    std::size_t n = 0;
    auto result = encode(value, buffer, size, n);
    if (result != Error::Ok) {
        return result;
    }

    if (!is_valid_utf8(buffer, n)) {
        return Error::InvalidUtf8;
    }

    out = std::string_view(buffer, n);
    return Error::Ok;
}

} // namespace emstr

#endif // EMSTR_ENCODE_HPP
