/**
 * @file integer.hpp
 * @brief Decimal encoding of fixed-width integers.
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
 * One algorithm serves every width (8/16/32/64-bit and machine words):
 * - Length: digit count by repeated division by 10, plus one for '-'
 * - Write: digits extracted least-significant first and stored from the
 *   end of the output span backward, so no reversal pass is needed
 *
 * @par Negative Values
 * The magnitude is computed in the unsigned type of the same width, so the
 * two's-complement minimum (e.g. INT64_MIN) encodes exactly.
 */

#ifndef EMSTR_INTEGER_HPP
#define EMSTR_INTEGER_HPP

#include "config.hpp"
#include "encode.hpp"
#include "error.hpp"
#include <limits>
#include <type_traits>

namespace emstr {

namespace detail {

inline constexpr char DEC_DIGITS[10] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};

/// Integral types rendered as numbers (character and boolean types excluded)
template <typename T>
inline constexpr bool is_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
    !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> &&
    !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

template <typename T>
constexpr bool is_negative(T value) noexcept {
    if constexpr (std::is_signed_v<T>) {
        return value < 0;
    } else {
        static_cast<void>(value);
        return false;
    }
}

/**
 * @brief Absolute value in the unsigned type of the same width.
 *
 * 0 - unsigned(value) is well defined for every value, the signed
 * minimum included.
 */
template <typename T>
constexpr std::make_unsigned_t<T> magnitude(T value) noexcept {
    using U = std::make_unsigned_t<T>;
    if (is_negative(value)) {
        return static_cast<U>(U{0} - static_cast<U>(value));
    }
    return static_cast<U>(value);
}

/**
 * @brief Number of decimal digits of an unsigned value (1 for zero).
 */
template <typename U>
constexpr std::size_t count_digits(U value) noexcept {
    std::size_t n = 0;
    do {
        value = static_cast<U>(value / 10U);
        ++n;
    } while (value != 0);
    return n;
}

/**
 * @brief Write the digits of an unsigned value ending just before end.
 *
 * @param value Value to write
 * @param end One past the last output position
 * @param count Number of digits to write (count_digits(value))
 */
template <typename U>
void write_digits(U value, char* end, std::size_t count) noexcept {
    for (std::size_t i = 0; i < count; ++i) {
        *--end = DEC_DIGITS[value % 10U];
        value = static_cast<U>(value / 10U);
    }
}

} // namespace detail

/**
 * @brief Upper bound of the encoded length of any value of type T.
 *
 * Suitable for sizing stack buffers at compile time.
 */
template <typename T>
inline constexpr std::size_t MAX_INTEGER_LENGTH =
    static_cast<std::size_t>(std::numeric_limits<std::make_unsigned_t<T>>::digits10) + 1U +
    (std::is_signed_v<T> ? 1U : 0U);

/**
 * @brief Get the decimal length of an integer.
 *
 * @param value Integer to measure
 * @return Digit count, plus one for the sign of negative values
 */
template <typename T>
[[nodiscard]] constexpr std::size_t integer_length(T value) noexcept {
    static_assert(detail::is_integer_v<T>, "integer_length requires an integer type");
    std::size_t sign = detail::is_negative(value) ? 1U : 0U;
    return sign + detail::count_digits(detail::magnitude(value));
}

/**
 * @brief Encode an integer as decimal ASCII.
 *
 * @param value Integer to encode
 * @param buffer Destination buffer
 * @param size Destination capacity in bytes
 * @param[out] written Number of bytes written
 * @return Error::Ok on success, Error::BufferLength if the buffer is too small
 */
template <typename T>
Error write_integer(T value, char* buffer, std::size_t size, std::size_t& written) noexcept {
    static_assert(detail::is_integer_v<T>, "write_integer requires an integer type");

    std::size_t n = integer_length(value);
    if (size < n) [[unlikely]] {
        return Error::BufferLength;
    }

    // Sign first, digits fill the rest of the span
    std::size_t digits = n;
    if (detail::is_negative(value)) {
        buffer[0] = '-';
        --digits;
    }

    detail::write_digits(detail::magnitude(value), buffer + n, digits);

    written = n;
    return Error::Ok;
}

/**
 * @brief Encode trait for integers of every width.
 */
template <typename T>
struct Encode<T, std::enable_if_t<detail::is_integer_v<T>>> {
    static std::size_t length(T value) noexcept {
        return integer_length(value);
    }

    static Error write(T value, char* buffer, std::size_t size, std::size_t& written) noexcept {
        return write_integer(value, buffer, size, written);
    }
};

} // namespace emstr

#endif // EMSTR_INTEGER_HPP
