/**
 * @file fractional.hpp
 * @brief Fixed-point decimal encoding of scaled integers.
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
 * Renders value/divisor with a decimal point, for quantities stored as
 * scaled integers (millidegrees, currency minor units):
 *
 * | value  | divisor | Trim::None | Trim::TrailingZeros |
 * |--------|---------|------------|---------------------|
 * | 1234056| 1000    | 1234.056   | 1234.056            |
 * | 1050   | 1000    | 1.050      | 1.05                |
 * | 5      | 1000    | 0.005      | 0.005               |
 * | -10    | 100     | -0.10      | -0.1                |
 * | 2000   | 1000    | 2          | 2                   |
 *
 * @par Layout
 * - Integer part: value / divisor, truncated toward zero
 * - Decimal part: |value % divisor|, left-padded with '0' to
 *   digits(divisor) - 1 places
 * - A zero decimal part drops the point entirely
 * - A zero integer part of a negative value carries an explicit '-'
 *
 * Divisors are expected to be positive powers of ten. Other positive
 * divisors widen the decimal part to fit its digits. A non-positive divisor
 * renders the raw value as an integer.
 */

#ifndef EMSTR_FRACTIONAL_HPP
#define EMSTR_FRACTIONAL_HPP

#include "config.hpp"
#include "error.hpp"
#include "integer.hpp"
#include <type_traits>

namespace emstr {

/**
 * @brief Trailing-zero policy for the decimal part.
 */
enum class Trim : std::uint8_t {
    None = 0,         ///< Keep the full divisor-implied precision
    TrailingZeros = 1 ///< Drop trailing '0' digits after the point
};

inline constexpr Trim DEFAULT_TRIM = EMSTR_FRACTIONAL_TRIM ? Trim::TrailingZeros : Trim::None;

/**
 * @brief Fixed-point wrapper over a signed integer and its divisor.
 *
 * @tparam T Signed integer type of value and divisor
 */
template <typename T>
class Fractional {
    static_assert(detail::is_integer_v<T> && std::is_signed_v<T>,
                  "Fractional requires a signed integer type");

public:
    /**
     * @brief Construct a fractional value.
     *
     * @param value Scaled integer
     * @param divisor Scale, a positive power of ten (e.g. 1000 for milli-units)
     * @param trim Trailing-zero policy
     */
    constexpr Fractional(T value, T divisor, Trim trim = DEFAULT_TRIM) noexcept
        : value_(value), divisor_(divisor), trim_(trim) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr T divisor() const noexcept { return divisor_; }
    [[nodiscard]] constexpr Trim trim() const noexcept { return trim_; }

    /**
     * @brief Get encoded length.
     * @return Number of bytes write() will produce
     */
    [[nodiscard]] std::size_t length() const noexcept {
        Parts parts = split();

        std::size_t n = integer_length(parts.integer);
        if (parts.negative_zero) {
            ++n;
        }
        if (parts.decimal != 0) {
            n += 1 + parts.decimal_width;
        }
        return n;
    }

    /**
     * @brief Write the decimal representation.
     *
     * @param buffer Destination buffer
     * @param size Destination capacity in bytes
     * @param[out] written Number of bytes written
     * @return Error::Ok on success, Error::BufferLength if the buffer is too small
     */
    Error write(char* buffer, std::size_t size, std::size_t& written) const noexcept {
        if (size < length()) [[unlikely]] {
            return Error::BufferLength;
        }

        Parts parts = split();
        std::size_t n = 0;

        // Integer division lost the sign of -1 < value/divisor < 0
        if (parts.negative_zero) {
            buffer[n++] = '-';
        }

        std::size_t int_len = 0;
        auto result = write_integer(parts.integer, buffer + n, size - n, int_len);
        if (result != Error::Ok) {
            return result;
        }
        n += int_len;

        if (parts.decimal == 0) {
            written = n;
            return Error::Ok;
        }

        buffer[n++] = '.';

        std::size_t digits = detail::count_digits(parts.decimal);
        for (std::size_t i = digits; i < parts.decimal_width; ++i) {
            buffer[n++] = '0';
        }

        detail::write_digits(parts.decimal, buffer + n + digits, digits);
        n += digits;

        written = n;
        return Error::Ok;
    }

private:
    using Unsigned = std::make_unsigned_t<T>;

    struct Parts {
        T integer;
        Unsigned decimal;
        std::size_t decimal_width;
        bool negative_zero;
    };

    /**
     * @brief Split into integer and decimal parts.
     *
     * Shared by length() and write() so both see the same layout.
     */
    Parts split() const noexcept {
        Parts parts{value_, 0, 0, false};
        if (divisor_ <= 0) {
            return parts;
        }

        parts.integer = static_cast<T>(value_ / divisor_);
        parts.decimal = detail::magnitude(static_cast<T>(value_ % divisor_));
        if (parts.decimal == 0) {
            return parts;
        }

        std::size_t scale = detail::count_digits(detail::magnitude(divisor_)) - 1;
        std::size_t digits = detail::count_digits(parts.decimal);
        parts.decimal_width = (digits > scale) ? digits : scale;

        if (trim_ == Trim::TrailingZeros) {
            while ((parts.decimal % 10U) == 0) {
                parts.decimal = static_cast<Unsigned>(parts.decimal / 10U);
                --parts.decimal_width;
            }
        }

        parts.negative_zero = (parts.integer == 0) && (value_ < 0);
        return parts;
    }

    T value_;
    T divisor_;
    Trim trim_;
};

} // namespace emstr

#endif // EMSTR_FRACTIONAL_HPP
