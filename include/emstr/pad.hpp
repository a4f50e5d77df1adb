/**
 * @file pad.hpp
 * @brief Minimum-width padding around any encodable value.
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
 * The output is max(width, inner length) bytes. The inner value is never
 * truncated:
 * - PadLeft("123", 6, ' ')  -> "   123"
 * - PadRight("123", 6, ' ') -> "123   "
 * - PadLeft("123", 2, ' ')  -> "123"
 */

#ifndef EMSTR_PAD_HPP
#define EMSTR_PAD_HPP

#include "config.hpp"
#include "encode.hpp"
#include "error.hpp"
#include "integer.hpp"
#include "text.hpp"
#include <cstring>
#include <type_traits>
#include <utility>

namespace emstr {

/// Direction tag: fill before the inner value
struct Left {};

/// Direction tag: fill after the inner value
struct Right {};

/**
 * @brief Padding wrapper.
 *
 * @tparam E Inner encodable type (use std::reference_wrapper to borrow)
 * @tparam Direction Left or Right
 */
template <typename E, typename Direction>
class Pad {
    static_assert(std::is_same_v<Direction, Left> || std::is_same_v<Direction, Right>,
                  "Pad direction must be Left or Right");

public:
    /**
     * @brief Construct a padding wrapper.
     *
     * @param inner Value to pad
     * @param width Minimum output width in bytes
     * @param fill Fill character
     */
    constexpr Pad(E inner, std::size_t width, char fill = ' ') noexcept(
        std::is_nothrow_move_constructible_v<E>)
        : inner_(std::move(inner)), width_(width), fill_(fill) {}

    [[nodiscard]] constexpr const E& inner() const noexcept { return inner_; }
    [[nodiscard]] constexpr std::size_t width() const noexcept { return width_; }
    [[nodiscard]] constexpr char fill() const noexcept { return fill_; }

    [[nodiscard]] std::size_t length() const noexcept {
        std::size_t n = encoded_length(inner_);
        return (width_ > n) ? width_ : n;
    }

    /**
     * @brief Write the padded value.
     *
     * The buffer is checked against the padded length before anything is
     * written.
     *
     * @param buffer Destination buffer
     * @param size Destination capacity in bytes
     * @param[out] written Number of bytes written
     * @return Error::Ok on success, Error::BufferLength if the buffer is too small
     */
    Error write(char* buffer, std::size_t size, std::size_t& written) const noexcept {
        std::size_t n = encoded_length(inner_);
        std::size_t total = (width_ > n) ? width_ : n;
        if (size < total) [[unlikely]] {
            return Error::BufferLength;
        }

        std::size_t padding = total - n;
        std::size_t inner_written = 0;
        Error result;

        if constexpr (std::is_same_v<Direction, Left>) {
            if (padding > 0) {
                std::memset(buffer, fill_, padding);
            }
            result = encode(inner_, buffer + padding, size - padding, inner_written);
        } else {
            result = encode(inner_, buffer, size, inner_written);
            if (result == Error::Ok && padding > 0) {
                std::memset(buffer + n, fill_, padding);
            }
        }

        if (result != Error::Ok) {
            return result;
        }

        written = total;
        return Error::Ok;
    }

private:
    E inner_;
    std::size_t width_;
    char fill_;
};

template <typename E>
using PadLeft = Pad<E, Left>;

template <typename E>
using PadRight = Pad<E, Right>;

/**
 * @brief Pad a value on the left (right-align it).
 *
 * String literals decay to const char*; pass std::cref(value) to borrow
 * instead of copy.
 */
template <typename E>
constexpr PadLeft<std::decay_t<E>> pad_left(E&& inner, std::size_t width, char fill = ' ') {
    return PadLeft<std::decay_t<E>>(std::forward<E>(inner), width, fill);
}

/**
 * @brief Pad a value on the right (left-align it).
 */
template <typename E>
constexpr PadRight<std::decay_t<E>> pad_right(E&& inner, std::size_t width, char fill = ' ') {
    return PadRight<std::decay_t<E>>(std::forward<E>(inner), width, fill);
}

} // namespace emstr

#endif // EMSTR_PAD_HPP
