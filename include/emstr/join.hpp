/**
 * @file join.hpp
 * @brief Sequential encoding of heterogeneous values into one buffer.
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
 * @code
 * char buffer[32];
 * std::size_t n = 0;
 * write_all(buffer, sizeof(buffer), n, "something", ' ', std::uint8_t{15}, '/',
 *           std::uint8_t{100});
 * // buffer[0..n) == "something 15/100", n == 16
 * @endcode
 *
 * Values are written in order, each starting where the previous one ended.
 * The first failure is returned immediately; bytes already written for
 * earlier values stay in the buffer.
 */

#ifndef EMSTR_JOIN_HPP
#define EMSTR_JOIN_HPP

#include "config.hpp"
#include "encode.hpp"
#include "error.hpp"
#include "integer.hpp"
#include "text.hpp"
#include <tuple>
#include <type_traits>
#include <utility>

namespace emstr {

/**
 * @brief Sum of the encoded lengths of all values.
 */
template <typename... Ts>
[[nodiscard]] std::size_t total_length(const Ts&... values) noexcept {
    return (std::size_t{0} + ... + encoded_length(values));
}

/**
 * @brief Encode values back to back.
 *
 * @param buffer Destination buffer
 * @param size Destination capacity in bytes
 * @param[out] written Total number of bytes written (set on success only)
 * @param values Encodable values, in output order
 * @return Error::Ok on success, or the first error encountered
 */
template <typename... Ts>
Error write_all(char* buffer, std::size_t size, std::size_t& written,
                const Ts&... values) noexcept {
    std::size_t total = 0;
    Error result = Error::Ok;

    auto step = [&](const auto& value) noexcept {
        std::size_t n = 0;
        result = encode(value, buffer + total, size - total, n);
        if (result != Error::Ok) {
            return false;
        }
        total += n;
        return true;
    };

    // Short-circuits on the first failing value
    static_cast<void>((step(values) && ...));

    if (result != Error::Ok) {
        return result;
    }

    written = total;
    return Error::Ok;
}

/**
 * @brief A concatenation that is itself encodable.
 *
 * Lets a sequence be padded or nested inside other wrappers.
 *
 * @tparam Ts Encodable element types (held by value)
 */
template <typename... Ts>
class Join {
public:
    constexpr explicit Join(Ts... values) noexcept(
        std::is_nothrow_move_constructible_v<std::tuple<Ts...>>)
        : values_(std::move(values)...) {}

    [[nodiscard]] std::size_t length() const noexcept {
        return std::apply([](const auto&... v) noexcept { return total_length(v...); },
                          values_);
    }

    Error write(char* buffer, std::size_t size, std::size_t& written) const noexcept {
        return std::apply(
            [&](const auto&... v) noexcept { return write_all(buffer, size, written, v...); },
            values_);
    }

private:
    std::tuple<Ts...> values_;
};

/**
 * @brief Build a Join; string literals decay to const char*.
 */
template <typename... Ts>
constexpr Join<std::decay_t<Ts>...> join(Ts&&... values) {
    return Join<std::decay_t<Ts>...>(std::forward<Ts>(values)...);
}

} // namespace emstr

#endif // EMSTR_JOIN_HPP
