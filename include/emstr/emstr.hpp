/**
 * @file emstr.hpp
 * @brief High-level emstr API.
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
 * Allocation-free string encoding: integers, characters, text slices, hex,
 * fixed-point decimals and padding, composed into caller-supplied buffers.
 *
 * @code
 * using namespace emstr;
 *
 * char buffer[32];
 * std::string_view text;
 * if (concat(buffer, sizeof(buffer), text, "T=", Fractional<int>(23041, 1000), 'C') ==
 *     Error::Ok) {
 *     // text == "T=23.041C"
 * }
 * @endcode
 */

#ifndef EMSTR_HPP
#define EMSTR_HPP

#include "config.hpp"
#include "encode.hpp"
#include "error.hpp"
#include "fractional.hpp"
#include "hex.hpp"
#include "integer.hpp"
#include "join.hpp"
#include "pad.hpp"
#include "strbuffer.hpp"
#include "text.hpp"

namespace emstr {

/**
 * @brief Concatenate values into a buffer and view the result as text.
 *
 * @param buffer Destination buffer
 * @param size Destination capacity in bytes
 * @param[out] out View over the written text
 * @param values Encodable values, in output order
 * @return Error::Ok on success, Error::BufferLength if the buffer is too
 *         small, Error::InvalidUtf8 if the result is not valid text
 */
template <typename... Ts>
Error concat(char* buffer, std::size_t size, std::string_view& out,
             const Ts&... values) noexcept {
    std::size_t n = 0;
    auto result = write_all(buffer, size, n, values...);
    if (result != Error::Ok) {
        return result;
    }

    if (!is_valid_utf8(buffer, n)) {
        return Error::InvalidUtf8;
    }

    out = std::string_view(buffer, n);
    return Error::Ok;
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace emstr

#endif // EMSTR_HPP
