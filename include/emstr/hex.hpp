/**
 * @file hex.hpp
 * @brief Lowercase hexadecimal encoding of byte sequences.
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
 * Each input byte becomes two characters, high nibble first, with no
 * separators: {0x12, 0x34, 0xff} -> "1234ff".
 */

#ifndef EMSTR_HEX_HPP
#define EMSTR_HEX_HPP

#include "config.hpp"
#include "error.hpp"
#include <array>
#include <string_view>

namespace emstr {

namespace detail {
inline constexpr char HEX_DIGITS[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
} // namespace detail

/**
 * @brief Hex view over a borrowed byte sequence.
 *
 * The referenced bytes must outlive the Hex object.
 */
class Hex {
public:
    /**
     * @brief Construct from a pointer and size.
     *
     * @param data Source bytes
     * @param size Number of bytes
     */
    constexpr Hex(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size) {}

    template <std::size_t N>
    constexpr explicit Hex(const std::uint8_t (&data)[N]) noexcept : data_(data), size_(N) {}

    template <std::size_t N>
    constexpr explicit Hex(const std::array<std::uint8_t, N>& data) noexcept
        : data_(data.data()), size_(N) {}

    /**
     * @brief Construct over the raw bytes of a text slice.
     */
    explicit Hex(std::string_view text) noexcept
        : data_(reinterpret_cast<const std::uint8_t*>(text.data())), size_(text.size()) {}

    [[nodiscard]] constexpr std::size_t size() const noexcept { return size_; }

    /**
     * @brief Get encoded length.
     * @return Two characters per input byte
     */
    [[nodiscard]] constexpr std::size_t length() const noexcept { return size_ * 2; }

    /**
     * @brief Write the hex characters.
     *
     * @param buffer Destination buffer
     * @param size Destination capacity in bytes
     * @param[out] written Number of bytes written
     * @return Error::Ok on success, Error::BufferLength if the buffer is too small
     */
    Error write(char* buffer, std::size_t size, std::size_t& written) const noexcept {
        std::size_t n = length();
        if (size < n) [[unlikely]] {
            return Error::BufferLength;
        }

        for (std::size_t i = 0; i < size_; ++i) {
            std::uint8_t byte = data_[i];
            buffer[i * 2] = detail::HEX_DIGITS[(byte >> 4) & 0x0FU];
            buffer[(i * 2) + 1] = detail::HEX_DIGITS[byte & 0x0FU];
        }

        written = n;
        return Error::Ok;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
};

} // namespace emstr

#endif // EMSTR_HEX_HPP
