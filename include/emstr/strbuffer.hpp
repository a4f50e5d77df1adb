/**
 * @file strbuffer.hpp
 * @brief Fixed-capacity text buffer for building encoded output.
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
 * Appends encodable values one after another into inline storage.
 *
 * @par Append Semantics
 * An append either fits entirely or leaves the buffer unchanged: the total
 * length of the appended values is checked against the remaining capacity
 * before any byte is written.
 */

#ifndef EMSTR_STRBUFFER_HPP
#define EMSTR_STRBUFFER_HPP

#include "config.hpp"
#include "encode.hpp"
#include "error.hpp"
#include "join.hpp"
#include <array>
#include <string_view>

namespace emstr {

/**
 * @brief Text buffer with static allocation.
 *
 * @tparam Capacity Maximum content size in bytes
 *
 * Uses static allocation only - no heap allocation. Suitable for
 * embedded systems with -fno-exceptions -fno-rtti.
 */
template <std::size_t Capacity = DEFAULT_BUFFER_SIZE>
class StrBuffer {
public:
    /**
     * @brief Default constructor - initializes to empty state.
     */
    constexpr StrBuffer() noexcept : data_{}, size_(0) {}

    /**
     * @brief Clear buffer to empty state.
     */
    void clear() noexcept {
        size_ = 0;
        data_.fill('\0');
    }

    /**
     * @brief Get number of bytes in buffer.
     * @return Number of bytes currently stored
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    [[nodiscard]] constexpr std::size_t capacity() const noexcept { return Capacity; }

    [[nodiscard]] std::size_t remaining() const noexcept { return Capacity - size_; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] const char* data() const noexcept { return data_.data(); }

    /**
     * @brief View the raw content, without text validation.
     */
    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(data_.data(), size_);
    }

    /**
     * @brief Append encodable values.
     *
     * @param values Values to encode, in output order
     * @return Error::Ok on success, Error::BufferLength if they do not fit
     */
    template <typename... Ts>
    Error append(const Ts&... values) noexcept {
        if (total_length(values...) > remaining()) {
            return Error::BufferLength;
        }

        std::size_t n = 0;
        auto result = write_all(data_.data() + size_, remaining(), n, values...);
        if (result != Error::Ok) {
            return result;
        }

        size_ += n;
        return Error::Ok;
    }

    /**
     * @brief View the content as validated text.
     *
     * @param[out] out View over the content
     * @return Error::Ok on success, Error::InvalidUtf8 if the content is not valid text
     */
    Error str(std::string_view& out) const noexcept {
        if (!is_valid_utf8(data_.data(), size_)) {
            return Error::InvalidUtf8;
        }
        out = view();
        return Error::Ok;
    }

private:
    std::array<char, Capacity> data_;
    std::size_t size_;
};

} // namespace emstr

#endif // EMSTR_STRBUFFER_HPP
