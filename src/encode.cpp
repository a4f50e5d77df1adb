/**
 * @file encode.cpp
 * @brief Text validation for the encoding contract.
 *
 * Holds the only non-template piece of the contract: the UTF-8 check
 * behind encode_str(), concat() and StrBuffer::str(). Encoders themselves
 * are templates and live in the headers.
 *
 * @see include/emstr/encode.hpp
 */

#include <emstr/encode.hpp>

namespace emstr {

bool is_valid_utf8(const char* data, std::size_t size) noexcept {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    std::size_t i = 0;

    while (i < size) {
        unsigned char lead = bytes[i];

        // ASCII fast path
        if (lead < 0x80U) {
            ++i;
            continue;
        }

        std::size_t extra;
        std::uint32_t code_point;
        std::uint32_t min_code_point;
        if ((lead & 0xE0U) == 0xC0U) {
            extra = 1;
            code_point = lead & 0x1FU;
            min_code_point = 0x80U;
        } else if ((lead & 0xF0U) == 0xE0U) {
            extra = 2;
            code_point = lead & 0x0FU;
            min_code_point = 0x800U;
        } else if ((lead & 0xF8U) == 0xF0U) {
            extra = 3;
            code_point = lead & 0x07U;
            min_code_point = 0x10000U;
        } else {
            return false;
        }

        // Truncated sequence
        if (size - i <= extra) {
            return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char next = bytes[i + k];
            if ((next & 0xC0U) != 0x80U) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3FU);
        }

        // Overlong forms, UTF-16 surrogates, beyond Unicode range
        if (code_point < min_code_point || code_point > 0x10FFFFU ||
            (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

} // namespace emstr
