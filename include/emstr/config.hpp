/**
 * @file config.hpp
 * @brief emstr compile-time configuration.
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
 * Allocation-free string encoding for embedded targets.
 */

#ifndef EMSTR_CONFIG_HPP
#define EMSTR_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace emstr {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default StrBuffer capacity in bytes
#ifndef EMSTR_DEFAULT_BUFFER_SIZE
#define EMSTR_DEFAULT_BUFFER_SIZE 64U
#endif

/// Default Fractional policy: 1 trims trailing zeros of the decimal part, 0 keeps them
#ifndef EMSTR_FRACTIONAL_TRIM
#define EMSTR_FRACTIONAL_TRIM 1
#endif

inline constexpr std::size_t DEFAULT_BUFFER_SIZE = EMSTR_DEFAULT_BUFFER_SIZE;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define EMSTR_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef EMSTR_NO_EXCEPTIONS
#define EMSTR_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace emstr

#endif // EMSTR_CONFIG_HPP
