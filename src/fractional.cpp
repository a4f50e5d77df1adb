/**
 * @file fractional.cpp
 * @brief Fractional compilation unit.
 *
 * This file exists for library structure purposes. The Fractional class is
 * implemented entirely in the header file (fractional.hpp) because it is a
 * template and must be visible at instantiation.
 *
 * Fractional<T> splits a scaled integer into integer and decimal parts
 * from one private split(), so length() and write() always agree.
 *
 * This .cpp file:
 * - Includes the header to verify it compiles correctly in isolation
 * - Provides a compilation unit for the static library
 *
 * @see include/emstr/fractional.hpp for the full implementation
 */

#include <emstr/fractional.hpp>

// All implementation is in the header (template class)
