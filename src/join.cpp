/**
 * @file join.cpp
 * @brief Join compilation unit.
 *
 * This file exists for library structure purposes. The composition facility
 * is implemented entirely in the header file (join.hpp) because it is a
 * template and must be visible at instantiation.
 *
 * write_all(), total_length() and Join<Ts...> are variadic templates over
 * the element types.
 *
 * This .cpp file:
 * - Includes the header to verify it compiles correctly in isolation
 * - Provides a compilation unit for the static library
 *
 * @see include/emstr/join.hpp for the full implementation
 */

#include <emstr/join.hpp>

// All implementation is in the header (variadic templates)
