/**
 * @file integer.cpp
 * @brief Integer encoder compilation unit.
 *
 * This file exists for library structure purposes. The integer encoder is
 * implemented entirely in the header file (integer.hpp) because it is a
 * template and must be visible at instantiation.
 *
 * One algorithm covers int8_t through int64_t, their unsigned
 * counterparts and the machine-word types; each width instantiates it
 * independently.
 *
 * This .cpp file:
 * - Includes the header to verify it compiles correctly in isolation
 * - Provides a compilation unit for the static library
 *
 * @see include/emstr/integer.hpp for the full implementation
 */

#include <emstr/integer.hpp>

// All implementation is in the header (template functions)
