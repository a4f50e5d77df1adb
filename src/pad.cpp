/**
 * @file pad.cpp
 * @brief Pad compilation unit.
 *
 * This file exists for library structure purposes. The Pad class is
 * implemented entirely in the header file (pad.hpp) because it is a template
 * and must be visible at instantiation.
 *
 * Pad<E, Direction> accepts any encodable inner type, including nested
 * Pad and Join values.
 *
 * This .cpp file:
 * - Includes the header to verify it compiles correctly in isolation
 * - Provides a compilation unit for the static library
 *
 * @see include/emstr/pad.hpp for the full implementation
 */

#include <emstr/pad.hpp>

// All implementation is in the header (template class)
