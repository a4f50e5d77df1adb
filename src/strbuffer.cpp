/**
 * @file strbuffer.cpp
 * @brief StrBuffer compilation unit.
 *
 * This file exists for library structure purposes. The StrBuffer class is
 * implemented entirely in the header file (strbuffer.hpp) because it is a
 * template and must be visible at instantiation.
 *
 * StrBuffer<Capacity> is parameterized by its inline storage size.
 *
 * This .cpp file:
 * - Includes the header to verify it compiles correctly in isolation
 * - Provides a compilation unit for the static library
 *
 * @see include/emstr/strbuffer.hpp for the full implementation
 */

#include <emstr/strbuffer.hpp>

// All implementation is in the header (template class)
