/**
 * @file byte_cursor.cpp
 * @brief ByteCursor compilation unit.
 *
 * The ByteCursor class is implemented entirely in the header file
 * (byte_cursor.hpp) so the fixed-width reads inline into the tree
 * builder's loop. This unit checks that the header compiles on its own.
 *
 * @see include/maxdump/byte_cursor.hpp for the full implementation
 */

#include <maxdump/byte_cursor.hpp>

// All implementation is in the header (inline functions)
