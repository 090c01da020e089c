/**
 * @file header_decoder.hpp
 * @brief Chunk header decoding.
 *
 * Wire layout of a header (little-endian):
 * - int16  id
 * - int32  length of header plus payload
 * - int64  extended length, present only when the int32 field is 0
 *
 * A negative length marks a container. The stored value is the true
 * length with the sign bit of its field forced on, so the magnitude is
 * recovered by clearing that bit, not by negation.
 */

#ifndef MAXDUMP_HEADER_DECODER_HPP
#define MAXDUMP_HEADER_DECODER_HPP

#include "byte_cursor.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "error.hpp"

namespace maxdump {

/**
 * @brief Clear the sign bit of a field of the given width.
 *
 * @param value Raw field value, sign-extended to 64 bits
 * @param width_bytes Width of the field as stored (1 to 8 bytes)
 * @return Field bits below the sign bit
 */
constexpr std::uint64_t clear_sign_bit(std::int64_t value, std::size_t width_bytes) noexcept {
    const std::size_t bits = width_bytes * 8U;
    const std::uint64_t field_mask = (bits >= 64U) ? ~0ULL : ((1ULL << bits) - 1ULL);
    const std::uint64_t sign_bit = 1ULL << (bits - 1U);
    return static_cast<std::uint64_t>(value) & field_mask & ~sign_bit;
}

/**
 * @brief Decode one chunk header.
 *
 * On success the cursor has advanced by exactly header.encoded_size()
 * bytes. On failure the header is left untouched.
 *
 * @param cursor Cursor positioned at a header boundary
 * @param[out] header Decoded header
 * @return Error::Ok on success
 * @return Error::UnexpectedEndOfStream if the header is cut off
 * @return Error::MalformedHeader for a zero extended length, or a length
 *         smaller than the header itself
 */
Error read_header(ByteCursor& cursor, ChunkHeader& header) noexcept;

} // namespace maxdump

#endif // MAXDUMP_HEADER_DECODER_HPP
