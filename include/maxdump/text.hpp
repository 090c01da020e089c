/**
 * @file text.hpp
 * @brief Text conversion helpers shared by the container reader,
 *        the value decoders and the formatter.
 */

#ifndef MAXDUMP_TEXT_HPP
#define MAXDUMP_TEXT_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>
#include <vector>

namespace maxdump {

/**
 * @brief Convert UTF-16 code units to UTF-8.
 *
 * Surrogate pairs are combined; unpaired surrogates become U+FFFD.
 */
std::string utf16_to_utf8(const std::vector<std::uint16_t>& units);

/**
 * @brief Convert UTF-16LE bytes to UTF-8.
 *
 * @param data Source bytes
 * @param size Number of bytes, must be even
 * @param[out] out Converted text
 * @return Error::Ok, or Error::InvalidData for an odd byte count
 */
Error utf16le_to_utf8(const std::uint8_t* data, std::size_t size, std::string& out);

/**
 * @brief Render bytes as ASCII, replacing non-printable bytes with '.'.
 */
std::string to_printable_ascii(const std::vector<std::uint8_t>& bytes);

/**
 * @brief Render bytes as space separated upper-case hex pairs.
 */
std::string to_hex(const std::vector<std::uint8_t>& bytes);

/**
 * @brief Shorten text to @p width columns.
 *
 * Cuts at the last space that keeps the result, including the " [...]"
 * marker, within @p width.
 */
std::string shorten(const std::string& text, std::size_t width);

/**
 * @brief ASCII case-insensitive comparison.
 */
bool iequals(const std::string& lhs, const std::string& rhs) noexcept;

} // namespace maxdump

#endif // MAXDUMP_TEXT_HPP
