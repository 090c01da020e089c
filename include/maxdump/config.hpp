/**
 * @file config.hpp
 * @brief maxdump compile-time configuration.
 *
 * Chunk streams are the nested binary records stored inside the named
 * streams of OLE compound files used by legacy 3D scene formats.
 */

#ifndef MAXDUMP_CONFIG_HPP
#define MAXDUMP_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace maxdump {

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

/// Maximum container nesting accepted by the tree builder
#ifndef MAXDUMP_MAX_NESTING_DEPTH
#define MAXDUMP_MAX_NESTING_DEPTH 256U
#endif

inline constexpr std::size_t MAX_NESTING_DEPTH = MAXDUMP_MAX_NESTING_DEPTH;

/// Header sizes in bytes: id (2) + length (4) [+ extended length (8)]
inline constexpr std::size_t ID_FIELD_SIZE = 2U;
inline constexpr std::size_t LENGTH_FIELD_SIZE = 4U;
inline constexpr std::size_t EXTENDED_LENGTH_FIELD_SIZE = 8U;
inline constexpr std::size_t HEADER_SIZE = ID_FIELD_SIZE + LENGTH_FIELD_SIZE;
inline constexpr std::size_t EXTENDED_HEADER_SIZE = HEADER_SIZE + EXTENDED_LENGTH_FIELD_SIZE;

/// Default column width of the shortened hex line in formatted output
inline constexpr std::size_t DEFAULT_HEX_WIDTH = 35U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define MAXDUMP_NO_EXCEPTIONS=1 to build without the throwing API.
 * @{
 */
#ifndef MAXDUMP_NO_EXCEPTIONS
#define MAXDUMP_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace maxdump

#endif // MAXDUMP_CONFIG_HPP
