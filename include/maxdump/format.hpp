/**
 * @file format.hpp
 * @brief Human-readable rendering of decoded chunk trees.
 *
 * Example output for a container holding one 2-byte value:
 *
 *     [0x2004 Container 8 1]
 *       [0x0001 Value 2]
 *           hex: 41 42
 *           ascii: AB
 */

#ifndef MAXDUMP_FORMAT_HPP
#define MAXDUMP_FORMAT_HPP

#include "chunk.hpp"
#include "config.hpp"
#include "value_decoder.hpp"

#include <string>

namespace maxdump {

/**
 * @brief Rendering options.
 */
struct FormatOptions {
    /// Width of the shortened "hex:" line
    std::size_t hex_width = DEFAULT_HEX_WIDTH;
    /// Adds a "decoded:" line for identifiers it knows; not owned
    const ValueDecoderRegistry* decoders = nullptr;
};

/**
 * @brief One-line header summary, e.g. "[0x2004 Container 120 ext]".
 */
std::string format_header(const ChunkHeader& header);

/**
 * @brief Render a node and its descendants.
 *
 * @param node Node to render
 * @param depth Nesting level; indentation is two spaces per level
 * @param options Rendering options
 */
std::string format_node(const Node& node, std::size_t depth, const FormatOptions& options = {});

/**
 * @brief Render a forest, top-level nodes at depth 0.
 */
std::string format_nodes(const NodeList& nodes, const FormatOptions& options = {});

} // namespace maxdump

#endif // MAXDUMP_FORMAT_HPP
