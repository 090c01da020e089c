/**
 * @file tree_builder.hpp
 * @brief Recursive decoding of a chunk byte run into a node tree.
 */

#ifndef MAXDUMP_TREE_BUILDER_HPP
#define MAXDUMP_TREE_BUILDER_HPP

#include "byte_cursor.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "error.hpp"

namespace maxdump {

/**
 * @brief Runtime limits for decoding.
 */
struct DecodeOptions {
    /// Deepest container level accepted; the top level is depth 0.
    std::size_t max_depth = MAX_NESTING_DEPTH;
};

/**
 * @brief Decode sibling chunks until exactly @p budget bytes are consumed.
 *
 * Containers are decoded recursively with their payload length as the
 * child budget. The loop never stops short of or beyond the budget: a
 * chunk that would cross it is an error.
 *
 * @param cursor Cursor positioned at the first header
 * @param budget Number of bytes making up this sibling sequence
 * @param[out] nodes Decoded siblings in stream order; empty on failure
 * @param depth Nesting level of this sequence
 * @param options Decoding limits
 * @param[out] diag Optional failure context (code, stream offset, message)
 * @return Error::Ok on success
 * @return Error::TruncatedStream if a chunk runs past the end of the buffer
 * @return Error::ChunkOverrun if a chunk runs past its parent's payload
 * @return Error::NestingTooDeep if depth exceeds options.max_depth
 * @return errors of read_header()
 */
Error read_nodes(ByteCursor& cursor, std::uint64_t budget, NodeList& nodes, std::size_t depth = 0,
                 const DecodeOptions& options = {}, Diagnostic* diag = nullptr);

} // namespace maxdump

#endif // MAXDUMP_TREE_BUILDER_HPP
