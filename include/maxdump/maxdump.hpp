/**
 * @file maxdump.hpp
 * @brief maxdump umbrella header.
 *
 * Decodes the nested chunk streams stored in OLE compound files:
 *
 * @code
 * maxdump::StorageParser parser("scene.max");
 * maxdump::NodeList nodes;
 * maxdump::Diagnostic diag;
 * if (parser.parse("Scene", nodes, &diag) != maxdump::Error::Ok) {
 *     std::fprintf(stderr, "%s\n", diag.message.c_str());
 * }
 * @endcode
 */

#ifndef MAXDUMP_HPP
#define MAXDUMP_HPP

#include "byte_cursor.hpp"
#include "chunk.hpp"
#include "compound_file.hpp"
#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "header_decoder.hpp"
#include "node_index.hpp"
#include "storage_parser.hpp"
#include "text.hpp"
#include "tree_builder.hpp"
#include "value_decoder.hpp"

namespace maxdump {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace maxdump

#endif // MAXDUMP_HPP
