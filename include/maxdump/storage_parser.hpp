/**
 * @file storage_parser.hpp
 * @brief Decoding of chunk streams stored in a compound file.
 */

#ifndef MAXDUMP_STORAGE_PARSER_HPP
#define MAXDUMP_STORAGE_PARSER_HPP

#include "chunk.hpp"
#include "config.hpp"
#include "error.hpp"
#include "tree_builder.hpp"

#include <string>
#include <utility>
#include <vector>

namespace maxdump {

/**
 * @brief Decoder of the chunk-based streams of one file.
 *
 * Each parse() call opens the file, loads the named stream entirely and
 * decodes it; no state is shared between calls.
 */
class StorageParser {
public:
    explicit StorageParser(std::string path, DecodeOptions options = {})
        : path_(std::move(path)), options_(options) {}

    /**
     * @brief Decode a stream into its top-level chunk forest.
     *
     * @param stream_name Stream path inside the compound file
     * @param[out] nodes Top-level nodes in stream order; empty on failure
     * @param[out] diag Optional failure context
     * @return Error::Ok on success
     * @return Error::IoError if the file cannot be read
     * @return Error::InvalidContainer if the file is not a compound file
     * @return Error::InvalidStreamName if the stream does not exist; the
     *         diagnostic lists the valid stream names
     * @return errors of read_nodes(), unchanged
     */
    Error parse(const std::string& stream_name, NodeList& nodes, Diagnostic* diag = nullptr) const;

#if !MAXDUMP_NO_EXCEPTIONS
    /**
     * @brief Throwing form of parse().
     *
     * @throws IoException, InvalidContainerException,
     *         InvalidStreamNameException, CorruptStreamException
     */
    NodeList parse(const std::string& stream_name) const;
#endif

    /**
     * @brief List the streams of the file.
     */
    Error list_streams(std::vector<std::string>& names, Diagnostic* diag = nullptr) const;

    /**
     * @brief Decode an already loaded stream.
     *
     * @param data Stream contents
     * @param size Stream length; the whole length is the top-level budget
     */
    static Error parse_bytes(const std::uint8_t* data, std::size_t size, NodeList& nodes,
                             const DecodeOptions& options = {}, Diagnostic* diag = nullptr);

    [[nodiscard]] const std::string& path() const noexcept {
        return path_;
    }

    [[nodiscard]] const DecodeOptions& options() const noexcept {
        return options_;
    }

private:
    std::string path_;
    DecodeOptions options_;
};

} // namespace maxdump

#endif // MAXDUMP_STORAGE_PARSER_HPP
