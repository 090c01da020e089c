/**
 * @file tree_builder.cpp
 * @brief Recursive decoding of a chunk byte run into a node tree.
 */

#include <maxdump/header_decoder.hpp>
#include <maxdump/tree_builder.hpp>

#include <string>
#include <utility>

namespace maxdump {

namespace {

Error fail(Diagnostic* diag, Error code, std::size_t offset, std::string message) {
    if (diag != nullptr) {
        diag->code = code;
        diag->offset = offset;
        diag->message = std::move(message);
    }
    return code;
}

std::string at(std::size_t offset) {
    return "chunk at offset " + std::to_string(offset);
}

} // namespace

Error read_nodes(ByteCursor& cursor, std::uint64_t budget, NodeList& nodes, std::size_t depth,
                 const DecodeOptions& options, Diagnostic* diag) {
    nodes.clear();

    const std::size_t start = cursor.position();
    if (depth > options.max_depth) {
        return fail(diag, Error::NestingTooDeep, start,
                    at(start) + " is nested deeper than " + std::to_string(options.max_depth) +
                        " levels");
    }

    NodeList items;
    std::uint64_t consumed = 0;

    while (consumed < budget) {
        const std::size_t chunk_start = cursor.position();
        const std::uint64_t left = budget - consumed;

        if (left < HEADER_SIZE) {
            if (cursor.remaining() < HEADER_SIZE) {
                return fail(diag, Error::TruncatedStream, chunk_start,
                            at(chunk_start) + ": stream ends inside the header");
            }
            return fail(diag, Error::ChunkOverrun, chunk_start,
                        at(chunk_start) + ": " + std::to_string(left) +
                            " bytes left in parent, too few for a header");
        }

        ChunkHeader header;
        auto status = read_header(cursor, header);
        if (status == Error::UnexpectedEndOfStream) {
            // Escaped length whose int64 field runs past the end
            return fail(diag, Error::TruncatedStream, chunk_start,
                        at(chunk_start) + ": stream ends inside the extended header");
        }
        if (status != Error::Ok) {
            return fail(diag, status, chunk_start,
                        at(chunk_start) + ": " + error_string(status));
        }

        if (header.length > cursor.remaining()) {
            return fail(diag, Error::TruncatedStream, chunk_start,
                        at(chunk_start) + " declares " + std::to_string(header.length) +
                            " payload bytes, only " + std::to_string(cursor.remaining()) +
                            " remain in the stream");
        }

        const std::uint64_t header_size = header.encoded_size();
        if (header_size > left || header.length > left - header_size) {
            return fail(diag, Error::ChunkOverrun, chunk_start,
                        at(chunk_start) + " declares " +
                            std::to_string(header_size + header.length) + " bytes, only " +
                            std::to_string(left) + " left in parent");
        }

        if (header.kind == ChunkKind::Container) {
            NodeList children;
            status = read_nodes(cursor, header.length, children, depth + 1, options, diag);
            if (status != Error::Ok) {
                return status;
            }
            items.push_back(Node::container(header, std::move(children)));
        } else {
            std::vector<std::uint8_t> bytes;
            status = cursor.read_bytes(static_cast<std::size_t>(header.length), bytes);
            if (status != Error::Ok) {
                return fail(diag, status, chunk_start,
                            at(chunk_start) + ": " + error_string(status));
            }
            items.push_back(Node::value(header, std::move(bytes)));
        }

        consumed = cursor.position() - start;
    }

    nodes = std::move(items);
    return Error::Ok;
}

} // namespace maxdump
