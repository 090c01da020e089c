/**
 * @file chunk.hpp
 * @brief Decoded chunk tree data model.
 *
 * A chunk is a header followed by a payload. The sign of the raw length
 * field decides what the payload is: child chunks (Container) or opaque
 * bytes (Value). Nodes are built once by the tree builder and never
 * modified afterwards.
 */

#ifndef MAXDUMP_CHUNK_HPP
#define MAXDUMP_CHUNK_HPP

#include "config.hpp"

#include <utility>
#include <variant>
#include <vector>

namespace maxdump {

/**
 * @brief Kind of a chunk payload.
 */
enum class ChunkKind : std::uint8_t {
    Container, ///< Payload is a sequence of child chunks
    Value      ///< Payload is raw bytes
};

/**
 * @brief Decoded chunk header.
 *
 * @c length is the payload length only; the header's own bytes have
 * already been subtracted.
 */
struct ChunkHeader {
    std::int16_t id = 0;
    std::uint64_t length = 0;
    ChunkKind kind = ChunkKind::Value;
    bool extended = false;

    /// Number of bytes the encoded header occupies.
    [[nodiscard]] std::size_t encoded_size() const noexcept {
        return extended ? EXTENDED_HEADER_SIZE : HEADER_SIZE;
    }
};

bool operator==(const ChunkHeader& lhs, const ChunkHeader& rhs) noexcept;

class Node;
using NodeList = std::vector<Node>;

/**
 * @brief Chunk whose payload is a sequence of child chunks.
 */
struct Container {
    ChunkHeader header;
    NodeList children;
};

/**
 * @brief Chunk whose payload is raw bytes.
 */
struct Value {
    ChunkHeader header;
    std::vector<std::uint8_t> bytes;
};

/**
 * @brief One node of a decoded chunk tree.
 *
 * Closed sum over Container and Value. Only const access is offered once
 * a node has been constructed.
 */
class Node {
public:
    explicit Node(Container container) : data_(std::move(container)) {}
    explicit Node(Value value) : data_(std::move(value)) {}

    static Node container(const ChunkHeader& header, NodeList children) {
        return Node(Container{header, std::move(children)});
    }

    static Node value(const ChunkHeader& header, std::vector<std::uint8_t> bytes) {
        return Node(Value{header, std::move(bytes)});
    }

    [[nodiscard]] const ChunkHeader& header() const noexcept {
        return std::visit([](const auto& node) -> const ChunkHeader& { return node.header; },
                          data_);
    }

    [[nodiscard]] std::int16_t id() const noexcept {
        return header().id;
    }

    [[nodiscard]] ChunkKind kind() const noexcept {
        return is_container() ? ChunkKind::Container : ChunkKind::Value;
    }

    [[nodiscard]] bool is_container() const noexcept {
        return std::holds_alternative<Container>(data_);
    }

    [[nodiscard]] bool is_value() const noexcept {
        return std::holds_alternative<Value>(data_);
    }

    /**
     * @brief Children of a container.
     * @return Empty list for a value node
     */
    [[nodiscard]] const NodeList& children() const noexcept;

    /**
     * @brief Payload of a value.
     * @return Empty byte vector for a container node
     */
    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept;

    /// Encoded size of the chunk: header plus payload.
    [[nodiscard]] std::uint64_t encoded_size() const noexcept {
        return header().encoded_size() + header().length;
    }

    [[nodiscard]] const std::variant<Container, Value>& data() const noexcept {
        return data_;
    }

private:
    std::variant<Container, Value> data_;
};

bool operator==(const Container& lhs, const Container& rhs);
bool operator==(const Value& lhs, const Value& rhs);
bool operator==(const Node& lhs, const Node& rhs);

/**
 * @brief Name of a chunk kind ("Container" or "Value").
 */
const char* kind_name(ChunkKind kind) noexcept;

} // namespace maxdump

#endif // MAXDUMP_CHUNK_HPP
