/**
 * @file chunk.cpp
 * @brief Chunk tree node accessors and structural equality.
 */

#include <maxdump/chunk.hpp>

namespace maxdump {

namespace {

const NodeList kNoChildren;
const std::vector<std::uint8_t> kNoBytes;

} // namespace

bool operator==(const ChunkHeader& lhs, const ChunkHeader& rhs) noexcept {
    return lhs.id == rhs.id && lhs.length == rhs.length && lhs.kind == rhs.kind &&
           lhs.extended == rhs.extended;
}

const NodeList& Node::children() const noexcept {
    if (const auto* container = std::get_if<Container>(&data_)) {
        return container->children;
    }
    return kNoChildren;
}

const std::vector<std::uint8_t>& Node::bytes() const noexcept {
    if (const auto* value = std::get_if<Value>(&data_)) {
        return value->bytes;
    }
    return kNoBytes;
}

bool operator==(const Container& lhs, const Container& rhs) {
    return lhs.header == rhs.header && lhs.children == rhs.children;
}

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.header == rhs.header && lhs.bytes == rhs.bytes;
}

bool operator==(const Node& lhs, const Node& rhs) {
    return lhs.data() == rhs.data();
}

const char* kind_name(ChunkKind kind) noexcept {
    switch (kind) {
    case ChunkKind::Container:
        return "Container";
    case ChunkKind::Value:
        return "Value";
    default:
        return "Unknown";
    }
}

} // namespace maxdump
