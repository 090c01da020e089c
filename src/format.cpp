/**
 * @file format.cpp
 * @brief Human-readable rendering of decoded chunk trees.
 */

#include <maxdump/format.hpp>
#include <maxdump/text.hpp>

#include <cstdio>

namespace maxdump {

namespace {

std::string hex_id(std::int16_t id) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04X", static_cast<unsigned>(static_cast<std::uint16_t>(id)));
    return buf;
}

void append_value_props(std::string& out, const Node& node, const std::string& pad,
                        const FormatOptions& options) {
    const auto& bytes = node.bytes();

    out += pad + shorten("hex: " + to_hex(bytes), options.hex_width) + "\n";
    out += pad + "ascii: " + to_printable_ascii(bytes) + "\n";

    if (bytes.size() == 4) {
        DecodedValue number;
        if (decode_i32(bytes, number) == Error::Ok) {
            out += pad + "int: " + to_string(number) + "\n";
        }
    }

    if (options.decoders != nullptr && options.decoders->contains(node.id())) {
        DecodedValue decoded;
        auto status = options.decoders->decode(node, decoded);
        if (status == Error::Ok) {
            out += pad + "decoded: " + to_string(decoded) + "\n";
        } else {
            out += pad + "decoded: <" + error_string(status) + ">\n";
        }
    }
}

void append_node(std::string& out, const Node& node, std::size_t depth,
                 const FormatOptions& options) {
    const ChunkHeader& header = node.header();
    const std::string indent(depth * 2U, ' ');
    const char* ext = header.extended ? " ext" : "";

    out += indent + "[" + hex_id(header.id) + " " + kind_name(node.kind()) + " " +
           std::to_string(header.length);
    if (node.is_container()) {
        out += " " + std::to_string(node.children().size());
    }
    out += std::string(ext) + "]\n";

    if (node.is_container()) {
        for (const auto& child : node.children()) {
            append_node(out, child, depth + 1, options);
        }
    } else {
        append_value_props(out, node, indent + "    ", options);
    }
}

} // namespace

std::string format_header(const ChunkHeader& header) {
    return "[" + hex_id(header.id) + " " + kind_name(header.kind) + " " +
           std::to_string(header.length) + (header.extended ? " ext" : "") + "]";
}

std::string format_node(const Node& node, std::size_t depth, const FormatOptions& options) {
    std::string out;
    append_node(out, node, depth, options);
    return out;
}

std::string format_nodes(const NodeList& nodes, const FormatOptions& options) {
    std::string out;
    for (const auto& node : nodes) {
        append_node(out, node, 0, options);
    }
    return out;
}

} // namespace maxdump
