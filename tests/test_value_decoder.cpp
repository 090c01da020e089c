/**
 * @file test_value_decoder.cpp
 * @brief Unit tests for typed value decoding and the decoder registry.
 */

#include <catch2/catch.hpp>
#include <maxdump/value_decoder.hpp>

#include "chunk_writer.hpp"

#include <variant>

using namespace maxdump;
using namespace testutil;

namespace {

Node value_node(std::int16_t id, Bytes bytes) {
    ChunkHeader header;
    header.id = id;
    header.length = bytes.size();
    header.kind = ChunkKind::Value;
    return Node::value(header, std::move(bytes));
}

} // namespace

// ============================================================================
// Decoders
// ============================================================================

TEST_CASE("decode_utf16 drops one trailing NUL", "[decode][text]") {
    DecodedValue out;

    SECTION("terminated") {
        REQUIRE(decode_utf16(utf16_of("Box01", true), out) == Error::Ok);
        REQUIRE(std::get<std::string>(out) == "Box01");
    }

    SECTION("unterminated") {
        REQUIRE(decode_utf16(utf16_of("Box01"), out) == Error::Ok);
        REQUIRE(std::get<std::string>(out) == "Box01");
    }

    SECTION("non-ASCII") {
        REQUIRE(decode_utf16(Bytes{0xE9, 0x00, 0x3D, 0xD8, 0x00, 0xDE}, out) == Error::Ok);
        REQUIRE(std::get<std::string>(out) == "\xC3\xA9\xF0\x9F\x98\x80");
    }

    SECTION("odd length") {
        REQUIRE(decode_utf16(Bytes{0x41, 0x00, 0x42}, out) == Error::InvalidData);
    }

    SECTION("byte order mark") {
        REQUIRE(decode_utf16(Bytes{0xFF, 0xFE, 'B', 0x00, 'o', 0x00, 'x', 0x00}, out) ==
                Error::Ok);
        REQUIRE(std::get<std::string>(out) == "Box");

        REQUIRE(decode_utf16(Bytes{0xFF, 0xFE, 0x00, 0x00}, out) == Error::Ok);
        REQUIRE(std::get<std::string>(out).empty());
    }
}

TEST_CASE("decode_utf8 drops one trailing NUL", "[decode][text]") {
    DecodedValue out;
    REQUIRE(decode_utf8(bytes_of(std::string("name\0", 5)), out) == Error::Ok);
    REQUIRE(std::get<std::string>(out) == "name");
    REQUIRE(decode_utf8(Bytes{}, out) == Error::Ok);
    REQUIRE(std::get<std::string>(out).empty());
}

TEST_CASE("Fixed width numbers", "[decode][number]") {
    DecodedValue out;

    REQUIRE(decode_i32(Bytes{0xFE, 0xFF, 0xFF, 0xFF}, out) == Error::Ok);
    REQUIRE(std::get<std::int32_t>(out) == -2);

    REQUIRE(decode_u32(Bytes{0xFE, 0xFF, 0xFF, 0xFF}, out) == Error::Ok);
    REQUIRE(std::get<std::uint32_t>(out) == 0xFFFFFFFEU);

    REQUIRE(decode_f32(Bytes{0x00, 0x00, 0xC0, 0x3F}, out) == Error::Ok);
    REQUIRE(std::get<float>(out) == 1.5F);

    REQUIRE(decode_i32(Bytes{1, 2, 3}, out) == Error::InvalidData);
    REQUIRE(decode_u32(Bytes{1, 2, 3, 4, 5}, out) == Error::InvalidData);
    REQUIRE(decode_f32(Bytes{}, out) == Error::InvalidData);
}

TEST_CASE("Number arrays", "[decode][number]") {
    DecodedValue out;

    REQUIRE(decode_i32_array(Bytes{1, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF}, out) == Error::Ok);
    REQUIRE(std::get<std::vector<std::int32_t>>(out) == std::vector<std::int32_t>{1, -1});

    REQUIRE(decode_f32_array(Bytes{0x00, 0x00, 0x80, 0x3F, 0x00, 0x00, 0x00, 0xC0}, out) ==
            Error::Ok);
    REQUIRE(std::get<std::vector<float>>(out) == std::vector<float>{1.0F, -2.0F});

    REQUIRE(decode_i32_array(Bytes{}, out) == Error::Ok);
    REQUIRE(std::get<std::vector<std::int32_t>>(out).empty());

    REQUIRE(decode_i32_array(Bytes{1, 2, 3, 4, 5, 6}, out) == Error::InvalidData);
    REQUIRE(decode_f32_array(Bytes{1}, out) == Error::InvalidData);
}

TEST_CASE("Rendering decoded values", "[decode][render]") {
    REQUIRE(to_string(DecodedValue{Bytes{0x41, 0x0A}}) == "41 0A");
    REQUIRE(to_string(DecodedValue{std::string("Box")}) == "Box");
    REQUIRE(to_string(DecodedValue{std::int32_t{-7}}) == "-7");
    REQUIRE(to_string(DecodedValue{std::uint32_t{7}}) == "7");
    REQUIRE(to_string(DecodedValue{0.5F}) == "0.5");
    REQUIRE(to_string(DecodedValue{std::vector<std::int32_t>{1, 2, 3}}) == "[1, 2, 3]");
    REQUIRE(to_string(DecodedValue{std::vector<float>{1.5F, -2.0F}}) == "[1.5, -2]");
    REQUIRE(to_string(DecodedValue{std::vector<float>{}}) == "[]");
}

// ============================================================================
// Registry
// ============================================================================

TEST_CASE("Registry selects the decoder by identifier", "[decode][registry]") {
    ValueDecoderRegistry registry;
    registry.add(0x0456, decode_utf16);
    registry.add(0x0100, decode_i32);

    REQUIRE(registry.size() == 2);
    REQUIRE(registry.contains(0x0456));
    REQUIRE_FALSE(registry.contains(0x0001));

    DecodedValue out;
    REQUIRE(registry.decode(value_node(0x0456, utf16_of("Teapot", true)), out) == Error::Ok);
    REQUIRE(std::get<std::string>(out) == "Teapot");

    REQUIRE(registry.decode(value_node(0x0100, Bytes{5, 0, 0, 0}), out) == Error::Ok);
    REQUIRE(std::get<std::int32_t>(out) == 5);

    SECTION("unregistered identifiers fall back to raw bytes") {
        REQUIRE(registry.decode(value_node(0x0001, Bytes{9, 8}), out) == Error::Ok);
        REQUIRE(std::get<Bytes>(out) == Bytes{9, 8});
    }

    SECTION("decoder errors propagate") {
        REQUIRE(registry.decode(value_node(0x0100, Bytes{1}), out) == Error::InvalidData);
    }

    SECTION("later registration replaces the decoder") {
        registry.add(0x0100, decode_u32);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.decode(value_node(0x0100, Bytes{0xFF, 0xFF, 0xFF, 0xFF}), out) ==
                Error::Ok);
        REQUIRE(std::get<std::uint32_t>(out) == 0xFFFFFFFFU);
    }

    SECTION("containers are not decoded") {
        ChunkHeader header;
        header.id = 0x0456;
        header.kind = ChunkKind::Container;
        REQUIRE(registry.decode(Node::container(header, {}), out) == Error::InvalidArg);
    }
}

TEST_CASE("Registry accepts custom strategies", "[decode][registry]") {
    ValueDecoderRegistry registry;
    registry.add(0x0010, [](const Bytes& bytes, DecodedValue& out) {
        out = static_cast<std::uint32_t>(bytes.size());
        return Error::Ok;
    });

    DecodedValue out;
    REQUIRE(registry.decode(value_node(0x0010, Bytes(12)), out) == Error::Ok);
    REQUIRE(std::get<std::uint32_t>(out) == 12);
}
