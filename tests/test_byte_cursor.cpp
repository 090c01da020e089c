/**
 * @file test_byte_cursor.cpp
 * @brief Unit tests for bounded little-endian reads.
 */

#include <catch2/catch.hpp>
#include <maxdump/byte_cursor.hpp>

#include <vector>

using namespace maxdump;

TEST_CASE("ByteCursor reads little-endian integers", "[cursor]") {
    const std::vector<std::uint8_t> data = {0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xFF, 0xFF,
                                            0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    ByteCursor cursor(data.data(), data.size());

    std::int16_t i16 = 0;
    REQUIRE(cursor.read_i16(i16) == Error::Ok);
    REQUIRE(i16 == 0x1234);

    std::int32_t i32 = 0;
    REQUIRE(cursor.read_i32(i32) == Error::Ok);
    REQUIRE(i32 == 0x12345678);

    std::int64_t i64 = 0;
    REQUIRE(cursor.read_i64(i64) == Error::Ok);
    REQUIRE(i64 == -1);

    REQUIRE(cursor.position() == 14);
    REQUIRE(cursor.remaining() == 0);
}

TEST_CASE("ByteCursor sign extends negative fields", "[cursor]") {
    const std::vector<std::uint8_t> data = {0xFE, 0xFF, 0xF2, 0xFF, 0xFF, 0xFF};
    ByteCursor cursor(data.data(), data.size());

    std::int16_t i16 = 0;
    std::int32_t i32 = 0;
    REQUIRE(cursor.read_i16(i16) == Error::Ok);
    REQUIRE(cursor.read_i32(i32) == Error::Ok);
    REQUIRE(i16 == -2);
    REQUIRE(i32 == -14);
}

TEST_CASE("ByteCursor short reads fail without moving", "[cursor]") {
    const std::vector<std::uint8_t> data = {0x01, 0x02, 0x03};
    ByteCursor cursor(data.data(), data.size());

    SECTION("integer") {
        std::int32_t value = 7;
        REQUIRE(cursor.read_i32(value) == Error::UnexpectedEndOfStream);
        REQUIRE(value == 7);
        REQUIRE(cursor.position() == 0);
    }

    SECTION("bytes") {
        std::vector<std::uint8_t> out;
        REQUIRE(cursor.read_bytes(4, out) == Error::UnexpectedEndOfStream);
        REQUIRE(cursor.position() == 0);
        REQUIRE(cursor.read_bytes(3, out) == Error::Ok);
        REQUIRE(out == data);
    }

    SECTION("skip") {
        REQUIRE(cursor.skip(4) == Error::UnexpectedEndOfStream);
        REQUIRE(cursor.skip(2) == Error::Ok);
        REQUIRE(cursor.remaining() == 1);
    }
}

TEST_CASE("ByteCursor over an empty buffer", "[cursor]") {
    ByteCursor cursor(nullptr, 0);
    std::int16_t value = 0;

    REQUIRE(cursor.size() == 0);
    REQUIRE(cursor.read_i16(value) == Error::UnexpectedEndOfStream);

    std::vector<std::uint8_t> out;
    REQUIRE(cursor.read_bytes(0, out) == Error::Ok);
    REQUIRE(out.empty());
}
