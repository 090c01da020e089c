/**
 * @file header_decoder.cpp
 * @brief Chunk header decoding.
 */

#include <maxdump/header_decoder.hpp>

namespace maxdump {

Error read_header(ByteCursor& cursor, ChunkHeader& header) noexcept {
    std::int16_t id = 0;
    auto status = cursor.read_i16(id);
    if (status != Error::Ok) {
        return status;
    }

    std::int32_t short_length = 0;
    status = cursor.read_i32(short_length);
    if (status != Error::Ok) {
        return status;
    }

    std::int64_t raw_length = short_length;
    std::size_t width = LENGTH_FIELD_SIZE;
    std::size_t header_size = HEADER_SIZE;
    bool extended = false;

    if (short_length == 0) {
        // Escape to a 64-bit length field
        status = cursor.read_i64(raw_length);
        if (status != Error::Ok) {
            return status;
        }
        if (raw_length == 0) {
            return Error::MalformedHeader;
        }
        extended = true;
        width = EXTENDED_LENGTH_FIELD_SIZE;
        header_size = EXTENDED_HEADER_SIZE;
    }

    ChunkKind kind = ChunkKind::Value;
    std::uint64_t magnitude = 0;
    if (raw_length < 0) {
        kind = ChunkKind::Container;
        magnitude = clear_sign_bit(raw_length, width);
    } else {
        magnitude = static_cast<std::uint64_t>(raw_length);
    }

    if (magnitude < header_size) {
        return Error::MalformedHeader;
    }

    header.id = id;
    header.length = magnitude - header_size;
    header.kind = kind;
    header.extended = extended;
    return Error::Ok;
}

} // namespace maxdump
