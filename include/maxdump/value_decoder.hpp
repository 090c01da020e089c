/**
 * @file value_decoder.hpp
 * @brief Typed decoding of value chunk payloads.
 *
 * Decoders are plain functions from a value's bytes to a DecodedValue.
 * A registry maps chunk identifiers to decoders; identifiers without an
 * entry decode as raw bytes.
 */

#ifndef MAXDUMP_VALUE_DECODER_HPP
#define MAXDUMP_VALUE_DECODER_HPP

#include "chunk.hpp"
#include "config.hpp"
#include "error.hpp"

#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace maxdump {

/**
 * @brief Result of decoding a value payload.
 */
using DecodedValue = std::variant<std::vector<std::uint8_t>, std::string, std::int32_t,
                                  std::uint32_t, float, std::vector<std::int32_t>,
                                  std::vector<float>>;

/**
 * @brief Decode step signature.
 *
 * @param bytes Payload of a value chunk
 * @param[out] out Decoded result, untouched on failure
 * @return Error::Ok, or Error::InvalidData if the bytes do not fit
 */
using ValueDecoder = std::function<Error(const std::vector<std::uint8_t>& bytes, DecodedValue& out)>;

/// Bytes unchanged.
Error decode_raw(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// UTF-16LE text converted to UTF-8; one trailing NUL and a leading BOM are dropped.
Error decode_utf16(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// 8-bit text; one trailing NUL is dropped.
Error decode_utf8(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// Exactly 4 bytes, little-endian signed.
Error decode_i32(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// Exactly 4 bytes, little-endian unsigned.
Error decode_u32(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// Exactly 4 bytes, little-endian IEEE 754 single.
Error decode_f32(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// Multiple of 4 bytes, little-endian signed.
Error decode_i32_array(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/// Multiple of 4 bytes, little-endian IEEE 754 singles.
Error decode_f32_array(const std::vector<std::uint8_t>& bytes, DecodedValue& out);

/**
 * @brief Render a decoded value as one line of text.
 */
std::string to_string(const DecodedValue& value);

/**
 * @brief Chunk identifier to decoder mapping.
 */
class ValueDecoderRegistry {
public:
    /**
     * @brief Register or replace the decoder for @p id.
     */
    void add(std::int16_t id, ValueDecoder decoder);

    /**
     * @brief Decoder registered for @p id.
     * @return nullptr if none
     */
    [[nodiscard]] const ValueDecoder* find(std::int16_t id) const;

    [[nodiscard]] bool contains(std::int16_t id) const {
        return find(id) != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return decoders_.size();
    }

    /**
     * @brief Decode a value node with the decoder for its identifier.
     *
     * Falls back to decode_raw() for unregistered identifiers.
     *
     * @return Error::InvalidArg for a container node, else the decoder's result
     */
    Error decode(const Node& node, DecodedValue& out) const;

private:
    std::map<std::int16_t, ValueDecoder> decoders_;
};

} // namespace maxdump

#endif // MAXDUMP_VALUE_DECODER_HPP
