/**
 * @file value_decoder.cpp
 * @brief Typed decoding of value chunk payloads.
 */

#include <maxdump/text.hpp>
#include <maxdump/value_decoder.hpp>

#include <cstdio>
#include <cstring>
#include <utility>

namespace maxdump {

namespace {

std::uint32_t load_u32(const std::uint8_t* p) noexcept {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

float load_f32(const std::uint8_t* p) noexcept {
    std::uint32_t bits = load_u32(p);
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

template <typename T, typename Format>
std::string join_numbers(const std::vector<T>& numbers, Format format) {
    std::string out = "[";
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += format(numbers[i]);
    }
    out += "]";
    return out;
}

std::string format_float(float number) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(number));
    return buf;
}

} // namespace

Error decode_raw(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    out = bytes;
    return Error::Ok;
}

Error decode_utf16(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    std::size_t size = bytes.size();
    if (size >= 2 && bytes[size - 1] == 0 && bytes[size - 2] == 0) {
        size -= 2;
    }

    // Little-endian byte order mark
    std::size_t begin = 0;
    if (size >= 2 && bytes[0] == 0xFF && bytes[1] == 0xFE) {
        begin = 2;
    }

    std::string text;
    auto status = utf16le_to_utf8(bytes.data() + begin, size - begin, text);
    if (status != Error::Ok) {
        return status;
    }
    out = std::move(text);
    return Error::Ok;
}

Error decode_utf8(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    std::size_t size = bytes.size();
    if (size >= 1 && bytes[size - 1] == 0) {
        --size;
    }
    out = std::string(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(size));
    return Error::Ok;
}

Error decode_i32(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    if (bytes.size() != 4) {
        return Error::InvalidData;
    }
    out = static_cast<std::int32_t>(load_u32(bytes.data()));
    return Error::Ok;
}

Error decode_u32(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    if (bytes.size() != 4) {
        return Error::InvalidData;
    }
    out = load_u32(bytes.data());
    return Error::Ok;
}

Error decode_f32(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    if (bytes.size() != 4) {
        return Error::InvalidData;
    }
    out = load_f32(bytes.data());
    return Error::Ok;
}

Error decode_i32_array(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    if ((bytes.size() % 4U) != 0) {
        return Error::InvalidData;
    }
    std::vector<std::int32_t> values(bytes.size() / 4U);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<std::int32_t>(load_u32(&bytes[i * 4U]));
    }
    out = std::move(values);
    return Error::Ok;
}

Error decode_f32_array(const std::vector<std::uint8_t>& bytes, DecodedValue& out) {
    if ((bytes.size() % 4U) != 0) {
        return Error::InvalidData;
    }
    std::vector<float> values(bytes.size() / 4U);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = load_f32(&bytes[i * 4U]);
    }
    out = std::move(values);
    return Error::Ok;
}

std::string to_string(const DecodedValue& value) {
    struct Renderer {
        std::string operator()(const std::vector<std::uint8_t>& bytes) const {
            return to_hex(bytes);
        }
        std::string operator()(const std::string& text) const {
            return text;
        }
        std::string operator()(std::int32_t number) const {
            return std::to_string(number);
        }
        std::string operator()(std::uint32_t number) const {
            return std::to_string(number);
        }
        std::string operator()(float number) const {
            return format_float(number);
        }
        std::string operator()(const std::vector<std::int32_t>& numbers) const {
            return join_numbers(numbers, [](std::int32_t n) { return std::to_string(n); });
        }
        std::string operator()(const std::vector<float>& numbers) const {
            return join_numbers(numbers, format_float);
        }
    };
    return std::visit(Renderer{}, value);
}

void ValueDecoderRegistry::add(std::int16_t id, ValueDecoder decoder) {
    decoders_[id] = std::move(decoder);
}

const ValueDecoder* ValueDecoderRegistry::find(std::int16_t id) const {
    auto it = decoders_.find(id);
    if (it == decoders_.end()) {
        return nullptr;
    }
    return &it->second;
}

Error ValueDecoderRegistry::decode(const Node& node, DecodedValue& out) const {
    if (!node.is_value()) {
        return Error::InvalidArg;
    }

    const ValueDecoder* decoder = find(node.id());
    if (decoder == nullptr) {
        return decode_raw(node.bytes(), out);
    }
    return (*decoder)(node.bytes(), out);
}

} // namespace maxdump
