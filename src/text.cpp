/**
 * @file text.cpp
 * @brief Text conversion helpers.
 */

#include <maxdump/text.hpp>

#include <cstdio>

namespace maxdump {

namespace {

constexpr std::uint32_t REPLACEMENT_CHAR = 0xFFFDU;

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80U) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 12) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
}

} // namespace

std::string utf16_to_utf8(const std::vector<std::uint16_t>& units) {
    std::string out;
    out.reserve(units.size());

    for (std::size_t i = 0; i < units.size(); ++i) {
        std::uint32_t unit = units[i];

        if (unit >= 0xD800U && unit <= 0xDBFFU) {
            if (i + 1 < units.size() && units[i + 1] >= 0xDC00U && units[i + 1] <= 0xDFFFU) {
                std::uint32_t low = units[++i];
                append_utf8(out, 0x10000U + ((unit - 0xD800U) << 10) + (low - 0xDC00U));
            } else {
                append_utf8(out, REPLACEMENT_CHAR);
            }
        } else if (unit >= 0xDC00U && unit <= 0xDFFFU) {
            append_utf8(out, REPLACEMENT_CHAR);
        } else {
            append_utf8(out, unit);
        }
    }

    return out;
}

Error utf16le_to_utf8(const std::uint8_t* data, std::size_t size, std::string& out) {
    if ((size % 2U) != 0) {
        return Error::InvalidData;
    }

    std::vector<std::uint16_t> units(size / 2U);
    for (std::size_t i = 0; i < units.size(); ++i) {
        units[i] = static_cast<std::uint16_t>(data[2 * i] | (data[2 * i + 1] << 8));
    }

    out = utf16_to_utf8(units);
    return Error::Ok;
}

std::string to_printable_ascii(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (std::uint8_t byte : bytes) {
        out.push_back((byte >= 0x20U && byte < 0x7FU) ? static_cast<char>(byte) : '.');
    }
    return out;
}

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 3U);
    char pair[3];
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        std::snprintf(pair, sizeof(pair), "%02X", bytes[i]);
        out.append(pair, 2);
    }
    return out;
}

std::string shorten(const std::string& text, std::size_t width) {
    static const std::string marker = " [...]";

    if (text.size() <= width) {
        return text;
    }
    if (width <= marker.size()) {
        return marker.substr(1);
    }

    std::size_t limit = width - marker.size();
    // Cut on a word boundary
    std::size_t cut = text.rfind(' ', limit);
    if (cut == std::string::npos || cut == 0) {
        return marker.substr(1);
    }
    return text.substr(0, cut) + marker;
}

bool iequals(const std::string& lhs, const std::string& rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        char a = lhs[i];
        char b = rhs[i];
        if (a >= 'A' && a <= 'Z') {
            a = static_cast<char>(a - 'A' + 'a');
        }
        if (b >= 'A' && b <= 'Z') {
            b = static_cast<char>(b - 'A' + 'a');
        }
        if (a != b) {
            return false;
        }
    }
    return true;
}

} // namespace maxdump
