/**
 * @file byte_cursor.hpp
 * @brief Sequential reading of fixed-width integers from a byte buffer.
 *
 * The cursor provides forward-only access to a loaded stream. All
 * multi-byte fields of the chunk format are little-endian; values are
 * assembled byte by byte so the result does not depend on the host.
 */

#ifndef MAXDUMP_BYTE_CURSOR_HPP
#define MAXDUMP_BYTE_CURSOR_HPP

#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace maxdump {

/**
 * @brief Forward-only reader over a fixed byte buffer.
 *
 * Does not own the buffer. A read that would run past the end fails with
 * Error::UnexpectedEndOfStream and leaves the position unchanged.
 */
class ByteCursor {
public:
    /**
     * @brief Construct a cursor.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteCursor(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a signed 16-bit integer.
     * @param[out] value Decoded value
     * @return Error::Ok, or Error::UnexpectedEndOfStream
     */
    Error read_i16(std::int16_t& value) noexcept {
        std::uint64_t raw = 0;
        auto status = read_le(2, raw);
        if (status == Error::Ok) {
            value = static_cast<std::int16_t>(static_cast<std::uint16_t>(raw));
        }
        return status;
    }

    /**
     * @brief Read a signed 32-bit integer.
     * @param[out] value Decoded value
     * @return Error::Ok, or Error::UnexpectedEndOfStream
     */
    Error read_i32(std::int32_t& value) noexcept {
        std::uint64_t raw = 0;
        auto status = read_le(4, raw);
        if (status == Error::Ok) {
            value = static_cast<std::int32_t>(static_cast<std::uint32_t>(raw));
        }
        return status;
    }

    /**
     * @brief Read a signed 64-bit integer.
     * @param[out] value Decoded value
     * @return Error::Ok, or Error::UnexpectedEndOfStream
     */
    Error read_i64(std::int64_t& value) noexcept {
        std::uint64_t raw = 0;
        auto status = read_le(8, raw);
        if (status == Error::Ok) {
            value = static_cast<std::int64_t>(raw);
        }
        return status;
    }

    /**
     * @brief Copy the next @p count bytes.
     *
     * @param count Number of bytes to read
     * @param[out] out Replaced with the bytes read
     * @return Error::Ok, or Error::UnexpectedEndOfStream
     */
    Error read_bytes(std::size_t count, std::vector<std::uint8_t>& out) {
        if (count > remaining()) [[unlikely]] {
            return Error::UnexpectedEndOfStream;
        }
        out.assign(data_ + pos_, data_ + pos_ + count);
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Advance without reading.
     */
    Error skip(std::size_t count) noexcept {
        if (count > remaining()) [[unlikely]] {
            return Error::UnexpectedEndOfStream;
        }
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Get current absolute position.
     *
     * @return Number of bytes already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

private:
    Error read_le(std::size_t width, std::uint64_t& value) noexcept {
        if (width > remaining()) [[unlikely]] {
            return Error::UnexpectedEndOfStream;
        }

        std::uint64_t result = 0;
        for (std::size_t i = 0; i < width; ++i) {
            result |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8U * i);
        }
        pos_ += width;
        value = result;
        return Error::Ok;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace maxdump

#endif // MAXDUMP_BYTE_CURSOR_HPP
