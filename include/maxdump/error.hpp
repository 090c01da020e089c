/**
 * @file error.hpp
 * @brief maxdump error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The decoding core only returns codes; the exception types back the
 * throwing StorageParser::parse() overload.
 */

#ifndef MAXDUMP_ERROR_HPP
#define MAXDUMP_ERROR_HPP

#include "config.hpp"

#include <string>
#include <utility>
#include <vector>

#if !MAXDUMP_NO_EXCEPTIONS
#include <stdexcept>
#endif

namespace maxdump {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                     ///< Success
    InvalidArg = -1,            ///< Invalid argument
    InvalidData = -2,           ///< Value bytes do not fit the requested decoding
    IoError = -3,               ///< File could not be read
    InvalidContainer = -4,      ///< Not a well-formed compound file
    StreamNotFound = -5,        ///< No stream with that path in the container
    InvalidStreamName = -6,     ///< Requested stream is absent (parser level)
    MalformedHeader = -7,       ///< Chunk header violates the format
    TruncatedStream = -8,       ///< Chunk runs past the end of the stream
    ChunkOverrun = -9,          ///< Chunk runs past its parent's payload
    UnexpectedEndOfStream = -10, ///< Fixed-width read past the buffer end
    NestingTooDeep = -11        ///< Container nesting exceeds the limit
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::InvalidData:
        return "Invalid value data";
    case Error::IoError:
        return "Cannot read file";
    case Error::InvalidContainer:
        return "Invalid compound file";
    case Error::StreamNotFound:
        return "Stream not found";
    case Error::InvalidStreamName:
        return "Invalid stream name";
    case Error::MalformedHeader:
        return "Malformed chunk header";
    case Error::TruncatedStream:
        return "Truncated stream";
    case Error::ChunkOverrun:
        return "Chunk overruns its parent";
    case Error::UnexpectedEndOfStream:
        return "Unexpected end of stream";
    case Error::NestingTooDeep:
        return "Chunk nesting too deep";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Context attached to a failed operation.
 *
 * Filled by the tree builder and the storage parser when a caller passes
 * one in. @c offset is the byte offset within the stream of the chunk
 * being decoded when the failure happened.
 */
struct Diagnostic {
    Error code = Error::Ok;
    std::size_t offset = 0;
    std::string stream_name;
    std::vector<std::string> valid_streams;
    std::string message;
};

#if !MAXDUMP_NO_EXCEPTIONS

/**
 * @brief Base exception for maxdump errors.
 */
class MaxDumpException : public std::runtime_error {
public:
    explicit MaxDumpException(const std::string& message, Error code = Error::InvalidArg,
                              std::size_t offset = 0)
        : std::runtime_error(message), error_code_(code), offset_(offset) {}

    Error code() const noexcept {
        return error_code_;
    }

    /// Byte offset within the stream, 0 for container-level errors.
    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    Error error_code_;
    std::size_t offset_;
};

/**
 * @brief Exception for files that cannot be read.
 */
class IoException : public MaxDumpException {
public:
    explicit IoException(const std::string& message)
        : MaxDumpException(message, Error::IoError) {}
};

/**
 * @brief Exception for files that are not compound files.
 */
class InvalidContainerException : public MaxDumpException {
public:
    explicit InvalidContainerException(const std::string& message)
        : MaxDumpException(message, Error::InvalidContainer) {}
};

/**
 * @brief Exception for a stream name missing from the container.
 */
class InvalidStreamNameException : public MaxDumpException {
public:
    InvalidStreamNameException(const std::string& message, std::vector<std::string> valid_streams)
        : MaxDumpException(message, Error::InvalidStreamName),
          valid_streams_(std::move(valid_streams)) {}

    const std::vector<std::string>& valid_streams() const noexcept {
        return valid_streams_;
    }

private:
    std::vector<std::string> valid_streams_;
};

/**
 * @brief Exception for corrupt chunk data.
 *
 * Covers MalformedHeader, TruncatedStream, ChunkOverrun,
 * UnexpectedEndOfStream and NestingTooDeep; code() tells them apart.
 */
class CorruptStreamException : public MaxDumpException {
public:
    CorruptStreamException(const std::string& message, Error code, std::size_t offset)
        : MaxDumpException(message, code, offset) {}
};

#endif // !MAXDUMP_NO_EXCEPTIONS

} // namespace maxdump

#endif // MAXDUMP_ERROR_HPP
