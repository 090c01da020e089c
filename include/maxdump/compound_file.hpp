/**
 * @file compound_file.hpp
 * @brief Read-only access to OLE Compound File Binary containers.
 *
 * The whole file is loaded into memory and handed to compoundfilereader.
 * This class adds the checks the reader leaves to its caller (header
 * fields, directory tree shape) and maps its failures onto Error codes.
 *
 * @see [MS-CFB] Compound File Binary File Format
 */

#ifndef MAXDUMP_COMPOUND_FILE_HPP
#define MAXDUMP_COMPOUND_FILE_HPP

#include "config.hpp"
#include "error.hpp"

#include <memory>
#include <string>
#include <vector>

namespace maxdump {

namespace cfb {

/// File signature at offset 0
inline constexpr std::uint8_t SIGNATURE[8] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

inline constexpr std::size_t HEADER_SIZE = 512U;
inline constexpr std::uint16_t BYTE_ORDER_MARK = 0xFFFEU;

/// Directory sibling/child "none" marker
inline constexpr std::uint32_t NO_STREAM = 0xFFFFFFFFU;

} // namespace cfb

/**
 * @brief In-memory compound file.
 */
class CompoundFile {
public:
    CompoundFile();
    ~CompoundFile();

    CompoundFile(CompoundFile&& other) noexcept;
    CompoundFile& operator=(CompoundFile&& other) noexcept;

    /**
     * @brief Read and load a compound file from disk.
     *
     * @param path File path
     * @return Error::Ok on success
     * @return Error::IoError if the file cannot be read
     * @return Error::InvalidContainer if it is not a well-formed compound file
     */
    Error open(const std::string& path);

    /**
     * @brief Load a compound file image.
     *
     * @param data Complete file contents, taken over by the object
     * @return Error::Ok, or Error::InvalidContainer
     */
    Error load(std::vector<std::uint8_t> data);

    /**
     * @brief Paths of all streams, '/'-separated below the root storage.
     */
    [[nodiscard]] std::vector<std::string> stream_names() const;

    /**
     * @brief Check whether @p path names a stream.
     */
    [[nodiscard]] bool exists(const std::string& path) const;

    /**
     * @brief Copy the full contents of a stream.
     *
     * Names are matched case-insensitively, component by component.
     *
     * @param path Stream path, for example "Scene" or "Storage/Stream"
     * @param[out] out Stream contents
     * @return Error::Ok on success
     * @return Error::StreamNotFound if no stream has that path
     * @return Error::InvalidContainer if the stream's sector chain is broken
     */
    Error read_stream(const std::string& path, std::vector<std::uint8_t>& out) const;

    [[nodiscard]] std::uint16_t major_version() const noexcept {
        return major_version_;
    }

    [[nodiscard]] std::size_t sector_size() const noexcept {
        return sector_size_;
    }

private:
    struct Impl;

    Error check_header();

    std::vector<std::uint8_t> data_;
    std::uint16_t major_version_ = 0;
    std::size_t sector_size_ = 0;
    std::unique_ptr<Impl> impl_;
};

} // namespace maxdump

#endif // MAXDUMP_COMPOUND_FILE_HPP
