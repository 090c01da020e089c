/**
 * @file storage_parser.cpp
 * @brief Decoding of chunk streams stored in a compound file.
 */

#include <maxdump/byte_cursor.hpp>
#include <maxdump/compound_file.hpp>
#include <maxdump/storage_parser.hpp>

#include <utility>

namespace maxdump {

namespace {

Error fail(Diagnostic* diag, Error code, std::string message) {
    if (diag != nullptr) {
        diag->code = code;
        diag->offset = 0;
        diag->message = std::move(message);
    }
    return code;
}

Error open_container(const std::string& path, CompoundFile& file, Diagnostic* diag) {
    auto status = file.open(path);
    if (status == Error::IoError) {
        return fail(diag, status, "Cannot read file: " + path);
    }
    if (status != Error::Ok) {
        return fail(diag, status, "Not a valid compound file: " + path);
    }
    return Error::Ok;
}

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out;
}

} // namespace

Error StorageParser::parse(const std::string& stream_name, NodeList& nodes,
                           Diagnostic* diag) const {
    nodes.clear();
    if (diag != nullptr) {
        *diag = Diagnostic();
        diag->stream_name = stream_name;
    }

    CompoundFile file;
    auto status = open_container(path_, file, diag);
    if (status != Error::Ok) {
        return status;
    }

    std::vector<std::uint8_t> bytes;
    status = file.read_stream(stream_name, bytes);
    if (status == Error::StreamNotFound) {
        auto valid = file.stream_names();
        std::string message = "Invalid stream name: '" + stream_name +
                              "'. Valid choices are: " + join(valid);
        if (diag != nullptr) {
            diag->valid_streams = std::move(valid);
        }
        return fail(diag, Error::InvalidStreamName, std::move(message));
    }
    if (status != Error::Ok) {
        return fail(diag, status, "Cannot read stream '" + stream_name + "' from " + path_);
    }

    status = parse_bytes(bytes.data(), bytes.size(), nodes, options_, diag);
    if (status != Error::Ok && diag != nullptr) {
        diag->message = "Stream '" + stream_name + "': " + diag->message;
    }
    return status;
}

#if !MAXDUMP_NO_EXCEPTIONS
NodeList StorageParser::parse(const std::string& stream_name) const {
    NodeList nodes;
    Diagnostic diag;
    auto status = parse(stream_name, nodes, &diag);

    switch (status) {
    case Error::Ok:
        return nodes;
    case Error::IoError:
        throw IoException(diag.message);
    case Error::InvalidContainer:
        throw InvalidContainerException(diag.message);
    case Error::InvalidStreamName:
        throw InvalidStreamNameException(diag.message, std::move(diag.valid_streams));
    default:
        throw CorruptStreamException(diag.message, status, diag.offset);
    }
}
#endif

Error StorageParser::list_streams(std::vector<std::string>& names, Diagnostic* diag) const {
    names.clear();

    CompoundFile file;
    auto status = open_container(path_, file, diag);
    if (status != Error::Ok) {
        return status;
    }

    names = file.stream_names();
    return Error::Ok;
}

Error StorageParser::parse_bytes(const std::uint8_t* data, std::size_t size, NodeList& nodes,
                                 const DecodeOptions& options, Diagnostic* diag) {
    ByteCursor cursor(data, size);
    return read_nodes(cursor, size, nodes, 0, options, diag);
}

} // namespace maxdump
