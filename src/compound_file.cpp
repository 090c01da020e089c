/**
 * @file compound_file.cpp
 * @brief Read-only access to OLE Compound File Binary containers.
 */

#include <maxdump/compound_file.hpp>
#include <maxdump/text.hpp>

#include <compoundfilereader.h>
#include <utf.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <fstream>
#include <set>
#include <utility>

namespace maxdump {

namespace {

using Entry = CFB::COMPOUND_FILE_ENTRY;

constexpr std::uint8_t STORAGE_OBJECT = 1;
constexpr std::uint8_t STREAM_OBJECT = 2;
constexpr std::uint8_t ROOT_OBJECT = 5;

constexpr std::size_t DIRECTORY_ENTRY_SIZE = 128U;

std::uint16_t load_u16(const std::uint8_t* p) noexcept {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::string entry_name(const Entry* entry) {
    // nameLen is in bytes and includes the terminating NUL
    std::size_t units = std::min<std::size_t>(entry->nameLen, 64U) / 2U;
    if (units != 0) {
        --units;
    }
    return UTF16ToUTF8(entry->name, units);
}

std::string normalize_path(const std::string& path) {
    std::string out;
    std::size_t begin = 0;
    while (begin <= path.size()) {
        std::size_t end = path.find('/', begin);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > begin) {
            if (!out.empty()) {
                out += '/';
            }
            out.append(path, begin, end - begin);
        }
        begin = end + 1;
    }
    return out;
}

/**
 * Walk the directory tree once before the reader recurses through it;
 * a sibling or child link that loops back or leaves the directory would
 * otherwise never terminate.
 */
Error check_directory(const CFB::CompoundFileReader& reader, std::size_t max_entries) {
    const Entry* root = reader.GetRootEntry();
    if (root == nullptr || root->type != ROOT_OBJECT) {
        return Error::InvalidContainer;
    }

    std::set<std::uint32_t> seen{0};
    std::vector<std::uint32_t> pending{root->childID};
    while (!pending.empty()) {
        std::uint32_t id = pending.back();
        pending.pop_back();
        if (id == cfb::NO_STREAM) {
            continue;
        }
        if (id >= max_entries || !seen.insert(id).second) {
            return Error::InvalidContainer;
        }

        const Entry* entry = reader.GetEntry(id);
        if (entry == nullptr) {
            return Error::InvalidContainer;
        }
        pending.push_back(entry->leftSiblingID);
        pending.push_back(entry->rightSiblingID);
        pending.push_back(entry->childID);
    }

    return Error::Ok;
}

} // namespace

struct CompoundFile::Impl {
    Impl(const std::uint8_t* data, std::size_t size) : reader(data, size) {}

    void collect(const Entry* storage, const std::string& prefix) {
        std::vector<const Entry*> children;
        reader.EnumFiles(storage, -1,
                         [&](const Entry* entry, const CFB::utf16string& dir, int /*level*/) {
                             // Deeper entries arrive with their parent's path
                             if (dir.empty()) {
                                 children.push_back(entry);
                             }
                         });

        for (const Entry* entry : children) {
            std::string name = prefix + entry_name(entry);
            if (entry->type == STREAM_OBJECT) {
                streams.emplace_back(std::move(name), entry);
            } else if (entry->type == STORAGE_OBJECT) {
                collect(entry, name + "/");
            }
        }
    }

    const Entry* find(const std::string& path) const {
        std::string wanted = normalize_path(path);
        if (wanted.empty()) {
            return nullptr;
        }
        for (const auto& [name, entry] : streams) {
            if (iequals(name, wanted)) {
                return entry;
            }
        }
        return nullptr;
    }

    CFB::CompoundFileReader reader;
    /// Stream paths in directory order
    std::vector<std::pair<std::string, const Entry*>> streams;
};

CompoundFile::CompoundFile() = default;
CompoundFile::~CompoundFile() = default;
CompoundFile::CompoundFile(CompoundFile&& other) noexcept = default;
CompoundFile& CompoundFile::operator=(CompoundFile&& other) noexcept = default;

Error CompoundFile::open(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error::IoError;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return Error::IoError;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return Error::IoError;
    }

    return load(std::move(buffer));
}

Error CompoundFile::load(std::vector<std::uint8_t> data) {
    *this = CompoundFile();
    data_ = std::move(data);

    auto status = check_header();
    if (status == Error::Ok) {
        try {
            auto impl = std::make_unique<Impl>(data_.data(), data_.size());
            status = check_directory(impl->reader, data_.size() / DIRECTORY_ENTRY_SIZE);
            if (status == Error::Ok) {
                impl->collect(impl->reader.GetRootEntry(), "");
                impl_ = std::move(impl);
            }
        } catch (const std::exception&) {
            // compoundfilereader reports corrupt input by throwing
            status = Error::InvalidContainer;
        }
    }

    if (status != Error::Ok) {
        *this = CompoundFile();
    }
    return status;
}

Error CompoundFile::check_header() {
    if (data_.size() < cfb::HEADER_SIZE) {
        return Error::InvalidContainer;
    }

    const std::uint8_t* h = data_.data();
    if (std::memcmp(h, cfb::SIGNATURE, sizeof(cfb::SIGNATURE)) != 0) {
        return Error::InvalidContainer;
    }
    if (load_u16(h + 0x1C) != cfb::BYTE_ORDER_MARK) {
        return Error::InvalidContainer;
    }

    std::uint16_t major = load_u16(h + 0x1A);
    std::uint16_t sector_shift = load_u16(h + 0x1E);
    // Version 3 uses 512-byte sectors, version 4 uses 4096-byte sectors
    if (!(major == 3 && sector_shift == 9) && !(major == 4 && sector_shift == 12)) {
        return Error::InvalidContainer;
    }
    if (load_u16(h + 0x20) != 6) {
        return Error::InvalidContainer;
    }

    // Header, at least one FAT sector and one directory sector
    std::size_t sector = std::size_t{1} << sector_shift;
    if (data_.size() < 3 * sector) {
        return Error::InvalidContainer;
    }

    major_version_ = major;
    sector_size_ = sector;
    return Error::Ok;
}

std::vector<std::string> CompoundFile::stream_names() const {
    std::vector<std::string> names;
    if (impl_ == nullptr) {
        return names;
    }
    names.reserve(impl_->streams.size());
    for (const auto& stream : impl_->streams) {
        names.push_back(stream.first);
    }
    return names;
}

bool CompoundFile::exists(const std::string& path) const {
    return impl_ != nullptr && impl_->find(path) != nullptr;
}

Error CompoundFile::read_stream(const std::string& path, std::vector<std::uint8_t>& out) const {
    out.clear();
    const Entry* entry = (impl_ != nullptr) ? impl_->find(path) : nullptr;
    if (entry == nullptr) {
        return Error::StreamNotFound;
    }

    std::uint64_t size = entry->size;
    if (major_version_ == 3) {
        // Version 3 files may leave garbage in the high half
        size &= 0xFFFFFFFFULL;
    }
    if (size == 0) {
        return Error::Ok;
    }
    if (size > data_.size()) {
        return Error::InvalidContainer;
    }

    out.resize(static_cast<std::size_t>(size));
    try {
        impl_->reader.ReadFile(entry, 0, reinterpret_cast<char*>(out.data()), out.size());
    } catch (const std::exception&) {
        out.clear();
        return Error::InvalidContainer;
    }
    return Error::Ok;
}

} // namespace maxdump
