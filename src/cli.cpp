/**
 * @file cli.cpp
 * @brief maxdump command line interface.
 *
 * Lists the streams of a compound file and dumps the chunk tree of one of
 * them.
 */

#include <maxdump/maxdump.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

using namespace maxdump;

namespace {

struct CliOptions {
    bool list = false;
    bool summary = false;
    std::size_t max_depth = MAX_NESTING_DEPTH;
    std::vector<std::int16_t> utf16_ids;
    std::vector<const char*> positional;
};

void print_version() {
    std::printf("maxdump %s\n", version());
}

void print_help(const char* prog_name) {
    std::printf("Chunk stream dumper for OLE compound files (v%s)\n", version());
    std::printf("=================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <file> <stream>\n", prog_name);
    std::printf("  %s -l <file>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -l, --list       List the streams of <file>\n");
    std::printf("  --summary        Print node counts per chunk id instead of the tree\n");
    std::printf("  --max-depth N    Reject containers nested deeper than N (default %zu)\n",
                MAX_NESTING_DEPTH);
    std::printf("  --utf16 ID       Decode value chunks with hex id ID as UTF-16 text\n");
    std::printf("                   (may be repeated)\n");
    std::printf("  -h, --help       Show this help message\n");
    std::printf("  -v, --version    Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s -l scene.max\n", prog_name);
    std::printf("  %s scene.max ClassDirectory3 --utf16 2042\n\n", prog_name);
}

bool parse_size(const char* text, std::size_t& value) {
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    value = static_cast<std::size_t>(parsed);
    return true;
}

bool parse_chunk_id(const char* text, std::int16_t& id) {
    char* end = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(text, &end, 16);
    if (errno != 0 || end == text || *end != '\0' || parsed > 0xFFFFUL) {
        return false;
    }
    id = static_cast<std::int16_t>(static_cast<std::uint16_t>(parsed));
    return true;
}

void report(const Diagnostic& diag, Error status) {
    if (!diag.message.empty()) {
        std::fprintf(stderr, "Error: %s\n", diag.message.c_str());
    } else {
        std::fprintf(stderr, "Error: %s\n", error_string(status));
    }
}

int do_list(const char* path) {
    StorageParser parser(path);
    std::vector<std::string> names;
    Diagnostic diag;

    auto status = parser.list_streams(names, &diag);
    if (status != Error::Ok) {
        report(diag, status);
        return 1;
    }

    for (const auto& name : names) {
        std::printf("%s\n", name.c_str());
    }
    return 0;
}

void print_summary(const NodeList& nodes) {
    std::map<std::int16_t, std::size_t> counts;
    std::vector<const NodeList*> pending{&nodes};
    while (!pending.empty()) {
        const NodeList* level = pending.back();
        pending.pop_back();
        for (const auto& [id, group] : group_by_id(*level)) {
            counts[id] += group.size();
        }
        for (const auto& node : *level) {
            if (node.is_container()) {
                pending.push_back(&node.children());
            }
        }
    }

    std::printf("Top-level:   %zu\n", nodes.size());
    std::printf("Total:       %zu\n", count_nodes(nodes));
    for (const auto& [id, count] : counts) {
        std::printf("  0x%04X     %zu\n", static_cast<unsigned>(static_cast<std::uint16_t>(id)),
                    count);
    }
}

int do_dump(const char* path, const char* stream_name, const CliOptions& options) {
    DecodeOptions decode_options;
    decode_options.max_depth = options.max_depth;

    StorageParser parser(path, decode_options);
    NodeList nodes;
    Diagnostic diag;

    auto status = parser.parse(stream_name, nodes, &diag);
    if (status != Error::Ok) {
        report(diag, status);
        return 1;
    }

    if (options.summary) {
        print_summary(nodes);
        return 0;
    }

    ValueDecoderRegistry decoders;
    for (std::int16_t id : options.utf16_ids) {
        decoders.add(id, decode_utf16);
    }

    FormatOptions format_options;
    format_options.decoders = &decoders;
    std::fputs(format_nodes(nodes, format_options).c_str(), stdout);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--list") == 0) {
            options.list = true;
        } else if (std::strcmp(arg, "--summary") == 0) {
            options.summary = true;
        } else if (std::strcmp(arg, "--max-depth") == 0) {
            if (i + 1 >= argc || !parse_size(argv[i + 1], options.max_depth)) {
                std::fprintf(stderr, "Error: --max-depth requires a non-negative integer\n");
                return 1;
            }
            ++i;
        } else if (std::strcmp(arg, "--utf16") == 0) {
            std::int16_t id = 0;
            if (i + 1 >= argc || !parse_chunk_id(argv[i + 1], id)) {
                std::fprintf(stderr, "Error: --utf16 requires a hex chunk id (0-FFFF)\n");
                return 1;
            }
            options.utf16_ids.push_back(id);
            ++i;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            return 1;
        } else {
            options.positional.push_back(arg);
        }
    }

    if (options.list) {
        if (options.positional.size() != 1) {
            std::fprintf(stderr, "Error: --list requires exactly one file\n");
            std::fprintf(stderr, "Usage: %s -l <file>\n", argv[0]);
            return 1;
        }
        return do_list(options.positional[0]);
    }

    if (options.positional.size() != 2) {
        std::fprintf(stderr, "Error: Dump requires a file and a stream name\n");
        std::fprintf(stderr, "Usage: %s [options] <file> <stream>\n", argv[0]);
        return 1;
    }

    return do_dump(options.positional[0], options.positional[1], options);
}
