/**
 * @file test_storage_parser.cpp
 * @brief Unit tests for decoding named streams of a compound file.
 */

#include <catch2/catch.hpp>
#include <maxdump/storage_parser.hpp>

#include "cfb_writer.hpp"
#include "chunk_writer.hpp"

#include <filesystem>
#include <string>

using namespace maxdump;
using namespace testutil;

namespace {

/// Temporary compound file removed on scope exit
class TempFile {
public:
    TempFile(const std::string& name, const Bytes& bytes)
        : path_(std::filesystem::temp_directory_path() / name) {
        ok_ = write_file(path_.string(), bytes);
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const {
        return path_.string();
    }

    bool ok() const {
        return ok_;
    }

private:
    std::filesystem::path path_;
    bool ok_ = false;
};

Bytes scene_stream() {
    return concat({container_chunk(0x2000, concat({value_chunk(0x0100, std::string("AB")),
                                                   value_chunk(0x0110, utf16_of("Box", true))})),
                   value_chunk(0x0200, Bytes{1, 0, 0, 0})});
}

} // namespace

TEST_CASE("Parse a named stream", "[parser]") {
    TempFile file("maxdump_parser_ok.cfb",
                  build_cfb({cfb_stream("Scene", scene_stream()), cfb_stream("Other", {})}).bytes);
    REQUIRE(file.ok());

    StorageParser parser(file.path());
    NodeList nodes;
    Diagnostic diag;
    REQUIRE(parser.parse("Scene", nodes, &diag) == Error::Ok);
    REQUIRE(diag.code == Error::Ok);
    REQUIRE(diag.stream_name == "Scene");

    REQUIRE(nodes.size() == 2);
    REQUIRE(nodes[0].is_container());
    REQUIRE(nodes[0].children().size() == 2);
    REQUIRE(nodes[0].children()[0].bytes() == bytes_of("AB"));
    REQUIRE(nodes[1].id() == 0x0200);

    SECTION("empty stream gives an empty forest") {
        REQUIRE(parser.parse("Other", nodes) == Error::Ok);
        REQUIRE(nodes.empty());
    }

    SECTION("parsing twice gives the same tree") {
        NodeList again;
        REQUIRE(parser.parse("Scene", again) == Error::Ok);
        REQUIRE(again == nodes);
    }
}

TEST_CASE("List streams", "[parser]") {
    TempFile file("maxdump_parser_list.cfb",
                  build_cfb({cfb_stream("A", bytes_of("x")),
                             cfb_storage("S", {cfb_stream("B", bytes_of("y"))})})
                      .bytes);
    REQUIRE(file.ok());

    std::vector<std::string> names;
    REQUIRE(StorageParser(file.path()).list_streams(names) == Error::Ok);
    REQUIRE(names == std::vector<std::string>{"A", "S/B"});
}

TEST_CASE("Unknown stream names list the valid ones", "[parser][error]") {
    TempFile file("maxdump_parser_names.cfb",
                  build_cfb({cfb_stream("Scene", scene_stream()), cfb_stream("Config", {})}).bytes);
    REQUIRE(file.ok());

    StorageParser parser(file.path());
    NodeList nodes;
    Diagnostic diag;
    REQUIRE(parser.parse("Missing", nodes, &diag) == Error::InvalidStreamName);
    REQUIRE(diag.code == Error::InvalidStreamName);
    REQUIRE(diag.valid_streams == std::vector<std::string>{"Scene", "Config"});
    REQUIRE(diag.message == "Invalid stream name: 'Missing'. Valid choices are: Scene, Config");
}

TEST_CASE("Missing file", "[parser][error]") {
    const auto path = std::filesystem::temp_directory_path() / "maxdump_parser_absent.cfb";
    std::filesystem::remove(path);

    StorageParser parser(path.string());
    NodeList nodes;
    Diagnostic diag;
    REQUIRE(parser.parse("Scene", nodes, &diag) == Error::IoError);
    REQUIRE(diag.message == "Cannot read file: " + path.string());

    std::vector<std::string> names;
    REQUIRE(parser.list_streams(names) == Error::IoError);
}

TEST_CASE("File that is not a compound file", "[parser][error]") {
    TempFile file("maxdump_parser_text.cfb", bytes_of("plain text"));
    REQUIRE(file.ok());

    NodeList nodes;
    Diagnostic diag;
    REQUIRE(StorageParser(file.path()).parse("Scene", nodes, &diag) == Error::InvalidContainer);
    REQUIRE(diag.message.find("Not a valid compound file") == 0);
}

TEST_CASE("Corrupt stream reports the stream and offset", "[parser][error]") {
    Bytes corrupt = concat({value_chunk(1, std::string("ok")), raw_header(2, 100)});
    TempFile file("maxdump_parser_corrupt.cfb", build_cfb({cfb_stream("Scene", corrupt)}).bytes);
    REQUIRE(file.ok());

    NodeList nodes;
    Diagnostic diag;
    REQUIRE(StorageParser(file.path()).parse("Scene", nodes, &diag) == Error::TruncatedStream);
    REQUIRE(nodes.empty());
    REQUIRE(diag.offset == 8);
    REQUIRE(diag.stream_name == "Scene");
    REQUIRE(diag.message.find("Stream 'Scene': ") == 0);
}

TEST_CASE("Nesting limit comes from the parser options", "[parser][depth]") {
    Bytes stream = container_chunk(1, container_chunk(2, value_chunk(3, std::string("x"))));
    TempFile file("maxdump_parser_depth.cfb", build_cfb({cfb_stream("Scene", stream)}).bytes);
    REQUIRE(file.ok());

    NodeList nodes;
    DecodeOptions shallow;
    shallow.max_depth = 1;
    StorageParser limited(file.path(), shallow);
    REQUIRE(limited.path() == file.path());
    REQUIRE(limited.options().max_depth == 1);
    REQUIRE(limited.parse("Scene", nodes) == Error::NestingTooDeep);

    StorageParser defaults(file.path());
    REQUIRE(defaults.options().max_depth == MAX_NESTING_DEPTH);
    REQUIRE(defaults.parse("Scene", nodes) == Error::Ok);
}

TEST_CASE("parse_bytes decodes an in-memory stream", "[parser]") {
    const Bytes stream = scene_stream();
    NodeList nodes;
    REQUIRE(StorageParser::parse_bytes(stream.data(), stream.size(), nodes) == Error::Ok);
    REQUIRE(nodes.size() == 2);
}

#if !MAXDUMP_NO_EXCEPTIONS
TEST_CASE("Throwing parse", "[parser][exceptions]") {
    TempFile file("maxdump_parser_throw.cfb",
                  build_cfb({cfb_stream("Scene", scene_stream()),
                             cfb_stream("Bad", raw_header(1, 3))})
                      .bytes);
    REQUIRE(file.ok());
    StorageParser parser(file.path());

    SECTION("success") {
        NodeList nodes = parser.parse("Scene");
        REQUIRE(nodes.size() == 2);
    }

    SECTION("invalid stream name") {
        try {
            (void)parser.parse("Nope");
            FAIL("expected InvalidStreamNameException");
        } catch (const InvalidStreamNameException& e) {
            REQUIRE(e.code() == Error::InvalidStreamName);
            REQUIRE(e.valid_streams() == std::vector<std::string>{"Scene", "Bad"});
        }
    }

    SECTION("corrupt stream") {
        try {
            (void)parser.parse("Bad");
            FAIL("expected CorruptStreamException");
        } catch (const CorruptStreamException& e) {
            REQUIRE(e.code() == Error::MalformedHeader);
            REQUIRE(e.offset() == 0);
        }
    }

    SECTION("missing file") {
        StorageParser absent(file.path() + ".absent");
        REQUIRE_THROWS_AS(absent.parse("Scene"), IoException);
    }
}
#endif
