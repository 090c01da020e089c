/**
 * @file bench.cpp
 * @brief Performance benchmarks for chunk tree decoding.
 *
 * Decodes synthetic streams of various shapes and reports throughput,
 * for regression testing during development.
 *
 * Usage:
 *   ./build/maxdump_bench          # Run with default 100 iterations
 *   ./build/maxdump_bench 1000     # Run with custom iteration count
 */

#include <maxdump/maxdump.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace maxdump;

static constexpr int DEFAULT_ITERATIONS = 100;

static void put_le(std::vector<std::uint8_t>& out, std::uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        out.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
    }
}

static void put_value(std::vector<std::uint8_t>& out, std::int16_t id, std::size_t payload) {
    put_le(out, static_cast<std::uint16_t>(id), 2);
    put_le(out, static_cast<std::uint32_t>(HEADER_SIZE + payload), 4);
    for (std::size_t i = 0; i < payload; ++i) {
        out.push_back(static_cast<std::uint8_t>(i));
    }
}

static void put_container(std::vector<std::uint8_t>& out, std::int16_t id,
                          const std::vector<std::uint8_t>& children) {
    put_le(out, static_cast<std::uint16_t>(id), 2);
    put_le(out, static_cast<std::uint32_t>(HEADER_SIZE + children.size()) | 0x80000000U, 4);
    out.insert(out.end(), children.begin(), children.end());
}

/// Many small values below a shallow container layer
static std::vector<std::uint8_t> make_flat(std::size_t containers, std::size_t values) {
    std::vector<std::uint8_t> stream;
    for (std::size_t c = 0; c < containers; ++c) {
        std::vector<std::uint8_t> children;
        for (std::size_t v = 0; v < values; ++v) {
            put_value(children, static_cast<std::int16_t>(v), 4);
        }
        put_container(stream, 0x2000, children);
    }
    return stream;
}

/// One chain of nested containers ending in a single value
static std::vector<std::uint8_t> make_deep(std::size_t depth) {
    std::vector<std::uint8_t> inner;
    put_value(inner, 0x0100, 16);
    for (std::size_t d = 0; d < depth; ++d) {
        std::vector<std::uint8_t> outer;
        put_container(outer, 0x2001, inner);
        inner.swap(outer);
    }
    return inner;
}

/// A few large values
static std::vector<std::uint8_t> make_blobs(std::size_t count, std::size_t size) {
    std::vector<std::uint8_t> stream;
    for (std::size_t i = 0; i < count; ++i) {
        put_value(stream, 0x0300, size);
    }
    return stream;
}

static void bench_decode(const char* name, const std::vector<std::uint8_t>& stream,
                         int iterations) {
    NodeList nodes;

    // Warmup run
    auto status = StorageParser::parse_bytes(stream.data(), stream.size(), nodes);
    if (status != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(status));
        return;
    }
    std::size_t node_count = count_nodes(nodes);

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations && status == Error::Ok; ++i) {
        status = StorageParser::parse_bytes(stream.data(), stream.size(), nodes);
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / iterations;
    double mb_per_sec = (static_cast<double>(stream.size()) / (1024.0 * 1024.0)) /
                        (per_iter_us / 1e6);

    std::printf("%-20s %10zu bytes %8zu nodes %10.2f us/iter %8.2f MB/s\n", name, stream.size(),
                node_count, per_iter_us, mb_per_sec);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("maxdump %s decode benchmark (%d iterations)\n\n", version(), iterations);

    bench_decode("flat 1000x64", make_flat(1000, 64), iterations);
    bench_decode("deep 200", make_deep(200), iterations);
    bench_decode("blobs 16x64KiB", make_blobs(16, 64 * 1024), iterations);

    return 0;
}
