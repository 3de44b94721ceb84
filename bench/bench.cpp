/**
 * @file bench.cpp
 * @brief Performance benchmarks for ch8pack compression.
 *
 * Measures compression and decompression time on synthetic ROM images,
 * plus any ROM files given on the command line.
 *
 * Usage:
 *   ./build/ch8pack_bench                 # 100 iterations, synthetic ROMs
 *   ./build/ch8pack_bench 1000 pong.ch8   # custom iteration count and ROM
 */

#include <ch8pack/ch8pack.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace ch8pack;

static constexpr int DEFAULT_ITERATIONS = 100;

static std::vector<std::uint8_t> make_random(std::size_t size, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::uint8_t> data(size);
    for (auto& b : data) {
        b = static_cast<std::uint8_t>(dist(rng));
    }
    return data;
}

// Opcode-like stream: a small instruction vocabulary with sprite rows
static std::vector<std::uint8_t> make_program(std::size_t size, std::uint32_t seed) {
    static const std::uint8_t vocabulary[][2] = {
        {0x00, 0xE0}, {0x6A, 0x02}, {0xA2, 0x2A}, {0xD0, 0x15}, {0x70, 0x08},
        {0x12, 0x00}, {0xF0, 0x65}, {0x3A, 0x00}, {0xFF, 0xFF}, {0x80, 0x80},
    };
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(vocabulary) / sizeof(vocabulary[0]) - 1);
    std::vector<std::uint8_t> data;
    while (data.size() < size) {
        const auto& op = vocabulary[pick(rng)];
        data.push_back(op[0]);
        data.push_back(op[1]);
    }
    data.resize(size);
    return data;
}

static void bench_rom(const char* name, const std::vector<std::uint8_t>& rom, int iterations) {
    Compressor compressor;
    std::vector<std::uint8_t> compressed;
    std::vector<std::uint8_t> restored;

    // Warmup run
    if (compressor.compress(rom.data(), rom.size(), compressed) != Error::Ok) {
        std::printf("%-16s SKIP (%s)\n", name, "compression failed");
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        (void)compressor.compress(rom.data(), rom.size(), compressed);
    }
    auto mid = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        (void)decompress(compressed.data(), compressed.size(), restored);
    }
    auto end = std::chrono::high_resolution_clock::now();

    double compress_us = std::chrono::duration<double, std::micro>(mid - start).count() /
                         static_cast<double>(iterations);
    double decompress_us = std::chrono::duration<double, std::micro>(end - mid).count() /
                           static_cast<double>(iterations);
    double ratio = compressed.empty() ? 0.0
                                      : static_cast<double>(rom.size()) /
                                            static_cast<double>(compressed.size());

    std::printf("%-16s %6zu -> %6zu  %6.2fx  %10.2f µs  %10.2f µs  %s\n", name, rom.size(),
                compressed.size(), ratio, compress_us, decompress_us,
                restored == rom ? "ok" : "MISMATCH");
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("ch8pack Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-16s %16s  %7s  %13s  %13s  %s\n", "ROM", "Size", "Ratio", "Compress",
                "Decompress", "Check");
    std::printf("%-16s %16s  %7s  %13s  %13s  %s\n", "---", "----", "-----", "--------",
                "----------", "-----");

    bench_rom("zeros-4k", std::vector<std::uint8_t>(MAX_ROM_SIZE, 0x00), iterations);
    bench_rom("flags-4k", std::vector<std::uint8_t>(MAX_ROM_SIZE, COMPRESS_FLAG), iterations);
    bench_rom("random-4k", make_random(MAX_ROM_SIZE, 1U), iterations);
    bench_rom("program-1k", make_program(1024, 2U), iterations);
    bench_rom("program-3k", make_program(3584, 3U), iterations);

    for (int i = 2; i < argc; ++i) {
        std::vector<std::uint8_t> rom;
        std::error_code ec;
        auto result = read_file(argv[i], rom, ec);
        if (result != Error::Ok) {
            std::printf("%-16s SKIP (%s)\n", argv[i],
                        result == Error::IoError ? ec.message().c_str() : error_string(result));
            continue;
        }
        bench_rom(default_var_name(argv[i]).c_str(), rom, iterations);
    }

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
