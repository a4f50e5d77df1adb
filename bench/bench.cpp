/**
 * @file bench.cpp
 * @brief Performance benchmarks for emstr encoders.
 *
 * Measures encoding throughput for regression testing during development.
 * Note: Desktop performance differs from embedded targets - use for relative
 * comparisons only.
 *
 * Usage:
 *   ./build/emstr_bench          # Run with default 100 iterations
 *   ./build/emstr_bench 1000     # Run with custom iteration count
 */

#include <emstr/emstr.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>

using namespace emstr;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t VALUES_PER_ITERATION = 4096;

/// Accumulated output length, keeps the encoders from being optimized out
static volatile std::size_t g_sink = 0;

/**
 * @brief Time one encoder over a batch of generated values.
 *
 * @param name Row label
 * @param iterations Number of passes over the batch
 * @param make Produces the encodable value for index i
 */
template <typename Make>
static void bench_encode(const char* name, int iterations, Make make) {
    char buffer[128];
    std::size_t bytes = 0;

    // Warmup run
    for (std::size_t i = 0; i < VALUES_PER_ITERATION; ++i) {
        std::size_t n = 0;
        if (encode(make(i), buffer, sizeof(buffer), n) != Error::Ok) {
            std::printf("%-20s FAIL (encoding error)\n", name);
            return;
        }
        bytes += n;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int it = 0; it < iterations; it++) {
        for (std::size_t i = 0; i < VALUES_PER_ITERATION; ++i) {
            std::size_t n = 0;
            static_cast<void>(encode(make(i), buffer, sizeof(buffer), n));
            g_sink = g_sink + n;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_value_ns = (per_iter_us * 1000.0) / static_cast<double>(VALUES_PER_ITERATION);
    double throughput_mbps = static_cast<double>(bytes) / per_iter_us;

    std::printf("%-20s %8.2f µs/iter  %6.2f ns/val  %8.1f MB/s  (%zu vals)\n",
                name, per_iter_us, per_value_ns, throughput_mbps, VALUES_PER_ITERATION);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("emstr Benchmarks (C++ Implementation)\n");
    std::printf("=====================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Values per iteration: %zu\n\n", VALUES_PER_ITERATION);

    std::printf("%-20s %14s  %13s  %12s  %s\n",
                "Test", "Time", "Per-Value", "Throughput", "Values");
    std::printf("%-20s %14s  %13s  %12s  %s\n",
                "----", "----", "---------", "----------", "------");

    static std::uint8_t bytes[32];
    for (std::size_t i = 0; i < sizeof(bytes); ++i) {
        bytes[i] = static_cast<std::uint8_t>(i * 37U);
    }

    std::printf("\nIntegers:\n");
    bench_encode("uint8", iterations,
                 [](std::size_t i) { return static_cast<std::uint8_t>(i); });
    bench_encode("int32", iterations, [](std::size_t i) {
        return static_cast<std::int32_t>(i * 2654435761U);
    });
    bench_encode("uint64", iterations, [](std::size_t i) {
        return static_cast<std::uint64_t>(i) * 0x9E3779B97F4A7C15ULL;
    });

    std::printf("\nFractional:\n");
    bench_encode("milli (full)", iterations, [](std::size_t i) {
        return Fractional<std::int32_t>(static_cast<std::int32_t>(i * 7919U) - 16000000, 1000,
                                        Trim::None);
    });
    bench_encode("milli (trimmed)", iterations, [](std::size_t i) {
        return Fractional<std::int32_t>(static_cast<std::int32_t>(i * 7919U) - 16000000, 1000,
                                        Trim::TrailingZeros);
    });

    std::printf("\nHex / Padding:\n");
    bench_encode("hex 32 bytes", iterations,
                 [](std::size_t) { return Hex(bytes); });
    bench_encode("pad_left int", iterations, [](std::size_t i) {
        return pad_left(static_cast<std::uint16_t>(i), 8, '0');
    });
    bench_encode("join", iterations, [](std::size_t i) {
        return join("id=", static_cast<std::uint32_t>(i), ' ', "T=",
                    Fractional<std::int32_t>(static_cast<std::int32_t>(i), 100));
    });

    std::printf("\nNote: Desktop performance differs from embedded targets.\n");
    std::printf("Use these results for relative comparisons only.\n");

    return 0;
}
