/**
 * @file bench.cpp
 * @brief Performance benchmarks for geohash16 encode, decode and neighbors.
 *
 * Measures throughput over a fixed set of coordinates for regression
 * testing during development. Use the results for relative comparisons
 * only.
 *
 * Usage:
 *   ./build/geohash16_bench          # Run with default 100 iterations
 *   ./build/geohash16_bench 1000     # Run with custom iteration count
 */

#include <geohash/geohash.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace geohash;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t POINTS = 1000;

static std::vector<Coordinate> make_points() {
    std::vector<Coordinate> points;
    points.reserve(POINTS);

    // Fixed LCG so every run measures the same inputs
    std::uint32_t state = 0x2545F491U;
    for (std::size_t i = 0; i < POINTS; ++i) {
        state = state * 1664525U + 1013904223U;
        double x = (static_cast<double>(state) / 4294967296.0) * 360.0 - 180.0;
        state = state * 1664525U + 1013904223U;
        double y = (static_cast<double>(state) / 4294967296.0) * 180.0 - 90.0;
        points.push_back(Coordinate{x, y});
    }
    return points;
}

static void report(const char* name, std::size_t length, double total_us, int iterations,
                   std::size_t ops_per_iter) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_op_ns = (per_iter_us * 1000.0) / static_cast<double>(ops_per_iter);
    double mops = static_cast<double>(ops_per_iter) / per_iter_us;

    std::printf("%-12s %4zu %10.2f µs/iter  %8.1f ns/op  %8.2f Mops/s\n", name, length,
                per_iter_us, per_op_ns, mops);
}

static bool bench_encode(const std::vector<Coordinate>& points, std::size_t length,
                         int iterations) {
    std::string hash;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        for (const auto& c : points) {
            if (encode(c, length, hash) != Error::Ok) {
                std::fprintf(stderr, "Error: encode failed for (%g, %g)\n", c.x, c.y);
                return false;
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    report("encode", length, total_us, iterations, points.size());
    return true;
}

static bool bench_decode(const std::vector<std::string>& hashes, std::size_t length,
                         int iterations) {
    DecodedHash decoded;
    ErrorInfo info;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        for (const auto& h : hashes) {
            if (decode(h, decoded, &info) != Error::Ok) {
                std::fprintf(stderr, "Error: %s\n", describe(info).c_str());
                return false;
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    report("decode", length, total_us, iterations, hashes.size());
    return true;
}

static void bench_neighbors(const std::vector<std::string>& hashes, std::size_t length,
                            int iterations) {
    Neighbors ns;
    std::size_t failed = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        for (const auto& h : hashes) {
            // Cells on the world edge have no neighbor across it
            if (neighbors(h, ns) != Error::Ok) {
                ++failed;
            }
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    report("neighbors", length, total_us, iterations, hashes.size());
    if (failed > 0) {
        std::printf("%-12s      (%zu edge cells skipped)\n", "",
                    failed / static_cast<std::size_t>(iterations));
    }
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("geohash16 Benchmarks (v%s)\n", version());
    std::printf("=========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Points:     %zu\n\n", POINTS);

    std::printf("%-12s %4s %17s  %11s  %14s\n", "Test", "Len", "Time", "Per-Op", "Throughput");
    std::printf("%-12s %4s %17s  %11s  %14s\n", "----", "---", "----", "------", "----------");

    const std::vector<Coordinate> points = make_points();
    const std::size_t lengths[] = {6, 12, MAX_LENGTH};

    for (std::size_t length : lengths) {
        std::vector<std::string> hashes;
        hashes.reserve(points.size());
        for (const auto& c : points) {
            std::string h;
            if (encode(c, length, h) != Error::Ok) {
                std::fprintf(stderr, "Error: encode failed for (%g, %g)\n", c.x, c.y);
                return 1;
            }
            hashes.push_back(std::move(h));
        }

        std::printf("\n");
        if (!bench_encode(points, length, iterations)) {
            return 1;
        }
        if (!bench_decode(hashes, length, iterations)) {
            return 1;
        }
        bench_neighbors(hashes, length, iterations);
    }

    std::printf("\nNote: Use these results for relative comparisons only.\n");

    return 0;
}
