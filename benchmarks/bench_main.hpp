#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace asn1::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    double best_ms;
    double avg_ms;
    double throughput_mbps;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    using clock = std::chrono::steady_clock;

    double best_ms = 0.0;
    double total_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        const auto start = clock::now();
        func();
        const auto stop = clock::now();
        const double ms =
            std::chrono::duration<double, std::milli>(stop - start).count();
        best_ms = (i == 0 ? ms : std::min(best_ms, ms));
        total_ms += ms;
    }

    // 吞吐按最快一次计算（MB/s），平均值仅用于观察抖动。
    double throughput_mbps = 0.0;
    if (best_ms > 0.0) {
        const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
        throughput_mbps = mb / (best_ms / 1000.0);
    }

    results().push_back({name,
                         data_size,
                         best_ms,
                         iterations > 0 ? total_ms / iterations : 0.0,
                         throughput_mbps});
}

inline void print_results() {
    std::cout << '\n' << std::string(110, '=') << '\n';
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(15)
              << "Size (B)" << std::setw(15) << "Best (ms)" << std::setw(15)
              << "Avg (ms)" << "Throughput (MB/s)\n";
    std::cout << std::string(110, '-') << '\n';

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(50) << r.name << std::setw(15)
                  << r.data_size << std::fixed << std::setprecision(3)
                  << std::setw(15) << r.best_ms << std::setw(15) << r.avg_ms;
        if (r.throughput_mbps > 0.0) {
            std::cout << r.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << '\n';
    }
    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace asn1::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::asn1::benchmarks::run_benchmark(name, size, iterations, [&]() { code; })
