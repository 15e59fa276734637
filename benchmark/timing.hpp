#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>


// keeps results alive so the optimizer cannot drop the timed work
inline volatile double benchmark_sink = 0.0;

// Runs f once to warm up, then `reps` times, and prints the mean wall time.
template<typename F>
double time_it(const std::string & label, const int reps, F && f) {
    benchmark_sink = benchmark_sink + f();

    const auto start_time = std::chrono::high_resolution_clock::now();
    double acc = 0.0;
    for (int r = 0; r < reps; ++r) {
        acc += f();
    }
    const auto end_time = std::chrono::high_resolution_clock::now();
    benchmark_sink = benchmark_sink + acc;

    const std::chrono::duration<double> diff = end_time - start_time;
    const double mean_ms = 1e3 * diff.count() / reps;

    std::cout << "  " << std::left << std::setw(40) << label
              << std::right << std::setw(12) << std::fixed << std::setprecision(4) << mean_ms << " ms\n";
    return mean_ms;
}

inline void print_section(const std::string & title) {
    std::cout << "\n" << title << "\n";
}
