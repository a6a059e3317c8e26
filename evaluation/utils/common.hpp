#pragma once

/**
 * Common Evaluation Utilities
 *
 * Shared helpers for the hashmv evaluation drivers: system report,
 * formatting, timing and summary statistics.
 */

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef HASHMV_USE_OPENMP
#include <omp.h>
#endif

namespace hashmv {
namespace eval {

// =============================================================================
// System Information
// =============================================================================

/**
 * Print system information (hardware threads, popcount support, OpenMP).
 */
inline void print_system_info() {
    std::cout << "=== System Information ===\n";
    std::cout << "Hardware threads: " << std::thread::hardware_concurrency() << "\n";

#ifdef HASHMV_USE_OPENMP
    std::cout << "OpenMP threads: " << omp_get_max_threads() << "\n";
#else
    std::cout << "OpenMP: DISABLED\n";
#endif

    std::cout << "Compilation: ";
#ifdef __AVX2__
    std::cout << "AVX2 ";
#endif
#if defined(__POPCNT__) || defined(__SSE4_2__)
    std::cout << "POPCNT ";
#else
    std::cout << "software-popcount ";
#endif
    std::cout << "\n\n";
}

// =============================================================================
// Formatting and Timing
// =============================================================================

/**
 * Format a number with specified precision.
 */
inline std::string format_number(double val, int precision = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << val;
    return ss.str();
}

class Timer {
    std::chrono::high_resolution_clock::time_point start_;
public:
    void start() { start_ = std::chrono::high_resolution_clock::now(); }
    double elapsed_ms() const {
        auto now = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(now - start_).count();
    }
};

// =============================================================================
// Statistical Utilities
// =============================================================================

inline double compute_mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double sum = 0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

/**
 * Compute standard deviation of a vector (sample estimate).
 */
inline double compute_stddev(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    double mean = compute_mean(v);
    double sum_sq = 0;
    for (double x : v) {
        double diff = x - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(v.size() - 1));
}

/**
 * Pearson correlation between estimated and exact values.
 *
 * @return Correlation coefficient in [-1, 1], or 0 if invalid
 */
inline double compute_pearson_correlation(const std::vector<double>& x,
                                          const std::vector<double>& y) {
    if (x.size() != y.size() || x.empty()) return 0.0;

    size_t n = x.size();
    double sum_x = 0, sum_y = 0, sum_xy = 0, sum_x2 = 0, sum_y2 = 0;

    for (size_t i = 0; i < n; ++i) {
        sum_x += x[i];
        sum_y += y[i];
        sum_xy += x[i] * y[i];
        sum_x2 += x[i] * x[i];
        sum_y2 += y[i] * y[i];
    }

    double num = n * sum_xy - sum_x * sum_y;
    double den = std::sqrt((n * sum_x2 - sum_x * sum_x) * (n * sum_y2 - sum_y * sum_y));

    return (den > 1e-10) ? num / den : 0.0;
}

}  // namespace eval
}  // namespace hashmv
