#ifndef INCTRIE_BENCHMARK_STATS_HPP
#define INCTRIE_BENCHMARK_STATS_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

// Enforce release build
#ifndef NDEBUG
    static_assert(false, "Benchmarks MUST be built in release mode! Use -DCMAKE_BUILD_TYPE=Release");
#endif

namespace benchmark {

// Configuration constants
constexpr std::size_t BENCHMARK_WARMUP_RUNS = 2;
constexpr std::size_t BENCHMARK_SAMPLES = 20;

/**
 * Statistical results for one timed case
 */
struct BenchmarkResult {
    std::string benchmark_name;
    std::size_t input_size = 0;
    std::size_t samples = 0;
    std::size_t outliers_removed = 0;
    double min_us = 0.0;
    double max_us = 0.0;
    double median_us = 0.0;  // Primary metric
    double mad_us = 0.0;
    std::vector<double> raw_timings_us;
};

inline double percentile(const std::vector<double>& sorted_data, double p) {
    if (sorted_data.empty()) return 0.0;
    if (sorted_data.size() == 1) return sorted_data[0];

    double index = (p / 100.0) * (sorted_data.size() - 1);
    std::size_t lower = static_cast<std::size_t>(std::floor(index));
    std::size_t upper = static_cast<std::size_t>(std::ceil(index));

    if (lower == upper) {
        return sorted_data[lower];
    }

    double weight = index - lower;
    return sorted_data[lower] * (1.0 - weight) + sorted_data[upper] * weight;
}

inline double median(const std::vector<double>& sorted_data) {
    return percentile(sorted_data, 50.0);
}

/**
 * Median Absolute Deviation, scaled by 1.4826 to approximate stddev
 */
inline double median_absolute_deviation(const std::vector<double>& data) {
    if (data.empty()) return 0.0;

    std::vector<double> sorted = data;
    std::sort(sorted.begin(), sorted.end());
    double med = median(sorted);

    std::vector<double> abs_deviations;
    abs_deviations.reserve(data.size());
    for (double val : data) {
        abs_deviations.push_back(std::abs(val - med));
    }
    std::sort(abs_deviations.begin(), abs_deviations.end());

    return median(abs_deviations) * 1.4826;
}

/**
 * Tukey's fences, wider on the high end for scheduling spikes
 */
inline std::vector<double> filter_outliers(const std::vector<double>& data, std::size_t& outliers_removed) {
    outliers_removed = 0;
    if (data.size() < 4) return data;

    std::vector<double> sorted = data;
    std::sort(sorted.begin(), sorted.end());

    double q1 = percentile(sorted, 25.0);
    double q3 = percentile(sorted, 75.0);
    double iqr = q3 - q1;
    double lower_fence = q1 - 1.5 * iqr;
    double upper_fence = q3 + 3.0 * iqr;

    std::vector<double> filtered;
    filtered.reserve(data.size());
    for (double val : sorted) {
        if (val >= lower_fence && val <= upper_fence) {
            filtered.push_back(val);
        } else {
            outliers_removed++;
        }
    }

    return filtered.empty() ? data : filtered;
}

inline void calculate_statistics(BenchmarkResult& result) {
    if (result.raw_timings_us.empty()) return;

    result.samples = result.raw_timings_us.size();
    std::vector<double> filtered = filter_outliers(result.raw_timings_us, result.outliers_removed);
    std::vector<double> sorted = filtered;
    std::sort(sorted.begin(), sorted.end());

    result.median_us = median(sorted);
    result.mad_us = median_absolute_deviation(filtered);
    result.min_us = sorted.front();
    result.max_us = sorted.back();
}

/**
 * Runs fn BENCHMARK_WARMUP_RUNS times untimed, then BENCHMARK_SAMPLES times timed
 */
template<typename Fn>
BenchmarkResult time_samples(const std::string& name, std::size_t input_size, Fn&& fn) {
    BenchmarkResult result;
    result.benchmark_name = name;
    result.input_size = input_size;

    for (std::size_t i = 0; i < BENCHMARK_WARMUP_RUNS; ++i) {
        fn();
    }

    result.raw_timings_us.reserve(BENCHMARK_SAMPLES);
    for (std::size_t i = 0; i < BENCHMARK_SAMPLES; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        fn();
        auto end = std::chrono::high_resolution_clock::now();
        result.raw_timings_us.push_back(
            std::chrono::duration<double, std::micro>(end - start).count());
    }

    calculate_statistics(result);
    return result;
}

} // namespace benchmark

#endif // INCTRIE_BENCHMARK_STATS_HPP
