#include "benchmark_stats.hpp"
#include <inctrie/engine.hpp>
#include <inctrie/set.hpp>
#include <inctrie/trie_fold.hpp>
#include <cstdio>
#include <string>
#include <vector>

using namespace inctrie;

namespace {

constexpr std::size_t INPUT_STEPS = 100;

// Folded by every timed sample
std::size_t sum_elements(const Set<std::size_t>& s, Engine& engine) {
    return fold_seq(s, std::size_t{0},
        [](const std::pair<std::size_t, Unit>& e, std::size_t acc) { return acc + e.first; },
        [](std::size_t acc) { return acc; },
        [](const Name&, std::size_t acc) { return acc; },
        &engine);
}

// One editing step: wrap the current set in a named articulation, then add i
Set<std::size_t> push_input(std::size_t i, const Set<std::size_t>& t, Engine& engine) {
    using S = Set<std::size_t>;
    S wrapped = S::art(engine.cell(Name::of_usize(i), t));
    wrapped = S::name(Name::of_usize(i), wrapped);
    return set::add(wrapped, i);
}

std::vector<benchmark::BenchmarkResult> run_growing_input(const char* label, EngineMode mode,
                                                          std::size_t& checksum) {
    Engine engine(EngineConfig{mode});
    Set<std::size_t> input = set::empty<std::size_t>();
    std::vector<benchmark::BenchmarkResult> results;

    for (std::size_t i = 1; i < INPUT_STEPS; ++i) {
        input = push_input(i, input, engine);
        results.push_back(benchmark::time_samples(label, i, [&]() {
            checksum += sum_elements(input, engine);
        }));
    }

    const EngineStats& stats = engine.stats();
    printf("  %-12s memo hits %zu, misses %zu, table entries %zu\n",
           label, stats.memo_hits, stats.memo_misses, engine.table_size());
    return results;
}

void print_results(const std::vector<benchmark::BenchmarkResult>& naive,
                   const std::vector<benchmark::BenchmarkResult>& incremental) {
    printf("\n%8s  %14s  %14s  %8s\n", "elements", "naive (us)", "incremental (us)", "speedup");
    double naive_total = 0.0;
    double incremental_total = 0.0;
    for (std::size_t k = 0; k < naive.size(); ++k) {
        naive_total += naive[k].median_us;
        incremental_total += incremental[k].median_us;
        std::size_t n = naive[k].input_size;
        if (n % 10 != 0 && n != 1 && n + 1 != INPUT_STEPS) continue;
        double speedup = incremental[k].median_us > 0.0 ? naive[k].median_us / incremental[k].median_us : 0.0;
        printf("%8zu  %9.2f±%-4.2f  %11.2f±%-4.2f  %7.2fx\n", n,
               naive[k].median_us, naive[k].mad_us,
               incremental[k].median_us, incremental[k].mad_us, speedup);
    }
    printf("\nTotal of medians: naive %.2f us, incremental %.2f us\n", naive_total, incremental_total);
}

bool selected(const std::string& filter, const std::string& name) {
    return filter.empty() || name.find(filter) != std::string::npos;
}

} // namespace

int main(int argc, char** argv) {
    printf("Incremental Trie Fold Benchmark\n");
    printf("===============================\n\n");

    std::string filter;
    bool list_only = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--list") {
            list_only = true;
        } else if (arg.find("--filter=") == 0) {
            filter = arg.substr(9);
        }
    }

    if (list_only) {
        printf("fold_growing_set\n");
        return 0;
    }
    if (!selected(filter, "fold_growing_set")) {
        printf("No benchmark matches filter '%s'\n", filter.c_str());
        return 0;
    }

    printf("fold_growing_set: sum over a set grown by %zu named steps, %zu samples per step\n\n",
           INPUT_STEPS - 1, benchmark::BENCHMARK_SAMPLES);

    std::size_t naive_checksum = 0;
    std::size_t incremental_checksum = 0;
    auto naive = run_growing_input("naive", EngineMode::NAIVE, naive_checksum);
    auto incremental = run_growing_input("incremental", EngineMode::INCREMENTAL, incremental_checksum);

    print_results(naive, incremental);

    if (naive_checksum != incremental_checksum) {
        fprintf(stderr, "Checksum mismatch: naive %zu, incremental %zu\n", naive_checksum, incremental_checksum);
        return 1;
    }
    return 0;
}
