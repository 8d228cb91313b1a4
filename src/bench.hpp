#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "generator.hpp"
#include "util.hpp"

namespace tsid {
namespace bench {

struct Stats {
    std::string name;
    uint64_t runs = 0;
    double total_ms = 0;
    double ops_per_sec = 0;
    double avg_us = 0;
};

std::vector<std::string> format(const Stats& s);

// Warm up, then time `runs` calls of fn.
template <typename Fn>
Stats measure(const std::string& name, Fn&& fn, uint64_t runs, uint64_t warmup) {
    for (uint64_t i = 0; i < warmup; ++i) fn();

    auto start = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < runs; ++i) fn();
    Stats s;
    s.name = name;
    s.runs = runs;
    s.total_ms = elapsed_ms(start);
    if (s.total_ms > 0) s.ops_per_sec = static_cast<double>(runs) / (s.total_ms / 1000.0);
    if (runs > 0) s.avg_us = s.total_ms * 1000.0 / static_cast<double>(runs);
    return s;
}

struct ThreadedResult {
    Stats stats;
    size_t tokens = 0;
    size_t distinct = 0;
    // Per-thread sequences that were not strictly increasing.
    size_t inversions = 0;
    size_t failures = 0;
};

// per_thread generate() calls on each of `threads` pool workers sharing one
// generator.
ThreadedResult run_threaded(Generator& gen, Strategy s, size_t threads, uint64_t per_thread);

struct Accuracy {
    uint64_t pairs = 0;
    double avg_diff_ms = 0;
    double avg_standard = 0;
    double avg_fast = 0;
};

// Interleaves standard and fast generation and compares decoded instants.
Accuracy compare_paths(Generator& gen, uint64_t pairs);

// Counts tokens from both paths that pass is_valid_token and contain no
// '+', '/' or '='.
uint64_t count_well_formed(Generator& gen, uint64_t per_path);

} // namespace bench
} // namespace tsid
