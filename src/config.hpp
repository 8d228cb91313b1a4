#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tsid {

struct Config {
    // Logging
    std::string log_file = "tsid.log";
    std::string log_level = "info";

    // Tool
    bool cli_enabled = true;
    bool fast = false; // default generation strategy

    // Benchmark
    uint64_t bench_runs = 100000;
    uint64_t bench_warmup = 1000;
    uint64_t bench_batch_runs = 1000;
    int64_t bench_batch_size = 100;
    size_t bench_threads = 4;
};

// key = value lines, '#' comments. On failure err names the line.
bool load_config(const std::string& path, Config& out, std::string& err);

} // namespace tsid
