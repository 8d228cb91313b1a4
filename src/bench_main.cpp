#include <cstdio>
#include <iostream>
#include <string>

#include "bench.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "console.hpp"
#include "generator.hpp"
#include "logger.hpp"
#include "time_source.hpp"

using namespace tsid;

namespace {

std::string rule(char c) { return std::string(60, c); }

std::string fixed(double v, int prec) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
    return buf;
}

} // namespace

int main(int argc, char** argv) {
    Config cfg;
    if (argc == 2) {
        std::string err;
        if (!load_config(argv[1], cfg, err)) {
            std::cerr << err << "\n";
            return 2;
        }
    } else if (argc > 2) {
        std::cout << "Usage:\n  " << argv[0] << " [config_path]\n";
        return 2;
    }

    LogLevel level = LogLevel::INFO;
    if (!parse_level(cfg.log_level, level)) {
        std::cerr << "invalid log_level: " << cfg.log_level << "\n";
        return 2;
    }
    Logger logger;
    logger.set_level(level);
    if (!cfg.log_file.empty() && !logger.open(cfg.log_file)) {
        std::cerr << "failed to open log file: " << cfg.log_file << "\n";
        return 2;
    }

    Console console;
    Generator gen(system_time_source(), &logger);
    logger.info("benchmark started runs=" + std::to_string(cfg.bench_runs) +
                " threads=" + std::to_string(cfg.bench_threads));

    console.println(rule('='));
    console.println("Single operation");
    console.println(rule('-'));

    auto standard = bench::measure("generate()", [&]{ (void)gen.generate(); },
                                   cfg.bench_runs, cfg.bench_warmup);
    console.println(bench::format(standard));
    auto fast = bench::measure("generate_fast()", [&]{ (void)gen.generate_fast(); },
                               cfg.bench_runs, cfg.bench_warmup);
    console.println(bench::format(fast));
    if (standard.ops_per_sec > 0) {
        console.println("fast path: " + fixed((fast.ops_per_sec / standard.ops_per_sec - 1) * 100, 1) +
                        "% vs standard");
    }

    console.println("");
    console.println("Decode");
    console.println(rule('-'));
    auto sample = gen.generate();
    if (!sample) {
        std::cerr << "generate failed: " << sample.error().to_string() << "\n";
        return 1;
    }
    const std::string token = sample.value();
    console.println(bench::format(bench::measure("decode()", [&]{ (void)decode(token); },
                                                 cfg.bench_runs, cfg.bench_warmup)));

    console.println("");
    console.println("Batch generation");
    console.println(rule('-'));
    const std::string n = std::to_string(cfg.bench_batch_size);
    for (bool f : {false, true}) {
        BatchOptions opts;
        opts.fast = f;
        auto first_batch = gen.generate_batch(cfg.bench_batch_size, opts);
        if (!first_batch) {
            std::cerr << "generate_batch failed: " << first_batch.error().to_string() << "\n";
            return 1;
        }
        std::string name = "generate_batch(" + n + ", {fast: " + (f ? "true" : "false") + "})";
        console.println(bench::format(bench::measure(
            name, [&]{ (void)gen.generate_batch(cfg.bench_batch_size, opts); },
            cfg.bench_batch_runs, cfg.bench_warmup / 100)));
    }

    console.println("");
    console.println("Threaded generation");
    console.println(rule('-'));
    auto threaded = bench::run_threaded(gen, Strategy::standard, cfg.bench_threads,
                                        cfg.bench_runs / cfg.bench_threads);
    console.println(bench::format(threaded.stats));
    console.println("  distinct:       " + std::to_string(threaded.distinct) + "/" +
                    std::to_string(threaded.tokens));
    console.println("  inversions:     " + std::to_string(threaded.inversions));

    console.println("");
    console.println("Accuracy");
    console.println(rule('-'));
    auto acc = bench::compare_paths(gen, 1000);
    console.println("  average difference: " + fixed(acc.avg_diff_ms, 3) + "ms");
    console.println("  standard avg:       " + fixed(acc.avg_standard, 0));
    console.println("  fast avg:           " + fixed(acc.avg_fast, 0));

    console.println("");
    console.println("Format");
    console.println(rule('-'));
    uint64_t valid = bench::count_well_formed(gen, 1000);
    console.println("  valid formats: " + std::to_string(valid) + "/2000 (" +
                    fixed(static_cast<double>(valid) / 20.0, 1) + "%)");

    console.println(rule('='));

    bool ok = threaded.distinct == threaded.tokens && threaded.inversions == 0 &&
              threaded.failures == 0 && valid == 2000;
    logger.info(std::string("benchmark finished ") + (ok ? "ok" : "with invariant violations"));
    return ok ? 0 : 1;
}
