#include "bench.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstdio>
#include <unordered_set>

#include "codec.hpp"

namespace tsid {
namespace bench {

std::vector<std::string> format(const Stats& s) {
    char buf[3][96];
    std::snprintf(buf[0], sizeof(buf[0]), "  total time:     %.2fms", s.total_ms);
    std::snprintf(buf[1], sizeof(buf[1]), "  ops/sec:        %.0f", s.ops_per_sec);
    std::snprintf(buf[2], sizeof(buf[2]), "  avg per op:     %.3fus", s.avg_us);
    return {s.name + ":", buf[0], buf[1], buf[2]};
}

ThreadedResult run_threaded(Generator& gen, Strategy s, size_t threads, uint64_t per_thread) {
    std::vector<std::vector<std::string>> out(threads);
    std::vector<size_t> failures(threads, 0);

    auto start = std::chrono::steady_clock::now();
    {
        boost::asio::thread_pool pool(threads);
        for (size_t t = 0; t < threads; ++t) {
            boost::asio::post(pool, [&gen, &out, &failures, s, t, per_thread]{
                auto& mine = out[t];
                mine.reserve(static_cast<size_t>(per_thread));
                for (uint64_t i = 0; i < per_thread; ++i) {
                    auto tok = gen.generate(s);
                    if (!tok) {
                        failures[t]++;
                        continue;
                    }
                    mine.push_back(std::move(tok.value()));
                }
            });
        }
        pool.join();
    }

    ThreadedResult r;
    r.stats.name = "threaded generate() x" + std::to_string(threads);
    r.stats.runs = per_thread * threads;
    r.stats.total_ms = elapsed_ms(start);
    if (r.stats.total_ms > 0) {
        r.stats.ops_per_sec = static_cast<double>(r.stats.runs) / (r.stats.total_ms / 1000.0);
    }
    if (r.stats.runs > 0) r.stats.avg_us = r.stats.total_ms * 1000.0 / static_cast<double>(r.stats.runs);

    std::unordered_set<std::string> seen;
    for (size_t t = 0; t < threads; ++t) {
        r.failures += failures[t];
        const auto& seq = out[t];
        for (size_t i = 0; i < seq.size(); ++i) {
            seen.insert(seq[i]);
            if (i > 0 && compare_tokens(seq[i-1], seq[i]) >= 0) r.inversions++;
        }
        r.tokens += seq.size();
    }
    r.distinct = seen.size();
    return r;
}

Accuracy compare_paths(Generator& gen, uint64_t pairs) {
    Accuracy a;
    double diff = 0, std_sum = 0, fast_sum = 0;
    for (uint64_t i = 0; i < pairs; ++i) {
        auto s = gen.generate(Strategy::standard);
        auto f = gen.generate(Strategy::fast);
        if (!s || !f) continue;
        auto ds = decode(s.value());
        auto df = decode(f.value());
        if (!ds || !df) continue;
        double vs = static_cast<double>(ds.value());
        double vf = static_cast<double>(df.value());
        std_sum += vs;
        fast_sum += vf;
        diff += vs > vf ? vs - vf : vf - vs;
        a.pairs++;
    }
    if (a.pairs > 0) {
        a.avg_diff_ms = diff / static_cast<double>(a.pairs);
        a.avg_standard = std_sum / static_cast<double>(a.pairs);
        a.avg_fast = fast_sum / static_cast<double>(a.pairs);
    }
    return a;
}

uint64_t count_well_formed(Generator& gen, uint64_t per_path) {
    uint64_t ok = 0;
    for (uint64_t i = 0; i < per_path; ++i) {
        for (Strategy s : {Strategy::standard, Strategy::fast}) {
            auto tok = gen.generate(s);
            if (!tok) continue;
            const std::string& t = tok.value();
            if (is_valid_token(t) && t.find_first_of("+/=") == std::string::npos) ok++;
        }
    }
    return ok;
}

} // namespace bench
} // namespace tsid
