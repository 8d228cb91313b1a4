#include "config.hpp"

#include "logger.hpp"
#include "util.hpp"

#include <fstream>
#include <stdexcept>

namespace tsid {

namespace {

// std::stoull quietly wraps "-1", and both parsers stop at trailing junk.
uint64_t to_u64(const std::string& v) {
    if (!v.empty() && v[0] == '-') throw std::invalid_argument("negative value '" + v + "'");
    size_t used = 0;
    uint64_t n = static_cast<uint64_t>(std::stoull(v, &used));
    if (used != v.size()) throw std::invalid_argument("not a number '" + v + "'");
    return n;
}

int64_t to_i64(const std::string& v) {
    size_t used = 0;
    int64_t n = static_cast<int64_t>(std::stoll(v, &used));
    if (used != v.size()) throw std::invalid_argument("not a number '" + v + "'");
    return n;
}

} // namespace

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "failed to open config: " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "bad config line " + std::to_string(lineno) + ": missing '='";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        auto bad_value = [&](const std::string& why) {
            err = "bad config value at line " + std::to_string(lineno) + ": " + why;
            return false;
        };

        try {
            if (key == "log_file") out.log_file = val;
            else if (key == "log_level") {
                LogLevel lvl = LogLevel::INFO;
                if (!parse_level(val, lvl)) return bad_value("invalid log level '" + val + "'");
                out.log_level = val;
            }
            else if (key == "cli_enabled") {
                bool b = false;
                if (!parse_bool(val, b)) return bad_value("invalid bool");
                out.cli_enabled = b;
            }
            else if (key == "fast") {
                bool b = false;
                if (!parse_bool(val, b)) return bad_value("invalid bool");
                out.fast = b;
            }

            else if (key == "bench_runs") out.bench_runs = to_u64(val);
            else if (key == "bench_warmup") out.bench_warmup = to_u64(val);
            else if (key == "bench_batch_runs") out.bench_batch_runs = to_u64(val);
            else if (key == "bench_batch_size") out.bench_batch_size = to_i64(val);
            else if (key == "bench_threads") {
                out.bench_threads = static_cast<size_t>(to_u64(val));
                if (out.bench_threads == 0) return bad_value("bench_threads must be > 0");
            }
            else {
                err = "unknown config key at line " + std::to_string(lineno) + ": " + key;
                return false;
            }
        } catch (const std::exception& e) {
            return bad_value(e.what());
        }
    }

    return true;
}

} // namespace tsid
