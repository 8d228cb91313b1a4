#include "generator.hpp"

#include "codec.hpp"
#include "logger.hpp"
#include "time_source.hpp"

namespace tsid {

const ModuleInfo& module_info() {
    static const ModuleInfo info{
        "timestamp-48bit",
        "1.0.0",
        "Base64URL",
        "millisecond",
        48,
        static_cast<unsigned>(kTokenLength),
        {"encode", "decode", "batch", "validate", "age", "fast"},
    };
    return info;
}

Generator::Generator(const TimeSource& src, Logger* logger)
    : own_(std::make_unique<MonotonicClock>(src, logger)),
      clock_(own_.get()),
      logger_(logger) {}

Generator::Generator(MonotonicClock& clock, Logger* logger)
    : clock_(&clock), logger_(logger) {}

Result<std::string> Generator::generate(Strategy s) {
    auto instant = clock_->next_instant();
    if (!instant) return instant.error();
    if (s == Strategy::fast) return encode_fast(instant.value());
    return encode(instant.value());
}

Result<std::vector<std::string>> Generator::generate_batch(int64_t count, BatchOptions opts) {
    if (count < kMinBatch || count > kMaxBatch) {
        if (logger_) logger_->warn("generate_batch rejected count " + std::to_string(count));
        return make_error(Errc::invalid_argument,
                          "count must be an integer between " + std::to_string(kMinBatch) +
                              " and " + std::to_string(kMaxBatch) + ", got " +
                              std::to_string(count));
    }

    const Strategy s = opts.fast ? Strategy::fast : Strategy::standard;
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) {
        auto tok = generate(s);
        if (!tok) return tok.error();
        out.push_back(std::move(tok.value()));
    }
    if (logger_ && logger_->enabled(LogLevel::DEBUG)) {
        logger_->debug("generated batch of " + std::to_string(count) +
                       (opts.fast ? " (fast)" : " (standard)") + " " + out.front() +
                       ".." + out.back());
    }
    return Result<std::vector<std::string>>(std::move(out));
}

Result<int64_t> Generator::token_age(std::string_view token) const {
    auto instant = decode(token);
    if (!instant) return instant.error();
    const int64_t now = clock_->time_source().now_ms();
    if (now < 0) {
        return make_error(Errc::clock_unavailable, "wall clock returned " + std::to_string(now));
    }
    return now - static_cast<int64_t>(instant.value());
}

Generator& default_generator() {
    static Generator gen(system_time_source());
    return gen;
}

Result<std::string> generate() {
    return default_generator().generate();
}

Result<std::string> generate_fast() {
    return default_generator().generate_fast();
}

Result<std::vector<std::string>> generate_batch(int64_t count, BatchOptions opts) {
    return default_generator().generate_batch(count, opts);
}

Result<int64_t> token_age(std::string_view token) {
    return default_generator().token_age(token);
}

} // namespace tsid
