#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "clock.hpp"
#include "error.hpp"

namespace tsid {

class Logger;

// Both strategies produce identical tokens from the same clock state.
enum class Strategy {
    standard,
    fast
};

struct BatchOptions {
    bool fast = false;
};

static constexpr int64_t kMinBatch = 1;
static constexpr int64_t kMaxBatch = 10000;

struct ModuleInfo {
    const char* name;
    const char* version;
    const char* format;
    const char* precision;
    unsigned bit_length;
    unsigned output_length;
    std::vector<std::string> features;
};

const ModuleInfo& module_info();

// Issues tokens from a MonotonicClock. The clock may be owned by the
// generator or shared with others by reference; either way every token from
// the same clock is strictly newer than the previous one.
class Generator {
public:
    explicit Generator(const TimeSource& src, Logger* logger = nullptr);
    explicit Generator(MonotonicClock& clock, Logger* logger = nullptr);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    Result<std::string> generate(Strategy s = Strategy::standard);
    Result<std::string> generate_fast() { return generate(Strategy::fast); }

    // count must be in [kMinBatch, kMaxBatch].
    Result<std::vector<std::string>> generate_batch(int64_t count, BatchOptions opts = {});

    // wall now - decoded instant. Negative for tokens issued ahead of the
    // wall clock, which is expected under load.
    Result<int64_t> token_age(std::string_view token) const;

    MonotonicClock& clock() { return *clock_; }

private:
    std::unique_ptr<MonotonicClock> own_;
    MonotonicClock* clock_;
    Logger* logger_;
};

// Process-wide generator on the system clock.
Generator& default_generator();

Result<std::string> generate();
Result<std::string> generate_fast();
Result<std::vector<std::string>> generate_batch(int64_t count, BatchOptions opts = {});
Result<int64_t> token_age(std::string_view token);

} // namespace tsid
