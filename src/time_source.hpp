#pragma once

#include <atomic>
#include <cstdint>

namespace tsid {

// Wall-clock reader. Negative readings mean the clock is unavailable.
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual int64_t now_ms() const = 0;
};

class SystemTimeSource final : public TimeSource {
public:
    int64_t now_ms() const override;
};

// Settable clock for tests and deterministic harnesses.
class ManualTimeSource final : public TimeSource {
public:
    explicit ManualTimeSource(int64_t start_ms = 0) : now_(start_ms) {}

    int64_t now_ms() const override { return now_.load(std::memory_order_acquire); }

    void set(int64_t ms) { now_.store(ms, std::memory_order_release); }
    void advance(int64_t delta_ms) { now_.fetch_add(delta_ms, std::memory_order_acq_rel); }

private:
    std::atomic<int64_t> now_;
};

// Process-wide system clock used by the default generator.
TimeSource& system_time_source();

} // namespace tsid
