#pragma once

#include <atomic>
#include <cstdint>

#include "error.hpp"
#include "time_source.hpp"

namespace tsid {

class Logger;

using Instant = uint64_t;

// Largest value that fits the 48-bit token (year ~10889). Readings past it
// are out of range and not guarded.
static constexpr Instant kMaxInstant = (Instant{1} << 48) - 1;

// Strictly increasing millisecond instants on top of a wall clock.
// If the wall clock has not moved past the last issued instant (same
// millisecond, or the clock stepped back) the next instant is last + 1, so
// issued instants can run ahead of real time under load.
// Safe to share between threads.
class MonotonicClock {
public:
    explicit MonotonicClock(const TimeSource& src, Logger* logger = nullptr);

    MonotonicClock(const MonotonicClock&) = delete;
    MonotonicClock& operator=(const MonotonicClock&) = delete;

    // Fails with clock_unavailable on a negative wall reading.
    Result<Instant> next_instant();

    Instant last_issued() const { return last_.load(std::memory_order_acquire); }

    // Rewinds the state. Not for use while other threads are generating.
    void reset(Instant value = 0);

    const TimeSource& time_source() const { return src_; }

private:
    void note_regression(int64_t wall);

    const TimeSource& src_;
    Logger* logger_;
    std::atomic<Instant> last_{0};
    std::atomic<int64_t> last_wall_{0};
};

} // namespace tsid
