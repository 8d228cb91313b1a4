#include "clock.hpp"

#include "logger.hpp"

namespace tsid {

MonotonicClock::MonotonicClock(const TimeSource& src, Logger* logger)
    : src_(src), logger_(logger) {}

Result<Instant> MonotonicClock::next_instant() {
    const int64_t wall = src_.now_ms();
    if (wall < 0) {
        if (logger_) logger_->error("wall clock unavailable: reading " + std::to_string(wall));
        return make_error(Errc::clock_unavailable,
                          "wall clock returned " + std::to_string(wall));
    }
    note_regression(wall);

    const Instant now = static_cast<Instant>(wall);
    Instant last = last_.load(std::memory_order_acquire);
    Instant next = 0;
    do {
        next = now > last ? now : last + 1;
    } while (!last_.compare_exchange_weak(last, next,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire));
    return next;
}

void MonotonicClock::reset(Instant value) {
    last_.store(value, std::memory_order_release);
    last_wall_.store(0, std::memory_order_release);
}

void MonotonicClock::note_regression(int64_t wall) {
    int64_t prev = last_wall_.exchange(wall, std::memory_order_acq_rel);
    if (logger_ && prev - wall > 1) {
        logger_->warn("wall clock moved backwards by " + std::to_string(prev - wall) +
                      "ms; holding instants monotonic");
    }
}

} // namespace tsid
