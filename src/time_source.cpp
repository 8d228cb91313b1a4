#include "time_source.hpp"

#include "util.hpp"

namespace tsid {

int64_t SystemTimeSource::now_ms() const {
    return wall_ms();
}

TimeSource& system_time_source() {
    static SystemTimeSource src;
    return src;
}

} // namespace tsid
