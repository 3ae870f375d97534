#include "cmdtree/timing.hpp"
#include <time.h>

namespace cmdtree {

// Get a timestamp in nanoseconds.
uint64_t get_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

} // namespace cmdtree
