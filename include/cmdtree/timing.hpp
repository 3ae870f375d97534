#ifndef CMDTREE_TIMING_HPP
#define CMDTREE_TIMING_HPP

#include <stdint.h>

namespace cmdtree {

// Get the current monotonic timestamp in nanoseconds
uint64_t get_timestamp_ns();

} // namespace cmdtree

#endif // CMDTREE_TIMING_HPP
