// segmented_sieve.cpp
// Segment-local Sieve of Eratosthenes. Segments are produced in
// increasing offset order by the orchestrator, but each call is
// self-contained: divisors below the segment are taken from the
// integers directly, not from earlier segments.

#include "segmented_sieve.hpp"
#include <algorithm>

namespace nthprime {

Segment sieve_segment(uint64_t offset, uint64_t length) {
    Segment segment(offset, length);
    uint64_t high = offset + length;   // exclusive

    // Handle 0 and 1 explicitly
    if (offset == 0) segment.clear(0);
    if (offset <= 1 && high > 1) segment.clear(1 - offset);

    for (uint64_t i = 2; i * i < high; i++) {
        // i lies in this segment and is already known composite:
        // its prime factors have cleared everything it would.
        if (i >= offset && !segment.test(i - offset))
            continue;

        // First multiple of i in the segment, never below i*i
        uint64_t first = std::max(i * i, ((offset + i - 1) / i) * i);

        for (uint64_t j = first - offset; j < length; j += i)
            segment.clear(j);
    }

    return segment;
}

} // namespace nthprime
