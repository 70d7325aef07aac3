// nth_prime.cpp
// Drives the search: one bound estimate, then sieve and scan
// segment by segment until the rank is reached.

#include "nth_prime.hpp"
#include "bound_estimator.hpp"
#include "segmented_sieve.hpp"
#include "segment_scanner.hpp"
#include <algorithm>

namespace nthprime {

BoundExceeded::BoundExceeded(int64_t rank, uint64_t upper_limit)
    : std::runtime_error(std::to_string(rank) +
                         "th prime not found within calculated upper limit " +
                         std::to_string(upper_limit))
    , rank_(rank)
    , upper_limit_(upper_limit)
{}

uint64_t nth_prime(int64_t n, uint64_t max_segment_size) {
    if (n < 0)
        throw InvalidArgument("n must be non-negative, got " + std::to_string(n));
    if (max_segment_size == 0)
        throw InvalidArgument("segment size must be positive");

    if (n == 0) return 2;

    const uint64_t rank        = (uint64_t)n;
    const uint64_t upper_limit = estimate_upper_bound(rank + 1);

    // [0, upper_limit] would not be addressable
    if (upper_limit == UNBOUNDED_LIMIT)
        throw BoundExceeded(n, upper_limit);

    // The limit itself is a candidate: for small ranks it is the prime 11.
    const uint64_t search_end = upper_limit + 1;

    uint64_t prime_count = 0;
    uint64_t offset      = 0;

    while (offset < search_end) {
        uint64_t length  = std::min(search_end - offset, max_segment_size);
        Segment  segment = sieve_segment(offset, length);

        auto found = find_target_in_segment(segment, rank - prime_count);
        if (found)
            return *found;

        prime_count += segment.count();
        offset      += length;
    }

    throw BoundExceeded(n, upper_limit);
}

} // namespace nthprime
