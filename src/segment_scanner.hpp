// segment_scanner.hpp
// Locates the k-th prime (zero-based) inside one sieved segment.

#pragma once
#include <cstdint>
#include <optional>
#include "segment.hpp"

namespace nthprime {

// -------------------------------------------------------
// Returns the absolute value of the prime that has exactly
// `target_index` primes before it in the segment, or nullopt
// if the segment holds target_index primes or fewer.
// -------------------------------------------------------
std::optional<uint64_t> find_target_in_segment(const Segment& segment,
                                               uint64_t target_index);

} // namespace nthprime
