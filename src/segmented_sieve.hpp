// segmented_sieve.hpp
// Sieve of Eratosthenes over a single window [offset, offset + length).

#pragma once
#include <cstdint>
#include "segment.hpp"

namespace nthprime {

// -------------------------------------------------------
// Build the primality bitset for [offset, offset + length).
// length must be >= 1. Divisors are every i with
// i*i < offset + length; composites that fall inside the
// segment are skipped as divisors.
// -------------------------------------------------------
Segment sieve_segment(uint64_t offset, uint64_t length);

} // namespace nthprime
