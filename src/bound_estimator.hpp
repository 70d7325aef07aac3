// bound_estimator.hpp
// Upper limit for the search of the n-th prime (1-indexed),
// from the prime number theorem:
//   p_n < n * (ln n + ln ln n)   for n >= 6   (Rosser)
// https://en.wikipedia.org/wiki/Prime_number_theorem#Approximations_for_the_nth_prime_number

#pragma once
#include <cstdint>

namespace nthprime {

// Below this rank the approximation is unreliable.
constexpr uint64_t SMALL_RANK_CUTOFF = 6;

// Fixed limit for n < SMALL_RANK_CUTOFF (the fifth prime).
constexpr uint64_t SMALL_RANK_BOUND = 11;

// Returned when the estimate does not fit in 64 bits.
constexpr uint64_t UNBOUNDED_LIMIT = UINT64_MAX;

// Limit guaranteed to be >= the n-th prime, counting from 1.
uint64_t estimate_upper_bound(uint64_t n);

} // namespace nthprime
