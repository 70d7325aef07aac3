// nth_prime.hpp
// n-th prime (zero-indexed: nth_prime(0) == 2) by segmented sieve.
// Peak memory is one segment of at most max_segment_size bits,
// whatever the rank.

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nthprime {

// Default chunk size for the search. Results do not depend on it.
constexpr uint64_t MAX_SEGMENT_SIZE = 1'000'000;

// Negative rank, or a zero segment size.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

// The estimated limit was exhausted before reaching the rank.
// No retry with a larger limit is attempted.
class BoundExceeded : public std::runtime_error {
public:
    BoundExceeded(int64_t rank, uint64_t upper_limit);

    int64_t  rank()        const { return rank_; }
    uint64_t upper_limit() const { return upper_limit_; }

private:
    int64_t  rank_;
    uint64_t upper_limit_;
};

// -------------------------------------------------------
// Value of the n-th prime. The search covers [0, L] where
// L = estimate_upper_bound(n + 1), in chunks of at most
// max_segment_size integers.
//
// Throws InvalidArgument if n < 0 or max_segment_size == 0,
// BoundExceeded if the prime is not found within L, or if L
// does not fit in 64 bits.
// -------------------------------------------------------
uint64_t nth_prime(int64_t n, uint64_t max_segment_size = MAX_SEGMENT_SIZE);

} // namespace nthprime
