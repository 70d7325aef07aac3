// segment.hpp
// Compact primality bitset for one sieve segment.
// Stores 1 bit per integer in [offset, offset + length).
//
// Encoding:
//   local index i  →  absolute value (offset + i)
//   bit for i      →  word i / 64, bit i % 64
//
// Memory usage: ~length/8 bytes, independent of the rank being searched
//   10^6 (default segment)  →  ~122 KB

#pragma once
#include <cstdint>
#include <vector>
#include <cassert>

namespace nthprime {

// -------------------------------------------------------
// Segment: primality flags for [offset, offset + length).
// Backed by a vector of uint64_t words.
// Bits past `length` in the last word are kept at 0, so
// count() can popcount whole words.
// -------------------------------------------------------
class Segment {
public:
    // All bits initialised to 1 (all assumed prime).
    // sieve_segment() clears the composites.
    Segment(uint64_t offset, uint64_t length)
        : offset_(offset)
        , length_(length)
        , words_((length + 63) / 64, ~0ULL)
    {
        if (length_ % 64 != 0)
            words_.back() = (1ULL << (length_ % 64)) - 1;
    }

    // -------------------------------------------------------
    // Core bit operations on local indices [0, length)
    // -------------------------------------------------------

    // Mark offset + i as prime
    void set(uint64_t i) {
        assert(i < length_ && "set: index out of segment");
        words_[i / 64] |= (1ULL << (i % 64));
    }

    // Mark offset + i as composite
    void clear(uint64_t i) {
        assert(i < length_ && "clear: index out of segment");
        words_[i / 64] &= ~(1ULL << (i % 64));
    }

    // Test if offset + i is prime
    bool test(uint64_t i) const {
        assert(i < length_ && "test: index out of segment");
        return (words_[i / 64] >> (i % 64)) & 1ULL;
    }

    // Primality of an absolute value; false outside the segment
    bool is_prime(uint64_t n) const {
        if (n < offset_ || n - offset_ >= length_) return false;
        return test(n - offset_);
    }

    // Number of primes in the segment
    uint64_t count() const {
        uint64_t total = 0;
        for (uint64_t w : words_)
            total += __builtin_popcountll(w);
        return total;
    }

    // -------------------------------------------------------
    // Accessors
    // -------------------------------------------------------
    uint64_t offset()      const { return offset_; }
    uint64_t length()      const { return length_; }
    uint64_t word_count()  const { return words_.size(); }
    const uint64_t* data() const { return words_.data(); }

    uint64_t memory_bytes() const {
        return words_.size() * sizeof(uint64_t);
    }

private:
    uint64_t offset_;
    uint64_t length_;
    std::vector<uint64_t> words_;
};

} // namespace nthprime
