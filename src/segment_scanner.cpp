#include "segment_scanner.hpp"

namespace nthprime {

std::optional<uint64_t> find_target_in_segment(const Segment& segment,
                                               uint64_t target_index) {
    const uint64_t* words = segment.data();
    uint64_t remaining = target_index;

    for (uint64_t w = 0; w < segment.word_count(); w++) {
        uint64_t word = words[w];
        uint64_t primes_here = __builtin_popcountll(word);

        // Whole word passes before the target
        if (primes_here <= remaining) {
            remaining -= primes_here;
            continue;
        }

        // Drop the lowest `remaining` set bits; the target is the next one
        for (uint64_t k = 0; k < remaining; k++)
            word &= word - 1;

        uint64_t bit = __builtin_ctzll(word);
        return segment.offset() + w * 64 + bit;
    }

    return std::nullopt;
}

} // namespace nthprime
