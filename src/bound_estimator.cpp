#include "bound_estimator.hpp"
#include <cmath>

namespace nthprime {

uint64_t estimate_upper_bound(uint64_t n) {
    if (n < SMALL_RANK_CUTOFF)
        return SMALL_RANK_BOUND;

    double x     = (double)n;
    double limit = std::ceil(x * (std::log(x) + std::log(std::log(x))));

    // 2^64: not representable, saturate
    if (limit >= 18446744073709551616.0)
        return UNBOUNDED_LIMIT;
    return (uint64_t)limit;
}

} // namespace nthprime
