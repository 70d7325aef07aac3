// nth_prime_cli.cpp
// Command-line front end for nthprime::nth_prime.
//
// Usage:
//   ./nth_prime                       (default n = 10000, the 10 001st prime)
//   ./nth_prime 1000000               (zero-indexed rank)
//   ./nth_prime 1000000 65536         (rank, segment size)

#include "nth_prime.hpp"
#include "bound_estimator.hpp"
#include <iostream>
#include <string>
#include <chrono>
#include <cstdint>
#include <stdexcept>

// Parse a whole decimal argument; false on junk or overflow.
static bool parse_int64(const std::string& s, int64_t& out) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used, 10);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    // -------------------------------------------------------
    // Configuration — defaults, overridden by argv
    // -------------------------------------------------------
    int64_t  n            = 10'000;
    uint64_t segment_size = nthprime::MAX_SEGMENT_SIZE;

    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [n] [segment_size]\n";
        return 1;
    }

    if (argc > 1 && !parse_int64(argv[1], n)) {
        std::cerr << "Error: invalid rank '" << argv[1] << "'\n";
        return 1;
    }

    if (argc > 2) {
        int64_t s = 0;
        if (!parse_int64(argv[2], s) || s < 0) {
            std::cerr << "Error: invalid segment size '" << argv[2] << "'\n";
            return 1;
        }
        segment_size = (uint64_t)s;
    }

    auto t0 = std::chrono::high_resolution_clock::now();

    uint64_t p = 0;
    try {
        p = nthprime::nth_prime(n, segment_size);
    } catch (const nthprime::InvalidArgument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const nthprime::BoundExceeded& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    std::cout << "nth_prime(" << n << ") = " << p << "\n";

    std::cout << "\n--- Details ---\n";
    std::cout << "Upper limit  : "
              << (n == 0 ? 2 : nthprime::estimate_upper_bound((uint64_t)n + 1))
              << "\n";
    std::cout << "Segment size : " << segment_size << "\n";
    std::cout << "Total time   : " << ms << " ms\n";

    return 0;
}
