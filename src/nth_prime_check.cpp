// nth_prime_check.cpp
// Verifies nth_prime(n) for every rank in [0, max_n].
// Uses GMP to build the reference sequence + OpenMP for parallelism.
// Each thread checks different ranks; every call to nth_prime is
// itself sequential and independent.
//
// Usage:
//   ./nth_prime_check                     (default max_n = 100000)
//   ./nth_prime_check 20000               (ranks 0..20000)
//   ./nth_prime_check 20000 10            (with segment size 10)

#include "nth_prime.hpp"
#include <gmp.h>
#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <atomic>
#include <stdexcept>
#include <new>
#include <omp.h>

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

// -------------------------------------------------------
// Reference primes p_0 .. p_max_n via mpz_nextprime.
// -------------------------------------------------------
std::vector<uint64_t> reference_primes(uint64_t max_n) {
    std::vector<uint64_t> primes;
    primes.reserve(max_n + 1);

    mpz_t p;
    mpz_init_set_ui(p, 1);

    for (uint64_t k = 0; k <= max_n; k++) {
        mpz_nextprime(p, p);
        primes.push_back(mpz_get_ui(p));
    }

    mpz_clear(p);
    return primes;
}

int main(int argc, char* argv[]) {
    // -------------------------------------------------------
    // Configuration — change these or pass them on the command line
    // -------------------------------------------------------
    uint64_t max_n        = 100'000;
    uint64_t segment_size = nthprime::MAX_SEGMENT_SIZE;

    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [max_n] [segment_size]\n";
        return 1;
    }

    for (int i = 1; i < argc; i++) {
        int64_t v = 0;
        if (!parse_int64(argv[i], v) || v < 0) {
            std::cerr << "Error: invalid argument '" << argv[i] << "'\n"
                      << "Usage: " << argv[0] << " [max_n] [segment_size]\n";
            return 1;
        }
        if (i == 1) max_n        = (uint64_t)v;
        else        segment_size = (uint64_t)v;
    }

    std::cout << "Building reference primes for ranks 0.." << max_n << "...\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    std::vector<uint64_t> expected;
    try {
        expected = reference_primes(max_n);
    } catch (const std::length_error&) {
        std::cerr << "Error: max_n " << max_n << " is too large\n";
        return 1;
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: out of memory for " << max_n << " reference primes\n";
        return 1;
    }
    auto t1 = std::chrono::high_resolution_clock::now();
    double ref_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    std::cout << "Checking nth_prime using "
              << omp_get_max_threads()
              << " threads (segment size " << segment_size << ")...\n";

    // -------------------------------------------------------
    // Parallel check across ranks.
    //
    // Each thread gets its own GMP variable for the primality
    // cross-check -- mpz_t objects are never shared.
    //
    // The first mismatch is recorded through failed_flag;
    // other threads stop doing work once it is set.
    // -------------------------------------------------------
    std::atomic<bool>     failed_flag(false);
    std::atomic<uint64_t> checked(0);
    int64_t     bad_rank = -1;
    uint64_t    bad_got  = 0;
    std::string bad_error;

    auto t2 = std::chrono::high_resolution_clock::now();

    #pragma omp parallel
    {
        mpz_t q_local;
        mpz_init(q_local);

        #pragma omp for schedule(dynamic, 64)
        for (int64_t n = 0; n <= (int64_t)max_n; n++) {
            if (failed_flag.load(std::memory_order_relaxed)) continue;

            uint64_t    got = 0;
            std::string error;
            try {
                got = nthprime::nth_prime(n, segment_size);
            } catch (const std::exception& e) {
                error = e.what();
            }

            bool ok = error.empty() && got == expected[n];
            if (ok) {
                mpz_set_ui(q_local, got);
                ok = mpz_probab_prime_p(q_local, 25) > 0;
            }

            if (ok) {
                checked.fetch_add(1, std::memory_order_relaxed);
            } else if (!failed_flag.exchange(true)) {
                // Only the first failing thread writes the report
                #pragma omp critical
                {
                    bad_rank  = n;
                    bad_got   = got;
                    bad_error = error;
                }
            }
        }

        mpz_clear(q_local);
    }

    auto t3 = std::chrono::high_resolution_clock::now();
    double check_ms = std::chrono::duration<double, std::milli>(t3 - t2).count();

    // -------------------------------------------------------
    // Summary
    // -------------------------------------------------------
    std::cout << "\n--- Summary ---\n";
    std::cout << "Ranks checked        : " << checked.load() << "\n";
    std::cout << "Threads used         : " << omp_get_max_threads() << "\n";
    std::cout << "Reference time       : " << ref_ms << " ms\n";
    std::cout << "Check time           : " << check_ms << " ms\n";

    if (failed_flag.load()) {
        std::cout << "\nFAIL at n = " << bad_rank << ": ";
        if (!bad_error.empty())
            std::cout << bad_error << "\n";
        else
            std::cout << "got " << bad_got
                      << ", expected " << expected[bad_rank] << "\n";
        return 1;
    }

    std::cout << "\nAll ranks up to " << max_n << " match the reference. ✓\n";
    return 0;
}
