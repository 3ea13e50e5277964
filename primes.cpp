#include "primes.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace shaforge {

// Upper bound on the n-th prime (Rosser), small n covered by a fixed table size
static std::size_t sieveLimit(std::size_t n) {
    if (n < 6) return 15;
    double x = static_cast<double>(n);
    return static_cast<std::size_t>(x * (std::log(x) + std::log(std::log(x)))) + 1;
}

std::vector<std::uint64_t> sieve(std::size_t n) {
    if (n < 1) throw std::invalid_argument("sieve: prime count must be at least 1");

    std::size_t limit = sieveLimit(n);
    std::vector<bool> composite(limit + 1, false);
    std::vector<std::uint64_t> primes;
    primes.reserve(n);

    for (std::size_t i = 2; i <= limit && primes.size() < n; ++i) {
        if (composite[i]) continue;
        primes.push_back(i);
        for (std::size_t j = i * i; j <= limit; j += i)
            composite[j] = true;
    }

    if (primes.size() < n)
        throw std::logic_error("sieve: limit too small for " + std::to_string(n) + " primes");
    return primes;
}

std::uint64_t PrimeStream::next() {
    if (!hasNext()) throw std::out_of_range("PrimeStream exhausted");
    return primes[pos++];
}

} // namespace shaforge
