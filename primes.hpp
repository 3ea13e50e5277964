#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace shaforge {

// First n primes in increasing order, starting at 2.
// Throws std::invalid_argument if n < 1.
std::vector<std::uint64_t> sieve(std::size_t n);

// Finite, restartable cursor over the first n primes
class PrimeStream {
public:
    explicit PrimeStream(std::size_t count) : primes(sieve(count)), pos(0) {}

    bool hasNext() const { return pos < primes.size(); }
    std::uint64_t next();
    void reset() { pos = 0; }
    std::size_t size() const { return primes.size(); }

private:
    std::vector<std::uint64_t> primes;
    std::size_t pos;
};

} // namespace shaforge
