#include "constants.hpp"
#include "primes.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <stdexcept>

namespace shaforge {

using boost::multiprecision::cpp_int;

static const RoundConstants kPublished = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
}};

static const HashState hPublished = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
}};

// floor(n^(1/k)), Newton iteration starting above the root
static cpp_int integerRoot(const cpp_int& n, unsigned k) {
    if (n < 2) return n;
    unsigned bits = boost::multiprecision::msb(n) + 1;
    cpp_int x = cpp_int(1) << ((bits + k - 1) / k);
    while (true) {
        cpp_int y = (x * (k - 1) + n / boost::multiprecision::pow(x, k - 1)) / k;
        if (y >= x) return x;
        x = y;
    }
}

// Low 32 bits of floor(p^(1/k) * 2^32) == floor(frac(p^(1/k)) * 2^32)
static Word rootFractionBits(std::uint64_t p, unsigned k) {
    if (p == 0) throw std::invalid_argument("root of zero has no fractional part to extract");
    cpp_int scaled = cpp_int(p) << (32 * k);
    cpp_int low = integerRoot(scaled, k) & cpp_int(0xffffffffu);
    return low.convert_to<Word>();
}

Word cubeRootFractionBits(std::uint64_t p) {
    return rootFractionBits(p, 3);
}

Word squareRootFractionBits(std::uint64_t p) {
    return rootFractionBits(p, 2);
}

Word fractionalBits(const HighPrecision& x) {
    if (x <= 0) throw std::invalid_argument("fractionalBits: value must be positive");
    HighPrecision frac = x - floor(x);
    HighPrecision scaled = floor(frac * HighPrecision(4294967296.0));
    return static_cast<Word>(scaled.convert_to<std::uint64_t>());
}

static RoundConstants deriveRoundConstants() {
    RoundConstants k{};
    PrimeStream primes(k.size());
    for (auto& w : k)
        w = cubeRootFractionBits(primes.next());
    return k;
}

static HashState deriveInitialHashValues() {
    HashState h{};
    PrimeStream primes(h.size());
    for (auto& w : h)
        w = squareRootFractionBits(primes.next());
    return h;
}

const RoundConstants& roundConstants() {
    static const RoundConstants k = deriveRoundConstants();
    return k;
}

const HashState& initialHashValues() {
    static const HashState h = deriveInitialHashValues();
    return h;
}

const RoundConstants& publishedRoundConstants() {
    return kPublished;
}

const HashState& publishedInitialHashValues() {
    return hPublished;
}

} // namespace shaforge
