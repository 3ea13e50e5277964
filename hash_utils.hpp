#pragma once
#include <array>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <string>
#include "digest.hpp"

namespace shaforge {

// Convert std::vector<uint8_t> of size 32 into a Digest
inline Digest toDigest(const std::vector<uint8_t>& vec) {
    if (vec.size() != kDigestBytes) {
        throw std::invalid_argument("Vector must be 32 bytes, got " + std::to_string(vec.size()));
    }
    Digest arr;
    std::copy(vec.begin(), vec.end(), arr.begin());
    return arr;
}

// Compare two digests (big-endian comparison)
// Returns:
//   -1 if a < b
//    0 if a == b
//    1 if a > b
inline int digestCompare(const Digest& a, const Digest& b) {
    for (size_t i = 0; i < kDigestBytes; ++i) {
        if (a[i] < b[i]) return -1;
        if (a[i] > b[i]) return 1;
    }
    return 0;
}

// Equality without an early exit, for checking candidates against a target digest
inline bool digestsEqual(const Digest& a, const Digest& b) {
    uint8_t diff = 0;
    for (size_t i = 0; i < kDigestBytes; ++i)
        diff |= a[i] ^ b[i];
    return diff == 0;
}

inline bool matchesTarget(const std::vector<uint8_t>& candidate, const Digest& target) {
    return digestsEqual(hash(candidate), target);
}

} // namespace shaforge
