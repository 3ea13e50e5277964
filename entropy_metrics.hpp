#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include "digest.hpp"

namespace shaforge {
namespace entropy {

// Summary of output bit changes over single input bit flips
struct AvalancheReport {
    std::size_t trials = 0;
    double meanFlippedBits = 0.0;
    int minFlippedBits = 0;
    int maxFlippedBits = 0;
    double meanRatio = 0.0;   // meanFlippedBits / 256
};

// Convert a byte vector to a vector of bits, most significant bit first
std::vector<bool> bytes_to_bits(const std::vector<uint8_t>& bytes);

// Number of differing bits between two digests
int hamming_distance(const Digest& a, const Digest& b);

// Shannon entropy of a bit vector, 0..1
double shannon_entropy(const std::vector<bool>& bits);

// Flip each of the first maxFlips input bits in turn and measure the digest change
AvalancheReport avalanche_profile(const std::vector<uint8_t>& message, std::size_t maxFlips);

} // namespace entropy
} // namespace shaforge
