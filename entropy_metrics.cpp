#include "entropy_metrics.hpp"
#include <algorithm>
#include <bitset>
#include <cmath>

namespace shaforge {
namespace entropy {

std::vector<bool> bytes_to_bits(const std::vector<uint8_t>& bytes) {
    std::vector<bool> bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t byte : bytes) {
        for (int i = 7; i >= 0; --i) {
            bits.push_back((byte >> i) & 1);
        }
    }
    return bits;
}

int hamming_distance(const Digest& a, const Digest& b) {
    int dist = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        dist += static_cast<int>(std::bitset<8>(a[i] ^ b[i]).count());
    }
    return dist;
}

double shannon_entropy(const std::vector<bool>& bits) {
    if (bits.empty()) return 0.0;
    std::size_t count1 = std::count(bits.begin(), bits.end(), true);
    std::size_t count0 = bits.size() - count1;

    double p0 = static_cast<double>(count0) / bits.size();
    double p1 = static_cast<double>(count1) / bits.size();

    double entropy = 0.0;
    if (p0 > 0.0) entropy -= p0 * std::log2(p0);
    if (p1 > 0.0) entropy -= p1 * std::log2(p1);

    return entropy;
}

AvalancheReport avalanche_profile(const std::vector<uint8_t>& message, std::size_t maxFlips) {
    AvalancheReport report;
    std::size_t flips = std::min(maxFlips, message.size() * 8);
    if (flips == 0) return report;

    Digest base = hash(message);
    std::vector<uint8_t> flipped = message;
    long total = 0;
    report.minFlippedBits = static_cast<int>(kDigestBytes * 8);

    for (std::size_t bit = 0; bit < flips; ++bit) {
        uint8_t mask = static_cast<uint8_t>(0x80 >> (bit % 8));
        flipped[bit / 8] ^= mask;
        int dist = hamming_distance(base, hash(flipped));
        flipped[bit / 8] ^= mask;

        total += dist;
        report.minFlippedBits = std::min(report.minFlippedBits, dist);
        report.maxFlippedBits = std::max(report.maxFlippedBits, dist);
    }

    report.trials = flips;
    report.meanFlippedBits = static_cast<double>(total) / flips;
    report.meanRatio = report.meanFlippedBits / (kDigestBytes * 8);
    return report;
}

} // namespace entropy
} // namespace shaforge
