#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace shaforge {

using Word = std::uint32_t;

// Circular right rotation, 0 <= n < 32
inline Word rotateRight(Word x, unsigned n) {
    if (n >= 32) throw std::invalid_argument("rotateRight: amount out of range: " + std::to_string(n));
    if (n == 0) return x;
    return (x >> n) | (x << (32 - n));
}

// Logical right shift, zero filled, 0 <= n < 32
inline Word shiftRight(Word x, unsigned n) {
    if (n >= 32) throw std::invalid_argument("shiftRight: amount out of range: " + std::to_string(n));
    return x >> n;
}

// Per bit: y where x is set, z elsewhere
inline Word choose(Word x, Word y, Word z) {
    return (x & y) ^ (~x & z);
}

inline Word majority(Word x, Word y, Word z) {
    return (x & y) ^ (x & z) ^ (y & z);
}

// Three-way XOR. Not used by the compression round.
inline Word parity3(Word x, Word y, Word z) {
    return x ^ y ^ z;
}

inline Word littleSigma0(Word x) {
    return rotateRight(x, 7) ^ rotateRight(x, 18) ^ shiftRight(x, 3);
}

inline Word littleSigma1(Word x) {
    return rotateRight(x, 17) ^ rotateRight(x, 19) ^ shiftRight(x, 10);
}

inline Word bigSigma0(Word x) {
    return rotateRight(x, 2) ^ rotateRight(x, 13) ^ rotateRight(x, 22);
}

inline Word bigSigma1(Word x) {
    return rotateRight(x, 6) ^ rotateRight(x, 11) ^ rotateRight(x, 25);
}

} // namespace shaforge
