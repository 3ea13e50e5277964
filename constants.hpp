#pragma once
#include <array>
#include <cstdint>
#include <boost/multiprecision/cpp_bin_float.hpp>
#include "bit_ops.hpp"

namespace shaforge {

using RoundConstants = std::array<Word, 64>;
using HashState = std::array<Word, 8>;

// 100 decimal digits (~332 bits) of mantissa
using HighPrecision = boost::multiprecision::cpp_bin_float_100;

// floor(frac(x) * 2^32) for x > 0.
// Throws std::invalid_argument if x <= 0.
Word fractionalBits(const HighPrecision& x);

// First 32 fractional bits of cbrt(p) / sqrt(p), computed exactly with integer roots
Word cubeRootFractionBits(std::uint64_t p);
Word squareRootFractionBits(std::uint64_t p);

// K[0..63] from the cube roots of the first 64 primes. Derived once on first use.
const RoundConstants& roundConstants();

// H0[0..7] from the square roots of the first 8 primes. Derived once on first use.
const HashState& initialHashValues();

// FIPS 180-4 section 4.2.2 / 5.3.3 tables, used as golden data
const RoundConstants& publishedRoundConstants();
const HashState& publishedInitialHashValues();

} // namespace shaforge
