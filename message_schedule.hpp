#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "bit_ops.hpp"

namespace shaforge {

constexpr std::size_t kBlockBytes = 64;
constexpr std::size_t kLengthFieldBytes = 8;

using Block = std::array<uint8_t, kBlockBytes>;
using Schedule = std::array<Word, 64>;

// Message length in bits. Throws std::overflow_error if it does not fit in 64 bits.
std::uint64_t messageBitLength(std::size_t byteCount);

// Size in bytes of the padded message (always at least one byte more than the input)
std::size_t paddedLength(std::size_t byteCount);

// Appends 0x80, zero bytes, then the 64-bit big-endian bit length
// so that the result is a multiple of 64 bytes.
std::vector<uint8_t> pad(const std::vector<uint8_t>& message);
std::vector<uint8_t> pad(const uint8_t* data, std::size_t len);

// Splits a padded message into 64-byte blocks.
// Throws std::invalid_argument if the size is not a multiple of 64.
std::vector<Block> segment(const std::vector<uint8_t>& padded);

// W[0..15] big-endian words of the block, W[16..63] from the sigma recurrence
Schedule expand(const Block& block);

} // namespace shaforge
