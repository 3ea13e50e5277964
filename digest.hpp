#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace shaforge {

constexpr std::size_t kDigestBytes = 32;

using Digest = std::array<uint8_t, kDigestBytes>;

// SHA-256 of an arbitrary byte sequence. Stateless, safe to call concurrently.
// Throws std::overflow_error if the bit length does not fit in 64 bits.
Digest hash(const uint8_t* data, std::size_t len);
Digest hash(const std::vector<uint8_t>& message);

// Hashes the raw bytes held by the string, no transcoding
Digest hash(const std::string& bytes);

// SHA-256(SHA-256(message))
Digest hashDouble(const std::vector<uint8_t>& message);

std::string digestToHex(const Digest& digest);
std::string hashHex(const std::string& bytes);

} // namespace shaforge
