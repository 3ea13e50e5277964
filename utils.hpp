#pragma once
#include <vector>
#include <string>
#include <cstdint>

namespace shaforge {

// Throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> hexToBytes(const std::string& hex);
std::string bytesToHex(const std::vector<uint8_t>& bytes);
std::string toHex(uint32_t value);

// Whole file as bytes. Throws std::runtime_error if it cannot be read.
std::vector<uint8_t> readFileBytes(const std::string& path);

} // namespace shaforge
