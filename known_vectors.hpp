#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace shaforge {

// A message with its expected digest
struct TestVector {
    std::string name;
    std::vector<uint8_t> message;
    std::string expectedHex;
};

// Entries: {"name", "ascii" | "hex", "repeat" (optional, default 1), "digest"}
// Throws std::runtime_error on malformed entries.
std::vector<TestVector> parseTestVectors(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be read or parsed
std::vector<TestVector> loadTestVectors(const std::string& path);

// Names of vectors whose digest does not match
std::vector<std::string> checkTestVectors(const std::vector<TestVector>& vectors);

} // namespace shaforge
