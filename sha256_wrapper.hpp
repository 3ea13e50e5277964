#pragma once
#include <vector>
#include <cstdint>
#include "digest.hpp"

namespace shaforge {

// SHA-256 computed by OpenSSL, the trusted reference
Digest referenceSha256(const std::vector<uint8_t>& data);

// True if hash(data) equals OpenSSL's digest
bool matchesReference(const std::vector<uint8_t>& data);

} // namespace shaforge
