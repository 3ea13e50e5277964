#pragma once
#include <vector>
#include <cstdint>
#include "digest.hpp"

namespace shaforge {

// Hash independent messages on up to `threads` workers.
// Output order matches input order. The first worker exception is rethrown.
std::vector<Digest> hashBatch(const std::vector<std::vector<uint8_t>>& messages, unsigned threads);

} // namespace shaforge
