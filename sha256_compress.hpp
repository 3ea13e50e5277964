#ifndef SHAFORGE_SHA256_COMPRESS_HPP
#define SHAFORGE_SHA256_COMPRESS_HPP

#include "constants.hpp"
#include "message_schedule.hpp"

namespace shaforge {

// Run the 64 compression rounds over one expanded block
// Input:
//   state: hash state before this block (a..h)
//   schedule: W[0..63] of the block
//   constants: K[0..63]
// Output:
//   state after this block, the rounds' registers added word-wise onto the input
HashState compressBlock(const HashState& state, const Schedule& schedule, const RoundConstants& constants);

// Expand and compress a single 64-byte block with the shared round constants
void sha256_compress(const Block& block, HashState& state);

} // namespace shaforge

#endif // SHAFORGE_SHA256_COMPRESS_HPP
