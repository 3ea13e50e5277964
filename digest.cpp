#include "digest.hpp"
#include "constants.hpp"
#include "message_schedule.hpp"
#include "sha256_compress.hpp"

namespace shaforge {

Digest hash(const uint8_t* data, std::size_t len) {
    const RoundConstants& k = roundConstants();
    HashState state = initialHashValues();

    for (const Block& block : segment(pad(data, len)))
        state = compressBlock(state, expand(block), k);

    Digest out;
    for (int i = 0; i < 8; ++i) {
        out[i*4 + 0] = (state[i] >> 24) & 0xff;
        out[i*4 + 1] = (state[i] >> 16) & 0xff;
        out[i*4 + 2] = (state[i] >> 8) & 0xff;
        out[i*4 + 3] = (state[i] >> 0) & 0xff;
    }
    return out;
}

Digest hash(const std::vector<uint8_t>& message) {
    return hash(message.data(), message.size());
}

Digest hash(const std::string& bytes) {
    return hash(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

Digest hashDouble(const std::vector<uint8_t>& message) {
    Digest first = hash(message);
    return hash(first.data(), first.size());
}

std::string digestToHex(const Digest& digest) {
    const char hexmap[] = "0123456789abcdef";
    std::string s;
    s.reserve(kDigestBytes * 2);
    for (auto b : digest) {
        s += hexmap[(b >> 4) & 0xF];
        s += hexmap[b & 0xF];
    }
    return s;
}

std::string hashHex(const std::string& bytes) {
    return digestToHex(hash(bytes));
}

} // namespace shaforge
