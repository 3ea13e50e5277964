#include "sha256_wrapper.hpp"
#include "hash_utils.hpp"
#include <openssl/sha.h>

namespace shaforge {

static_assert(SHA256_DIGEST_LENGTH == kDigestBytes, "OpenSSL digest size mismatch");

Digest referenceSha256(const std::vector<uint8_t>& data) {
    Digest out;
    SHA256(data.data(), data.size(), out.data());
    return out;
}

bool matchesReference(const std::vector<uint8_t>& data) {
    return digestsEqual(hash(data), referenceSha256(data));
}

} // namespace shaforge
