#include "message_schedule.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace shaforge {

std::uint64_t messageBitLength(std::size_t byteCount) {
    if (static_cast<std::uint64_t>(byteCount) > std::numeric_limits<std::uint64_t>::max() / 8)
        throw std::overflow_error("message too long: bit length exceeds 64 bits");
    return static_cast<std::uint64_t>(byteCount) * 8;
}

std::size_t paddedLength(std::size_t byteCount) {
    messageBitLength(byteCount);
    if (byteCount > std::numeric_limits<std::size_t>::max() - (kLengthFieldBytes + kBlockBytes))
        throw std::overflow_error("message too long: padded size exceeds addressable memory");
    // 0x80 marker plus length field, rounded up to whole blocks
    return ((byteCount + 1 + kLengthFieldBytes + kBlockBytes - 1) / kBlockBytes) * kBlockBytes;
}

std::vector<uint8_t> pad(const uint8_t* data, std::size_t len) {
    std::uint64_t bitlen = messageBitLength(len);
    std::vector<uint8_t> padded(paddedLength(len), 0);

    if (len > 0)
        std::copy(data, data + len, padded.begin());
    padded[len] = 0x80;

    std::size_t tail = padded.size() - kLengthFieldBytes;
    for (int i = 0; i < 8; ++i)
        padded[tail + i] = static_cast<uint8_t>(bitlen >> (56 - 8 * i));

    return padded;
}

std::vector<uint8_t> pad(const std::vector<uint8_t>& message) {
    return pad(message.data(), message.size());
}

std::vector<Block> segment(const std::vector<uint8_t>& padded) {
    if (padded.size() % kBlockBytes != 0)
        throw std::invalid_argument("segment: padded size " + std::to_string(padded.size()) +
                                    " is not a multiple of 64");

    std::vector<Block> blocks(padded.size() / kBlockBytes);
    for (std::size_t b = 0; b < blocks.size(); ++b)
        std::copy_n(padded.begin() + b * kBlockBytes, kBlockBytes, blocks[b].begin());
    return blocks;
}

Schedule expand(const Block& block) {
    Schedule w;
    for (int i = 0; i < 16; i++) {
        w[i] = (Word(block[i*4]) << 24) |
               (Word(block[i*4 + 1]) << 16) |
               (Word(block[i*4 + 2]) << 8) |
               (Word(block[i*4 + 3]));
    }
    for (int i = 16; i < 64; i++) {
        w[i] = littleSigma1(w[i-2]) + w[i-7] + littleSigma0(w[i-15]) + w[i-16];
    }
    return w;
}

} // namespace shaforge
