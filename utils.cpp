#include "utils.hpp"
#include <sstream>
#include <iomanip>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <cctype>

namespace shaforge {

std::vector<uint8_t> hexToBytes(const std::string& hex) {
    std::vector<uint8_t> bytes;
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        unsigned char high = static_cast<unsigned char>(hex[i]);
        unsigned char low = static_cast<unsigned char>(hex[i + 1]);
        if (!std::isxdigit(high) || !std::isxdigit(low)) {
            throw std::invalid_argument("hex string contains non-hex characters");
        }
        uint8_t byte = static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

std::string bytesToHex(const std::vector<uint8_t>& bytes) {
    static const char hexmap[] = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s += hexmap[b >> 4];
        s += hexmap[b & 0xF];
    }
    return s;
}

std::string toHex(uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open file: " + path);

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw std::runtime_error("Read error on file: " + path);
    return data;
}

} // namespace shaforge
