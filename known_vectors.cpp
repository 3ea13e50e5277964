#include "known_vectors.hpp"
#include "digest.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace shaforge {

using json = nlohmann::json;

// Largest message a vector file may expand to
static const size_t kMaxVectorBytes = size_t(1) << 30;

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static TestVector parseEntry(const json& item, size_t index) {
    std::string where = "test vector #" + std::to_string(index);
    if (!item.is_object()) throw std::runtime_error(where + " is not an object");
    if (!item.contains("digest")) throw std::runtime_error(where + " has no 'digest'");

    TestVector v;
    std::vector<uint8_t> unit;
    try {
        v.name = item.value("name", where);
        if (item.contains("ascii")) {
            std::string text = item["ascii"].get<std::string>();
            unit.assign(text.begin(), text.end());
        } else if (item.contains("hex")) {
            unit = hexToBytes(item["hex"].get<std::string>());
        } else {
            throw std::runtime_error(where + " needs 'ascii' or 'hex'");
        }

        long repeat = item.value("repeat", 1L);
        if (repeat < 0) throw std::runtime_error(where + " has negative 'repeat'");
        size_t perUnit = unit.empty() ? 1 : unit.size();
        if (static_cast<unsigned long>(repeat) > kMaxVectorBytes / perUnit)
            throw std::runtime_error(where + " 'repeat' makes the message larger than " +
                                     std::to_string(kMaxVectorBytes) + " bytes");
        v.message.reserve(unit.size() * static_cast<size_t>(repeat));
        for (long r = 0; r < repeat; ++r)
            v.message.insert(v.message.end(), unit.begin(), unit.end());

        v.expectedHex = lowercase(item["digest"].get<std::string>());
    } catch (const json::exception& e) {
        throw std::runtime_error(where + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(where + ": " + e.what());
    }

    if (v.expectedHex.size() != kDigestBytes * 2)
        throw std::runtime_error(where + " digest must be 64 hex characters");
    return v;
}

std::vector<TestVector> parseTestVectors(const json& j) {
    if (!j.is_array()) throw std::runtime_error("test vectors JSON is not an array");

    std::vector<TestVector> vectors;
    for (size_t i = 0; i < j.size(); ++i)
        vectors.push_back(parseEntry(j[i], i));
    return vectors;
}

std::vector<TestVector> loadTestVectors(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("Failed to open test vector file: " + path);

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Test vector JSON parse error in " + path + ": " + e.what());
    }
    return parseTestVectors(j);
}

std::vector<std::string> checkTestVectors(const std::vector<TestVector>& vectors) {
    std::vector<std::string> failed;
    for (const auto& v : vectors) {
        std::string got = digestToHex(hash(v.message));
        if (got != v.expectedHex) {
            debugLog("vector '" + v.name + "' expected " + v.expectedHex + " got " + got);
            failed.push_back(v.name);
        }
    }
    return failed;
}

} // namespace shaforge
