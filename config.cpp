#include "config.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace shaforge {

using json = nlohmann::json;

Config defaultConfig() {
    Config cfg;
    unsigned hw = std::thread::hardware_concurrency();
    cfg.threads = hw > 0 ? hw : 1;
    return cfg;
}

template <typename T>
static T field(const json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    try {
        return j[key].get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
    }
}

// Non-negative integer no larger than maxValue; negatives and fractions are rejected
static std::uint64_t countField(const json& j, const char* key, std::uint64_t fallback, std::uint64_t maxValue) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    const json& v = j[key];
    if (!v.is_number_integer())
        throw std::runtime_error(std::string("config key '") + key + "': expected a non-negative integer");
    if (!v.is_number_unsigned() && v.get<std::int64_t>() < 0)
        throw std::runtime_error(std::string("config key '") + key + "': must not be negative");
    std::uint64_t n = v.get<std::uint64_t>();
    if (n > maxValue)
        throw std::runtime_error(std::string("config key '") + key + "': value " + std::to_string(n) + " too large");
    return n;
}

Config parseConfig(const json& j) {
    if (!j.is_object()) throw std::runtime_error("config must be a JSON object");

    Config cfg = defaultConfig();
    cfg.logFile = field<std::string>(j, "log_file", cfg.logFile);
    cfg.verbose = field<bool>(j, "verbose", cfg.verbose);
    cfg.crossCheck = field<bool>(j, "cross_check", cfg.crossCheck);
    cfg.selftestTrials = static_cast<std::size_t>(
        countField(j, "selftest_trials", cfg.selftestTrials, std::numeric_limits<std::size_t>::max()));
    cfg.vectorsFile = field<std::string>(j, "vectors_file", cfg.vectorsFile);

    unsigned threads = static_cast<unsigned>(
        countField(j, "threads", cfg.threads, std::numeric_limits<unsigned>::max()));
    cfg.threads = threads > 0 ? threads : 1;

    std::string output = field<std::string>(j, "output", "hex");
    if (output == "hex") {
        cfg.output = OutputFormat::Hex;
    } else if (output == "json") {
        cfg.output = OutputFormat::Json;
    } else {
        throw std::runtime_error("config key 'output': unknown format '" + output + "'");
    }
    return cfg;
}

Config loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("Failed to open config file: " + path);

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Config JSON parse error in " + path + ": " + e.what());
    }
    return parseConfig(j);
}

} // namespace shaforge
