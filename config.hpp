#pragma once
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace shaforge {

enum class OutputFormat { Hex, Json };

struct Config {
    std::string logFile;
    bool verbose = false;
    OutputFormat output = OutputFormat::Hex;
    bool crossCheck = false;
    std::size_t selftestTrials = 10000;
    unsigned threads = 1;
    std::string vectorsFile;
};

// Defaults; threads = hardware concurrency (at least 1)
Config defaultConfig();

// Overlays the keys present in the JSON object onto the defaults.
// Throws std::runtime_error on wrong types or unknown output format.
Config parseConfig(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be read or parsed
Config loadConfig(const std::string& path);

} // namespace shaforge
