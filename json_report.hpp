#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "digest.hpp"
#include "entropy_metrics.hpp"

namespace shaforge {

// {"input": label, "digest": hex}
nlohmann::json digestEntry(const std::string& label, const Digest& digest);

nlohmann::json avalancheEntry(const entropy::AvalancheReport& report);

// Pretty-printed JSON. Labels are raw argv or path bytes, so invalid UTF-8
// is written as U+FFFD instead of failing the whole report.
std::string dumpReport(const nlohmann::json& report);

} // namespace shaforge
