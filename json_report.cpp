#include "json_report.hpp"

namespace shaforge {

using json = nlohmann::json;

json digestEntry(const std::string& label, const Digest& digest) {
    return {{"input", label}, {"digest", digestToHex(digest)}};
}

json avalancheEntry(const entropy::AvalancheReport& report) {
    return {{"flips", report.trials},
            {"mean_bits", report.meanFlippedBits},
            {"min_bits", report.minFlippedBits},
            {"max_bits", report.maxFlippedBits},
            {"mean_ratio", report.meanRatio}};
}

std::string dumpReport(const json& report) {
    return report.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace shaforge
