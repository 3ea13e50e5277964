#include "batch_hasher.hpp"
#include "config.hpp"
#include "digest.hpp"
#include "entropy_metrics.hpp"
#include "json_report.hpp"
#include "log.hpp"
#include "self_test.hpp"
#include "sha256_wrapper.hpp"
#include "known_vectors.hpp"
#include "utils.hpp"

#include <iostream>
#include <iterator>
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace shaforge;
using json = nlohmann::json;

namespace {

enum class InputMode { Text, Hex, File };

struct Options {
    std::string configPath;
    InputMode mode = InputMode::Text;
    bool doubleHash = false;
    bool jsonOutput = false;
    bool crossCheck = false;
    bool batch = false;
    bool verbose = false;
    bool selftest = false;
    long selftestTrials = -1;
    std::size_t avalancheFlips = 0;
    std::string vectorsFile;
    std::vector<std::string> args;
};

struct Input {
    std::string label;
    std::vector<uint8_t> bytes;
};

void printUsage() {
    std::cerr <<
        "usage: shaforge [--config FILE] [--hex] [--file] [--double] [--json]\n"
        "                [--cross-check] [--avalanche N] [--batch] [--selftest [TRIALS]]\n"
        "                [--vectors FILE] [--verbose] [ARG...]\n"
        "Hashes each ARG (stdin when none) with SHA-256.\n";
}

std::string requireValue(int& i, int argc, char** argv) {
    if (i + 1 >= argc) throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

bool isNumber(const std::string& s) {
    return !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
}

Options parseArgs(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") opt.configPath = requireValue(i, argc, argv);
        else if (a == "--hex") opt.mode = InputMode::Hex;
        else if (a == "--file") opt.mode = InputMode::File;
        else if (a == "--double") opt.doubleHash = true;
        else if (a == "--json") opt.jsonOutput = true;
        else if (a == "--cross-check") opt.crossCheck = true;
        else if (a == "--batch") opt.batch = true;
        else if (a == "--verbose") opt.verbose = true;
        else if (a == "--vectors") opt.vectorsFile = requireValue(i, argc, argv);
        else if (a == "--avalanche") {
            std::string n = requireValue(i, argc, argv);
            if (!isNumber(n)) throw std::invalid_argument("--avalanche expects a count, got " + n);
            opt.avalancheFlips = std::stoul(n);
        } else if (a == "--selftest") {
            opt.selftest = true;
            if (i + 1 < argc && isNumber(argv[i + 1]))
                opt.selftestTrials = std::stol(argv[++i]);
        } else if (a == "--") {
            for (++i; i < argc; ++i) opt.args.push_back(argv[i]);
        } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            throw std::invalid_argument("unknown option " + a);
        } else {
            opt.args.push_back(a);
        }
    }
    return opt;
}

std::vector<Input> collectInputs(const Options& opt) {
    std::vector<Input> inputs;
    if (opt.args.empty()) {
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        inputs.push_back({"-", data});
        return inputs;
    }

    for (const auto& arg : opt.args) {
        switch (opt.mode) {
        case InputMode::Text:
            inputs.push_back({arg, std::vector<uint8_t>(arg.begin(), arg.end())});
            break;
        case InputMode::Hex:
            inputs.push_back({arg, hexToBytes(arg)});
            break;
        case InputMode::File:
            inputs.push_back({arg, readFileBytes(arg)});
            break;
        }
    }
    return inputs;
}

int runSelfTestCommand(const Config& cfg, long trialsOverride) {
    std::size_t trials = trialsOverride >= 0 ? static_cast<std::size_t>(trialsOverride) : cfg.selftestTrials;
    logLine("🧪 Running self test (" + std::to_string(trials) + " random messages)...");
    SelfTestReport report = runSelfTest(trials);
    if (!report.passed) {
        logLine("❌ Self test failed: " + std::to_string(report.failures.size()) + " of " +
                std::to_string(report.checks) + " checks");
        return 1;
    }
    logLine("✅ Self test passed (" + std::to_string(report.checks) + " checks)");
    return 0;
}

int runVectorsCommand(const std::string& path) {
    std::vector<TestVector> vectors = loadTestVectors(path);
    std::vector<std::string> failed = checkTestVectors(vectors);
    for (const auto& name : failed)
        logLine("❌ vector failed: " + name);
    if (!failed.empty()) return 1;
    logLine("✅ All " + std::to_string(vectors.size()) + " vectors from " + path + " match");
    return 0;
}

std::string formatAvalanche(const entropy::AvalancheReport& r) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "avalanche: " << r.trials << " flips, mean " << r.meanFlippedBits
        << " bits (" << r.meanRatio * 100.0 << "%), min " << r.minFlippedBits
        << ", max " << r.maxFlippedBits;
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    try {
        Options opt = parseArgs(argc, argv);

        Config cfg = opt.configPath.empty() ? defaultConfig() : loadConfig(opt.configPath);
        if (opt.verbose) cfg.verbose = true;
        if (opt.crossCheck) cfg.crossCheck = true;
        if (opt.jsonOutput) cfg.output = OutputFormat::Json;
        if (!opt.vectorsFile.empty()) cfg.vectorsFile = opt.vectorsFile;
        bool runVectors = !opt.vectorsFile.empty() || (opt.selftest && !cfg.vectorsFile.empty());

        setVerbose(cfg.verbose);
        if (!cfg.logFile.empty() && !openDebugLog(cfg.logFile))
            throw std::runtime_error("Failed to open debug log file: " + cfg.logFile);

        if (opt.selftest || runVectors) {
            int rc = 0;
            if (opt.selftest) rc |= runSelfTestCommand(cfg, opt.selftestTrials);
            if (runVectors) rc |= runVectorsCommand(cfg.vectorsFile);
            if (opt.args.empty()) return rc;
            if (rc != 0) return rc;
        }

        std::vector<Input> inputs = collectInputs(opt);
        std::vector<Digest> digests;

        if (opt.batch && !opt.doubleHash) {
            std::vector<std::vector<uint8_t>> messages;
            messages.reserve(inputs.size());
            for (const auto& in : inputs) messages.push_back(in.bytes);
            digests = hashBatch(messages, cfg.threads);
        } else {
            for (const auto& in : inputs)
                digests.push_back(opt.doubleHash ? hashDouble(in.bytes) : hash(in.bytes));
        }

        if (cfg.crossCheck) {
            for (size_t i = 0; i < inputs.size(); ++i) {
                Digest ref = referenceSha256(inputs[i].bytes);
                if (opt.doubleHash) ref = referenceSha256(std::vector<uint8_t>(ref.begin(), ref.end()));
                if (ref != digests[i])
                    throw std::runtime_error("digest mismatch against OpenSSL for input " + inputs[i].label);
            }
            debugLog("cross check passed for " + std::to_string(inputs.size()) + " inputs");
        }

        if (cfg.output == OutputFormat::Json) {
            json out = json::array();
            for (size_t i = 0; i < inputs.size(); ++i) {
                json entry = digestEntry(inputs[i].label, digests[i]);
                if (opt.avalancheFlips > 0)
                    entry["avalanche"] = avalancheEntry(entropy::avalanche_profile(inputs[i].bytes, opt.avalancheFlips));
                out.push_back(entry);
            }
            std::cout << dumpReport(out) << std::endl;
        } else {
            for (size_t i = 0; i < inputs.size(); ++i) {
                std::cout << digestToHex(digests[i]) << "  " << inputs[i].label << "\n";
                if (opt.avalancheFlips > 0)
                    std::cout << "  " << formatAvalanche(entropy::avalanche_profile(inputs[i].bytes, opt.avalancheFlips)) << "\n";
            }
            std::cout.flush();
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << "💥 " << ex.what() << "\n";
        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "💥 Exception: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
