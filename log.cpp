#include "log.hpp"
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>

namespace shaforge {

static std::mutex logMutex;
static std::ofstream debugLogFile;
static std::atomic<bool> verboseLogging{false};

void logLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr << line << std::endl;
}

void debugLog(const std::string& line) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (debugLogFile.is_open()) {
        debugLogFile << line << std::endl;
        debugLogFile.flush();
    }
    if (verboseLogging.load())
        std::cerr << "[debug] " << line << std::endl;
}

bool openDebugLog(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (debugLogFile.is_open()) debugLogFile.close();
    debugLogFile.open(path, std::ios::app);
    return debugLogFile.is_open();
}

void closeDebugLog() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (debugLogFile.is_open()) debugLogFile.close();
}

void setVerbose(bool verbose) { verboseLogging.store(verbose); }
bool isVerbose() { return verboseLogging.load(); }

} // namespace shaforge
