#pragma once
#include <string>

namespace shaforge {

// Line to stderr
void logLine(const std::string& line);

// Line to the debug log file, if one is open; echoed to stderr in verbose mode
void debugLog(const std::string& line);

// Opens (appends to) the debug log. Returns false if the file cannot be opened.
bool openDebugLog(const std::string& path);
void closeDebugLog();

void setVerbose(bool verbose);
bool isVerbose();

} // namespace shaforge
