#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            default: return "[DEBUG] ";
        }
    }
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logFile.is_open()) logFile.close();
    logFile.clear();
    if (!path.empty()) {
        logFile.open(path, std::ios::app);
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string lower;
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "debug" || lower == "trace") { out = LogLevel::DEBUG; return true; }
    if (lower == "info") { out = LogLevel::INFO; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::WARNING; return true; }
    if (lower == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

void Logger::writeRecord(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (logFile.is_open()) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tmNow{};
        localtime_r(&now, &tmNow);
        logFile << std::put_time(&tmNow, "[%Y-%m-%d %H:%M:%S] ") << levelTag(level) << trimmedMsg << std::endl;
    }

    if (!consoleEnabled) return;

    static const bool useColor = isatty(STDERR_FILENO) != 0;
    std::string prefix;
    if (useColor) {
        switch (level) {
            case LogLevel::DEBUG: prefix = GRAY + "[Debug] " + RESET; break;
            case LogLevel::INFO: prefix = CYAN + "[Info] " + RESET; break;
            case LogLevel::WARNING: prefix = YELLOW + "⚠ " + RESET; break;
            case LogLevel::ERROR: prefix = RED + BOLD + "✖ " + RESET; break;
        }
    } else {
        prefix = levelTag(level);
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << '\n';
    }
    std::cerr.flush();
}
