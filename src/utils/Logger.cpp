#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::SUCCESS: return "[OK] ";
            case LogLevel::THOUGHT: return "[THOUGHT] ";
            case LogLevel::ACTION: return "[ACTION] ";
            default: return "[DEBUG] ";
        }
    }
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;
    std::ofstream logFile(logFilePath, std::ios::app);
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTm{};
    localtime_r(&now, &localTm);
    logFile << std::put_time(&localTm, "[%Y-%m-%d %H:%M:%S] ") << levelTag(level) << message << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string prefix;
    switch (level) {
        case LogLevel::THOUGHT:
            prefix = GRAY + BOLD + "[Think] " + RESET;
            break;
        case LogLevel::ACTION:
            prefix = YELLOW + BOLD + "[Action] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // Diagnostics go to stderr so stdout stays usable for command output
    std::ostream& out = (level == LogLevel::SUCCESS || level == LogLevel::INFO) ? std::cout : std::cerr;

    std::stringstream ss(trimmedMsg);
    std::string line;
    bool first = true;
    while (std::getline(ss, line)) {
        if (first) {
            out << prefix << line << std::endl;
        } else {
            out << GRAY << "  │ " << RESET << line << std::endl;
        }
        first = false;
    }
}
