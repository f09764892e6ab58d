#include "mcp/SecurityGate.h"
#include "mcp/MCPError.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {
const char* const kCalculatorMarkers[] = {"calculator", "calc.exe", "calc.app"};
const char* const kLaunchers[] = {"open", "xdg-open", "gnome-open", "kde-open"};

std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string baseName(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\')) trimmed.pop_back();
    auto pos = trimmed.find_last_of("/\\");
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

bool isLauncher(const std::string& lowerName) {
    return std::any_of(std::begin(kLaunchers), std::end(kLaunchers),
                       [&](const char* l) { return lowerName == l; });
}

SecurityGate::Verdict reject(const std::string& reason) {
    return {false, reason};
}
} // namespace

SecurityGate::Verdict SecurityGate::evaluate(const std::string& executable, const std::vector<std::string>& args) {
    std::string full = toLower(executable);
    for (const auto& arg : args) {
        full += " ";
        full += toLower(arg);
    }

    for (const char* marker : kCalculatorMarkers) {
        if (contains(full, marker)) {
            return reject("command line contains blocked marker '" + std::string(marker) + "'");
        }
    }

    std::string lowerExe = toLower(executable);
    std::string exeName = toLower(baseName(executable));
    if (isLauncher(exeName)) {
        return reject("executable '" + executable + "' is an OS launcher");
    }
    std::string trimmedExe = lowerExe;
    while (!trimmedExe.empty() && trimmedExe.back() == '/') trimmedExe.pop_back();
    if (endsWith(trimmedExe, ".app")) {
        return reject("executable '" + executable + "' is an application bundle");
    }

    for (const auto& arg : args) {
        std::string lowerArg = toLower(arg);
        if (lowerArg == "open") {
            return reject("argument 'open' is not allowed");
        }
        if (contains(lowerArg, "calc") && (endsWith(lowerArg, ".app") || endsWith(lowerArg, ".exe"))) {
            return reject("argument '" + arg + "' names a calculator binary");
        }
    }

    // "sh -c 'open -a calc'" style: a launcher word anywhere plus a calc marker
    if (contains(full, "calc")) {
        std::istringstream words(full);
        std::string word;
        while (words >> word) {
            if (isLauncher(baseName(word))) {
                return reject("launcher '" + word + "' combined with a calculator marker");
            }
        }
    }

    return {};
}

void SecurityGate::enforce(const std::string& executable, const std::vector<std::string>& args) {
    auto verdict = evaluate(executable, args);
    if (verdict.allowed) return;

    std::string commandLine = executable;
    for (const auto& arg : args) commandLine += " " + arg;
    Logger::getInstance().error("[MCP] SECURITY BLOCKED: " + commandLine + " (" + verdict.reason + ")");
    throw MCPError(MCPErrorKind::SecurityRejected, verdict.reason + ": " + commandLine);
}
