#include "mcp/CommandResolver.h"
#include "mcp/SecurityGate.h"
#include <cstdlib>
#include <filesystem>
#include <unordered_set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
std::vector<std::string> splitPath(const std::string& paths) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        std::string dir = (end == std::string::npos) ? paths.substr(start) : paths.substr(start, end - start);
        if (!dir.empty()) out.push_back(dir);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return out;
}

std::string effectivePath(const Environment& env) {
    auto it = env.find("PATH");
    if (it != env.end()) return it->second;
    const char* pathEnv = std::getenv("PATH");
    return pathEnv ? pathEnv : "";
}

bool isExecutableFile(const fs::path& candidate) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) return false;
    return access(candidate.c_str(), X_OK) == 0;
}
} // namespace

std::vector<std::string> CommandResolver::wellKnownDirs() {
    const char* homeEnv = std::getenv("HOME");
    std::string home = homeEnv ? homeEnv : "";
    return {
        home + "/.cargo/bin",
        home + "/.local/bin",
        "/opt/homebrew/bin",
        "/usr/local/bin",
        "/usr/bin",
        "/bin"
    };
}

std::string CommandResolver::augmentPath(const Environment& env) {
    std::vector<std::string> paths = wellKnownDirs();
    for (const auto& dir : splitPath(effectivePath(env))) {
        paths.push_back(dir);
    }

    // Dedup preserving order
    std::unordered_set<std::string> seen;
    std::string joined;
    for (const auto& p : paths) {
        if (!seen.insert(p).second) continue;
        if (!joined.empty()) joined += ":";
        joined += p;
    }
    return joined;
}

std::optional<std::string> CommandResolver::findInPath(const std::string& name, const std::string& pathValue) {
    if (name.empty()) return std::nullopt;
    for (const auto& dir : splitPath(pathValue)) {
        fs::path candidate = fs::path(dir) / name;
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::optional<std::string> CommandResolver::findCommand(const std::string& command, const Environment& env) {
    if (command.find('/') != std::string::npos || command.find('\\') != std::string::npos) {
        return command;
    }
    if (auto found = findInPath(command, effectivePath(env))) {
        return found;
    }
    for (const auto& dir : wellKnownDirs()) {
        fs::path candidate = fs::path(dir) / command;
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

bool CommandResolver::commandExists(const std::string& command) {
    SecurityGate::enforce(command, {});
    Environment env{{"PATH", augmentPath({})}};
    auto found = findCommand(command, env);
    return found.has_value() && isExecutableFile(*found);
}
