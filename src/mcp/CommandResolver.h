#pragma once
#include <optional>
#include <string>
#include <vector>
#include "mcp/ProcessLauncher.h"

// Locates tool-server executables the way a login shell would, even when the
// host was started from a GUI session with a minimal PATH.
class CommandResolver {
public:
    /** Well-known install dirs (cargo, pipx/uv, homebrew, system) followed by env's PATH, de-duplicated. */
    static std::string augmentPath(const Environment& env);

    /**
     * Commands containing a path separator are returned unchanged. Otherwise the
     * first executable regular file in env's PATH (host PATH when env has none),
     * then in the well-known dirs.
     */
    static std::optional<std::string> findCommand(const std::string& command, const Environment& env);

    static std::optional<std::string> findInPath(const std::string& name, const std::string& pathValue);

    // Runs the security gate first; throws MCPError(SecurityRejected)
    static bool commandExists(const std::string& command);

    static std::vector<std::string> wellKnownDirs();
};
