#pragma once
#include <string>
#include <vector>

/**
 * Denylist applied to every spawn attempt. The predicate is pure; enforce()
 * logs the rejection at error level and throws MCPError(SecurityRejected).
 */
class SecurityGate {
public:
    struct Verdict {
        bool allowed = true;
        std::string reason;
    };

    static Verdict evaluate(const std::string& executable, const std::vector<std::string>& args);

    static void enforce(const std::string& executable, const std::vector<std::string>& args);
};
