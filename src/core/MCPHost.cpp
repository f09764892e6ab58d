#include "core/MCPHost.h"
#include "mcp/CommandResolver.h"
#include "mcp/MCPError.h"
#include "mcp/SecurityGate.h"
#include "utils/Logger.h"
#include <future>

namespace {
nlohmann::json errorReply(const std::string& message) {
    return {{"error", message}};
}
} // namespace

MCPHost::MCPHost(IProcessLauncher& launcher, const Config::MCP& settings)
    : mcpManager(launcher, clientOptions(settings)) {}

MCPClient::Options MCPHost::clientOptions(const Config::MCP& settings) {
    MCPClient::Options options;
    options.requestTimeout = std::chrono::milliseconds(settings.requestTimeoutMs);
    options.shutdownGrace = std::chrono::milliseconds(settings.shutdownGraceMs);
    options.maxLineBytes = settings.maxLineBytes;
    options.clientInfo = {settings.clientName, settings.clientVersion};
    return options;
}

nlohmann::json MCPHost::connect(const std::string& name,
                                const std::string& command,
                                const std::vector<std::string>& args,
                                const Environment& env) {
    Environment envAug = env;
    envAug["PATH"] = CommandResolver::augmentPath(env);
#ifdef __APPLE__
    // Keeps auth flows in a real browser instead of whatever the system default handler is
    envAug["BROWSER"] = "safari";
#endif

    std::string finalCommand = CommandResolver::findCommand(command, envAug).value_or(command);

    try {
        // Resolution may have produced a different path than the caller asked for
        SecurityGate::enforce(finalCommand, args);
        Logger::getInstance().info("[MCP] Connecting to " + name + " using command: " + finalCommand);
        mcpManager.addServer(name, finalCommand, args, envAug);
    } catch (const MCPError& e) {
        std::string msg = "Failed to connect to " + name + ": " + e.what();
        Logger::getInstance().error("[MCP] " + msg);
        return errorReply(msg);
    }

    auto client = mcpManager.getClient(name);
    return {
        {"status", "connected"},
        {"server", name},
        {"command", finalCommand},
        {"tools", client ? client->listTools().size() : 0}
    };
}

nlohmann::json MCPHost::disconnect(const std::string& name) {
    mcpManager.removeServer(name);
    return {{"status", "disconnected"}, {"server", name}};
}

nlohmann::json MCPHost::listTools() const {
    nlohmann::json allTools = nlohmann::json::array();
    for (const auto& tool : mcpManager.listAllTools()) {
        allTools.push_back(tool.toJson());
    }
    return allTools;
}

nlohmann::json MCPHost::callTool(const std::string& serverName, const std::string& toolName, const nlohmann::json& args) {
    try {
        return mcpManager.callTool(serverName, toolName, args);
    } catch (const MCPError& e) {
        Logger::getInstance().warn("[MCP] Tool call " + serverName + kToolNameSeparator + toolName + " failed: " + e.what());
        return errorReply(e.what());
    }
}

nlohmann::json MCPHost::listConnectedServers() const {
    return mcpManager.listConnectedServers();
}

nlohmann::json MCPHost::checkCommandExists(const std::string& command) const {
    try {
        if (CommandResolver::commandExists(command)) {
            return {{"exists", true}, {"command", command}};
        }
        return errorReply(command + " is not available in PATH");
    } catch (const MCPError& e) {
        return errorReply(e.what());
    }
}

int MCPHost::connectAll(const std::vector<Config::MCPServerConfig>& configs) {
    std::vector<std::pair<std::string, std::future<nlohmann::json>>> futures;
    for (const auto& cfg : configs) {
        if (!cfg.enabled) continue;
        futures.push_back({cfg.name, std::async(std::launch::async, [this, cfg]() {
            return connect(cfg.name, cfg.command, cfg.args, cfg.env);
        })});
    }

    int count = 0;
    for (auto& f : futures) {
        auto result = f.second.get();
        if (!result.contains("error")) {
            count++;
        }
    }
    return count;
}
