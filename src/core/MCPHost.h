#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "mcp/MCPManager.h"

/**
 * Surface used by the agent layer and the CLI. Every call returns a JSON
 * envelope; failures come back as {"error": "<Kind>: <detail>"} and are never thrown.
 */
class MCPHost {
public:
    MCPHost(IProcessLauncher& launcher, const Config::MCP& settings);

    nlohmann::json connect(const std::string& name,
                           const std::string& command,
                           const std::vector<std::string>& args,
                           const Environment& env);
    nlohmann::json disconnect(const std::string& name);
    nlohmann::json listTools() const;
    nlohmann::json callTool(const std::string& serverName, const std::string& toolName, const nlohmann::json& args);
    nlohmann::json listConnectedServers() const;
    nlohmann::json checkCommandExists(const std::string& command) const;

    // Connects enabled servers in parallel; returns how many came up
    int connectAll(const std::vector<Config::MCPServerConfig>& configs);

    MCPManager& manager() { return mcpManager; }

    static MCPClient::Options clientOptions(const Config::MCP& settings);

private:
    MCPManager mcpManager;
};
