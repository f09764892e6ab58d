#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/MCPClient.h"

// Separator between server and tool in a qualified tool name
constexpr const char* kToolNameSeparator = "__";

struct QualifiedTool {
    std::string qualifiedName;   // "<server>__<tool>"
    std::string originalName;
    std::string server;
    std::optional<std::string> description;
    nlohmann::json inputSchema;

    nlohmann::json toJson() const;
};

/**
 * Live MCP connections keyed by server name. The table lock only guards
 * pointer copies; process I/O always happens on a copied shared_ptr outside it.
 */
class MCPManager {
public:
    explicit MCPManager(IProcessLauncher& launcher);
    MCPManager(IProcessLauncher& launcher, MCPClient::Options options);
    ~MCPManager();

    MCPManager(const MCPManager&) = delete;
    MCPManager& operator=(const MCPManager&) = delete;

    // Spawn + handshake, then register. An existing entry under the same name is replaced and shut down.
    void addServer(const std::string& name,
                   const std::string& executable,
                   const std::vector<std::string>& args,
                   const Environment& env);

    // No-op when the name is unknown
    void removeServer(const std::string& name);

    std::vector<QualifiedTool> listAllTools() const;

    // Throws MCPError(ServerNotFound) before any I/O when the server is unknown
    nlohmann::json callTool(const std::string& serverName, const std::string& toolName, const nlohmann::json& arguments);

    std::vector<std::string> listConnectedServers() const;

    std::shared_ptr<MCPClient> getClient(const std::string& name) const;

    void shutdownAll();

private:
    IProcessLauncher& launcher;
    MCPClient::Options options;

    mutable std::mutex mtx;
    std::map<std::string, std::shared_ptr<MCPClient>> clients;
};
