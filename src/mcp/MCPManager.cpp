#include "mcp/MCPManager.h"
#include "mcp/MCPError.h"
#include "utils/Logger.h"

nlohmann::json QualifiedTool::toJson() const {
    return {
        {"name", qualifiedName},
        {"original_name", originalName},
        {"server", server},
        {"description", description ? nlohmann::json(*description) : nlohmann::json()},
        {"input_schema", inputSchema}
    };
}

MCPManager::MCPManager(IProcessLauncher& launcher)
    : MCPManager(launcher, MCPClient::Options()) {}

MCPManager::MCPManager(IProcessLauncher& launcher, MCPClient::Options options)
    : launcher(launcher), options(std::move(options)) {}

MCPManager::~MCPManager() {
    shutdownAll();
}

void MCPManager::addServer(const std::string& name,
                           const std::string& executable,
                           const std::vector<std::string>& args,
                           const Environment& env) {
    // A failed handshake destroys the client here, which kills its process
    auto client = std::make_shared<MCPClient>(name, executable, args, env, launcher, options);
    client->initialize();

    std::shared_ptr<MCPClient> previous;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = clients.find(name);
        if (it != clients.end()) {
            previous = std::move(it->second);
            it->second = client;
        } else {
            clients.emplace(name, client);
        }
    }

    if (previous) {
        Logger::getInstance().warn("[MCP] Replacing existing connection: " + name);
        previous->shutdown();
    }
    Logger::getInstance().info("[MCP] Added server: " + name);
}

void MCPManager::removeServer(const std::string& name) {
    std::shared_ptr<MCPClient> client;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = clients.find(name);
        if (it == clients.end()) return;
        client = std::move(it->second);
        clients.erase(it);
    }
    client->shutdown();
    Logger::getInstance().info("[MCP] Removed server: " + name);
}

std::vector<QualifiedTool> MCPManager::listAllTools() const {
    std::vector<std::pair<std::string, std::shared_ptr<MCPClient>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx);
        snapshot.assign(clients.begin(), clients.end());
    }

    std::vector<QualifiedTool> allTools;
    for (const auto& [serverName, client] : snapshot) {
        for (auto& tool : client->listTools()) {
            QualifiedTool q;
            q.qualifiedName = serverName + kToolNameSeparator + tool.name;
            q.originalName = std::move(tool.name);
            q.server = serverName;
            q.description = std::move(tool.description);
            q.inputSchema = std::move(tool.inputSchema);
            allTools.push_back(std::move(q));
        }
    }
    return allTools;
}

nlohmann::json MCPManager::callTool(const std::string& serverName, const std::string& toolName, const nlohmann::json& arguments) {
    auto client = getClient(serverName);
    if (!client) {
        throw MCPError(MCPErrorKind::ServerNotFound, "Server " + serverName + " not found");
    }
    return client->callTool(toolName, arguments);
}

std::vector<std::string> MCPManager::listConnectedServers() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> names;
    names.reserve(clients.size());
    for (const auto& entry : clients) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<MCPClient> MCPManager::getClient(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = clients.find(name);
    return it != clients.end() ? it->second : nullptr;
}

void MCPManager::shutdownAll() {
    std::map<std::string, std::shared_ptr<MCPClient>> drained;
    {
        std::lock_guard<std::mutex> lock(mtx);
        drained.swap(clients);
    }
    for (auto& entry : drained) {
        entry.second->shutdown();
    }
}
