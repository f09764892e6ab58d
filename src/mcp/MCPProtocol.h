#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// JSON-RPC 2.0 envelopes and the MCP payloads used by the client.
// Field names on the wire are fixed by the protocol.

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kMCPProtocolVersion = "2024-11-05";

struct JsonRpcRequest {
    std::string method;
    std::optional<nlohmann::json> params;
    uint64_t id = 0;
};

// Same as a request, but the id member is absent (not null)
struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

struct JsonRpcError {
    int64_t code = 0;
    std::string message;
    nlohmann::json data;
};

struct JsonRpcResponse {
    std::optional<uint64_t> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

struct MCPTool {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

struct MCPClientInfo {
    std::string name;
    std::string version;
};

struct MCPClientCapabilities {
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
};

struct MCPInitializeParams {
    std::string protocolVersion = kMCPProtocolVersion;
    MCPClientCapabilities capabilities;
    MCPClientInfo clientInfo;
};

struct MCPServerInfo {
    std::string name;
    std::string version;
};

struct MCPInitializeResult {
    std::string protocolVersion;
    MCPServerInfo serverInfo;
    nlohmann::json capabilities = nlohmann::json::object();
};

struct MCPListToolsResult {
    std::vector<MCPTool> tools;
};

/** What an incoming line turned out to be, judged by its members. */
enum class MessageKind {
    Response,      // no "method"
    Request,       // "method" and "id": the server is asking us something
    Notification   // "method" without "id"
};

// Throws std::invalid_argument when msg is not a JSON object
MessageKind classifyMessage(const nlohmann::json& msg);

// One JSON document terminated by '\n'. Invalid UTF-8 is replaced, never thrown.
std::string serializeLine(const nlohmann::json& msg);

void to_json(nlohmann::json& j, const JsonRpcRequest& req);
void from_json(const nlohmann::json& j, JsonRpcRequest& req);
void to_json(nlohmann::json& j, const JsonRpcNotification& note);
void from_json(const nlohmann::json& j, JsonRpcNotification& note);
void to_json(nlohmann::json& j, const JsonRpcError& err);
void from_json(const nlohmann::json& j, JsonRpcError& err);
void to_json(nlohmann::json& j, const JsonRpcResponse& resp);
void from_json(const nlohmann::json& j, JsonRpcResponse& resp);
void to_json(nlohmann::json& j, const MCPTool& tool);
void from_json(const nlohmann::json& j, MCPTool& tool);
void to_json(nlohmann::json& j, const MCPClientInfo& info);
void to_json(nlohmann::json& j, const MCPClientCapabilities& caps);
void to_json(nlohmann::json& j, const MCPInitializeParams& params);
void from_json(const nlohmann::json& j, MCPServerInfo& info);
void from_json(const nlohmann::json& j, MCPInitializeResult& result);
void from_json(const nlohmann::json& j, MCPListToolsResult& result);
