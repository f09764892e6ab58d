#include "mcp/MCPProtocol.h"
#include <stdexcept>

namespace {
void requireVersion(const nlohmann::json& j) {
    if (!j.contains("jsonrpc") || !j["jsonrpc"].is_string()) {
        throw std::invalid_argument("missing jsonrpc version");
    }
}

std::optional<uint64_t> parseId(const nlohmann::json& id) {
    if (id.is_null()) return std::nullopt;
    if (id.is_number_unsigned()) return id.get<uint64_t>();
    if (id.is_number_integer() && id.get<int64_t>() >= 0) return static_cast<uint64_t>(id.get<int64_t>());
    throw std::invalid_argument("id must be a non-negative integer, got " + id.dump());
}
} // namespace

MessageKind classifyMessage(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        throw std::invalid_argument("message is not a JSON object");
    }
    if (!msg.contains("method")) return MessageKind::Response;
    return msg.contains("id") ? MessageKind::Request : MessageKind::Notification;
}

std::string serializeLine(const nlohmann::json& msg) {
    return msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

void to_json(nlohmann::json& j, const JsonRpcRequest& req) {
    j = {{"jsonrpc", kJsonRpcVersion}, {"method", req.method}, {"id", req.id}};
    if (req.params) j["params"] = *req.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& req) {
    requireVersion(j);
    req.method = j.at("method").get<std::string>();
    auto id = parseId(j.at("id"));
    if (!id) throw std::invalid_argument("request id must not be null");
    req.id = *id;
    req.params = j.contains("params") ? std::optional<nlohmann::json>(j["params"]) : std::nullopt;
}

void to_json(nlohmann::json& j, const JsonRpcNotification& note) {
    j = {{"jsonrpc", kJsonRpcVersion}, {"method", note.method}};
    if (note.params) j["params"] = *note.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& note) {
    requireVersion(j);
    if (j.contains("id")) throw std::invalid_argument("notification must not carry an id");
    note.method = j.at("method").get<std::string>();
    note.params = j.contains("params") ? std::optional<nlohmann::json>(j["params"]) : std::nullopt;
}

void to_json(nlohmann::json& j, const JsonRpcError& err) {
    j = {{"code", err.code}, {"message", err.message}};
    if (!err.data.is_null()) j["data"] = err.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& err) {
    err.code = j.at("code").get<int64_t>();
    err.message = j.at("message").get<std::string>();
    err.data = j.value("data", nlohmann::json());
}

void to_json(nlohmann::json& j, const JsonRpcResponse& resp) {
    j = {{"jsonrpc", kJsonRpcVersion}};
    j["id"] = resp.id ? nlohmann::json(*resp.id) : nlohmann::json();
    if (resp.error) {
        j["error"] = *resp.error;
    } else {
        j["result"] = resp.result ? *resp.result : nlohmann::json();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& resp) {
    requireVersion(j);
    resp.id = j.contains("id") ? parseId(j["id"]) : std::nullopt;
    resp.result = j.contains("result") ? std::optional<nlohmann::json>(j["result"]) : std::nullopt;
    if (j.contains("error") && !j["error"].is_null()) {
        resp.error = j["error"].get<JsonRpcError>();
    } else {
        resp.error.reset();
    }
}

void to_json(nlohmann::json& j, const MCPTool& tool) {
    j = {{"name", tool.name}, {"inputSchema", tool.inputSchema}};
    if (tool.description) j["description"] = *tool.description;
}

void from_json(const nlohmann::json& j, MCPTool& tool) {
    tool.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string()) {
        tool.description = j["description"].get<std::string>();
    } else {
        tool.description.reset();
    }
    tool.inputSchema = j.at("inputSchema");
}

void to_json(nlohmann::json& j, const MCPClientInfo& info) {
    j = {{"name", info.name}, {"version", info.version}};
}

void to_json(nlohmann::json& j, const MCPClientCapabilities& caps) {
    j = nlohmann::json::object();
    if (caps.roots) j["roots"] = *caps.roots;
    if (caps.sampling) j["sampling"] = *caps.sampling;
}

void to_json(nlohmann::json& j, const MCPInitializeParams& params) {
    j = {
        {"protocolVersion", params.protocolVersion},
        {"capabilities", params.capabilities},
        {"clientInfo", params.clientInfo}
    };
}

void from_json(const nlohmann::json& j, MCPServerInfo& info) {
    info.name = j.value("name", "");
    info.version = j.value("version", "");
}

void from_json(const nlohmann::json& j, MCPInitializeResult& result) {
    result.protocolVersion = j.value("protocolVersion", "");
    if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
        result.serverInfo = j["serverInfo"].get<MCPServerInfo>();
    }
    result.capabilities = j.value("capabilities", nlohmann::json::object());
}

void from_json(const nlohmann::json& j, MCPListToolsResult& result) {
    result.tools = j.at("tools").get<std::vector<MCPTool>>();
}
