#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

enum class MCPErrorKind {
    SecurityRejected,
    SpawnFailed,
    TransportWriteFailed,
    RequestTimedOut,
    RemoteError,
    HandshakeFailed,
    ServerNotFound,
    ConnectionClosed
};

const char* toString(MCPErrorKind kind);

/**
 * Every failure raised by the MCP client stack. what() is "<Kind>: <detail>",
 * which is also the text handed to the agent/UI layer.
 */
class MCPError : public std::runtime_error {
public:
    MCPError(MCPErrorKind kind, const std::string& detail);

    static MCPError remote(int64_t code, const std::string& message, const nlohmann::json& data = nullptr);
    static MCPError handshake(const std::string& stage, const MCPError& cause);
    static MCPError handshake(const std::string& stage, const std::string& cause);

    MCPErrorKind kind() const { return errorKind; }
    const std::string& detail() const { return errorDetail; }

    // RemoteError only
    int64_t remoteCode() const { return code; }
    const std::string& remoteMessage() const { return message; }
    const nlohmann::json& remoteData() const { return data; }

    // HandshakeFailed only
    const std::string& stage() const { return handshakeStage; }
    MCPErrorKind causeKind() const { return cause; }

private:
    MCPErrorKind errorKind;
    std::string errorDetail;
    int64_t code = 0;
    std::string message;
    nlohmann::json data;
    std::string handshakeStage;
    MCPErrorKind cause = MCPErrorKind::HandshakeFailed;
};
