#include "mcp/MCPError.h"

const char* toString(MCPErrorKind kind) {
    switch (kind) {
        case MCPErrorKind::SecurityRejected: return "SecurityRejected";
        case MCPErrorKind::SpawnFailed: return "SpawnFailed";
        case MCPErrorKind::TransportWriteFailed: return "TransportWriteFailed";
        case MCPErrorKind::RequestTimedOut: return "RequestTimedOut";
        case MCPErrorKind::RemoteError: return "RemoteError";
        case MCPErrorKind::HandshakeFailed: return "HandshakeFailed";
        case MCPErrorKind::ServerNotFound: return "ServerNotFound";
        case MCPErrorKind::ConnectionClosed: return "ConnectionClosed";
    }
    return "Unknown";
}

MCPError::MCPError(MCPErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(toString(kind)) + ": " + detail),
      errorKind(kind),
      errorDetail(detail) {}

MCPError MCPError::remote(int64_t code, const std::string& message, const nlohmann::json& data) {
    MCPError err(MCPErrorKind::RemoteError, "MCP Error " + std::to_string(code) + ": " + message);
    err.code = code;
    err.message = message;
    err.data = data;
    return err;
}

MCPError MCPError::handshake(const std::string& stage, const MCPError& cause) {
    MCPError err(MCPErrorKind::HandshakeFailed, "stage '" + stage + "' failed: " + cause.what());
    err.handshakeStage = stage;
    err.cause = cause.kind();
    return err;
}

MCPError MCPError::handshake(const std::string& stage, const std::string& cause) {
    MCPError err(MCPErrorKind::HandshakeFailed, "stage '" + stage + "' failed: " + cause);
    err.handshakeStage = stage;
    return err;
}
