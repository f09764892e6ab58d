#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/MCPProtocol.h"
#include "mcp/ProcessLauncher.h"

/**
 * JSON-RPC peer over one MCP tool server's stdin/stdout.
 *
 * Requests may be issued from any number of threads. Each gets a fresh id and
 * waits on its own completion slot; the reader thread resolves slots by id, so
 * responses may arrive in any order. Every spawn goes through SecurityGate
 * inside the constructor.
 */
class MCPClient {
public:
    struct Options {
        std::chrono::milliseconds requestTimeout{30000};
        std::chrono::milliseconds shutdownGrace{500};
        size_t maxLineBytes = 16 * 1024 * 1024;
        MCPClientInfo clientInfo{"mcphost", "0.1.0"};
    };

    // Throws MCPError(SecurityRejected | SpawnFailed)
    MCPClient(const std::string& serverName,
              const std::string& executable,
              const std::vector<std::string>& args,
              const Environment& env,
              IProcessLauncher& launcher,
              Options options);
    MCPClient(const std::string& serverName,
              const std::string& executable,
              const std::vector<std::string>& args,
              const Environment& env,
              IProcessLauncher& launcher);
    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    // Handshake: initialize, notifications/initialized, tools/list. Throws MCPError(HandshakeFailed)
    void initialize();

    // Blocks until the matching response, timeout, or stream closure. Throws MCPError
    nlohmann::json request(const std::string& method, const std::optional<nlohmann::json>& params = std::nullopt);

    // Fire-and-forget. Throws MCPError(TransportWriteFailed | ConnectionClosed)
    void notify(const std::string& method, const std::optional<nlohmann::json>& params = std::nullopt);

    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments);

    // Idempotent
    void shutdown();

    std::vector<MCPTool> listTools() const;
    const std::string& name() const { return serverName; }
    MCPInitializeResult serverInfo() const;
    bool isAlive() const;
    pid_t processId() const;
    size_t pendingCount() const;

private:
    using Slot = std::promise<nlohmann::json>;

    std::string serverName;
    Options options;
    std::unique_ptr<ChildProcess> process;

    std::atomic<uint64_t> nextId{1};
    std::atomic<bool> stopping{false};

    mutable std::mutex pendingMtx;
    std::unordered_map<uint64_t, Slot> pending;
    bool streamClosed = false;

    std::mutex writeMtx;
    std::atomic<bool> writeFailed{false};

    mutable std::mutex toolsMtx;
    std::vector<MCPTool> tools;
    MCPInitializeResult initResult;

    int wakePipe[2] = {-1, -1};
    std::thread readerThread;
    std::thread stderrThread;
    std::once_flag shutdownOnce;

    void readerLoop();
    void stderrLoop();
    // Splits fd into lines until EOF or shutdown
    template <typename OnLine>
    void readLines(int fd, const char* streamName, OnLine onLine);

    void handleLine(const std::string& line);
    void handleResponse(const JsonRpcResponse& response);
    void handleServerRequest(const nlohmann::json& msg);
    void failAllPending(const std::string& reason);

    void writeMessage(const nlohmann::json& msg, std::chrono::steady_clock::time_point deadline);
    // For the reader thread: one all-or-nothing write, false instead of waiting
    bool tryWriteWithoutBlocking(const nlohmann::json& msg);
    void failWrite(const std::string& reason);
    std::optional<Slot> takeSlot(uint64_t id);
};
