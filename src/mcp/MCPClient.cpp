#include "mcp/MCPClient.h"
#include "mcp/MCPError.h"
#include "mcp/SecurityGate.h"
#include "utils/Logger.h"
#include <cerrno>
#include <climits>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace {
constexpr size_t kLogPreview = 200;
constexpr size_t kMaxEchoedMethod = 256;

std::string preview(const std::string& text) {
    if (text.size() <= kLogPreview) return text;
    return text.substr(0, kLogPreview) + "...";
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string joinCommand(const std::string& executable, const std::vector<std::string>& args) {
    std::string out = executable;
    for (const auto& a : args) out += " " + a;
    return out;
}
} // namespace

MCPClient::MCPClient(const std::string& serverName,
                     const std::string& executable,
                     const std::vector<std::string>& args,
                     const Environment& env,
                     IProcessLauncher& launcher)
    : MCPClient(serverName, executable, args, env, launcher, Options()) {}

MCPClient::MCPClient(const std::string& serverName,
                     const std::string& executable,
                     const std::vector<std::string>& args,
                     const Environment& env,
                     IProcessLauncher& launcher,
                     Options options)
    : serverName(serverName), options(std::move(options)) {
    // Final choke point: no connection exists without passing the gate
    SecurityGate::enforce(executable, args);

    auto& log = Logger::getInstance();
    log.info("[MCP][" + serverName + "] Spawning: " + joinCommand(executable, args));
    auto path = env.find("PATH");
    log.debug("[MCP][" + serverName + "] PATH: " + (path != env.end() ? path->second : "<inherited>"));

    process = launcher.launch(executable, args, env);
    ignoreSigpipe();

    int flags = fcntl(process->stdinFd(), F_GETFL);
    if (flags >= 0) {
        fcntl(process->stdinFd(), F_SETFL, flags | O_NONBLOCK);
    }

    if (pipe2(wakePipe, O_CLOEXEC) != 0) {
        int err = errno;
        process->terminate(this->options.shutdownGrace);
        throw MCPError(MCPErrorKind::SpawnFailed, std::string("wake pipe: ") + std::strerror(err));
    }

    try {
        readerThread = std::thread(&MCPClient::readerLoop, this);
        stderrThread = std::thread(&MCPClient::stderrLoop, this);
    } catch (const std::system_error& e) {
        stopping = true;
        char b = 1;
        ssize_t ignored = write(wakePipe[1], &b, 1);
        (void)ignored;
        if (readerThread.joinable()) readerThread.join();
        process->terminate(this->options.shutdownGrace);
        close(wakePipe[0]);
        close(wakePipe[1]);
        throw MCPError(MCPErrorKind::SpawnFailed, std::string("could not start I/O threads: ") + e.what());
    }
    log.debug("[MCP][" + serverName + "] Process spawned, pid " + std::to_string(process->pid()));
}

MCPClient::~MCPClient() {
    shutdown();
}

void MCPClient::shutdown() {
    std::call_once(shutdownOnce, [this]() {
        stopping = true;

        // Kill first so a writer stuck on a full pipe gets EPIPE and releases writeMtx
        process->terminate(options.shutdownGrace);

        char b = 1;
        ssize_t ignored = write(wakePipe[1], &b, 1);
        (void)ignored;
        if (readerThread.joinable()) readerThread.join();
        if (stderrThread.joinable()) stderrThread.join();

        {
            std::lock_guard<std::mutex> lock(writeMtx);
            process->closeStreams();
        }
        failAllPending("connection to '" + serverName + "' was shut down");

        close(wakePipe[0]);
        close(wakePipe[1]);
        wakePipe[0] = wakePipe[1] = -1;
        Logger::getInstance().info("[MCP][" + serverName + "] Shut down");
    });
}

bool MCPClient::isAlive() const {
    if (stopping || writeFailed) return false;
    std::lock_guard<std::mutex> lock(pendingMtx);
    return !streamClosed;
}

pid_t MCPClient::processId() const {
    return process ? process->pid() : -1;
}

size_t MCPClient::pendingCount() const {
    std::lock_guard<std::mutex> lock(pendingMtx);
    return pending.size();
}

std::vector<MCPTool> MCPClient::listTools() const {
    std::lock_guard<std::mutex> lock(toolsMtx);
    return tools;
}

MCPInitializeResult MCPClient::serverInfo() const {
    std::lock_guard<std::mutex> lock(toolsMtx);
    return initResult;
}

// ── reading ─────────────────────────────────────────────────────────

template <typename OnLine>
void MCPClient::readLines(int fd, const char* streamName, OnLine onLine) {
    if (fd < 0) return;

    std::string buffer;
    bool discarding = false;
    char temp[65536];
    auto warnOversized = [&]() {
        Logger::getInstance().warn("[MCP][" + serverName + "] Dropping " + streamName + " line longer than " +
                                   std::to_string(options.maxLineBytes) + " bytes");
    };

    while (true) {
        pollfd fds[2] = {{fd, POLLIN, 0}, {wakePipe[0], POLLIN, 0}};
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::getInstance().warn("[MCP][" + serverName + "] poll on " + streamName + " failed: " + std::strerror(errno));
            return;
        }
        if (fds[1].revents != 0) return;
        if (fds[0].revents == 0) continue;

        ssize_t n = read(fd, temp, sizeof(temp));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Logger::getInstance().warn("[MCP][" + serverName + "] read on " + streamName + " failed: " + std::strerror(errno));
            return;
        }
        if (n == 0) {
            if (!discarding && !buffer.empty()) onLine(buffer);
            return;
        }

        size_t scanFrom = buffer.size();
        buffer.append(temp, static_cast<size_t>(n));

        size_t lineStart = 0;
        size_t pos;
        while ((pos = buffer.find('\n', scanFrom)) != std::string::npos) {
            if (discarding) {
                discarding = false;
            } else if (pos - lineStart > options.maxLineBytes) {
                warnOversized();
            } else {
                onLine(buffer.substr(lineStart, pos - lineStart));
            }
            lineStart = pos + 1;
            scanFrom = lineStart;
        }
        buffer.erase(0, lineStart);

        if (!discarding && buffer.size() > options.maxLineBytes) {
            warnOversized();
            discarding = true;
        }
        if (discarding) buffer.clear();
    }
}

void MCPClient::readerLoop() {
    readLines(process->stdoutFd(), "stdout", [this](const std::string& line) { handleLine(line); });

    if (stopping) {
        failAllPending("connection to '" + serverName + "' was shut down");
        return;
    }
    Logger::getInstance().warn("[MCP][" + serverName + "] Server closed its output stream");
    failAllPending("server '" + serverName + "' closed its output stream");
}

void MCPClient::stderrLoop() {
    readLines(process->stderrFd(), "stderr", [this](const std::string& line) {
        std::string text = trim(line);
        if (!text.empty()) {
            Logger::getInstance().debug("[MCP stderr][" + serverName + "] " + text);
        }
    });
}

void MCPClient::handleLine(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) return;

    auto& log = Logger::getInstance();
    log.debug("[MCP][" + serverName + "] Received: " + preview(text));

    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        log.warn("[MCP][" + serverName + "] Failed to parse line: " + std::string(e.what()));
        return;
    }

    try {
        switch (classifyMessage(msg)) {
            case MessageKind::Response:
                handleResponse(msg.get<JsonRpcResponse>());
                break;
            case MessageKind::Request:
                handleServerRequest(msg);
                break;
            case MessageKind::Notification:
                log.debug("[MCP][" + serverName + "] Notification: " + msg.value("method", ""));
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        log.warn("[MCP][" + serverName + "] Malformed message dropped: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        log.warn("[MCP][" + serverName + "] Malformed message dropped: " + std::string(e.what()));
    }
}

void MCPClient::handleResponse(const JsonRpcResponse& response) {
    auto& log = Logger::getInstance();
    if (!response.id) {
        std::string detail = response.error ? response.error->message : "no error";
        log.warn("[MCP][" + serverName + "] Response without id dropped (" + detail + ")");
        return;
    }

    auto slot = takeSlot(*response.id);
    if (!slot) {
        log.warn("[MCP][" + serverName + "] No pending request for id " + std::to_string(*response.id));
        return;
    }

    if (response.error) {
        const auto& err = *response.error;
        slot->set_exception(std::make_exception_ptr(MCPError::remote(err.code, err.message, err.data)));
    } else {
        slot->set_value(response.result ? *response.result : nlohmann::json());
    }
}

void MCPClient::handleServerRequest(const nlohmann::json& msg) {
    // roots/list, sampling/createMessage, ping... are not served by this client
    std::string method = msg.value("method", "");
    Logger::getInstance().debug("[MCP][" + serverName + "] Rejecting server request: " + preview(method));
    nlohmann::json reply = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", msg["id"]},
        {"error", JsonRpcError{-32601, "Method not found: " + method.substr(0, kMaxEchoedMethod), nullptr}}
    };
    // The reader must keep draining responses, so a busy or full stdin costs the server its answer
    if (!tryWriteWithoutBlocking(reply)) {
        Logger::getInstance().warn("[MCP][" + serverName + "] Dropped reply to server request " + preview(method));
    }
}

std::optional<MCPClient::Slot> MCPClient::takeSlot(uint64_t id) {
    std::lock_guard<std::mutex> lock(pendingMtx);
    auto it = pending.find(id);
    if (it == pending.end()) return std::nullopt;
    std::optional<Slot> slot(std::move(it->second));
    pending.erase(it);
    return slot;
}

void MCPClient::failAllPending(const std::string& reason) {
    std::unordered_map<uint64_t, Slot> stranded;
    {
        std::lock_guard<std::mutex> lock(pendingMtx);
        streamClosed = true;
        stranded.swap(pending);
    }
    for (auto& [id, slot] : stranded) {
        slot.set_exception(std::make_exception_ptr(MCPError(MCPErrorKind::ConnectionClosed, reason)));
    }
}

// ── writing ─────────────────────────────────────────────────────────

void MCPClient::failWrite(const std::string& reason) {
    writeFailed = true;
    Logger::getInstance().error("[MCP][" + serverName + "] Write failed: " + reason);
    throw MCPError(MCPErrorKind::TransportWriteFailed, reason);
}

bool MCPClient::tryWriteWithoutBlocking(const nlohmann::json& msg) {
    if (writeFailed) return false;
    std::string line = serializeLine(msg);
    // Pipe writes up to PIPE_BUF bytes are atomic: a refused write leaves no partial line behind
    if (line.size() > PIPE_BUF) return false;

    std::unique_lock<std::mutex> lock(writeMtx, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    int fd = process->stdinFd();
    if (fd < 0) return false;

    ssize_t n;
    do {
        n = write(fd, line.data(), line.size());
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(line.size())) return true;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return false;

    writeFailed = true;
    Logger::getInstance().error("[MCP][" + serverName + "] Write failed: " +
                                (n < 0 ? std::string(std::strerror(errno)) : "short write"));
    return false;
}

void MCPClient::writeMessage(const nlohmann::json& msg, std::chrono::steady_clock::time_point deadline) {
    if (writeFailed) {
        throw MCPError(MCPErrorKind::TransportWriteFailed, "transport to '" + serverName + "' is broken");
    }
    std::string line = serializeLine(msg);
    Logger::getInstance().debug("[MCP][" + serverName + "] Sending: " + preview(line.substr(0, line.size() - 1)));

    std::lock_guard<std::mutex> lock(writeMtx);
    int fd = process->stdinFd();
    if (fd < 0) {
        throw MCPError(MCPErrorKind::TransportWriteFailed, "stdin of '" + serverName + "' is closed");
    }

    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = write(fd, line.data() + written, line.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                failWrite("server is not reading its input");
            }
            pollfd pfd{fd, POLLOUT, 0};
            poll(&pfd, 1, static_cast<int>(remaining.count()));
            continue;
        }
        failWrite(n < 0 ? std::strerror(errno) : "write returned 0");
    }
}

// ── protocol ────────────────────────────────────────────────────────

nlohmann::json MCPClient::request(const std::string& method, const std::optional<nlohmann::json>& params) {
    uint64_t id = nextId.fetch_add(1);
    // Writing and waiting share one bound
    auto deadline = std::chrono::steady_clock::now() + options.requestTimeout;

    std::future<nlohmann::json> future;
    {
        std::lock_guard<std::mutex> lock(pendingMtx);
        if (streamClosed || stopping) {
            throw MCPError(MCPErrorKind::ConnectionClosed, "server '" + serverName + "' is no longer connected");
        }
        Slot slot;
        future = slot.get_future();
        pending.emplace(id, std::move(slot));
    }

    try {
        writeMessage(JsonRpcRequest{method, params, id}, deadline);
    } catch (const MCPError&) {
        takeSlot(id);
        throw;
    }

    if (future.wait_until(deadline) == std::future_status::timeout) {
        if (takeSlot(id)) {
            Logger::getInstance().warn("[MCP][" + serverName + "] Request " + method + " (id " + std::to_string(id) + ") timed out");
            throw MCPError(MCPErrorKind::RequestTimedOut,
                           method + " got no response within " + std::to_string(options.requestTimeout.count()) + " ms");
        }
        // The reader claimed the slot just as the wait expired; its value is on the way
    }
    return future.get();
}

void MCPClient::notify(const std::string& method, const std::optional<nlohmann::json>& params) {
    if (stopping) {
        throw MCPError(MCPErrorKind::ConnectionClosed, "server '" + serverName + "' is no longer connected");
    }
    writeMessage(JsonRpcNotification{method, params}, std::chrono::steady_clock::now() + options.requestTimeout);
}

nlohmann::json MCPClient::callTool(const std::string& name, const nlohmann::json& arguments) {
    return request("tools/call", nlohmann::json{{"name", name}, {"arguments", arguments}});
}

void MCPClient::initialize() {
    MCPInitializeParams params;
    params.capabilities.roots = nlohmann::json{{"listChanged", true}};
    params.capabilities.sampling = nlohmann::json::object();
    params.clientInfo = options.clientInfo;

    nlohmann::json initRes;
    try {
        initRes = request("initialize", nlohmann::json(params));
    } catch (const MCPError& e) {
        throw MCPError::handshake("initialize", e);
    }

    MCPInitializeResult info;
    try {
        if (initRes.is_object()) info = initRes.get<MCPInitializeResult>();
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().warn("[MCP][" + serverName + "] Unexpected initialize result: " + std::string(e.what()));
    }

    // Must be a notification: servers reject an initialized *request*
    try {
        notify("notifications/initialized");
    } catch (const MCPError& e) {
        throw MCPError::handshake("notifications/initialized", e);
    }

    nlohmann::json listRes;
    try {
        listRes = request("tools/list");
    } catch (const MCPError& e) {
        throw MCPError::handshake("tools/list", e);
    }

    MCPListToolsResult list;
    try {
        list = listRes.get<MCPListToolsResult>();
    } catch (const nlohmann::json::exception& e) {
        throw MCPError::handshake("tools/list", std::string("malformed tool list: ") + e.what());
    }

    std::string peer = info.serverInfo.name.empty() ? serverName : info.serverInfo.name;
    size_t toolCount = list.tools.size();
    {
        std::lock_guard<std::mutex> lock(toolsMtx);
        tools = std::move(list.tools);
        initResult = std::move(info);
    }
    Logger::getInstance().success("[MCP][" + serverName + "] Connected to " + peer + " with " +
                                  std::to_string(toolCount) + " tools");
}
