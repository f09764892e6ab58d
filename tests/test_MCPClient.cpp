#include <gtest/gtest.h>
#include "TestSupport.h"
#include "mcp/MCPClient.h"
#include "mcp/MCPError.h"
#include <functional>
#include <future>
#include <map>
#include <set>
#include <thread>

using testsupport::PipePeer;
using namespace std::chrono_literals;

namespace {
MCPErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const MCPError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an MCPError";
    return MCPErrorKind::HandshakeFailed;
}
} // namespace

class MCPClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        testsupport::quietLogger();
        options.requestTimeout = 2000ms;
    }

    std::unique_ptr<MCPClient> connect() {
        return std::make_unique<MCPClient>("peer", "mock-server", std::vector<std::string>{"--stdio"}, Environment{}, peer, options);
    }

    PipePeer peer;
    MCPClient::Options options;
};

TEST_F(MCPClientTest, ResponsesDeliveredOutOfOrderReachTheirCallers) {
    auto client = connect();

    std::vector<std::future<nlohmann::json>> calls;
    for (const std::string tag : {"first", "second", "third"}) {
        calls.push_back(std::async(std::launch::async, [&client, tag]() {
            return client->request("echo", nlohmann::json{{"tag", tag}});
        }));
    }

    std::map<uint64_t, std::string> tagById;
    for (int i = 0; i < 3; ++i) {
        auto msg = peer.readMessage();
        ASSERT_TRUE(msg.has_value());
        tagById[(*msg)["id"].get<uint64_t>()] = (*msg)["params"]["tag"].get<std::string>();
    }
    ASSERT_EQ(tagById.size(), 3u);
    EXPECT_EQ(tagById.begin()->first, 1u);
    EXPECT_EQ(tagById.rbegin()->first, 3u);

    // Answer 3, 2, 1
    for (auto it = tagById.rbegin(); it != tagById.rend(); ++it) {
        peer.respond(it->first, {{"tag", it->second}, {"id", it->first}});
    }

    std::vector<std::string> tags = {"first", "second", "third"};
    for (size_t i = 0; i < calls.size(); ++i) {
        auto result = calls[i].get();
        EXPECT_EQ(result["tag"], tags[i]);
        EXPECT_EQ(tagById[result["id"].get<uint64_t>()], tags[i]);
    }
    EXPECT_EQ(client->pendingCount(), 0u);
}

TEST_F(MCPClientTest, UnansweredRequestTimesOutAfterBoundAndLateAnswerIsDropped) {
    options.requestTimeout = 300ms;
    auto client = connect();

    auto start = std::chrono::steady_clock::now();
    auto slow = std::async(std::launch::async, [&client]() { return client->request("slow"); });
    auto first = peer.readMessage();
    ASSERT_TRUE(first.has_value());
    uint64_t staleId = (*first)["id"].get<uint64_t>();

    EXPECT_EQ(kindOf([&]() { slow.get(); }), MCPErrorKind::RequestTimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 300ms);
    EXPECT_EQ(client->pendingCount(), 0u);

    auto next = std::async(std::launch::async, [&client]() { return client->request("fast"); });
    auto second = peer.readMessage();
    ASSERT_TRUE(second.has_value());
    uint64_t liveId = (*second)["id"].get<uint64_t>();
    EXPECT_NE(liveId, staleId);

    peer.respond(staleId, {{"value", "stale"}});
    peer.respond(liveId, {{"value", "fresh"}});
    EXPECT_EQ(next.get()["value"], "fresh");
}

TEST_F(MCPClientTest, SlowWriteCountsAgainstTheRequestTimeout) {
    options.requestTimeout = 500ms;
    auto client = connect();

    auto start = std::chrono::steady_clock::now();
    auto call = std::async(std::launch::async, [&client]() {
        return client->request("upload", nlohmann::json{{"blob", std::string(200 * 1024, 'u')}});
    });

    // Stall the write for most of the budget, then accept it but never answer
    std::this_thread::sleep_for(300ms);
    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ((*msg)["method"], "upload");

    EXPECT_EQ(kindOf([&]() { call.get(); }), MCPErrorKind::RequestTimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 700ms);
}

TEST_F(MCPClientTest, NotifyNeverRegistersASlotOrWaits) {
    auto client = connect();

    auto start = std::chrono::steady_clock::now();
    client->notify("notifications/progress", nlohmann::json{{"value", 1}});
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    EXPECT_EQ(client->pendingCount(), 0u);

    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ((*msg)["method"], "notifications/progress");
    EXPECT_FALSE(msg->contains("id"));
    EXPECT_EQ((*msg)["jsonrpc"], "2.0");
}

TEST_F(MCPClientTest, RequestOmitsAbsentParams) {
    auto client = connect();
    auto call = std::async(std::launch::async, [&client]() { return client->request("tools/list"); });

    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    EXPECT_FALSE(msg->contains("params"));
    peer.respond((*msg)["id"].get<uint64_t>(), {{"tools", nlohmann::json::array()}});
    EXPECT_TRUE(call.get()["tools"].is_array());
}

TEST_F(MCPClientTest, RemoteErrorCarriesCodeAndMessage) {
    auto client = connect();
    auto call = std::async(std::launch::async, [&client]() { return client->request("tools/call", nlohmann::json::object()); });

    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    peer.respondError((*msg)["id"].get<uint64_t>(), -32602, "Invalid params");

    try {
        call.get();
        FAIL() << "expected RemoteError";
    } catch (const MCPError& e) {
        EXPECT_EQ(e.kind(), MCPErrorKind::RemoteError);
        EXPECT_EQ(e.remoteCode(), -32602);
        EXPECT_EQ(e.remoteMessage(), "Invalid params");
        EXPECT_NE(std::string(e.what()).find("RemoteError"), std::string::npos);
    }
}

TEST_F(MCPClientTest, NullResultResolvesToNull) {
    auto client = connect();
    auto call = std::async(std::launch::async, [&client]() { return client->request("ping"); });

    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    peer.send({{"jsonrpc", "2.0"}, {"id", (*msg)["id"]}});
    EXPECT_TRUE(call.get().is_null());
}

TEST_F(MCPClientTest, GarbageLinesAreSkippedWithoutKillingTheConnection) {
    options.maxLineBytes = 1024;
    auto client = connect();
    auto call = std::async(std::launch::async, [&client]() { return client->request("ping"); });

    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    uint64_t id = (*msg)["id"].get<uint64_t>();

    peer.sendRaw("this is not json\n");
    peer.sendRaw("\n   \n");
    peer.sendRaw("[1, 2, 3]\n");
    peer.sendRaw("{\"jsonrpc\":\"2.0\",\"id\":\"abc\",\"result\":1}\n");
    peer.sendRaw(std::string(4096, 'x') + "\n");
    peer.sendRaw("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + ",\"result\":{\"ok\":true}}\r\n");

    EXPECT_EQ(call.get()["ok"], true);
    EXPECT_TRUE(client->isAlive());
}

TEST_F(MCPClientTest, ValidResponseOverLineLimitIsDropped) {
    options.maxLineBytes = 1024;
    options.requestTimeout = 500ms;
    auto client = connect();

    auto big = std::async(std::launch::async, [&client]() { return client->request("big"); });
    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    // Whole line, newline included, in one write
    peer.respond((*msg)["id"].get<uint64_t>(), std::string(4000, 'y'));
    EXPECT_EQ(kindOf([&]() { big.get(); }), MCPErrorKind::RequestTimedOut);

    auto small = std::async(std::launch::async, [&client]() { return client->request("small"); });
    msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    peer.respond((*msg)["id"].get<uint64_t>(), "fits");
    EXPECT_EQ(small.get(), "fits");
    EXPECT_TRUE(client->isAlive());
}

TEST_F(MCPClientTest, ServerRequestDuringStalledWriteDoesNotHoldUpResponses) {
    options.requestTimeout = 1500ms;
    auto client = connect();

    auto ping = std::async(std::launch::async, [&client]() { return client->request("ping"); });
    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    uint64_t pingId = (*msg)["id"].get<uint64_t>();

    // Larger than the pipe buffer: the writer stays blocked until the peer reads
    auto bulk = std::async(std::launch::async, [&client]() {
        client->notify("notifications/bulk", nlohmann::json{{"blob", std::string(200 * 1024, 'z')}});
    });
    std::this_thread::sleep_for(100ms);

    peer.send({{"jsonrpc", "2.0"}, {"id", 77}, {"method", "roots/list"}});
    peer.respond(pingId, "pong");

    ASSERT_EQ(ping.wait_for(1000ms), std::future_status::ready);
    EXPECT_EQ(ping.get(), "pong");

    auto drained = peer.readMessage();
    ASSERT_TRUE(drained.has_value());
    EXPECT_EQ((*drained)["method"], "notifications/bulk");
    EXPECT_NO_THROW(bulk.get());

    // The refusal was dropped rather than interleaved with the bulk line
    EXPECT_FALSE(peer.readMessage(200ms).has_value());
    EXPECT_TRUE(client->isAlive());
}

TEST_F(MCPClientTest, ServerRequestsAreRefusedWithMethodNotFound) {
    auto client = connect();
    peer.send({{"jsonrpc", "2.0"}, {"id", 99}, {"method", "roots/list"}});

    auto reply = peer.readMessage();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 99);
    EXPECT_EQ((*reply)["error"]["code"], -32601);
    EXPECT_FALSE(reply->contains("result"));
}

TEST_F(MCPClientTest, StreamClosureFailsInFlightAndLaterRequests) {
    auto client = connect();
    auto call = std::async(std::launch::async, [&client]() { return client->request("slow"); });
    ASSERT_TRUE(peer.readMessage().has_value());

    auto start = std::chrono::steady_clock::now();
    peer.closeOutput();
    EXPECT_EQ(kindOf([&]() { call.get(); }), MCPErrorKind::ConnectionClosed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);

    EXPECT_FALSE(client->isAlive());
    EXPECT_EQ(kindOf([&]() { client->request("again"); }), MCPErrorKind::ConnectionClosed);
}

TEST_F(MCPClientTest, ShutdownIsIdempotentAndReleasesWaiters) {
    auto client = connect();
    auto call = std::async(std::launch::async, [&client]() { return client->request("slow"); });
    ASSERT_TRUE(peer.readMessage().has_value());

    client->shutdown();
    client->shutdown();
    EXPECT_EQ(kindOf([&]() { call.get(); }), MCPErrorKind::ConnectionClosed);
    EXPECT_FALSE(client->isAlive());
    EXPECT_EQ(kindOf([&]() { client->notify("x"); }), MCPErrorKind::ConnectionClosed);
}

TEST_F(MCPClientTest, StderrNoiseDoesNotDisturbRequests) {
    auto client = connect();
    peer.writeStderr("warming up\nstill warming up\n");

    auto call = std::async(std::launch::async, [&client]() { return client->request("ping"); });
    auto msg = peer.readMessage();
    ASSERT_TRUE(msg.has_value());
    peer.respond((*msg)["id"].get<uint64_t>(), "pong");
    EXPECT_EQ(call.get(), "pong");
}

TEST_F(MCPClientTest, BlockedCommandIsRejectedBeforeLaunch) {
    EXPECT_EQ(kindOf([&]() {
        MCPClient client("calc", "open", {"-a", "Calculator"}, Environment{}, peer, options);
    }), MCPErrorKind::SecurityRejected);
    EXPECT_EQ(peer.launches, 0);
}

class MCPClientHandshakeTest : public MCPClientTest {
protected:
    // Answers initialize, expects the initialized notification, then answers tools/list
    void serveHandshake(const nlohmann::json& toolsResult, std::optional<nlohmann::json>* initParams = nullptr) {
        auto init = peer.readMessage();
        ASSERT_TRUE(init.has_value());
        ASSERT_EQ((*init)["method"], "initialize");
        if (initParams) *initParams = (*init)["params"];
        peer.respond((*init)["id"].get<uint64_t>(), {
            {"protocolVersion", "2024-11-05"},
            {"serverInfo", {{"name", "mock"}, {"version", "9.9"}}},
            {"capabilities", {{"tools", nlohmann::json::object()}}}
        });

        auto initialized = peer.readMessage();
        ASSERT_TRUE(initialized.has_value());
        EXPECT_EQ((*initialized)["method"], "notifications/initialized");
        EXPECT_FALSE(initialized->contains("id"));

        auto list = peer.readMessage();
        ASSERT_TRUE(list.has_value());
        ASSERT_EQ((*list)["method"], "tools/list");
        if (toolsResult.contains("error")) {
            peer.respondError((*list)["id"].get<uint64_t>(), toolsResult["error"]["code"].get<int>(),
                              toolsResult["error"]["message"].get<std::string>());
        } else {
            peer.respond((*list)["id"].get<uint64_t>(), toolsResult);
        }
    }
};

TEST_F(MCPClientHandshakeTest, InitializeSendsHandshakeAndCachesCatalog) {
    options.clientInfo = {"test-host", "1.2.3"};
    auto client = connect();
    auto done = std::async(std::launch::async, [&client]() { client->initialize(); });

    std::optional<nlohmann::json> initParams;
    nlohmann::json tools = {{"tools", {
        {{"name", "query"}, {"description", "Run a query"}, {"inputSchema", {{"type", "object"}}}},
        {{"name", "status"}, {"inputSchema", {{"type", "object"}}}}
    }}};
    serveHandshake(tools, &initParams);
    done.get();

    ASSERT_TRUE(initParams.has_value());
    EXPECT_EQ((*initParams)["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*initParams)["clientInfo"]["name"], "test-host");
    EXPECT_EQ((*initParams)["clientInfo"]["version"], "1.2.3");
    EXPECT_EQ((*initParams)["capabilities"]["roots"]["listChanged"], true);
    EXPECT_TRUE((*initParams)["capabilities"]["sampling"].is_object());

    auto catalog = client->listTools();
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog[0].name, "query");
    EXPECT_EQ(catalog[0].description.value_or(""), "Run a query");
    EXPECT_EQ(catalog[1].name, "status");
    EXPECT_FALSE(catalog[1].description.has_value());
    EXPECT_EQ(client->serverInfo().serverInfo.name, "mock");
}

TEST_F(MCPClientHandshakeTest, ReinitializeReplacesCatalogWholesale) {
    auto client = connect();

    auto first = std::async(std::launch::async, [&client]() { client->initialize(); });
    serveHandshake({{"tools", {{{"name", "a"}, {"inputSchema", nlohmann::json::object()}},
                               {{"name", "b"}, {"inputSchema", nlohmann::json::object()}}}}});
    first.get();
    ASSERT_EQ(client->listTools().size(), 2u);

    auto second = std::async(std::launch::async, [&client]() { client->initialize(); });
    serveHandshake({{"tools", {{{"name", "c"}, {"inputSchema", nlohmann::json::object()}}}}});
    second.get();

    auto catalog = client->listTools();
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog[0].name, "c");
}

TEST_F(MCPClientHandshakeTest, ToolListErrorFailsHandshakeButKeepsConnection) {
    auto client = connect();
    auto done = std::async(std::launch::async, [&client]() { client->initialize(); });
    serveHandshake({{"error", {{"code", -32601}, {"message", "no tools here"}}}});

    try {
        done.get();
        FAIL() << "expected HandshakeFailed";
    } catch (const MCPError& e) {
        EXPECT_EQ(e.kind(), MCPErrorKind::HandshakeFailed);
        EXPECT_EQ(e.stage(), "tools/list");
        EXPECT_EQ(e.causeKind(), MCPErrorKind::RemoteError);
    }
    EXPECT_TRUE(client->isAlive());
    EXPECT_TRUE(client->listTools().empty());
}

TEST_F(MCPClientHandshakeTest, MalformedToolListFailsHandshake) {
    auto client = connect();
    auto done = std::async(std::launch::async, [&client]() { client->initialize(); });
    serveHandshake({{"tools", "not-a-list"}});

    try {
        done.get();
        FAIL() << "expected HandshakeFailed";
    } catch (const MCPError& e) {
        EXPECT_EQ(e.kind(), MCPErrorKind::HandshakeFailed);
        EXPECT_EQ(e.stage(), "tools/list");
    }
}

TEST_F(MCPClientHandshakeTest, InitializeErrorNamesTheStage) {
    auto client = connect();
    auto done = std::async(std::launch::async, [&client]() { client->initialize(); });

    auto init = peer.readMessage();
    ASSERT_TRUE(init.has_value());
    peer.respondError((*init)["id"].get<uint64_t>(), -32600, "unsupported protocol version");

    try {
        done.get();
        FAIL() << "expected HandshakeFailed";
    } catch (const MCPError& e) {
        EXPECT_EQ(e.stage(), "initialize");
    }
    // Nothing else was sent after the failed initialize
    EXPECT_FALSE(peer.readMessage(200ms).has_value());
}
