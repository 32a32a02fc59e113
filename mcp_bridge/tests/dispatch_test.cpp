#include <gtest/gtest.h>

#include "bridge_server.hpp"
#include "builtin_handlers.hpp"
#include "connection_registry.hpp"
#include "dispatch_loop.hpp"
#include "logger.hpp"
#include "message_queue.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using bridge::BridgeServer;
using bridge::ConnectionRegistry;
using bridge::DispatchLoop;
using bridge::DispatchOptions;
using bridge::MessageQueue;
using bridge::json::Value;
using bridge::protocol::ToolResult;
namespace error_code = bridge::protocol::error_code;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

// Fails with something that is not a std::exception.
class ErrnoThrowingConnection : public bridge::Connection {
public:
    bool send(const std::string&) override { throw 104; }
};

class DispatchLoopTest : public ::testing::Test {
protected:
    DispatchLoopTest() : engine_(tools_, resources_), client_(std::make_shared<RecordingConnection>()) {
        connections_.register_connection("conn-1", client_);
    }

    std::unique_ptr<DispatchLoop> make_loop(DispatchOptions options = {}) {
        return std::make_unique<DispatchLoop>(queue_, engine_, connections_, options);
    }

    bridge::registry::ToolRegistry tools_;
    bridge::registry::ResourceRegistry resources_;
    bridge::rpc::JsonRpcEngine engine_;
    MessageQueue queue_;
    ConnectionRegistry connections_;
    std::shared_ptr<RecordingConnection> client_;
};

} // namespace

TEST(MessageQueue, IsFirstInFirstOut) {
    MessageQueue queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_dequeue().has_value());

    queue.enqueue("one", "conn-1");
    queue.enqueue("two", "conn-2");
    EXPECT_EQ(queue.size(), 2u);

    auto first = queue.try_dequeue();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->raw_text, "one");
    EXPECT_EQ(first->source, "conn-1");

    auto second = queue.try_dequeue();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->raw_text, "two");
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.total_enqueued(), 2u);
}

TEST(MessageQueue, ConcurrentProducersLoseNothing) {
    MessageQueue queue(100);
    const int producers = 4;
    const int per_producer = 500;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&queue, p]() {
            for (int i = 0; i < per_producer; ++i) {
                queue.enqueue(std::to_string(p) + ":" + std::to_string(i), "conn-" + std::to_string(p));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> seen;
    std::vector<int> last_index(producers, -1);
    while (auto message = queue.try_dequeue()) {
        EXPECT_TRUE(seen.insert(message->raw_text).second) << "duplicate " << message->raw_text;
        auto colon = message->raw_text.find(':');
        int producer = std::stoi(message->raw_text.substr(0, colon));
        int index = std::stoi(message->raw_text.substr(colon + 1));
        EXPECT_GT(index, last_index[producer]);
        last_index[producer] = index;
    }

    EXPECT_EQ(seen.size(), static_cast<size_t>(producers * per_producer));
    EXPECT_EQ(queue.total_enqueued(), static_cast<uint64_t>(producers * per_producer));
}

TEST(MessageQueue, ClearDropsPendingMessages) {
    MessageQueue queue;
    queue.enqueue("a", "conn-1");
    queue.enqueue("b", "conn-1");
    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_dequeue().has_value());
}

TEST(MessageQueue, WarnsOncePerBacklogCrossing) {
    MessageQueue queue(4);
    for (int i = 0; i < 9; ++i) {
        queue.enqueue("m", "conn-1");
    }
    EXPECT_EQ(queue.backlog_warnings(), 1u);

    // Draining to 3 keeps the warning latched, 2 (half the mark) re-arms it.
    while (queue.size() > 3) {
        queue.try_dequeue();
    }
    queue.enqueue("m", "conn-1");
    EXPECT_EQ(queue.backlog_warnings(), 1u);
    while (queue.size() > 2) {
        queue.try_dequeue();
    }
    queue.enqueue("m", "conn-1");
    queue.enqueue("m", "conn-1");
    EXPECT_EQ(queue.backlog_warnings(), 2u);
}

TEST(MessageQueue, SingleMessageMarkReArms) {
    MessageQueue queue(1);
    queue.enqueue("a", "conn-1");
    EXPECT_EQ(queue.backlog_warnings(), 1u);
    queue.try_dequeue();
    queue.enqueue("b", "conn-1");
    EXPECT_EQ(queue.backlog_warnings(), 2u);
}

TEST(MessageQueue, ZeroMarkNeverWarns) {
    MessageQueue queue(0);
    for (int i = 0; i < 50; ++i) {
        queue.enqueue("m", "conn-1");
    }
    EXPECT_EQ(queue.backlog_warnings(), 0u);
}

TEST(ConnectionRegistry, NonStandardExceptionIsContained) {
    ConnectionRegistry registry;
    auto good = std::make_shared<RecordingConnection>();
    registry.register_connection("odd", std::make_shared<ErrnoThrowingConnection>());
    registry.register_connection("good", good);

    EXPECT_FALSE(registry.send("odd", "hello"));
    EXPECT_EQ(registry.broadcast("all"), 1u);
    EXPECT_EQ(good->frame_count(), 1u);
}

TEST(ConnectionRegistry, SendIsBestEffort) {
    ConnectionRegistry registry;
    auto good = std::make_shared<RecordingConnection>();
    auto failing = std::make_shared<RecordingConnection>();
    auto throwing = std::make_shared<RecordingConnection>();
    failing->set_fail(true);
    throwing->set_throw(true);

    registry.register_connection("good", good);
    registry.register_connection("failing", failing);
    registry.register_connection("throwing", throwing);
    registry.register_connection("", good);
    registry.register_connection("null", nullptr);
    EXPECT_EQ(registry.size(), 3u);

    EXPECT_TRUE(registry.send("good", "hello"));
    EXPECT_FALSE(registry.send("failing", "hello"));
    EXPECT_FALSE(registry.send("throwing", "hello"));
    EXPECT_FALSE(registry.send("unknown", "hello"));

    EXPECT_EQ(registry.broadcast("all"), 1u);
    EXPECT_EQ(good->frames(), (std::vector<std::string>{"hello", "all"}));
}

TEST(ConnectionRegistry, UnregisterAndClear) {
    ConnectionRegistry registry;
    registry.register_connection("a", std::make_shared<RecordingConnection>());
    registry.register_connection("b", std::make_shared<RecordingConnection>());

    EXPECT_TRUE(registry.unregister_connection("a"));
    EXPECT_FALSE(registry.unregister_connection("a"));
    EXPECT_EQ(registry.find("a"), nullptr);
    EXPECT_NE(registry.find("b"), nullptr);
    EXPECT_EQ(registry.ids(), std::vector<std::string>{"b"});

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DispatchLoopTest, DrainIsBoundedPerTick) {
    auto loop = make_loop();
    loop->mark_ready();

    for (int i = 0; i < 25; ++i) {
        queue_.enqueue(make_request(i, "ping"), "conn-1");
    }

    EXPECT_EQ(loop->drain_tick(10), 10u);
    EXPECT_EQ(queue_.size(), 15u);
    EXPECT_EQ(loop->drain_tick(10), 10u);
    EXPECT_EQ(loop->drain_tick(10), 5u);
    EXPECT_EQ(loop->drain_tick(10), 0u);
    EXPECT_EQ(loop->processed_count(), 25u);

    auto frames = client_->frames();
    ASSERT_EQ(frames.size(), 25u);
    for (int i = 0; i < 25; ++i) {
        EXPECT_EQ(parse_response(frames[i])["id"], i);
    }
}

TEST_F(DispatchLoopTest, TickUsesConfiguredBound) {
    DispatchOptions options;
    options.max_messages_per_tick = 3;
    auto loop = make_loop(options);
    loop->mark_ready();

    for (int i = 0; i < 5; ++i) {
        queue_.enqueue(make_request(i, "ping"), "conn-1");
    }
    EXPECT_EQ(loop->tick(), 3u);
    EXPECT_EQ(loop->tick(), 2u);
}

TEST_F(DispatchLoopTest, NothingRunsBeforeStartupFallback) {
    DispatchOptions options;
    options.startup_delay_ticks = 3;
    auto loop = make_loop(options);

    int initializations = 0;
    loop->set_initializer([&initializations]() { ++initializations; });

    queue_.enqueue(make_request(1, "ping"), "conn-1");

    EXPECT_EQ(loop->tick(), 0u);
    EXPECT_EQ(loop->tick(), 0u);
    EXPECT_FALSE(loop->is_ready());
    EXPECT_EQ(initializations, 0);

    EXPECT_EQ(loop->tick(), 1u);
    EXPECT_TRUE(loop->is_ready());
    EXPECT_EQ(initializations, 1);
    EXPECT_EQ(client_->frame_count(), 1u);

    queue_.enqueue(make_request(2, "ping"), "conn-1");
    EXPECT_EQ(loop->tick(), 1u);
    EXPECT_EQ(initializations, 1);
}

TEST_F(DispatchLoopTest, ThrowingInitializerStillOpensLoop) {
    DispatchOptions options;
    options.startup_delay_ticks = 1;
    auto loop = make_loop(options);
    loop->set_initializer([]() { throw std::runtime_error("registration failed"); });

    queue_.enqueue(make_request(1, "ping"), "conn-1");
    EXPECT_EQ(loop->tick(), 1u);
    EXPECT_TRUE(loop->is_ready());
}

TEST_F(DispatchLoopTest, DrainFromAnotherThreadIsRefused) {
    auto loop = make_loop();
    loop->mark_ready();
    EXPECT_EQ(loop->drain_tick(10), 0u);

    queue_.enqueue(make_request(1, "ping"), "conn-1");

    size_t drained_elsewhere = 99;
    std::thread other([&]() { drained_elsewhere = loop->drain_tick(10); });
    other.join();

    EXPECT_EQ(drained_elsewhere, 0u);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_EQ(loop->drain_tick(10), 1u);
}

TEST_F(DispatchLoopTest, ResetUnbindsExecutionThread) {
    auto loop = make_loop();
    loop->mark_ready();
    EXPECT_EQ(loop->drain_tick(1), 0u);

    loop->reset();
    EXPECT_FALSE(loop->is_ready());

    queue_.enqueue(make_request(1, "ping"), "conn-1");
    size_t drained = 0;
    std::thread other([&]() {
        loop->mark_ready();
        drained = loop->drain_tick(10);
    });
    other.join();
    EXPECT_EQ(drained, 1u);
}

TEST_F(DispatchLoopTest, FailuresDoNotStopRemainingItems) {
    engine_.register_method("app/explode", [](const bridge::protocol::Request&) -> bridge::protocol::Response {
        throw std::runtime_error("boom");
    });

    auto loop = make_loop();
    loop->mark_ready();

    queue_.enqueue(make_request(1, "app/explode"), "conn-1");
    queue_.enqueue("garbage", "conn-1");
    queue_.enqueue(make_notification("initialized"), "conn-1");
    queue_.enqueue(make_request(2, "ping"), "gone");
    queue_.enqueue(make_request(3, "ping"), "conn-1");

    EXPECT_EQ(loop->drain_tick(10), 5u);

    auto frames = client_->frames();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(parse_response(frames[0])["error"]["code"], error_code::INTERNAL_ERROR);
    EXPECT_EQ(parse_response(frames[1])["error"]["code"], error_code::PARSE_ERROR);
    EXPECT_EQ(parse_response(frames[2])["id"], 3);
}

TEST(BridgeServer, InitializeRunsRegistrarOnce) {
    BridgeServer server;
    int runs = 0;
    server.set_registrar([&runs](BridgeServer& target) {
        ++runs;
        target.register_tool(make_tool_definition("hello"), [](const Value&) { return ToolResult::success("hi"); });
    });

    server.initialize();
    server.initialize();

    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(server.is_initialized());
    EXPECT_TRUE(server.loop().is_ready());
    EXPECT_TRUE(server.tools().has_tool("hello"));
}

TEST(BridgeServer, RoutesResponsesToTheOriginatingConnection) {
    BridgeServer server;
    auto first = std::make_shared<RecordingConnection>();
    auto second = std::make_shared<RecordingConnection>();
    server.connections().register_connection("conn-1", first);
    server.connections().register_connection("conn-2", second);
    server.initialize();

    server.enqueue(make_request("a", "ping"), "conn-1");
    server.enqueue(make_request("b", "ping"), "conn-2");
    server.enqueue(make_request("c", "ping"), "conn-1");
    EXPECT_EQ(server.tick(), 3u);

    ASSERT_EQ(first->frame_count(), 2u);
    ASSERT_EQ(second->frame_count(), 1u);
    EXPECT_EQ(parse_response(first->frames()[1])["id"], "c");
    EXPECT_EQ(parse_response(second->frames()[0])["id"], "b");
}

TEST(BridgeServer, BroadcastNotificationReachesEveryClient) {
    BridgeServer server;
    auto first = std::make_shared<RecordingConnection>();
    auto second = std::make_shared<RecordingConnection>();
    server.connections().register_connection("conn-1", first);
    server.connections().register_connection("conn-2", second);

    EXPECT_EQ(server.broadcast_notification("notifications/tools/list_changed"), 2u);
    ASSERT_EQ(first->frame_count(), 1u);
    EXPECT_EQ(first->frames()[0], R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");

    server.broadcast_notification("app/progress", Value::object({{"percent", 50}}));
    auto progress = parse_response(second->frames()[1]);
    EXPECT_EQ(progress["params"]["percent"], 50);
    EXPECT_FALSE(progress.contains("id"));
}

TEST(BridgeServer, ShutdownAndResetAllowRestart) {
    BridgeServer server;
    server.set_registrar([](BridgeServer& target) {
        target.register_tool(make_tool_definition("old"), [](const Value&) { return ToolResult::success("old"); });
    });
    server.register_method("app/custom", [](const bridge::protocol::Request& request) {
        return bridge::protocol::Response::success(request.id, Value::object());
    });
    server.initialize();
    server.connections().register_connection("conn-1", std::make_shared<RecordingConnection>());
    server.enqueue(make_request(1, "ping"), "conn-1");

    server.shutdown();
    EXPECT_FALSE(server.is_initialized());
    EXPECT_FALSE(server.loop().is_ready());
    EXPECT_TRUE(server.queue().empty());
    EXPECT_EQ(server.connections().size(), 0u);

    server.reset();
    EXPECT_EQ(server.tools().size(), 0u);
    EXPECT_FALSE(server.engine().has_method("app/custom"));
    EXPECT_TRUE(server.engine().has_method("ping"));

    server.set_registrar([](BridgeServer& target) {
        target.register_tool(make_tool_definition("new"), [](const Value&) { return ToolResult::success("new"); });
    });
    server.initialize();
    EXPECT_TRUE(server.tools().has_tool("new"));
    EXPECT_FALSE(server.tools().has_tool("old"));
}

TEST(BuiltinHandlers, EchoAndStatusTools) {
    BridgeServer server;
    auto client = std::make_shared<RecordingConnection>();
    server.connections().register_connection("conn-1", client);
    server.set_registrar(bridge::builtin::register_builtin_handlers);
    server.initialize();

    server.enqueue(make_request(1, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hello"}}}}), "conn-1");
    server.enqueue(make_request(2, "tools/call", {{"name", "echo"}}), "conn-1");
    server.enqueue(make_request(3, "tools/call", {{"name", "server_status"}}), "conn-1");
    EXPECT_EQ(server.tick(), 3u);

    auto frames = client->frames();
    ASSERT_EQ(frames.size(), 3u);

    auto echo = parse_response(frames[0]);
    EXPECT_EQ(echo["result"]["content"][0]["text"], "hello");

    auto missing = parse_response(frames[1]);
    EXPECT_EQ(missing["result"]["isError"], true);
    EXPECT_EQ(missing["result"]["content"][0]["text"], "Missing required argument: message");

    auto status = parse_response(frames[2]);
    auto& block = status["result"]["content"][0];
    EXPECT_EQ(block["mimeType"], "application/json");
    auto snapshot = nlohmann::json::parse(block["text"].get<std::string>());
    EXPECT_EQ(snapshot["name"], "mcp-bridge");
    EXPECT_EQ(snapshot["tools"], 2);
    EXPECT_EQ(snapshot["resources"], 2);
    EXPECT_EQ(snapshot["connections"], 1);
    EXPECT_EQ(snapshot["ready"], true);
}

TEST(BuiltinHandlers, BridgeResources) {
    BridgeServer server;
    auto client = std::make_shared<RecordingConnection>();
    server.connections().register_connection("conn-1", client);
    server.set_registrar(bridge::builtin::register_builtin_handlers);
    server.initialize();

    server.enqueue(make_request(1, "resources/read", {{"uri", bridge::builtin::STATUS_RESOURCE_URI}}), "conn-1");
    server.enqueue(make_request(2, "resources/read", {{"uri", "bridge://tools/echo"}}), "conn-1");
    EXPECT_EQ(server.tick(), 2u);

    auto frames = client->frames();
    ASSERT_EQ(frames.size(), 2u);

    auto status = parse_response(frames[0]);
    auto& status_content = status["result"]["contents"][0];
    EXPECT_EQ(status_content["uri"], bridge::builtin::STATUS_RESOURCE_URI);
    EXPECT_EQ(nlohmann::json::parse(status_content["text"].get<std::string>())["protocolVersion"], "2024-11-05");

    auto tools = parse_response(frames[1]);
    auto& tools_content = tools["result"]["contents"][0];
    EXPECT_EQ(tools_content["uri"], "bridge://tools/echo");
    auto listing = nlohmann::json::parse(tools_content["text"].get<std::string>());
    EXPECT_EQ(listing["count"], 2);
    EXPECT_EQ(listing["tools"][0]["name"], "echo");
}
