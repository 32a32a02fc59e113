#pragma once

#include "connection_registry.hpp"
#include "dispatch_loop.hpp"
#include "message_queue.hpp"
#include "protocol.hpp"
#include "registry/resource_registry.hpp"
#include "registry/tool_registry.hpp"
#include "rpc_engine.hpp"

#include <functional>
#include <string>

namespace bridge {

struct BridgeOptions {
    protocol::ServerInfo server_info;
    DispatchOptions dispatch;
    size_t backlog_warning = 1000;
};

/**
 * Owns one bridge instance: registries, engine, inbound queue, connections
 * and the dispatch loop.
 *
 * Network threads call enqueue() (and broadcast()); everything else belongs to
 * the execution thread, which calls tick() periodically.
 *
 * Restart sequence: shutdown(), reset(), set_registrar(), initialize().
 */
class BridgeServer {
public:
    /// Populates the registries; run once per initialize().
    using Registrar = std::function<void(BridgeServer& server)>;

    explicit BridgeServer(BridgeOptions options = {});

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    void register_tool(protocol::ToolDefinition definition, registry::ToolHandler handler);
    void register_resource(protocol::ResourceDefinition definition, registry::ResourceHandler handler);
    void register_method(const std::string& method, rpc::MethodHandler handler);

    void set_registrar(Registrar registrar);

    /// Runs the registrar and opens the dispatch loop. Repeated calls are no-ops.
    void initialize();
    bool is_initialized() const { return initialized_; }

    /// Network-thread entry point for one inbound text frame.
    void enqueue(std::string raw_text, const ConnectionId& source);

    size_t drain_tick(size_t max_count) { return loop_.drain_tick(max_count); }
    size_t tick() { return loop_.tick(); }

    /// Sends a frame to every connected client; returns how many got it.
    size_t broadcast(const std::string& text);

    /// Sends a JSON-RPC notification to every connected client.
    size_t broadcast_notification(const std::string& method, const json::Value& params = {});

    /// Drops pending messages and connections and closes the dispatch loop.
    void shutdown();

    /// Empties registries and restores the built-in method table.
    void reset();

    registry::ToolRegistry& tools() { return tools_; }
    registry::ResourceRegistry& resources() { return resources_; }
    rpc::JsonRpcEngine& engine() { return engine_; }
    MessageQueue& queue() { return queue_; }
    ConnectionRegistry& connections() { return connections_; }
    DispatchLoop& loop() { return loop_; }
    const BridgeOptions& options() const { return options_; }

private:
    void run_registrar();

    BridgeOptions options_;
    registry::ToolRegistry tools_;
    registry::ResourceRegistry resources_;
    rpc::JsonRpcEngine engine_;
    MessageQueue queue_;
    ConnectionRegistry connections_;
    DispatchLoop loop_;

    Registrar registrar_;
    bool initialized_ = false;
};

} // namespace bridge
