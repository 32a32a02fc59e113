#pragma once

#include "protocol.hpp"
#include "registry/resource_registry.hpp"
#include "registry/tool_registry.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace bridge::rpc {

using MethodHandler = std::function<protocol::Response(const protocol::Request& request)>;

/**
 * JSON-RPC 2.0 message processor.
 *
 * Turns one raw text frame into at most one response frame. Requests always
 * get exactly one response; notifications never get one, even when they fail.
 * Only a frame that cannot be read as a request at all is answered with a
 * null id.
 */
class JsonRpcEngine {
public:
    JsonRpcEngine(registry::ToolRegistry& tools, registry::ResourceRegistry& resources,
                  protocol::ServerInfo server_info = {});

    /// Adds or replaces a method. Built-in methods can be overridden.
    void register_method(const std::string& method, MethodHandler handler);
    bool unregister_method(const std::string& method);
    bool has_method(const std::string& method) const;

    /// Restores the built-in method table, dropping application methods.
    void reset_methods();

    std::optional<std::string> process_message(const std::string& raw_text);

    /// Dispatches an already decoded request. Never throws.
    protocol::Response process_request(const protocol::Request& request);

    const protocol::ServerInfo& server_info() const { return server_info_; }

private:
    void register_default_methods();

    protocol::Response handle_initialize(const protocol::Request& request);
    protocol::Response handle_initialized(const protocol::Request& request);
    protocol::Response handle_ping(const protocol::Request& request);
    protocol::Response handle_tools_list(const protocol::Request& request);
    protocol::Response handle_tools_call(const protocol::Request& request);
    protocol::Response handle_resources_list(const protocol::Request& request);
    protocol::Response handle_resources_read(const protocol::Request& request);
    protocol::Response handle_prompts_list(const protocol::Request& request);

    registry::ToolRegistry& tools_;
    registry::ResourceRegistry& resources_;
    protocol::ServerInfo server_info_;
    std::unordered_map<std::string, MethodHandler> methods_;
};

} // namespace bridge::rpc
