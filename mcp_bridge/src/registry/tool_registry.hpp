#pragma once

#include "../json_value.hpp"
#include "../protocol.hpp"

#include <functional>
#include <string>
#include <vector>

namespace bridge::registry {

/// Tool callable. Receives the call's argument object, returns the tool result.
using ToolHandler = std::function<protocol::ToolResult(const json::Value& arguments)>;

/**
 * Name-keyed store of tool definitions and their handlers.
 *
 * Mutation is only expected during initialization or from the execution
 * thread; the registry does no locking of its own.
 */
class ToolRegistry {
public:
    /// Ignores (and logs) a definition without a name or a handler. Re-registering a name replaces it in place.
    void register_tool(protocol::ToolDefinition definition, ToolHandler handler);
    bool unregister_tool(const std::string& name);
    bool has_tool(const std::string& name) const;

    /// Definitions in registration order.
    std::vector<protocol::ToolDefinition> all_tools() const;
    const protocol::ToolDefinition* find(const std::string& name) const;

    /**
     * Validates required arguments and runs the handler. Every failure comes
     * back as an error result; nothing thrown by a handler escapes.
     */
    protocol::ToolResult execute(const std::string& name, const json::Value& arguments) const;

    size_t size() const { return bindings_.size(); }
    void clear();

    /// Human-readable listing sorted by tool name.
    std::string debug_listing() const;

private:
    struct Binding {
        protocol::ToolDefinition definition;
        ToolHandler handler;
    };

    const Binding* find_binding(const std::string& name) const;
    static std::string validate_arguments(const protocol::ToolDefinition& definition, const json::Value& arguments);

    std::vector<Binding> bindings_;
};

} // namespace bridge::registry
