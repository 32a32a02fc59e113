#include "builtin_handlers.hpp"

#include "json_codec.hpp"

#include <cstdint>
#include <vector>

namespace bridge::builtin {

namespace {

struct StatusSnapshot {
    protocol::ServerInfo server_info;
    size_t tools = 0;
    size_t resources = 0;
    size_t connections = 0;
    size_t pending_messages = 0;
    uint64_t received_messages = 0;
    uint64_t processed_messages = 0;
    bool ready = false;

    void describe(json::RecordWriter& rw) const {
        rw.field("name", server_info.name);
        rw.field("version", server_info.version);
        rw.field("protocolVersion", protocol::MCP_PROTOCOL_VERSION);
        rw.field("tools", tools);
        rw.field("resources", resources);
        rw.field("connections", connections);
        rw.field("pendingMessages", pending_messages);
        rw.field("receivedMessages", received_messages);
        rw.field("processedMessages", processed_messages);
        rw.field("ready", ready);
    }
};

struct ToolListing {
    std::vector<protocol::ToolDefinition> tools;

    void describe(json::RecordWriter& rw) const {
        rw.field("count", tools.size());
        rw.field("tools", tools);
    }
};

StatusSnapshot snapshot(BridgeServer& server) {
    StatusSnapshot status;
    status.server_info = server.engine().server_info();
    status.tools = server.tools().size();
    status.resources = server.resources().size();
    status.connections = server.connections().size();
    status.pending_messages = server.queue().size();
    status.received_messages = server.queue().total_enqueued();
    status.processed_messages = server.loop().processed_count();
    status.ready = server.loop().is_ready();
    return status;
}

protocol::ToolDefinition echo_definition() {
    protocol::ToolDefinition definition;
    definition.name = "echo";
    definition.description = "Returns the given message unchanged";

    protocol::PropertySchema message;
    message.type = "string";
    message.description = "Text to echo back";
    definition.input_schema.properties["message"] = message;
    definition.input_schema.required.push_back("message");
    return definition;
}

protocol::ToolDefinition status_definition() {
    protocol::ToolDefinition definition;
    definition.name = "server_status";
    definition.description = "Reports registry sizes, connections and queue state";
    return definition;
}

} // namespace

void register_builtin_handlers(BridgeServer& server) {
    server.register_tool(echo_definition(), [](const json::Value& arguments) {
        const json::Value& message = arguments["message"];
        if (message.is_string()) {
            return protocol::ToolResult::success(message.string_ref());
        }
        return protocol::ToolResult::success(json::serialize(message));
    });

    server.register_tool(status_definition(), [&server](const json::Value&) {
        return protocol::ToolResult::success(std::vector<protocol::Content>{protocol::Content::json_block(snapshot(server))});
    });

    protocol::ResourceDefinition status;
    status.uri = STATUS_RESOURCE_URI;
    status.name = "Server Status";
    status.description = "Current bridge state";
    server.register_resource(status, [&server]() {
        protocol::ResourceContent content;
        content.uri = STATUS_RESOURCE_URI;
        content.text = json::serialize(snapshot(server));
        return content;
    });

    protocol::ResourceDefinition tools;
    tools.uri = TOOLS_RESOURCE_PATTERN;
    tools.name = "Tool Listing";
    tools.description = "Registered tools with their input schemas";
    server.register_resource(tools, [&server]() {
        protocol::ResourceContent content;
        content.text = json::serialize(ToolListing{server.tools().all_tools()});
        return content;
    });
}

} // namespace bridge::builtin
