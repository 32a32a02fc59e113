#pragma once

#include "json_codec.hpp"
#include "json_value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bridge::protocol {

constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace error_code {
    // JSON-RPC 2.0
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Bridge specific
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int RESOURCE_NOT_FOUND = -32002;
    constexpr int EXECUTION_ERROR = -32003;
    constexpr int TIMEOUT_ERROR = -32004;
    constexpr int HOST_ERROR = -32005;
} // namespace error_code

struct RpcError {
    int code = error_code::INTERNAL_ERROR;
    std::string message;
    json::Value data;

    void describe(json::RecordWriter& rw) const;
};

/**
 * Parsed JSON-RPC call. A missing (or null) id makes it a notification.
 */
struct Request {
    json::Value id;
    bool has_id = false;
    std::string method;
    json::Value params;

    bool is_notification() const { return !has_id; }
};

/**
 * JSON-RPC response. Exactly one of result and error is set; the factories
 * are the only way to build one.
 */
class Response {
public:
    template <typename T>
    static Response success(const json::Value& id, const T& result) {
        Response response;
        response.id_ = id;
        response.result_ = json::RawJson{json::serialize(result)};
        return response;
    }

    static Response failure(const json::Value& id, int code, std::string message, json::Value data = {});

    const json::Value& id() const { return id_; }
    bool is_error() const { return error_.has_value(); }
    const std::optional<RpcError>& error() const { return error_; }
    const std::optional<json::RawJson>& result() const { return result_; }

    std::string to_json() const;
    void describe(json::RecordWriter& rw) const;

private:
    Response() = default;

    json::Value id_;
    std::optional<json::RawJson> result_;
    std::optional<RpcError> error_;
};

/// One block of a tool result.
struct Content {
    std::string type = "text";
    std::optional<std::string> text;
    std::optional<std::string> mime_type;
    std::optional<std::string> data; // base64 payload for binary content

    static Content text_block(std::string text);
    static Content image(std::string base64_data, std::string mime_type = "image/png");

    /// Serializes any value or record into a JSON text block.
    template <typename T>
    static Content json_block(const T& value) {
        Content content;
        content.text = json::serialize(value);
        content.mime_type = "application/json";
        return content;
    }

    void describe(json::RecordWriter& rw) const;
};

struct ToolResult {
    std::vector<Content> content;
    bool is_error = false;

    static ToolResult success(std::string text);
    static ToolResult success(std::vector<Content> content);
    static ToolResult error(std::string message);

    /// Text of the first block, empty when there is none.
    std::string first_text() const;

    void describe(json::RecordWriter& rw) const;
};

struct PropertySchema {
    std::string type;
    std::string description;
    std::optional<std::vector<std::string>> enum_;
    json::Value default_;

    void describe(json::RecordWriter& rw) const;
};

struct InputSchema {
    std::string type = "object";
    std::map<std::string, PropertySchema> properties;
    std::vector<std::string> required;

    void describe(json::RecordWriter& rw) const;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    InputSchema input_schema;

    void describe(json::RecordWriter& rw) const;
};

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "application/json";

    void describe(json::RecordWriter& rw) const;
};

struct ResourceContent {
    std::string uri;
    std::string mime_type = "application/json";
    std::optional<std::string> text;
    std::optional<std::string> blob; // base64 payload for binary content

    void describe(json::RecordWriter& rw) const;
};

struct ResourceResult {
    std::vector<ResourceContent> contents;

    void describe(json::RecordWriter& rw) const;
};

struct ServerInfo {
    std::string name = "mcp-bridge";
    std::string version = "1.0.0";

    void describe(json::RecordWriter& rw) const;
};

struct ServerCapabilities {
    bool tools_list_changed = true;
    bool resources_subscribe = false;
    bool resources_list_changed = true;
    bool prompts_list_changed = false;

    void describe(json::RecordWriter& rw) const;
};

struct InitializeResult {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ServerCapabilities capabilities;
    ServerInfo server_info;

    void describe(json::RecordWriter& rw) const;
};

} // namespace bridge::protocol
