#include "protocol.hpp"

namespace bridge::protocol {

using Emit = json::RecordWriter::Emit;

void RpcError::describe(json::RecordWriter& rw) const {
    rw.field("code", code);
    rw.field("message", message);
    rw.field("data", data);
}

Response Response::failure(const json::Value& id, int code, std::string message, json::Value data) {
    Response response;
    response.id_ = id;
    response.error_ = RpcError{code, std::move(message), std::move(data)};
    return response;
}

std::string Response::to_json() const {
    return json::serialize(*this);
}

void Response::describe(json::RecordWriter& rw) const {
    rw.property("jsonrpc", JSONRPC_VERSION);
    // A response always names the call it answers, null when it could not be read.
    rw.field("id", id_, Emit::Always);
    rw.field("result", result_);
    rw.field("error", error_);
}

Content Content::text_block(std::string text) {
    Content content;
    content.text = std::move(text);
    return content;
}

Content Content::image(std::string base64_data, std::string mime_type) {
    Content content;
    content.type = "image";
    content.data = std::move(base64_data);
    content.mime_type = std::move(mime_type);
    return content;
}

void Content::describe(json::RecordWriter& rw) const {
    rw.field("type", type);
    rw.field("text", text);
    rw.field("mimeType", mime_type);
    rw.field("data", data);
}

ToolResult ToolResult::success(std::string text) {
    ToolResult result;
    result.content.push_back(Content::text_block(std::move(text)));
    return result;
}

ToolResult ToolResult::success(std::vector<Content> content) {
    ToolResult result;
    result.content = std::move(content);
    return result;
}

ToolResult ToolResult::error(std::string message) {
    ToolResult result;
    result.content.push_back(Content::text_block(std::move(message)));
    result.is_error = true;
    return result;
}

std::string ToolResult::first_text() const {
    if (content.empty() || !content.front().text) {
        return "";
    }
    return *content.front().text;
}

void ToolResult::describe(json::RecordWriter& rw) const {
    rw.field("content", content);
    rw.field("isError", is_error);
}

void PropertySchema::describe(json::RecordWriter& rw) const {
    rw.field("type", type);
    rw.field("description", description);
    rw.field("enum_", enum_);
    rw.field("default_", default_);
}

void InputSchema::describe(json::RecordWriter& rw) const {
    rw.field("type", type);
    rw.field("properties", properties);
    rw.field("required", required);
}

void ToolDefinition::describe(json::RecordWriter& rw) const {
    rw.field("name", name);
    rw.field("description", description);
    rw.field("inputSchema", input_schema);
}

void ResourceDefinition::describe(json::RecordWriter& rw) const {
    rw.field("uri", uri);
    rw.field("name", name);
    rw.field("description", description);
    rw.field("mimeType", mime_type);
}

void ResourceContent::describe(json::RecordWriter& rw) const {
    rw.field("uri", uri);
    rw.field("mimeType", mime_type);
    rw.field("text", text);
    rw.field("blob", blob);
}

void ResourceResult::describe(json::RecordWriter& rw) const {
    rw.field("contents", contents);
}

void ServerInfo::describe(json::RecordWriter& rw) const {
    rw.field("name", name);
    rw.field("version", version);
}

void ServerCapabilities::describe(json::RecordWriter& rw) const {
    rw.property("tools", json::Value::object({{"listChanged", tools_list_changed}}));
    rw.property("resources", json::Value::object({
        {"subscribe", resources_subscribe},
        {"listChanged", resources_list_changed},
    }));
    rw.property("prompts", json::Value::object({{"listChanged", prompts_list_changed}}));
}

void InitializeResult::describe(json::RecordWriter& rw) const {
    rw.field("protocolVersion", protocol_version);
    rw.field("capabilities", capabilities);
    rw.field("serverInfo", server_info);
}

} // namespace bridge::protocol
