#include "test_helpers.hpp"

#include <gtest/gtest.h>

bool RecordingConnection::send(const std::string& text) {
    if (throw_) {
        throw std::runtime_error("connection reset");
    }
    if (fail_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.push_back(text);
    return true;
}

std::vector<std::string> RecordingConnection::frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
}

size_t RecordingConnection::frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

std::string make_request(const nlohmann::json& id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request.dump();
}

std::string make_notification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json request = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request.dump();
}

nlohmann::json parse_response(const std::string& text) {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    EXPECT_FALSE(parsed.is_discarded()) << "Malformed response: " << text;
    return parsed;
}

bridge::protocol::ToolDefinition make_tool_definition(const std::string& name,
                                                      const std::vector<std::string>& required) {
    bridge::protocol::ToolDefinition definition;
    definition.name = name;
    definition.description = "Test tool " + name;
    for (const auto& argument : required) {
        bridge::protocol::PropertySchema schema;
        schema.type = "string";
        schema.description = argument;
        definition.input_schema.properties[argument] = schema;
        definition.input_schema.required.push_back(argument);
    }
    return definition;
}
