#include "rpc_engine.hpp"

#include "logger.hpp"

#include <variant>

#include <log4cplus/loggingmacros.h>

namespace bridge::rpc {

using protocol::Request;
using protocol::Response;
namespace error_code = protocol::error_code;

namespace {

struct ToolsListResult {
    std::vector<protocol::ToolDefinition> tools;

    void describe(json::RecordWriter& rw) const { rw.field("tools", tools); }
};

struct ResourcesListResult {
    std::vector<protocol::ResourceDefinition> resources;

    void describe(json::RecordWriter& rw) const { rw.field("resources", resources); }
};

struct PromptsListResult {
    std::vector<json::Value> prompts;

    void describe(json::RecordWriter& rw) const { rw.field("prompts", prompts); }
};

} // namespace

JsonRpcEngine::JsonRpcEngine(registry::ToolRegistry& tools, registry::ResourceRegistry& resources,
                             protocol::ServerInfo server_info)
    : tools_(tools), resources_(resources), server_info_(std::move(server_info)) {
    register_default_methods();
}

void JsonRpcEngine::register_default_methods() {
    methods_.clear();

    register_method("initialize", [this](const Request& r) { return handle_initialize(r); });
    register_method("initialized", [this](const Request& r) { return handle_initialized(r); });
    register_method("notifications/initialized", [this](const Request& r) { return handle_initialized(r); });
    register_method("ping", [this](const Request& r) { return handle_ping(r); });

    register_method("tools/list", [this](const Request& r) { return handle_tools_list(r); });
    register_method("tools/call", [this](const Request& r) { return handle_tools_call(r); });

    register_method("resources/list", [this](const Request& r) { return handle_resources_list(r); });
    register_method("resources/read", [this](const Request& r) { return handle_resources_read(r); });

    register_method("prompts/list", [this](const Request& r) { return handle_prompts_list(r); });
}

void JsonRpcEngine::register_method(const std::string& method, MethodHandler handler) {
    if (method.empty() || !handler) {
        LOG4CPLUS_ERROR(rpc_logger(), "Cannot register method without a name or handler");
        return;
    }
    methods_[method] = std::move(handler);
}

bool JsonRpcEngine::unregister_method(const std::string& method) {
    return methods_.erase(method) > 0;
}

bool JsonRpcEngine::has_method(const std::string& method) const {
    return methods_.count(method) > 0;
}

void JsonRpcEngine::reset_methods() {
    register_default_methods();
}

std::optional<std::string> JsonRpcEngine::process_message(const std::string& raw_text) {
    json::Value request_id;
    bool is_notification = false;

    try {
        std::optional<json::Value> parsed = json::parse(raw_text);
        if (!parsed) {
            LOG4CPLUS_WARN(rpc_logger(), "Failed to parse message: " << log_excerpt(raw_text, 100));
            return Response::failure({}, error_code::PARSE_ERROR, "Failed to parse JSON").to_json();
        }

        if (!parsed->is_object()) {
            return Response::failure({}, error_code::INVALID_REQUEST,
                                     "Invalid JSON-RPC request: expected an object").to_json();
        }

        Request request;
        const json::Value* id = parsed->find("id");
        if (id && !id->is_null()) {
            if (!id->is_string() && !id->is_number()) {
                return Response::failure({}, error_code::INVALID_REQUEST,
                                         "Invalid JSON-RPC request: id must be a string or number").to_json();
            }
            request.id = *id;
            request.has_id = true;
        }
        request_id = request.id;
        is_notification = request.is_notification();

        const json::Value& method = (*parsed)["method"];
        if (!method.is_string() || method.string_ref().empty()) {
            return Response::failure(request.id, error_code::INVALID_REQUEST,
                                     "Invalid JSON-RPC request: method is required").to_json();
        }
        request.method = method.string_ref();

        if (const json::Value* params = parsed->find("params")) {
            request.params = *params;
        }

        LOG4CPLUS_DEBUG(rpc_logger(), "RPC " << (is_notification ? "notification" : "request") << ": "
                                             << request.method);

        Response response = process_request(request);

        if (is_notification) {
            if (response.is_error()) {
                LOG4CPLUS_WARN(rpc_logger(), "Notification " << request.method
                                                             << " failed: " << response.error()->message);
            }
            return std::nullopt;
        }

        return response.to_json();
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), "Error processing message: " << exc.what());
        if (is_notification) {
            return std::nullopt;
        }
        return Response::failure(request_id, error_code::INTERNAL_ERROR, exc.what()).to_json();
    }
}

Response JsonRpcEngine::process_request(const Request& request) {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        LOG4CPLUS_WARN(rpc_logger(), "Method not found: " << request.method);
        return Response::failure(request.id, error_code::METHOD_NOT_FOUND, "Method not found: " + request.method);
    }

    try {
        return it->second(request);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), "Handler error for " << request.method << ": " << exc.what());
        return Response::failure(request.id, error_code::INTERNAL_ERROR, exc.what());
    } catch (...) {
        LOG4CPLUS_ERROR(rpc_logger(), "Handler error for " << request.method << ": unknown exception");
        return Response::failure(request.id, error_code::INTERNAL_ERROR, "Unknown error");
    }
}

Response JsonRpcEngine::handle_initialize(const Request& request) {
    const json::Value& client_info = request.params["clientInfo"];
    if (client_info.is_object()) {
        LOG4CPLUS_INFO(rpc_logger(), "Client " << client_info["name"].as_string("unknown") << " "
                                               << client_info["version"].as_string("") << " initializing (protocol "
                                               << request.params["protocolVersion"].as_string("unspecified") << ")");
    }

    protocol::InitializeResult result;
    result.server_info = server_info_;
    return Response::success(request.id, result);
}

Response JsonRpcEngine::handle_initialized(const Request& request) {
    LOG4CPLUS_INFO(rpc_logger(), "Client initialized successfully");
    return Response::success(request.id, json::Value::object());
}

Response JsonRpcEngine::handle_ping(const Request& request) {
    return Response::success(request.id, json::Value::object());
}

Response JsonRpcEngine::handle_tools_list(const Request& request) {
    return Response::success(request.id, ToolsListResult{tools_.all_tools()});
}

Response JsonRpcEngine::handle_tools_call(const Request& request) {
    std::string tool_name = request.params["name"].as_string();
    if (tool_name.empty()) {
        return Response::failure(request.id, error_code::INVALID_PARAMS, "Tool name is required");
    }

    json::Value arguments = json::Value::object();
    const json::Value* supplied = request.params.find("arguments");
    if (supplied && !supplied->is_null()) {
        if (!supplied->is_object()) {
            return Response::failure(request.id, error_code::INVALID_PARAMS, "Tool arguments must be an object");
        }
        arguments = *supplied;
    }

    LOG4CPLUS_DEBUG(rpc_logger(), "Executing tool: " << tool_name << " with " << arguments.size() << " arguments");

    try {
        protocol::ToolResult result = tools_.execute(tool_name, arguments);
        return Response::success(request.id, result);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), "Tool execution error: " << exc.what());
        return Response::failure(request.id, error_code::EXECUTION_ERROR,
                                 std::string("Tool execution failed: ") + exc.what());
    }
}

Response JsonRpcEngine::handle_resources_list(const Request& request) {
    return Response::success(request.id, ResourcesListResult{resources_.all_resources()});
}

Response JsonRpcEngine::handle_resources_read(const Request& request) {
    std::string uri = request.params["uri"].as_string();
    if (uri.empty()) {
        return Response::failure(request.id, error_code::INVALID_PARAMS, "Resource URI is required");
    }

    registry::ReadResult outcome = resources_.read(uri);
    if (const auto* error = std::get_if<protocol::RpcError>(&outcome)) {
        return Response::failure(request.id, error->code, error->message, error->data);
    }
    return Response::success(request.id, std::get<protocol::ResourceResult>(outcome));
}

Response JsonRpcEngine::handle_prompts_list(const Request& request) {
    return Response::success(request.id, PromptsListResult{});
}

} // namespace bridge::rpc
