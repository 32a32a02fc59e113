#include "bridge_server.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

namespace {

struct Notification {
    std::string method;
    json::Value params;

    void describe(json::RecordWriter& rw) const {
        rw.property("jsonrpc", protocol::JSONRPC_VERSION);
        rw.field("method", method);
        rw.field("params", params);
    }
};

} // namespace

BridgeServer::BridgeServer(BridgeOptions options)
    : options_(std::move(options)),
      engine_(tools_, resources_, options_.server_info),
      queue_(options_.backlog_warning),
      loop_(queue_, engine_, connections_, options_.dispatch) {
    loop_.set_initializer([this]() { run_registrar(); });
}

void BridgeServer::register_tool(protocol::ToolDefinition definition, registry::ToolHandler handler) {
    tools_.register_tool(std::move(definition), std::move(handler));
}

void BridgeServer::register_resource(protocol::ResourceDefinition definition, registry::ResourceHandler handler) {
    resources_.register_resource(std::move(definition), std::move(handler));
}

void BridgeServer::register_method(const std::string& method, rpc::MethodHandler handler) {
    engine_.register_method(method, std::move(handler));
}

void BridgeServer::set_registrar(Registrar registrar) {
    registrar_ = std::move(registrar);
}

void BridgeServer::initialize() {
    run_registrar();
    loop_.mark_ready();
}

void BridgeServer::run_registrar() {
    if (initialized_) {
        return;
    }
    initialized_ = true;

    if (registrar_) {
        try {
            registrar_(*this);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Registrar failed: " << exc.what());
        }
    }

    LOG4CPLUS_INFO(core_logger(), options_.server_info.name << " initialized with " << tools_.size() << " tool(s), "
                                                            << resources_.size() << " resource(s)");
}

void BridgeServer::enqueue(std::string raw_text, const ConnectionId& source) {
    LOG4CPLUS_DEBUG(core_logger(), "Received from " << source << ": " << log_excerpt(raw_text, 100));
    queue_.enqueue(std::move(raw_text), source);
}

size_t BridgeServer::broadcast(const std::string& text) {
    return connections_.broadcast(text);
}

size_t BridgeServer::broadcast_notification(const std::string& method, const json::Value& params) {
    return broadcast(json::serialize(Notification{method, params}));
}

void BridgeServer::shutdown() {
    size_t dropped = queue_.size();
    queue_.clear();
    connections_.clear();
    loop_.reset();
    initialized_ = false;

    LOG4CPLUS_INFO(core_logger(), options_.server_info.name << " shut down, " << dropped
                                                            << " pending message(s) dropped");
}

void BridgeServer::reset() {
    tools_.clear();
    resources_.clear();
    engine_.reset_methods();
    registrar_ = nullptr;
}

} // namespace bridge
