#include "connection_registry.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

void ConnectionRegistry::register_connection(const ConnectionId& id, std::shared_ptr<Connection> connection) {
    if (id.empty() || !connection) {
        LOG4CPLUS_WARN(transport_logger(), "Ignoring connection registration without id or connection");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[id] = std::move(connection);
    }
    LOG4CPLUS_INFO(transport_logger(), "Client connected: " << id);
}

bool ConnectionRegistry::unregister_connection(const ConnectionId& id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = connections_.erase(id) > 0;
    }
    if (removed) {
        LOG4CPLUS_INFO(transport_logger(), "Client disconnected: " << id);
    }
    return removed;
}

std::shared_ptr<Connection> ConnectionRegistry::find(const ConnectionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ConnectionId> ConnectionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionId> result;
    result.reserve(connections_.size());
    for (const auto& entry : connections_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.clear();
}

bool ConnectionRegistry::deliver(const ConnectionId& id, Connection& connection, const std::string& text) {
    try {
        if (connection.send(text)) {
            return true;
        }
        LOG4CPLUS_WARN(transport_logger(), "Failed to deliver message to client " << id);
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(transport_logger(), "Failed to deliver message to client " << id << ": " << exc.what());
    } catch (...) {
        LOG4CPLUS_WARN(transport_logger(), "Failed to deliver message to client " << id << ": unknown exception");
    }
    return false;
}

bool ConnectionRegistry::send(const ConnectionId& id, const std::string& text) const {
    std::shared_ptr<Connection> connection = find(id);
    if (!connection) {
        LOG4CPLUS_WARN(transport_logger(), "Cannot send to unknown client " << id);
        return false;
    }
    return deliver(id, *connection, text);
}

size_t ConnectionRegistry::broadcast(const std::string& text) const {
    std::vector<std::pair<ConnectionId, std::shared_ptr<Connection>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.assign(connections_.begin(), connections_.end());
    }

    size_t delivered = 0;
    for (const auto& [id, connection] : targets) {
        if (deliver(id, *connection, text)) {
            ++delivered;
        }
    }
    return delivered;
}

} // namespace bridge
