#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bridge {

using ConnectionId = std::string;

/// Outbound side of one client connection, implemented by the transport.
class Connection {
public:
    virtual ~Connection() = default;

    /// Delivers one text frame. Returns false (or throws) when delivery failed.
    virtual bool send(const std::string& text) = 0;
};

/**
 * Live connections by id. Safe to use from any thread; sends happen outside
 * the table lock so a slow peer never blocks lookups.
 */
class ConnectionRegistry {
public:
    void register_connection(const ConnectionId& id, std::shared_ptr<Connection> connection);
    bool unregister_connection(const ConnectionId& id);

    std::shared_ptr<Connection> find(const ConnectionId& id) const;
    std::vector<ConnectionId> ids() const;
    size_t size() const;
    void clear();

    /// Best effort: failures are logged and reported as false, never thrown.
    bool send(const ConnectionId& id, const std::string& text) const;

    /// Sends to every connection; returns how many deliveries succeeded.
    size_t broadcast(const std::string& text) const;

private:
    static bool deliver(const ConnectionId& id, Connection& connection, const std::string& text);

    mutable std::mutex mutex_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;
};

} // namespace bridge
