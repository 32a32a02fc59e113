#pragma once

#include "../connection_registry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace bridge::transport {

/// Largest accepted frame payload; larger length prefixes drop the client.
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

/**
 * Writing side of one accepted client socket. Owns the descriptor.
 * Frames are a 4-byte big-endian length followed by the payload.
 */
class SocketConnection : public Connection {
public:
    explicit SocketConnection(int fd);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    bool send(const std::string& text) override;
    void close();

    int fd() const { return fd_; }

private:
    std::mutex write_mutex_;
    int fd_;
    bool closed_ = false;
};

/**
 * Unix domain socket listener serving every client from one epoll thread.
 *
 * Accepted clients are registered in the ConnectionRegistry as `conn-<n>`.
 * Client sockets are non-blocking: bytes are buffered per client and each
 * complete inbound frame is handed to the frame handler on the epoll thread,
 * so a peer that stalls mid-frame holds up nobody else. Peer close or a bad
 * frame unregisters the client.
 */
class FrameServer {
public:
    using FrameHandler = std::function<void(const ConnectionId& source, std::string frame)>;

    FrameServer(std::string socket_path, ConnectionRegistry& connections, FrameHandler handler);
    ~FrameServer();

    bool start();
    void stop();

    bool is_running() const { return running_.load(); }
    const std::string& socket_path() const { return socket_path_; }
    size_t client_count() const;

    /// Reads one length-prefixed frame from a blocking descriptor (client side).
    static bool read_frame(int fd, std::string& frame);

    /// Writes one length-prefixed frame, retrying short writes.
    static bool write_frame(int fd, const std::string& frame);

    /**
     * Moves every complete frame out of `buffer` into `frames`, leaving a
     * trailing partial frame in place. Returns false on a length prefix
     * above MAX_FRAME_SIZE.
     */
    static bool extract_frames(std::string& buffer, std::vector<std::string>& frames);

private:
    struct Client {
        ConnectionId id;
        std::shared_ptr<SocketConnection> connection;
        std::string inbound;
    };

    bool setup_socket();
    void event_loop();
    void accept_client();
    void read_client(int fd);
    void close_client(int fd);
    void close_all_clients();

    std::string socket_path_;
    ConnectionRegistry& connections_;
    FrameHandler handler_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread event_thread_;

    mutable std::mutex clients_mutex_;
    std::unordered_map<int, Client> clients_;
    uint64_t next_client_ = 0;
};

} // namespace bridge::transport
