#include "frame_server.hpp"

#include "../logger.hpp"

#include <poll.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <log4cplus/loggingmacros.h>

namespace bridge::transport {

namespace {

bool read_exact(int fd, char* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::read(fd, data + offset, size - offset);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

// Client sockets are non-blocking; a full send buffer waits up to SEND_TIMEOUT_MS for room.
constexpr int SEND_TIMEOUT_MS = 1000;

constexpr size_t READ_CHUNK_SIZE = 4096;
constexpr int MAX_READS_PER_EVENT = 64;

bool write_exact(int fd, const char* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::send(fd, data + offset, size - offset, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int ready = ::poll(&pfd, 1, SEND_TIMEOUT_MS);
            if (ready < 0 && errno == EINTR) {
                continue;
            }
            if (ready <= 0) {
                return false;
            }
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

} // namespace

SocketConnection::SocketConnection(int fd) : fd_(fd) {}

SocketConnection::~SocketConnection() {
    close();
}

bool SocketConnection::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        return false;
    }
    return FrameServer::write_frame(fd_, text);
}

void SocketConnection::close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    ::close(fd_);
}

FrameServer::FrameServer(std::string socket_path, ConnectionRegistry& connections, FrameHandler handler)
    : socket_path_(std::move(socket_path)), connections_(connections), handler_(std::move(handler)) {}

FrameServer::~FrameServer() {
    stop();
}

bool FrameServer::setup_socket() {
    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "socket: " << std::strerror(errno));
        return false;
    }

    ::unlink(socket_path_.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG4CPLUS_ERROR(transport_logger(), "Socket path too long: " << socket_path_);
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "bind " << socket_path_ << ": " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "listen: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

bool FrameServer::start() {
    if (running_) {
        return true;
    }

    if (!setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "epoll_create1: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(transport_logger(), "epoll_ctl ADD server_fd: " << std::strerror(errno));
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;
    event_thread_ = std::thread(&FrameServer::event_loop, this);

    LOG4CPLUS_INFO(transport_logger(), "Listening on " << socket_path_);
    return true;
}

void FrameServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& entry : clients_) {
            ::shutdown(entry.first, SHUT_RDWR);
        }
    }

    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    close_all_clients();

    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    ::unlink(socket_path_.c_str());
    LOG4CPLUS_INFO(transport_logger(), "Stopped listening on " << socket_path_);
}

size_t FrameServer::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

bool FrameServer::read_frame(int fd, std::string& frame) {
    uint32_t length_be = 0;
    if (!read_exact(fd, reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = __builtin_bswap32(length_be);
    if (length > MAX_FRAME_SIZE) {
        LOG4CPLUS_WARN(transport_logger(), "Frame of " << length << " bytes exceeds limit");
        return false;
    }

    std::vector<char> buffer(length);
    if (length > 0 && !read_exact(fd, buffer.data(), length)) {
        return false;
    }

    frame.assign(buffer.data(), buffer.size());
    return true;
}

bool FrameServer::extract_frames(std::string& buffer, std::vector<std::string>& frames) {
    size_t offset = 0;
    while (buffer.size() - offset >= sizeof(uint32_t)) {
        uint32_t length_be = 0;
        std::memcpy(&length_be, buffer.data() + offset, sizeof(length_be));
        uint32_t length = __builtin_bswap32(length_be);
        if (length > MAX_FRAME_SIZE) {
            LOG4CPLUS_WARN(transport_logger(), "Frame of " << length << " bytes exceeds limit");
            return false;
        }
        if (buffer.size() - offset - sizeof(length_be) < length) {
            break;
        }
        frames.emplace_back(buffer, offset + sizeof(length_be), length);
        offset += sizeof(length_be) + length;
    }
    buffer.erase(0, offset);
    return true;
}

bool FrameServer::write_frame(int fd, const std::string& frame) {
    if (frame.size() > MAX_FRAME_SIZE) {
        LOG4CPLUS_WARN(transport_logger(), "Refusing to send frame of " << frame.size() << " bytes");
        return false;
    }

    uint32_t length_be = __builtin_bswap32(static_cast<uint32_t>(frame.size()));
    if (!write_exact(fd, reinterpret_cast<const char*>(&length_be), sizeof(length_be))) {
        return false;
    }
    return frame.empty() || write_exact(fd, frame.data(), frame.size());
}

void FrameServer::accept_client() {
    int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        LOG4CPLUS_WARN(transport_logger(), "accept: " << std::strerror(errno));
        return;
    }

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP;
    ev.data.fd = client_fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
        LOG4CPLUS_WARN(transport_logger(), "epoll_ctl ADD client_fd: " << std::strerror(errno));
        ::close(client_fd);
        return;
    }

    Client client;
    client.connection = std::make_shared<SocketConnection>(client_fd);
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client.id = "conn-" + std::to_string(++next_client_);
        clients_[client_fd] = client;
    }

    connections_.register_connection(client.id, client.connection);
    LOG4CPLUS_DEBUG(transport_logger(), "Accepted " << client.id << " on fd " << client_fd);
}

void FrameServer::close_client(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);

    Client client;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(fd);
        if (it == clients_.end()) {
            ::close(fd);
            return;
        }
        client = std::move(it->second);
        clients_.erase(it);
    }

    connections_.unregister_connection(client.id);
    client.connection->close();
    LOG4CPLUS_DEBUG(transport_logger(), "Closed " << client.id << " on fd " << fd);
}

void FrameServer::close_all_clients() {
    std::unordered_map<int, Client> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }

    for (auto& [fd, client] : clients) {
        connections_.unregister_connection(client.id);
        client.connection->close();
    }
}

void FrameServer::read_client(int fd) {
    std::string received;
    bool peer_closed = false;
    char chunk[READ_CHUNK_SIZE];

    // Bounded so one busy client cannot starve the others; epoll reports the rest next round.
    for (int reads = 0; reads < MAX_READS_PER_EVENT; ++reads) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            received.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        if (n < 0) {
            LOG4CPLUS_DEBUG(transport_logger(), "recv on fd " << fd << ": " << std::strerror(errno));
        }
        peer_closed = true;
        break;
    }

    ConnectionId source;
    std::vector<std::string> frames;
    bool bad_frame = false;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(fd);
        if (it == clients_.end()) {
            return;
        }
        source = it->second.id;
        it->second.inbound += received;
        bad_frame = !extract_frames(it->second.inbound, frames);
    }

    for (auto& frame : frames) {
        try {
            handler_(source, std::move(frame));
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(transport_logger(), "Frame handler error for " << source << ": " << exc.what());
        }
    }

    if (bad_frame || peer_closed) {
        close_client(fd);
    }
}

void FrameServer::event_loop() {
    // 使用 epoll 在单个线程中处理所有连接和请求
    // One epoll thread serves the listener and every client.
    const int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, 200);
        if (nfds < 0) {
            if (errno != EINTR && running_) {
                LOG4CPLUS_WARN(transport_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                accept_client();
                continue;
            }

            if (events[i].events & EPOLLIN) {
                read_client(fd);
                continue;
            }

            if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                close_client(fd);
            }
        }
    }
}

} // namespace bridge::transport
