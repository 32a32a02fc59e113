#pragma once

#include "connection_registry.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace bridge {

struct QueuedMessage {
    std::string raw_text;
    ConnectionId source;
};

/**
 * Inbound FIFO between network threads (producers) and the execution thread
 * (the only consumer). Enqueue never waits on the consumer; the queue is
 * unbounded and only warns when the backlog crosses the high-water mark.
 */
class MessageQueue {
public:
    /// @param backlog_warning Backlog size that triggers a warning, 0 disables it.
    explicit MessageQueue(size_t backlog_warning = 1000);

    void enqueue(std::string raw_text, ConnectionId source);

    /// Pops the oldest message; each message is handed out exactly once.
    std::optional<QueuedMessage> try_dequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    /// Total messages accepted since construction.
    uint64_t total_enqueued() const { return total_enqueued_.load(); }

    /// Backlog warnings issued so far, one per crossing of the mark.
    uint64_t backlog_warnings() const;

private:
    mutable std::mutex mutex_;
    std::queue<QueuedMessage> queue_;
    size_t backlog_warning_;
    bool backlog_warned_ = false;
    uint64_t backlog_warnings_ = 0;
    std::atomic<uint64_t> total_enqueued_{0};
};

} // namespace bridge
