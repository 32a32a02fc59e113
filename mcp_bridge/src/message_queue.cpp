#include "message_queue.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

MessageQueue::MessageQueue(size_t backlog_warning) : backlog_warning_(backlog_warning) {}

void MessageQueue::enqueue(std::string raw_text, ConnectionId source) {
    size_t backlog = 0;
    bool warn = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push({std::move(raw_text), std::move(source)});
        backlog = queue_.size();
        if (backlog_warning_ > 0 && backlog >= backlog_warning_ && !backlog_warned_) {
            backlog_warned_ = true;
            ++backlog_warnings_;
            warn = true;
        }
    }
    ++total_enqueued_;

    if (warn) {
        LOG4CPLUS_WARN(core_logger(), "Inbound backlog reached " << backlog << " messages");
    }
}

std::optional<QueuedMessage> MessageQueue::try_dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    QueuedMessage message = std::move(queue_.front());
    queue_.pop();
    // Re-arm the warning once the backlog has drained to half the mark.
    if (backlog_warned_ && queue_.size() <= backlog_warning_ / 2) {
        backlog_warned_ = false;
    }
    return message;
}

size_t MessageQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool MessageQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

uint64_t MessageQueue::backlog_warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_warnings_;
}

void MessageQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::queue<QueuedMessage>().swap(queue_);
    backlog_warned_ = false;
}

} // namespace bridge
