#include "dispatch_loop.hpp"

#include "logger.hpp"
#include "protocol.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

DispatchLoop::DispatchLoop(MessageQueue& queue, rpc::JsonRpcEngine& engine, ConnectionRegistry& connections,
                           DispatchOptions options)
    : queue_(queue), engine_(engine), connections_(connections), options_(options) {}

void DispatchLoop::set_initializer(Initializer initializer) {
    initializer_ = std::move(initializer);
}

void DispatchLoop::mark_ready() {
    if (!ready_.exchange(true)) {
        LOG4CPLUS_INFO(core_logger(), "Dispatch loop ready, " << queue_.size() << " message(s) pending");
    }
}

size_t DispatchLoop::tick() {
    return drain_tick(options_.max_messages_per_tick);
}

size_t DispatchLoop::drain_tick(size_t max_count) {
    if (!claim_execution_thread()) {
        return 0;
    }

    if (!pass_startup_gate()) {
        return 0;
    }

    size_t processed = 0;
    while (processed < max_count) {
        std::optional<QueuedMessage> message = queue_.try_dequeue();
        if (!message) {
            break;
        }
        process(*message);
        ++processed;
    }

    processed_ += processed;
    return processed;
}

void DispatchLoop::reset() {
    ready_ = false;
    ticks_waited_ = 0;
    std::lock_guard<std::mutex> lock(thread_mutex_);
    execution_thread_.reset();
}

bool DispatchLoop::claim_execution_thread() {
    const std::thread::id current = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (!execution_thread_) {
        execution_thread_ = current;
        return true;
    }
    if (*execution_thread_ != current) {
        LOG4CPLUS_ERROR(core_logger(), "drain_tick called off the execution thread, ignoring");
        return false;
    }
    return true;
}

bool DispatchLoop::pass_startup_gate() {
    if (ready_) {
        return true;
    }

    if (++ticks_waited_ < options_.startup_delay_ticks) {
        return false;
    }

    LOG4CPLUS_WARN(core_logger(), "Not initialized after " << ticks_waited_ << " ticks, initializing now");
    if (initializer_) {
        try {
            initializer_();
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Initialization failed: " << exc.what());
        }
    }
    mark_ready();
    return true;
}

void DispatchLoop::process(const QueuedMessage& message) {
    std::optional<std::string> response;

    try {
        response = engine_.process_message(message.raw_text);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Error processing message from " << message.source << ": " << exc.what());
        response = protocol::Response::failure({}, protocol::error_code::INTERNAL_ERROR,
                                               std::string("Internal error: ") + exc.what()).to_json();
    } catch (...) {
        LOG4CPLUS_ERROR(core_logger(), "Unknown error processing message from " << message.source);
        response = protocol::Response::failure({}, protocol::error_code::INTERNAL_ERROR, "Internal error").to_json();
    }

    if (!response) {
        return;
    }

    LOG4CPLUS_DEBUG(core_logger(), "Sending to " << message.source << ": " << log_excerpt(*response, 200));
    if (!connections_.send(message.source, *response)) {
        LOG4CPLUS_WARN(core_logger(), "Response for " << message.source << " was not delivered");
    }
}

} // namespace bridge
