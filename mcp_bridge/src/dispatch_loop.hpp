#pragma once

#include "connection_registry.hpp"
#include "message_queue.hpp"
#include "rpc_engine.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace bridge {

struct DispatchOptions {
    size_t max_messages_per_tick = 10;
    int startup_delay_ticks = 10;
};

/**
 * Execution-thread side of the bridge.
 *
 * Each tick pops a bounded number of queued frames, runs them through the
 * engine and sends any response back over the connection the frame came from.
 * Nothing is processed before the loop is ready: either mark_ready() was
 * called, or startup_delay_ticks ticks have passed, in which case the loop
 * runs the initializer itself and drains in that same tick.
 *
 * The first thread to drain becomes the execution thread. Drains attempted
 * from any other thread are refused.
 */
class DispatchLoop {
public:
    using Initializer = std::function<void()>;

    DispatchLoop(MessageQueue& queue, rpc::JsonRpcEngine& engine, ConnectionRegistry& connections,
                 DispatchOptions options = {});

    /// Callback run by the startup fallback when nobody called mark_ready() in time.
    void set_initializer(Initializer initializer);

    void mark_ready();
    bool is_ready() const { return ready_.load(); }

    /// Processes up to max_count messages. Returns how many were processed.
    size_t drain_tick(size_t max_count);

    /// drain_tick() with the configured per-tick bound.
    size_t tick();

    /// Back to the not-ready state with no execution thread bound.
    void reset();

    uint64_t processed_count() const { return processed_.load(); }
    const DispatchOptions& options() const { return options_; }

private:
    bool claim_execution_thread();
    bool pass_startup_gate();
    void process(const QueuedMessage& message);

    MessageQueue& queue_;
    rpc::JsonRpcEngine& engine_;
    ConnectionRegistry& connections_;
    DispatchOptions options_;
    Initializer initializer_;

    std::atomic<bool> ready_{false};
    int ticks_waited_ = 0;
    std::atomic<uint64_t> processed_{0};

    std::mutex thread_mutex_;
    std::optional<std::thread::id> execution_thread_;
};

} // namespace bridge
