#include "bridge_server.hpp"
#include "builtin_handlers.hpp"
#include "logger.hpp"
#include "server_config.hpp"
#include "transport/frame_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
    g_stop_requested = true;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bridge::ServerConfig config;
    std::string error;
    if (!bridge::parse_command_line(argc, argv, config, error)) {
        std::cerr << error << std::endl;
        std::cerr << bridge::usage_text(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << bridge::usage_text(argv[0]);
        return 0;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (config.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    const bool logging_configured = init_logging(config.log_config_path);

    LOG4CPLUS_INFO(core_logger(), "mcp_bridge_core starting");
    if (!logging_configured) {
        LOG4CPLUS_WARN(core_logger(), "Logging config " << config.log_config_path << " not found, using console output");
    }
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Socket: " << config.socket_path);
    LOG4CPLUS_INFO(core_logger(), "Tick: " << config.tick_ms << " ms, " << config.max_messages_per_tick
                                           << " message(s) per tick");
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (config.enable_pdeathsig ? "enabled" : "disabled"));

    bridge::BridgeOptions options;
    options.server_info.version = VERSION_STRING;
    options.dispatch.max_messages_per_tick = config.max_messages_per_tick;
    options.dispatch.startup_delay_ticks = config.startup_delay_ticks;
    options.backlog_warning = config.backlog_warning;

    bridge::BridgeServer server(options);
    server.set_registrar(bridge::builtin::register_builtin_handlers);

    bridge::transport::FrameServer transport(
        config.socket_path, server.connections(),
        [&server](const bridge::ConnectionId& source, std::string frame) { server.enqueue(std::move(frame), source); });

    if (!transport.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start frame server");
        return 1;
    }

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    server.initialize();

    const auto tick_interval = std::chrono::milliseconds(config.tick_ms);
    while (!g_stop_requested) {
        server.tick();
        std::this_thread::sleep_for(tick_interval);
    }

    LOG4CPLUS_INFO(core_logger(), "Stop requested, shutting down");
    transport.stop();
    server.shutdown();

    return 0;
}
