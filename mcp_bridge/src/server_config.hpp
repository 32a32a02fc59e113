#pragma once

#include <cstddef>
#include <string>

namespace bridge {

struct ServerConfig {
    std::string socket_path = "/tmp/mcp_bridge.sock";
    std::string log_config_path = "log4cplus.ini";
    int tick_ms = 10;
    size_t max_messages_per_tick = 10;
    int startup_delay_ticks = 10;
    size_t backlog_warning = 1000;
    bool enable_pdeathsig = false;

    bool show_version = false;
    bool show_help = false;
};

/**
 * Fills a ServerConfig from the command line. Returns false and sets `error`
 * on an unknown option, a missing value or a malformed number.
 */
bool parse_command_line(int argc, const char* const* argv, ServerConfig& config, std::string& error);

std::string usage_text(const char* program);

} // namespace bridge
