#include "server_config.hpp"

#include <charconv>
#include <cstring>
#include <sstream>
#include <system_error>

namespace bridge {

namespace {

template <typename T>
bool parse_number(const char* text, T min_value, T& out) {
    const char* end = text + std::strlen(text);
    T value{};
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc() || ptr != end || text == end || value < min_value) {
        return false;
    }
    out = value;
    return true;
}

// Matches "--name value" and "--name=value"; advances i past a separate value.
const char* option_value(const char* name, int argc, const char* const* argv, int& i, bool& missing) {
    const size_t length = std::strlen(name);
    const char* arg = argv[i];
    missing = false;

    if (std::strcmp(arg, name) == 0) {
        if (i + 1 >= argc) {
            missing = true;
            return nullptr;
        }
        return argv[++i];
    }

    if (std::strncmp(arg, name, length) == 0 && arg[length] == '=') {
        return arg + length + 1;
    }

    return nullptr;
}

} // namespace

bool parse_command_line(int argc, const char* const* argv, ServerConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            config.show_help = true;
            continue;
        }

        if (std::strcmp(arg, "--pdeathsig") == 0) {
            config.enable_pdeathsig = true;
            continue;
        }

        bool missing = false;
        const char* value = nullptr;

        if ((value = option_value("--socket", argc, argv, i, missing)) || missing) {
            if (missing) {
                error = "--socket requires a path";
                return false;
            }
            config.socket_path = value;
            continue;
        }

        if ((value = option_value("--config", argc, argv, i, missing)) || missing) {
            if (missing) {
                error = "--config requires a path";
                return false;
            }
            config.log_config_path = value;
            continue;
        }

        if ((value = option_value("--tick-ms", argc, argv, i, missing)) || missing) {
            if (missing || !parse_number(value, 1, config.tick_ms)) {
                error = "--tick-ms requires a positive integer";
                return false;
            }
            continue;
        }

        if ((value = option_value("--max-per-tick", argc, argv, i, missing)) || missing) {
            if (missing || !parse_number(value, size_t{1}, config.max_messages_per_tick)) {
                error = "--max-per-tick requires a positive integer";
                return false;
            }
            continue;
        }

        if ((value = option_value("--startup-delay", argc, argv, i, missing)) || missing) {
            if (missing || !parse_number(value, 0, config.startup_delay_ticks)) {
                error = "--startup-delay requires a non-negative integer";
                return false;
            }
            continue;
        }

        if ((value = option_value("--backlog-warning", argc, argv, i, missing)) || missing) {
            if (missing || !parse_number(value, size_t{0}, config.backlog_warning)) {
                error = "--backlog-warning requires a non-negative integer";
                return false;
            }
            continue;
        }

        if (arg[0] != '-') {
            config.socket_path = arg;
            continue;
        }

        error = std::string("Unknown option: ") + arg;
        return false;
    }

    return true;
}

std::string usage_text(const char* program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options] [socket_path]\n"
        << "  --socket <path>          Unix socket to listen on (default /tmp/mcp_bridge.sock)\n"
        << "  --config <file>          log4cplus configuration (default log4cplus.ini)\n"
        << "  --tick-ms <n>            Dispatch tick interval in milliseconds (default 10)\n"
        << "  --max-per-tick <n>       Messages processed per tick (default 10)\n"
        << "  --startup-delay <n>      Ticks before forced initialization (default 10)\n"
        << "  --backlog-warning <n>    Queue size that triggers a warning, 0 to disable (default 1000)\n"
        << "  --pdeathsig              Exit when the parent process dies\n"
        << "  -v, --version            Print version information\n"
        << "  -h, --help               Print this help\n";
    return out.str();
}

} // namespace bridge
