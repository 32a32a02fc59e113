#pragma once

#include <cstddef>
#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& rpc_logger();
log4cplus::Logger& registry_logger();
log4cplus::Logger& transport_logger();

// Loads a log4cplus properties file. Returns false when none was found and the
// console fallback is in use.
bool init_logging(const std::string& config_path);

// Shortens a frame for debug output. A cut text ends in "... (<size> bytes)".
std::string log_excerpt(const std::string& text, size_t max_length);
