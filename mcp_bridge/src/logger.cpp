#include "logger.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_bridge"));
	return logger;
}

log4cplus::Logger& rpc_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_bridge.rpc"));
	return logger;
}

log4cplus::Logger& registry_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_bridge.registry"));
	return logger;
}

log4cplus::Logger& transport_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_bridge.transport"));
	return logger;
}

// Relative paths are tried against the working directory, then beside the executable.
static std::vector<std::filesystem::path> candidate_config_paths(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return {path};
	}

	std::vector<std::filesystem::path> candidates{std::filesystem::current_path() / path};
	std::error_code ec;
	auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
	if (!ec) {
		candidates.push_back(executable.parent_path() / path);
	}
	return candidates;
}

bool init_logging(const std::string& config_path) {
	try {
		for (const auto& candidate : candidate_config_paths(config_path)) {
			if (!std::filesystem::exists(candidate)) {
				continue;
			}
			std::filesystem::create_directories("logs");
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(candidate.string()));
			return true;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	// Keep whatever is already configured; only a bare root gets the console fallback.
	if (log4cplus::Logger::getRoot().getAllAppenders().empty()) {
		log4cplus::BasicConfigurator fallback;
		fallback.configure();
		log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
	}
	return false;
}

std::string log_excerpt(const std::string& text, size_t max_length) {
	if (text.size() <= max_length) {
		return text;
	}

	// Never cut inside a UTF-8 sequence.
	size_t cut = max_length;
	while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
		--cut;
	}
	return text.substr(0, cut) + "... (" + std::to_string(text.size()) + " bytes)";
}
