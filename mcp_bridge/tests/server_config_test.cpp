#include <gtest/gtest.h>

#include "logger.hpp"
#include "server_config.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
	void SetUp() override {
		static std::once_flag once;
		std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
	}
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

bool parse(std::vector<const char*> args, bridge::ServerConfig& config, std::string& error) {
	args.insert(args.begin(), "mcp_bridge_core");
	return bridge::parse_command_line(static_cast<int>(args.size()), args.data(), config, error);
}

} // namespace

TEST(ServerConfig, DefaultsWithoutArguments) {
	bridge::ServerConfig config;
	std::string error;
	ASSERT_TRUE(parse({}, config, error));

	EXPECT_EQ(config.socket_path, "/tmp/mcp_bridge.sock");
	EXPECT_EQ(config.log_config_path, "log4cplus.ini");
	EXPECT_EQ(config.tick_ms, 10);
	EXPECT_EQ(config.max_messages_per_tick, 10u);
	EXPECT_EQ(config.startup_delay_ticks, 10);
	EXPECT_EQ(config.backlog_warning, 1000u);
	EXPECT_FALSE(config.enable_pdeathsig);
	EXPECT_FALSE(config.show_version);
	EXPECT_FALSE(config.show_help);
}

TEST(ServerConfig, AcceptsSeparateAndInlineValues) {
	bridge::ServerConfig config;
	std::string error;
	ASSERT_TRUE(parse({"--socket", "/run/a.sock", "--config=custom.ini", "--tick-ms=25", "--max-per-tick", "4",
	                   "--startup-delay", "0", "--backlog-warning=0", "--pdeathsig"},
	                  config, error))
		<< error;

	EXPECT_EQ(config.socket_path, "/run/a.sock");
	EXPECT_EQ(config.log_config_path, "custom.ini");
	EXPECT_EQ(config.tick_ms, 25);
	EXPECT_EQ(config.max_messages_per_tick, 4u);
	EXPECT_EQ(config.startup_delay_ticks, 0);
	EXPECT_EQ(config.backlog_warning, 0u);
	EXPECT_TRUE(config.enable_pdeathsig);
}

TEST(ServerConfig, PositionalArgumentIsSocketPath) {
	bridge::ServerConfig config;
	std::string error;
	ASSERT_TRUE(parse({"/tmp/positional.sock"}, config, error));
	EXPECT_EQ(config.socket_path, "/tmp/positional.sock");
}

TEST(ServerConfig, VersionAndHelpFlags) {
	bridge::ServerConfig config;
	std::string error;
	ASSERT_TRUE(parse({"-v", "--help"}, config, error));
	EXPECT_TRUE(config.show_version);
	EXPECT_TRUE(config.show_help);
}

TEST(ServerConfig, RejectsBadInput) {
	const std::vector<std::vector<const char*>> cases = {
		{"--tick-ms", "0"},
		{"--tick-ms", "fast"},
		{"--max-per-tick=0"},
		{"--startup-delay", "-1"},
		{"--backlog-warning", "12x"},
		{"--socket"},
		{"--config"},
		{"--unknown"},
	};

	for (const auto& args : cases) {
		bridge::ServerConfig config;
		std::string error;
		EXPECT_FALSE(parse(args, config, error)) << args.front();
		EXPECT_FALSE(error.empty());
	}
}

TEST(ServerConfig, UsageMentionsEveryOption) {
	std::string usage = bridge::usage_text("mcp_bridge_core");
	for (const char* option : {"--socket", "--config", "--tick-ms", "--max-per-tick", "--startup-delay",
	                           "--backlog-warning", "--pdeathsig", "--version", "--help"}) {
		EXPECT_NE(usage.find(option), std::string::npos) << option;
	}
}
