#include <gtest/gtest.h>

#include "logger.hpp"

#include <log4cplus/logger.h>

#include <mutex>
#include <string>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

TEST(Logging, MissingConfigKeepsExistingAppenders) {
    auto before = log4cplus::Logger::getRoot().getAllAppenders().size();
    ASSERT_GT(before, 0u);

    EXPECT_FALSE(init_logging("no/such/dir/missing.ini"));
    EXPECT_FALSE(init_logging("/no/such/dir/missing.ini"));
    EXPECT_EQ(log4cplus::Logger::getRoot().getAllAppenders().size(), before);
}

TEST(Logging, LoggersShareTheBridgeHierarchy) {
    EXPECT_EQ(core_logger().getName(), LOG4CPLUS_TEXT("mcp_bridge"));
    EXPECT_EQ(rpc_logger().getParent().getName(), LOG4CPLUS_TEXT("mcp_bridge"));
    EXPECT_EQ(registry_logger().getParent().getName(), LOG4CPLUS_TEXT("mcp_bridge"));
    EXPECT_EQ(transport_logger().getParent().getName(), LOG4CPLUS_TEXT("mcp_bridge"));
}

TEST(LogExcerpt, ShortTextIsUnchanged) {
    EXPECT_EQ(log_excerpt("ping", 10), "ping");
    EXPECT_EQ(log_excerpt("0123456789", 10), "0123456789");
}

TEST(LogExcerpt, LongTextIsCutWithSize) {
    EXPECT_EQ(log_excerpt("0123456789abc", 10), "0123456789... (13 bytes)");
}

TEST(LogExcerpt, CutNeverSplitsMultiByteCharacter) {
    // "ab" followed by U+00E9 (two bytes); a cut at 3 would land inside it.
    const std::string text = "ab\xC3\xA9" "cd";
    EXPECT_EQ(log_excerpt(text, 3), "ab... (6 bytes)");
}
