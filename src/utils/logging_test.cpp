#include "utils/logging.hpp"

#include <sstream>
#include "gtest/gtest.h"

namespace {

using runbox::utils::FormatLine;
using runbox::utils::LogLevel;
using runbox::utils::LogMessage;
using runbox::utils::ParseLogLevel;

std::string Format(const std::string& tag, const LogMessage& message) {
    std::ostringstream out;
    FormatLine(out, tag, message);
    return out.str();
}

// NOLINTNEXTLINE
TEST(Logging, InfoLineHasTagAndMessage) {
    EXPECT_EQ(Format("engine", LogMessage{LogLevel::kInfo, "started", {}}), "[engine] started");
}

// NOLINTNEXTLINE
TEST(Logging, WarningsCarryLevelAndFieldsAreSorted) {
    const LogMessage message{
        LogLevel::kWarn, "execution finished", {{"status", "error"}, {"session", "s1"}}};
    EXPECT_EQ(Format("engine", message),
              "[engine] WARN execution finished session=s1 status=error");
}

// NOLINTNEXTLINE
TEST(Logging, ErrorLevelIsShown) {
    EXPECT_EQ(Format("runner", LogMessage{LogLevel::kError, "boom", {{"pid", "7"}}}),
              "[runner] ERROR boom pid=7");
}

// NOLINTNEXTLINE
TEST(Logging, ParseLogLevelIsCaseInsensitive) {
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("info"), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("verbose"), std::nullopt);
}

// NOLINTNEXTLINE
TEST(Logging, MinimumLevelFiltersLowerLevels) {
    runbox::utils::ConfigureLogging({LogLevel::kWarn});
    EXPECT_FALSE(runbox::utils::IsEnabled(LogLevel::kInfo));
    EXPECT_TRUE(runbox::utils::IsEnabled(LogLevel::kWarn));
    EXPECT_TRUE(runbox::utils::IsEnabled(LogLevel::kError));
    runbox::utils::ConfigureLogging({});
    EXPECT_TRUE(runbox::utils::IsEnabled(LogLevel::kInfo));
    EXPECT_FALSE(runbox::utils::IsEnabled(LogLevel::kDebug));
}

}  // namespace
