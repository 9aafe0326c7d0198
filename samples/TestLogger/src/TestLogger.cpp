#include "svgserve/basic/filesystem_utils.hpp"
#include "svgserve/basic/log.h"

#include <unistd.h>

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

using SvgServe::Logger;

namespace
{
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std_fs::temp_directory_path() / ("svgserve_log_test_" + std::to_string(::getpid()));
        std_fs::remove_all(dir);
        std_fs::create_directories(dir);
    }
    void TearDown() override {
        Logger::Release(&logger);
        std::error_code ec;
        std_fs::remove_all(dir, ec);
    }

    Logger logger;
    std_fs::path dir;
};
} // namespace

TEST_F(LoggerTest, WritesRotatingLogFile) {
    Logger::LoggerInitOptions options;
    options.logOutputPath        = (dir / "logs").string();
    options.logOutputProgramName = "svg_dir_server";
    options.enableConsoleOutput  = false;
    Logger::Initialize(std::move(options), &logger);
    SLOG(&logger, SvgServe::LogLevel::info, "serving {} on port {}", "/srv/svg", 5000);
    SLOG(&logger, SvgServe::LogLevel::debug, "below the default level");
    Logger::Release(&logger);

    std::string content;
    ASSERT_TRUE(SvgServe::fs::ReadFile((dir / "logs" / "svg_dir_server.log").string(), content));
    EXPECT_NE(content.find("serving /srv/svg on port 5000"), std::string::npos);
    EXPECT_EQ(content.find("below the default level"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableLogDirectoryIsRuntimeError) {
    // the directory exists but no file can be created in it
    Logger::LoggerInitOptions options;
    options.logOutputPath       = "/proc/self";
    options.enableConsoleOutput = false;
    EXPECT_THROW(Logger::Initialize(std::move(options), &logger), std::runtime_error);
    // the previous sinks stay usable
    SLOG(&logger, SvgServe::LogLevel::info, "still logging");
}

TEST_F(LoggerTest, LogPathIsAFile) {
    auto file = dir / "not_a_dir";
    ASSERT_TRUE(SvgServe::fs::WriteFile(file.string(), "x", 1));
    Logger::LoggerInitOptions options;
    options.logOutputPath = file.string();
    EXPECT_THROW(Logger::Initialize(std::move(options), &logger), std::runtime_error);
}

TEST(StringFormatTest, Format) {
    EXPECT_EQ(SvgServe::StringFormat("{}:{}", "127.0.0.1", 5000), "127.0.0.1:5000");
    EXPECT_EQ(SvgServe::StringFormat("no args"), "no args");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
