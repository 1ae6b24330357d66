// tests/common/logging/logger_test.cpp

#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

#include "common/logging/logger.hpp"
#include "../temporary_directory.hpp"

using common::logging::Logger;

TEST(LoggerTest, MapsLevelNames) {
    EXPECT_EQ(Logger::getLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::getLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::getLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::getLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::getLogLevel("off"), spdlog::level::off);
}

TEST(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(Logger::getLogLevel("verbose"), spdlog::level::info);
    EXPECT_EQ(Logger::getLogLevel(""), spdlog::level::info);
}

TEST(LoggerTest, InitializeWritesToConfiguredFile) {
    TemporaryDirectory directory;
    const auto log_directory = directory.path() / "logs";

    Logger::initialize(log_directory.string(), "test.log", "info");
    LOG_INFO("pair {} compared", "01-home");
    LOG_DEBUG("hidden at info level");
    Logger::getLogger()->flush();

    std::ifstream file(log_directory / "test.log");
    ASSERT_TRUE(file.good());
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("pair 01-home compared"), std::string::npos);
    EXPECT_EQ(content.str().find("hidden at info level"), std::string::npos);

    // release the file before the directory is removed
    Logger::initialize("", "", "warn");
}

TEST(LoggerTest, DefaultLoggerIsConsoleOnly) {
    LOG_INFO("logged before any initialize call");
    const auto logger = Logger::getLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->sinks().size(), 1u);
    EXPECT_EQ(logger->name(), "shotdiff");
}

TEST(LoggerTest, EmptyDirectoryKeepsLoggerConsoleOnly) {
    TemporaryDirectory directory;
    Logger::initialize((directory.path() / "logs").string(), "test.log", "info");
    EXPECT_EQ(Logger::getLogger()->sinks().size(), 2u);

    Logger::initialize("", "ignored.log", "info");
    EXPECT_EQ(Logger::getLogger()->sinks().size(), 1u);
    EXPECT_EQ(Logger::getLogger()->level(), spdlog::level::info);
}

TEST(LoggerTest, FormatsOpenCVSizes) {
    EXPECT_EQ(fmt::format("{}", cv::Size(800, 600)), "800x600");
}
