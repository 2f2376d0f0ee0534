/*
 * test_sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for SinkFactory

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/sinks/sink_factory.hpp"

#include <filesystem>
#include <string>

using namespace geofleet::logging;

class SinkFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ =
            std::filesystem::temp_directory_path() / "geofleet_sink_factory_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

// ============================================================================
// Console Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, CreateConsoleSink) {
    SinkConfig config;
    config.name = "console";
    config.type = SinkType::Console;
    config.level = spdlog::level::info;

    auto sink = SinkFactory::createSink(config);

    ASSERT_TRUE(sink.has_value());
    EXPECT_EQ((*sink)->level(), spdlog::level::info);
}

TEST_F(SinkFactoryTest, CreateConsoleSinkWithoutColor) {
    auto sink =
        SinkFactory::createConsoleSink(spdlog::level::debug, "[%l] %v", false);

    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::debug);
}

// ============================================================================
// File Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, CreateFileSink) {
    auto file_path = test_dir_ / "test.log";

    SinkConfig config;
    config.name = "file";
    config.type = SinkType::BasicFile;
    config.level = spdlog::level::debug;
    config.file_path = file_path.string();

    auto sink = SinkFactory::createSink(config);

    ASSERT_TRUE(sink.has_value());
    EXPECT_TRUE(std::filesystem::exists(file_path));
}

TEST_F(SinkFactoryTest, CreateFileSinkCreatesDirectory) {
    auto file_path = test_dir_ / "nested" / "deeper" / "test.log";

    auto sink = SinkFactory::createFileSink(file_path.string());

    ASSERT_NE(sink, nullptr);
    EXPECT_TRUE(std::filesystem::exists(file_path.parent_path()));
}

TEST_F(SinkFactoryTest, CreateRotatingFileSink) {
    SinkConfig config;
    config.name = "rotating";
    config.type = SinkType::RotatingFile;
    config.file_path = (test_dir_ / "rotating.log").string();
    config.max_file_size = 1024 * 1024;
    config.max_files = 3;

    EXPECT_TRUE(SinkFactory::createSink(config).has_value());
}

TEST_F(SinkFactoryTest, CreateDailyFileSink) {
    SinkConfig config;
    config.name = "daily";
    config.type = SinkType::DailyFile;
    config.file_path = (test_dir_ / "daily.log").string();
    config.rotation_hour = 2;
    config.rotation_minute = 30;

    EXPECT_TRUE(SinkFactory::createSink(config).has_value());
}

TEST_F(SinkFactoryTest, FileSinkWithoutPathFails) {
    SinkConfig config;
    config.name = "nowhere";
    config.type = SinkType::RotatingFile;

    auto sink = SinkFactory::createSink(config);

    ASSERT_FALSE(sink.has_value());
    EXPECT_THAT(sink.error(), ::testing::HasSubstr("nowhere"));
}

// ============================================================================
// describeSinks Tests
// ============================================================================

TEST_F(SinkFactoryTest, DescribeDefaultSectionIsConsoleOnly) {
    geofleet::config::LoggingConfig logging;

    auto sinks = SinkFactory::describeSinks(logging);

    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_EQ(sinks[0].type, SinkType::Console);
    EXPECT_EQ(sinks[0].level, spdlog::level::info);
}

TEST_F(SinkFactoryTest, DescribeFileAndExtraSinks) {
    geofleet::config::LoggingConfig logging;
    logging.enableConsole = false;
    logging.enableFile = true;
    logging.logDir = test_dir_.string();
    logging.useDailyRotation = true;
    logging.rotationHour = 4;

    geofleet::config::LogSinkConfig extra;
    extra.name = "audit";
    extra.type = "file";
    extra.level = "warn";
    extra.filePath = (test_dir_ / "audit.log").string();
    logging.additionalSinks.push_back(extra);

    auto sinks = SinkFactory::describeSinks(logging);

    ASSERT_EQ(sinks.size(), 2u);
    EXPECT_EQ(sinks[0].type, SinkType::DailyFile);
    EXPECT_EQ(sinks[0].rotation_hour, 4);
    EXPECT_EQ(sinks[0].file_path, (test_dir_ / "geofleet.log").string());
    EXPECT_EQ(sinks[1].type, SinkType::BasicFile);
    EXPECT_EQ(sinks[1].level, spdlog::level::warn);
    EXPECT_EQ(sinks[1].pattern, logging.pattern);
}
