/*
 * logging_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_setup.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>

#include "sinks/sink_factory.hpp"

namespace geofleet::logging {

auto initLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    auto lowest = spdlog::level::off;

    for (const auto& sinkConfig : SinkFactory::describeSinks(config)) {
        auto sink = SinkFactory::createSink(sinkConfig);
        if (!sink) {
            spdlog::error("Skipping log sink: {}", sink.error());
            continue;
        }
        lowest = std::min(lowest, sinkConfig.level);
        sinks.push_back(std::move(*sink));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.asyncMode) {
        spdlog::init_thread_pool(config.asyncQueueSize,
                                 config.asyncThreadCount);
        auto policy = config.overflowPolicy == "discard"
                          ? spdlog::async_overflow_policy::overrun_oldest
                          : spdlog::async_overflow_policy::block;
        logger = std::make_shared<spdlog::async_logger>(
            config.loggerName, sinks.begin(), sinks.end(),
            spdlog::thread_pool(), policy);
    } else {
        logger = std::make_shared<spdlog::logger>(config.loggerName,
                                                  sinks.begin(), sinks.end());
    }

    logger->set_level(lowest);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(config.loggerName);
    spdlog::set_default_logger(logger);

    logger->info("Logging initialized: {} sink(s), level {}, {}",
                 sinks.size(), levelToString(lowest),
                 config.asyncMode ? "async" : "sync");
    return logger;
}

void shutdownLogging() { spdlog::shutdown(); }

}  // namespace geofleet::logging
