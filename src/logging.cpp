// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/logging.hpp>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace devbridge
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::mutex mutex;
    static std::shared_ptr<spdlog::logger> instance;

    std::lock_guard<std::mutex> lock(mutex);
    if (instance)
        return instance;

    instance = spdlog::get(kLoggerName);
    if (!instance)
    {
        instance = spdlog::stderr_color_mt(kLoggerName);
        instance->set_level(spdlog::level::info);
    }
    return instance;
}

void set_log_level(const std::string& level)
{
    static const char* kNames[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const auto* name : kNames)
    {
        if (level == name)
        {
            logger()->set_level(spdlog::level::from_str(level));
            return;
        }
    }
    throw std::invalid_argument("Unknown log level: " + level);
}

} // namespace devbridge
