// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief Shared spdlog logger for the bridge layer

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace devbridge
{

/// Name under which the bridge logger is registered with spdlog
inline constexpr const char* kLoggerName = "devbridge";

/// Get the bridge logger
///
/// If the application registered a logger named "devbridge" before first use,
/// that logger is returned; otherwise a stderr color logger is created.
std::shared_ptr<spdlog::logger> logger();

/// Set the bridge log level from its name
/// @param level One of trace, debug, info, warn, error, critical, off
/// @throws std::invalid_argument for an unknown level name
void set_log_level(const std::string& level);

} // namespace devbridge
