// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace texel::log {

/**
 * @brief Initialize the logging system
 *
 * Safe to call more than once; later calls only change the level.
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace texel::log

// Convenience macros
#define TEXEL_LOG_TRACE(...) ::texel::log::get_logger()->trace(__VA_ARGS__)
#define TEXEL_LOG_DEBUG(...) ::texel::log::get_logger()->debug(__VA_ARGS__)
#define TEXEL_LOG_INFO(...)  ::texel::log::get_logger()->info(__VA_ARGS__)
#define TEXEL_LOG_WARN(...)  ::texel::log::get_logger()->warn(__VA_ARGS__)
#define TEXEL_LOG_ERROR(...) ::texel::log::get_logger()->error(__VA_ARGS__)
#define TEXEL_LOG_CRITICAL(...) ::texel::log::get_logger()->critical(__VA_ARGS__)
