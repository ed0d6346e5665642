// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/core/log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace texel::log
{

static std::shared_ptr<spdlog::logger> s_logger;
static std::mutex s_logger_mutex;

void init(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(s_logger_mutex);
    if (!s_logger)
    {
        s_logger = spdlog::get("texel");
        if (!s_logger)
        {
            s_logger = spdlog::stdout_color_mt("texel");
        }
        s_logger->set_pattern("[%T] [%^%l%$] %v");
    }
    s_logger->set_level(level);

    s_logger->debug("texel logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    std::unique_lock<std::mutex> lock(s_logger_mutex);
    if (!s_logger)
    {
        lock.unlock();
        init();
        lock.lock();
    }
    return s_logger;
}

} // namespace texel::log
