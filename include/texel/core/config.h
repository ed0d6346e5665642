// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace texel::config {

// Compressed texture support reported by a device that is described in the config
// instead of queried from a Vulkan instance.
struct DeviceConfig {
    bool bc = false;
    bool astc_ldr = false;
    bool etc2 = false;
};

struct AppConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::filesystem::path asset_root = "assets";
    bool read_meta_files = true;
    std::optional<DeviceConfig> device; // 未配置时视为没有渲染设备
    std::filesystem::path config_path;
};

spdlog::level::level_enum parse_log_level(const std::string& value);

AppConfig load_from_file(const std::filesystem::path& path);

} // namespace texel::config
