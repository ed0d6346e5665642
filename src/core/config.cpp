// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/core/config.h"

#include <cctype>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace texel::config {

spdlog::level::level_enum parse_log_level(const std::string& value) {
    const auto lowered = [&]() {
        std::string tmp = value;
        for (char& c : tmp) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return tmp;
    }();

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return spdlog::level::info;
}

AppConfig load_from_file(const std::filesystem::path& path) {
    AppConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config; // 使用默认值
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << path << "\n";
            return config;
        }

        nlohmann::json json;
        file >> json;

        if (auto logging = json.find("logging"); logging != json.end()) {
            if (logging->contains("level")) {
                config.log_level = parse_log_level((*logging)["level"].get<std::string>());
            }
        }

        if (auto assets = json.find("assets"); assets != json.end()) {
            if (assets->contains("root")) {
                config.asset_root = (*assets)["root"].get<std::string>();
            }
            if (assets->contains("read_meta_files")) {
                config.read_meta_files = (*assets)["read_meta_files"].get<bool>();
            }
        }

        if (auto device = json.find("device"); device != json.end() && device->is_object()) {
            DeviceConfig device_config{};
            device_config.bc = device->value("bc", false);
            device_config.astc_ldr = device->value("astc_ldr", false);
            device_config.etc2 = device->value("etc2", false);
            config.device = device_config;
        }
    } catch (const std::exception& err) {
        std::cerr << "Error parsing config file: " << path << " -> " << err.what() << "\n";
    }

    return config;
}

} // namespace texel::config
