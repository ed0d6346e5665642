// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string>

#include <vulkan/vulkan.h>

#include "texel/core/config.h"

namespace texel::render {

/**
 * @brief Render device resource as seen by asset loaders
 *
 * Only the physical device features are exposed; creating GPU resources is the job of
 * the backend that owns the VkDevice.
 */
class RenderDevice {
public:
    explicit RenderDevice(const VkPhysicalDeviceFeatures& features, std::string name = "vulkan");

    // Device whose compressed texture support comes from the app config.
    static RenderDevice FromConfig(const config::DeviceConfig& device);

    const VkPhysicalDeviceFeatures& Features() const { return features_; }
    const std::string& Name() const { return name_; }

private:
    VkPhysicalDeviceFeatures features_;
    std::string name_;
};

} // namespace texel::render
