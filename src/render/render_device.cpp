// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/render_device.h"

#include <utility>

namespace texel::render {

RenderDevice::RenderDevice(const VkPhysicalDeviceFeatures& features, std::string name)
    : features_(features), name_(std::move(name)) {}

RenderDevice RenderDevice::FromConfig(const config::DeviceConfig& device) {
    VkPhysicalDeviceFeatures features{};
    features.textureCompressionBC = device.bc ? VK_TRUE : VK_FALSE;
    features.textureCompressionASTC_LDR = device.astc_ldr ? VK_TRUE : VK_FALSE;
    features.textureCompressionETC2 = device.etc2 ? VK_TRUE : VK_FALSE;
    return RenderDevice(features, "configured");
}

} // namespace texel::render
