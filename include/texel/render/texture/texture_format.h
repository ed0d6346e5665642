// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include <vulkan/vulkan.h>

#include "texel/core/common.h"

namespace texel::render {

enum class CompressionFamily {
    None,
    Bc,
    Etc2,
    Astc
};

struct FormatBlockInfo {
    u32 block_width = 1;
    u32 block_height = 1;
    u32 block_bytes = 4;
};

// Block footprint for the formats images can carry; nullopt for anything else.
std::optional<FormatBlockInfo> GetFormatBlockInfo(VkFormat format);

CompressionFamily GetCompressionFamily(VkFormat format);

inline bool IsBlockCompressed(VkFormat format) {
    return GetCompressionFamily(format) != CompressionFamily::None;
}

// Byte size of one mip level of one layer.
usize MipLevelSize(VkFormat format, u32 width, u32 height, u32 depth = 1);

// Swaps a color format for its sRGB or linear sibling; formats without one pass through.
VkFormat WithSrgb(VkFormat format, bool srgb);

std::string_view FormatName(VkFormat format);

} // namespace texel::render
