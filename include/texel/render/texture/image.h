// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <span>
#include <vector>

#include <glm/glm.hpp>
#include <vulkan/vulkan.h>

#include "texel/core/common.h"
#include "texel/core/result.h"
#include "texel/render/render_asset.h"
#include "texel/render/texture/compressed_image_formats.h"
#include "texel/render/texture/image_format.h"
#include "texel/render/texture/image_sampler.h"
#include "texel/render/texture/texture_error.h"

namespace texel::render {

/**
 * @brief CPU-side texture ready for upload
 *
 * `data` holds every layer and mip level, layer-major then mip. For 2D images
 * `extent.z` is the array layer count (6 for cubemaps).
 */
struct Image {
    std::vector<u8> data;
    VkFormat format = VK_FORMAT_R8G8B8A8_SRGB;
    glm::uvec3 extent = glm::uvec3(1u);
    u32 mip_level_count = 1;
    VkImageType dimension = VK_IMAGE_TYPE_2D;
    bool is_cubemap = false;
    ImageSampler sampler;
    RenderAssetPersistencePolicy cpu_persistent_access = RenderAssetPersistencePolicy::Keep;

    // 1x1 opaque white RGBA8 sRGB.
    static Image Default();

    static Image New(
        glm::uvec3 extent,
        VkImageType dimension,
        std::vector<u8> data,
        VkFormat format,
        RenderAssetPersistencePolicy cpu_persistent_access);

    /**
     * @brief Decode an encoded buffer
     *
     * @param buffer Encoded bytes
     * @param image_type Container, given as extension, mime type or explicit format
     * @param supported_compressed_formats Block-compressed families the device can sample
     * @param is_srgb Pick sRGB variants for color formats
     * @param sampler Sampler attached to the result
     * @param cpu_persistent_access Retention policy attached to the result
     */
    static core::Result<Image, TextureError> FromBuffer(
        std::span<const u8> buffer,
        const ImageType& image_type,
        CompressedImageFormats supported_compressed_formats,
        bool is_srgb,
        ImageSampler sampler,
        RenderAssetPersistencePolicy cpu_persistent_access);

    u32 Width() const { return extent.x; }
    u32 Height() const { return extent.y; }
    glm::uvec2 Size() const { return glm::uvec2(extent.x, extent.y); }
    f32 AspectRatio() const;
    bool IsCompressed() const;
};

} // namespace texel::render
