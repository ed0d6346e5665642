// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "decoders.h"

#include <algorithm>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <ktx.h>

namespace texel::render::detail {

namespace {

struct Ktx2Deleter {
    void operator()(ktxTexture2* texture) const { ktxTexture_Destroy(ktxTexture(texture)); }
};

ktx_transcode_fmt_e ToKtxTranscodeFormat(TranscodeTarget target) {
    switch (target) {
        case TranscodeTarget::Bc7: return KTX_TTF_BC7_RGBA;
        case TranscodeTarget::Astc4x4: return KTX_TTF_ASTC_4x4_RGBA;
        case TranscodeTarget::Etc2Rgba: return KTX_TTF_ETC2_RGBA;
        case TranscodeTarget::Rgba32: return KTX_TTF_RGBA32;
    }
    return KTX_TTF_RGBA32;
}

} // namespace

ImageResult DecodeKtx2(std::span<const u8> buffer, CompressedImageFormats supported, bool is_srgb) {
    ktxTexture2* raw = nullptr;
    KTX_error_code rc = ktxTexture2_CreateFromMemory(
        buffer.data(), buffer.size(), KTX_TEXTURE_CREATE_LOAD_IMAGE_DATA_BIT, &raw);
    if (rc != KTX_SUCCESS) {
        return ImageResult::Err(TextureError::InvalidData(fmt::format("ktx2: {}", ktxErrorString(rc))));
    }
    std::unique_ptr<ktxTexture2, Ktx2Deleter> texture(raw);

    VkFormat format = VK_FORMAT_UNDEFINED;
    if (ktxTexture2_NeedsTranscoding(texture.get())) {
        const TranscodeTarget target = ChooseTranscodeTarget(supported);
        rc = ktxTexture2_TranscodeBasis(texture.get(), ToKtxTranscodeFormat(target), 0);
        if (rc != KTX_SUCCESS) {
            return ImageResult::Err(TextureError::TranscodeError(ktxErrorString(rc)));
        }
        format = TranscodeTargetFormat(target, is_srgb);
    } else {
        format = WithSrgb(static_cast<VkFormat>(texture->vkFormat), is_srgb);
    }

    if (format == VK_FORMAT_UNDEFINED) {
        return ImageResult::Err(TextureError::UnsupportedTextureFormat("ktx2 texture without vkFormat"));
    }
    if (!supported.Supports(format)) {
        return ImageResult::Err(TextureError::UnsupportedTextureFormat(std::string(FormatName(format))));
    }
    if (texture->isCubemap && texture->numFaces != 6) {
        return ImageResult::Err(TextureError::IncompleteCubemap());
    }

    ktxTexture* base = ktxTexture(texture.get());
    const u8* source = ktxTexture_GetData(base);
    const u32 depth = std::max(1u, static_cast<u32>(texture->baseDepth));
    const u32 layers = std::max(1u, static_cast<u32>(texture->numLayers)) * texture->numFaces;

    Image image;
    image.format = format;
    image.mip_level_count = std::max(1u, static_cast<u32>(texture->numLevels));
    image.is_cubemap = texture->isCubemap;
    image.dimension = depth > 1 ? VK_IMAGE_TYPE_3D : VK_IMAGE_TYPE_2D;
    image.extent = glm::uvec3(texture->baseWidth, texture->baseHeight, depth > 1 ? depth : layers);

    // libktx stores levels outermost; images want layer-major order.
    for (u32 layer = 0; layer < std::max(1u, static_cast<u32>(texture->numLayers)); ++layer) {
        for (u32 face = 0; face < texture->numFaces; ++face) {
            for (u32 level = 0; level < image.mip_level_count; ++level) {
                ktx_size_t offset = 0;
                rc = ktxTexture_GetImageOffset(base, level, layer, face, &offset);
                if (rc != KTX_SUCCESS) {
                    return ImageResult::Err(TextureError::InvalidData(
                        fmt::format("ktx2 level {}: {}", level, ktxErrorString(rc))));
                }
                const usize slices = std::max(1u, depth >> level);
                const usize size = ktxTexture_GetImageSize(base, level) * slices;
                image.data.insert(image.data.end(), source + offset, source + offset + size);
            }
        }
    }

    return ImageResult::Ok(std::move(image));
}

} // namespace texel::render::detail
