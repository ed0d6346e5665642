// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <span>

#include <vulkan/vulkan.h>

#include "texel/core/common.h"
#include "texel/core/result.h"
#include "texel/render/texture/compressed_image_formats.h"
#include "texel/render/texture/image.h"
#include "texel/render/texture/image_format.h"
#include "texel/render/texture/texture_error.h"
#include "texel/render/texture/texture_format.h"

// Per-container decode entry points behind Image::FromBuffer. Sampler and retention
// policy are attached by the caller.
namespace texel::render::detail {

using ImageResult = core::Result<Image, TextureError>;

ImageResult DecodeDds(std::span<const u8> buffer, CompressedImageFormats supported, bool is_srgb);

// Bmp, Png, Jpeg, Tga and Pnm through stb_image.
ImageResult DecodeWithStb(ImageFormat format, std::span<const u8> buffer, bool is_srgb);

// Checks the magic bytes of formats that have one. Tga has none and always matches.
bool MatchesSignature(ImageFormat format, std::span<const u8> buffer);

#ifdef TEXEL_FEATURE_KTX2
ImageResult DecodeKtx2(std::span<const u8> buffer, CompressedImageFormats supported, bool is_srgb);
#endif

#ifdef TEXEL_FEATURE_BASIS_UNIVERSAL
ImageResult DecodeBasis(std::span<const u8> buffer, CompressedImageFormats supported, bool is_srgb);
#endif

#ifdef TEXEL_FEATURE_WEBP
ImageResult DecodeWebP(std::span<const u8> buffer, bool is_srgb);
#endif

enum class TranscodeTarget {
    Bc7,
    Astc4x4,
    Etc2Rgba,
    Rgba32
};

// Best universal-texture target the device can sample, falling back to plain RGBA8.
inline TranscodeTarget ChooseTranscodeTarget(CompressedImageFormats supported) {
    if (supported.Contains(CompressedImageFormats::BC)) return TranscodeTarget::Bc7;
    if (supported.Contains(CompressedImageFormats::ASTC_LDR)) return TranscodeTarget::Astc4x4;
    if (supported.Contains(CompressedImageFormats::ETC2)) return TranscodeTarget::Etc2Rgba;
    return TranscodeTarget::Rgba32;
}

inline VkFormat TranscodeTargetFormat(TranscodeTarget target, bool is_srgb) {
    switch (target) {
        case TranscodeTarget::Bc7: return WithSrgb(VK_FORMAT_BC7_UNORM_BLOCK, is_srgb);
        case TranscodeTarget::Astc4x4: return WithSrgb(VK_FORMAT_ASTC_4x4_UNORM_BLOCK, is_srgb);
        case TranscodeTarget::Etc2Rgba: return WithSrgb(VK_FORMAT_ETC2_R8G8B8A8_UNORM_BLOCK, is_srgb);
        case TranscodeTarget::Rgba32: return WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, is_srgb);
    }
    return WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, is_srgb);
}

} // namespace texel::render::detail
