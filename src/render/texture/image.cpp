// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/texture/image.h"
#include "texel/render/texture/texture_format.h"
#include "texel/core/log.h"

#include <string>
#include <utility>

#include "decoders.h"

namespace texel::render {

Image Image::Default() {
    return New(glm::uvec3(1u), VK_IMAGE_TYPE_2D, {255, 255, 255, 255}, VK_FORMAT_R8G8B8A8_SRGB,
        RenderAssetPersistencePolicy::Keep);
}

Image Image::New(
    glm::uvec3 extent,
    VkImageType dimension,
    std::vector<u8> data,
    VkFormat format,
    RenderAssetPersistencePolicy cpu_persistent_access)
{
    Image image;
    image.data = std::move(data);
    image.format = format;
    image.extent = extent;
    image.dimension = dimension;
    image.cpu_persistent_access = cpu_persistent_access;
    return image;
}

core::Result<Image, TextureError> Image::FromBuffer(
    std::span<const u8> buffer,
    const ImageType& image_type,
    CompressedImageFormats supported_compressed_formats,
    bool is_srgb,
    ImageSampler sampler,
    RenderAssetPersistencePolicy cpu_persistent_access)
{
    using R = core::Result<Image, TextureError>;

    auto format_result = image_type.ToImageFormat();
    if (!format_result) {
        return R::Err(std::move(format_result).GetError());
    }
    const ImageFormat format = format_result.Value();

    if (!IsFormatEnabled(format)) {
        return R::Err(TextureError::UnsupportedTextureFormat(std::string(ToString(format))));
    }

    R decoded = [&]() -> R {
        switch (format) {
            case ImageFormat::Dds:
                return detail::DecodeDds(buffer, supported_compressed_formats, is_srgb);
            case ImageFormat::Ktx2:
#ifdef TEXEL_FEATURE_KTX2
                return detail::DecodeKtx2(buffer, supported_compressed_formats, is_srgb);
#else
                break;
#endif
            case ImageFormat::Basis:
#ifdef TEXEL_FEATURE_BASIS_UNIVERSAL
                return detail::DecodeBasis(buffer, supported_compressed_formats, is_srgb);
#else
                break;
#endif
            case ImageFormat::WebP:
#ifdef TEXEL_FEATURE_WEBP
                return detail::DecodeWebP(buffer, is_srgb);
#else
                break;
#endif
            case ImageFormat::Bmp:
            case ImageFormat::Png:
            case ImageFormat::Jpeg:
            case ImageFormat::Tga:
            case ImageFormat::Pnm:
                return detail::DecodeWithStb(format, buffer, is_srgb);
        }
        return R::Err(TextureError::UnsupportedTextureFormat(std::string(ToString(format))));
    }();

    if (!decoded) {
        return decoded;
    }

    Image image = std::move(decoded).Unwrap();
    image.sampler = std::move(sampler);
    image.cpu_persistent_access = cpu_persistent_access;

    TEXEL_LOG_TRACE("Decoded {} image: {}x{}x{} mips={} format={}",
        ToString(format), image.extent.x, image.extent.y, image.extent.z,
        image.mip_level_count, FormatName(image.format));

    return R::Ok(std::move(image));
}

f32 Image::AspectRatio() const {
    if (extent.x == 0) {
        return 0.0f;
    }
    return static_cast<f32>(extent.y) / static_cast<f32>(extent.x);
}

bool Image::IsCompressed() const {
    return IsBlockCompressed(format);
}

} // namespace texel::render
