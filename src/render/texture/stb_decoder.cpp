// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "decoders.h"

#include <algorithm>
#include <climits>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <string>

#include <fmt/format.h>

// For image loading
#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#define STBI_NO_GIF
#define STBI_NO_HDR
#define STBI_NO_PSD
#define STBI_NO_PIC
#ifndef TEXEL_FEATURE_BMP
#define STBI_NO_BMP
#endif
#ifndef TEXEL_FEATURE_PNG
#define STBI_NO_PNG
#endif
#ifndef TEXEL_FEATURE_JPEG
#define STBI_NO_JPEG
#endif
#ifndef TEXEL_FEATURE_TGA
#define STBI_NO_TGA
#endif
#ifndef TEXEL_FEATURE_PNM
#define STBI_NO_PNM
#endif
#include <stb_image.h>

namespace texel::render::detail {

namespace {

struct StbiDeleter {
    void operator()(void* pixels) const { stbi_image_free(pixels); }
};

template<typename T>
using StbiPixels = std::unique_ptr<T, StbiDeleter>;

std::string FailureReason() {
    const char* reason = stbi_failure_reason();
    return reason ? std::string(reason) : std::string("unknown stb_image failure");
}

} // namespace

bool MatchesSignature(ImageFormat format, std::span<const u8> buffer) {
    auto starts_with = [&buffer](std::initializer_list<u8> magic) {
        if (buffer.size() < magic.size()) {
            return false;
        }
        return std::equal(magic.begin(), magic.end(), buffer.begin());
    };

    switch (format) {
        case ImageFormat::Png:
            return starts_with({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A});
        case ImageFormat::Jpeg:
            return starts_with({0xFF, 0xD8, 0xFF});
        case ImageFormat::Bmp:
            return starts_with({'B', 'M'});
        case ImageFormat::Pnm:
            return buffer.size() >= 2 && buffer[0] == 'P' && buffer[1] >= '1' && buffer[1] <= '7';
        case ImageFormat::Tga: {
            // No magic number: color map type, image type and pixel depth of the 18 byte header.
            if (buffer.size() < 18 || buffer[1] > 1) {
                return false;
            }
            const u8 image_type = buffer[2];
            const u8 bits = buffer[16];
            const bool known_type = image_type == 1 || image_type == 2 || image_type == 3
                || image_type == 9 || image_type == 10 || image_type == 11;
            const bool known_depth = bits == 8 || bits == 15 || bits == 16 || bits == 24 || bits == 32;
            return known_type && known_depth;
        }
        default:
            return true;
    }
}

ImageResult DecodeWithStb(ImageFormat format, std::span<const u8> buffer, bool is_srgb) {
    if (buffer.size() > static_cast<usize>(INT_MAX)) {
        return ImageResult::Err(TextureError::InvalidData(
            fmt::format("{} byte buffer is too large to decode", buffer.size())));
    }
    if (!MatchesSignature(format, buffer)) {
        return ImageResult::Err(TextureError::ImageError(
            fmt::format("data is not a valid {} image", ToString(format))));
    }

    const int length = static_cast<int>(buffer.size());
    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(buffer.data(), length, &width, &height, &channels)) {
        return ImageResult::Err(TextureError::ImageError(FailureReason()));
    }

    // Three-channel sources are widened to RGBA.
    const int desired = channels == 3 ? 4 : channels;
    const bool is_16_bit = stbi_is_16_bit_from_memory(buffer.data(), length) != 0;

    Image image;
    image.dimension = VK_IMAGE_TYPE_2D;
    image.mip_level_count = 1;

    if (is_16_bit) {
        StbiPixels<stbi_us> pixels(
            stbi_load_16_from_memory(buffer.data(), length, &width, &height, &channels, desired));
        if (!pixels || width <= 0 || height <= 0) {
            return ImageResult::Err(TextureError::ImageError(FailureReason()));
        }
        switch (desired) {
            case 1: image.format = VK_FORMAT_R16_UINT; break;
            case 2: image.format = VK_FORMAT_R16G16_UINT; break;
            default: image.format = VK_FORMAT_R16G16B16A16_UNORM; break;
        }
        const usize size = static_cast<usize>(width) * height * desired * sizeof(stbi_us);
        image.data.resize(size);
        std::memcpy(image.data.data(), pixels.get(), size);
    } else {
        StbiPixels<stbi_uc> pixels(
            stbi_load_from_memory(buffer.data(), length, &width, &height, &channels, desired));
        if (!pixels || width <= 0 || height <= 0) {
            return ImageResult::Err(TextureError::ImageError(FailureReason()));
        }
        switch (desired) {
            case 1: image.format = VK_FORMAT_R8_UNORM; break;
            case 2: image.format = VK_FORMAT_R8G8_UNORM; break;
            default: image.format = WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, is_srgb); break;
        }
        const usize size = static_cast<usize>(width) * height * desired;
        image.data.assign(pixels.get(), pixels.get() + size);
    }

    image.extent = glm::uvec3(static_cast<u32>(width), static_cast<u32>(height), 1u);
    return ImageResult::Ok(std::move(image));
}

} // namespace texel::render::detail
