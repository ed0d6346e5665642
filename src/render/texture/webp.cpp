// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "decoders.h"

#include <memory>

#include <webp/decode.h>

namespace texel::render::detail {

namespace {

struct WebPDeleter {
    void operator()(uint8_t* pixels) const { WebPFree(pixels); }
};

} // namespace

ImageResult DecodeWebP(std::span<const u8> buffer, bool is_srgb) {
    int width = 0;
    int height = 0;
    if (!WebPGetInfo(buffer.data(), buffer.size(), &width, &height)) {
        return ImageResult::Err(TextureError::ImageError("data is not a valid WebP image"));
    }

    std::unique_ptr<uint8_t, WebPDeleter> pixels(
        WebPDecodeRGBA(buffer.data(), buffer.size(), &width, &height));
    if (!pixels) {
        return ImageResult::Err(TextureError::ImageError("WebP decoding failed"));
    }

    Image image;
    image.format = WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, is_srgb);
    image.extent = glm::uvec3(static_cast<u32>(width), static_cast<u32>(height), 1u);
    image.data.assign(pixels.get(), pixels.get() + static_cast<usize>(width) * height * 4);
    return ImageResult::Ok(std::move(image));
}

} // namespace texel::render::detail
