// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "decoders.h"

#include <mutex>
#include <string>
#include <vector>

#include <basisu_transcoder.h>
#include <fmt/format.h>

namespace texel::render::detail {

namespace {

basist::transcoder_texture_format ToBasisFormat(TranscodeTarget target) {
    switch (target) {
        case TranscodeTarget::Bc7: return basist::transcoder_texture_format::cTFBC7_RGBA;
        case TranscodeTarget::Astc4x4: return basist::transcoder_texture_format::cTFASTC_4x4_RGBA;
        case TranscodeTarget::Etc2Rgba: return basist::transcoder_texture_format::cTFETC2_RGBA;
        case TranscodeTarget::Rgba32: return basist::transcoder_texture_format::cTFRGBA32;
    }
    return basist::transcoder_texture_format::cTFRGBA32;
}

void InitTranscoder() {
    static std::once_flag once;
    std::call_once(once, [] { basist::basisu_transcoder_init(); });
}

} // namespace

ImageResult DecodeBasis(std::span<const u8> buffer, CompressedImageFormats supported, bool is_srgb) {
    InitTranscoder();

    const void* data = buffer.data();
    const u32 size = static_cast<u32>(buffer.size());

    basist::basisu_transcoder transcoder;
    if (!transcoder.validate_header(data, size)) {
        return ImageResult::Err(TextureError::InvalidData("invalid basis header"));
    }

    basist::basisu_file_info file_info;
    if (!transcoder.get_file_info(data, size, file_info) || file_info.m_total_images == 0) {
        return ImageResult::Err(TextureError::InvalidData("basis file contains no images"));
    }

    const bool is_cubemap = file_info.m_tex_type == basist::cBASISTexTypeCubemapArray;
    if (is_cubemap && file_info.m_total_images % 6 != 0) {
        return ImageResult::Err(TextureError::IncompleteCubemap());
    }

    basist::basisu_image_info image_info;
    if (!transcoder.get_image_info(data, size, image_info, 0)) {
        return ImageResult::Err(TextureError::InvalidData("basis image 0 is missing"));
    }

    if (!transcoder.start_transcoding(data, size)) {
        return ImageResult::Err(TextureError::TranscodeError("failed to start transcoding"));
    }

    const TranscodeTarget target = ChooseTranscodeTarget(supported);
    const basist::transcoder_texture_format basis_format = ToBasisFormat(target);
    const bool uncompressed = basist::basis_transcoder_format_is_uncompressed(basis_format);
    const u32 bytes_per_unit = basist::basis_get_bytes_per_block_or_pixel(basis_format);

    Image image;
    image.format = TranscodeTargetFormat(target, is_srgb);
    image.dimension = VK_IMAGE_TYPE_2D;
    image.is_cubemap = is_cubemap;
    image.mip_level_count = image_info.m_total_levels;
    image.extent = glm::uvec3(image_info.m_orig_width, image_info.m_orig_height, file_info.m_total_images);

    std::vector<u8> level_data;
    for (u32 image_index = 0; image_index < file_info.m_total_images; ++image_index) {
        for (u32 level = 0; level < image.mip_level_count; ++level) {
            basist::basisu_image_level_info level_info;
            if (!transcoder.get_image_level_info(data, size, level_info, image_index, level)) {
                return ImageResult::Err(TextureError::InvalidData(
                    fmt::format("basis image {} level {} is missing", image_index, level)));
            }
            const u32 units = uncompressed
                ? level_info.m_orig_width * level_info.m_orig_height
                : level_info.m_total_blocks;
            level_data.assign(static_cast<usize>(units) * bytes_per_unit, 0);
            if (!transcoder.transcode_image_level(
                    data, size, image_index, level, level_data.data(), units, basis_format)) {
                return ImageResult::Err(TextureError::TranscodeError(
                    fmt::format("failed to transcode image {} level {}", image_index, level)));
            }
            image.data.insert(image.data.end(), level_data.begin(), level_data.end());
        }
    }

    return ImageResult::Ok(std::move(image));
}

} // namespace texel::render::detail
