// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "texel/core/result.h"
#include "texel/render/texture/texture_error.h"

namespace texel::render {

/**
 * @brief Image containers the loader knows how to dispatch
 */
enum class ImageFormat {
    Basis,
    Bmp,
    Dds,
    Jpeg,
    Ktx2,
    Png,
    Pnm,
    Tga,
    WebP
};

// Case-insensitive; "jpg" and "jpeg" both map to Jpeg, "pam/pbm/pgm/ppm" to Pnm.
std::optional<ImageFormat> ImageFormatFromExtension(std::string_view extension);
std::optional<ImageFormat> ImageFormatFromMimeType(std::string_view mime_type);
std::optional<ImageFormat> ImageFormatFromName(std::string_view name);

std::string_view ToString(ImageFormat format);

// Name of the compile-time feature that carries the codec for this format.
std::string_view FeatureName(ImageFormat format);

// Whether the codec for this format is compiled in.
bool IsFormatEnabled(ImageFormat format);

void to_json(nlohmann::json& j, const ImageFormat& format);
void from_json(const nlohmann::json& j, ImageFormat& format);

/**
 * @brief How the caller identifies the container of an encoded buffer
 */
class ImageType {
public:
    enum class Kind {
        MimeType,
        Extension,
        Format
    };

    static ImageType MimeType(std::string mime_type);
    static ImageType Extension(std::string extension);
    static ImageType Format(ImageFormat format);

    Kind GetKind() const { return kind_; }
    const std::string& GetName() const { return name_; }

    core::Result<ImageFormat, TextureError> ToImageFormat() const;

private:
    ImageType(Kind kind, std::string name, ImageFormat format);

    Kind kind_;
    std::string name_;
    ImageFormat format_;
};

} // namespace texel::render
