// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/texture/image_format.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "texel/render/texture/features.h"

namespace texel::render {

namespace {

std::string ToLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

constexpr ImageFormat kAllFormats[] = {
    ImageFormat::Basis, ImageFormat::Bmp, ImageFormat::Dds, ImageFormat::Jpeg, ImageFormat::Ktx2,
    ImageFormat::Png, ImageFormat::Pnm, ImageFormat::Tga, ImageFormat::WebP,
};

} // namespace

std::optional<ImageFormat> ImageFormatFromExtension(std::string_view extension) {
    const std::string ext = ToLower(extension);
    if (ext == "basis") return ImageFormat::Basis;
    if (ext == "bmp") return ImageFormat::Bmp;
    if (ext == "dds") return ImageFormat::Dds;
    if (ext == "jpg" || ext == "jpeg") return ImageFormat::Jpeg;
    if (ext == "ktx2") return ImageFormat::Ktx2;
    if (ext == "png") return ImageFormat::Png;
    if (ext == "pam" || ext == "pbm" || ext == "pgm" || ext == "ppm") return ImageFormat::Pnm;
    if (ext == "tga") return ImageFormat::Tga;
    if (ext == "webp") return ImageFormat::WebP;
    return std::nullopt;
}

std::optional<ImageFormat> ImageFormatFromMimeType(std::string_view mime_type) {
    const std::string mime = ToLower(mime_type);
    if (mime == "image/basis" || mime == "image/x-basis") return ImageFormat::Basis;
    if (mime == "image/bmp" || mime == "image/x-bmp") return ImageFormat::Bmp;
    if (mime == "image/vnd-ms.dds") return ImageFormat::Dds;
    if (mime == "image/jpeg") return ImageFormat::Jpeg;
    if (mime == "image/ktx2") return ImageFormat::Ktx2;
    if (mime == "image/png") return ImageFormat::Png;
    if (mime == "image/x-portable-bitmap" || mime == "image/x-portable-graymap"
        || mime == "image/x-portable-pixmap" || mime == "image/x-portable-anymap") {
        return ImageFormat::Pnm;
    }
    if (mime == "image/x-targa" || mime == "image/x-tga") return ImageFormat::Tga;
    if (mime == "image/webp") return ImageFormat::WebP;
    return std::nullopt;
}

std::optional<ImageFormat> ImageFormatFromName(std::string_view name) {
    for (ImageFormat format : kAllFormats) {
        if (ToString(format) == name) {
            return format;
        }
    }
    return std::nullopt;
}

std::string_view ToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::Basis: return "Basis";
        case ImageFormat::Bmp: return "Bmp";
        case ImageFormat::Dds: return "Dds";
        case ImageFormat::Jpeg: return "Jpeg";
        case ImageFormat::Ktx2: return "Ktx2";
        case ImageFormat::Png: return "Png";
        case ImageFormat::Pnm: return "Pnm";
        case ImageFormat::Tga: return "Tga";
        case ImageFormat::WebP: return "WebP";
    }
    return "Unknown";
}

std::string_view FeatureName(ImageFormat format) {
    switch (format) {
        case ImageFormat::Basis: return "basis-universal";
        case ImageFormat::Bmp: return "bmp";
        case ImageFormat::Dds: return "dds";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Ktx2: return "ktx2";
        case ImageFormat::Png: return "png";
        case ImageFormat::Pnm: return "pnm";
        case ImageFormat::Tga: return "tga";
        case ImageFormat::WebP: return "webp";
    }
    return "";
}

bool IsFormatEnabled(ImageFormat format) {
    switch (format) {
        case ImageFormat::Basis: return features::kBasisUniversal;
        case ImageFormat::Bmp: return features::kBmp;
        case ImageFormat::Dds: return features::kDds;
        case ImageFormat::Jpeg: return features::kJpeg;
        case ImageFormat::Ktx2: return features::kKtx2;
        case ImageFormat::Png: return features::kPng;
        case ImageFormat::Pnm: return features::kPnm;
        case ImageFormat::Tga: return features::kTga;
        case ImageFormat::WebP: return features::kWebp;
    }
    return false;
}

void to_json(nlohmann::json& j, const ImageFormat& format) {
    j = std::string(ToString(format));
}

void from_json(const nlohmann::json& j, ImageFormat& format) {
    const auto name = j.get<std::string>();
    auto parsed = ImageFormatFromName(name);
    if (!parsed) {
        throw std::invalid_argument(fmt::format("unknown image format '{}'", name));
    }
    format = *parsed;
}

// ImageType implementation
ImageType::ImageType(Kind kind, std::string name, ImageFormat format)
    : kind_(kind), name_(std::move(name)), format_(format) {}

ImageType ImageType::MimeType(std::string mime_type) {
    return ImageType(Kind::MimeType, std::move(mime_type), ImageFormat::Png);
}

ImageType ImageType::Extension(std::string extension) {
    return ImageType(Kind::Extension, std::move(extension), ImageFormat::Png);
}

ImageType ImageType::Format(ImageFormat format) {
    return ImageType(Kind::Format, std::string(ToString(format)), format);
}

core::Result<ImageFormat, TextureError> ImageType::ToImageFormat() const {
    using R = core::Result<ImageFormat, TextureError>;
    switch (kind_) {
        case Kind::MimeType:
            if (auto format = ImageFormatFromMimeType(name_)) {
                return R::Ok(*format);
            }
            return R::Err(TextureError::InvalidImageMimeType(name_));
        case Kind::Extension:
            if (auto format = ImageFormatFromExtension(name_)) {
                return R::Ok(*format);
            }
            return R::Err(TextureError::InvalidImageExtension(name_));
        case Kind::Format:
            return R::Ok(format_);
    }
    return R::Err(TextureError::InvalidImageExtension(name_));
}

} // namespace texel::render
