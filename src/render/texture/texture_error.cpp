// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/texture/texture_error.h"

#include <utility>

#include <fmt/format.h>

namespace texel::render {

TextureError::TextureError(Kind kind, std::string detail)
    : kind_(kind), detail_(std::move(detail)) {}

TextureError TextureError::InvalidImageMimeType(std::string mime_type) {
    return TextureError(Kind::InvalidImageMimeType, std::move(mime_type));
}

TextureError TextureError::InvalidImageExtension(std::string extension) {
    return TextureError(Kind::InvalidImageExtension, std::move(extension));
}

TextureError TextureError::ImageError(std::string reason) {
    return TextureError(Kind::ImageError, std::move(reason));
}

TextureError TextureError::UnsupportedTextureFormat(std::string format) {
    return TextureError(Kind::UnsupportedTextureFormat, std::move(format));
}

TextureError TextureError::SuperCompressionNotSupported(std::string scheme) {
    return TextureError(Kind::SuperCompressionNotSupported, std::move(scheme));
}

TextureError TextureError::SuperDecompressionError(std::string reason) {
    return TextureError(Kind::SuperDecompressionError, std::move(reason));
}

TextureError TextureError::InvalidData(std::string reason) {
    return TextureError(Kind::InvalidData, std::move(reason));
}

TextureError TextureError::TranscodeError(std::string reason) {
    return TextureError(Kind::TranscodeError, std::move(reason));
}

TextureError TextureError::FormatRequiresTranscodingError(std::string format) {
    return TextureError(Kind::FormatRequiresTranscodingError, std::move(format));
}

TextureError TextureError::IncompleteCubemap() {
    return TextureError(Kind::IncompleteCubemap, {});
}

std::string TextureError::Message() const {
    switch (kind_) {
        case Kind::InvalidImageMimeType:
            return fmt::format("invalid image mime type: {}", detail_);
        case Kind::InvalidImageExtension:
            return fmt::format("invalid image extension: {}", detail_);
        case Kind::ImageError:
            return fmt::format("failed to load an image: {}", detail_);
        case Kind::UnsupportedTextureFormat:
            return fmt::format("unsupported texture format: {}", detail_);
        case Kind::SuperCompressionNotSupported:
            return fmt::format("supercompression not supported: {}", detail_);
        case Kind::SuperDecompressionError:
            return fmt::format("failed to decompress an image: {}", detail_);
        case Kind::InvalidData:
            return fmt::format("invalid data: {}", detail_);
        case Kind::TranscodeError:
            return fmt::format("transcode error: {}", detail_);
        case Kind::FormatRequiresTranscodingError:
            return fmt::format("format requires transcoding: {}", detail_);
        case Kind::IncompleteCubemap:
            return "only cubemaps with six faces are supported";
    }
    return detail_;
}

std::string_view ToString(TextureError::Kind kind) {
    switch (kind) {
        case TextureError::Kind::InvalidImageMimeType: return "InvalidImageMimeType";
        case TextureError::Kind::InvalidImageExtension: return "InvalidImageExtension";
        case TextureError::Kind::ImageError: return "ImageError";
        case TextureError::Kind::UnsupportedTextureFormat: return "UnsupportedTextureFormat";
        case TextureError::Kind::SuperCompressionNotSupported: return "SuperCompressionNotSupported";
        case TextureError::Kind::SuperDecompressionError: return "SuperDecompressionError";
        case TextureError::Kind::InvalidData: return "InvalidData";
        case TextureError::Kind::TranscodeError: return "TranscodeError";
        case TextureError::Kind::FormatRequiresTranscodingError: return "FormatRequiresTranscodingError";
        case TextureError::Kind::IncompleteCubemap: return "IncompleteCubemap";
    }
    return "Unknown";
}

} // namespace texel::render
