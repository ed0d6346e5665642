// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string>
#include <string_view>

namespace texel::render {

/**
 * @brief Failure while turning encoded bytes into an Image
 */
class TextureError {
public:
    enum class Kind {
        InvalidImageMimeType,
        InvalidImageExtension,
        ImageError,
        UnsupportedTextureFormat,
        SuperCompressionNotSupported,
        SuperDecompressionError,
        InvalidData,
        TranscodeError,
        FormatRequiresTranscodingError,
        IncompleteCubemap
    };

    TextureError(Kind kind, std::string detail);

    static TextureError InvalidImageMimeType(std::string mime_type);
    static TextureError InvalidImageExtension(std::string extension);
    static TextureError ImageError(std::string reason);
    static TextureError UnsupportedTextureFormat(std::string format);
    static TextureError SuperCompressionNotSupported(std::string scheme);
    static TextureError SuperDecompressionError(std::string reason);
    static TextureError InvalidData(std::string reason);
    static TextureError TranscodeError(std::string reason);
    static TextureError FormatRequiresTranscodingError(std::string format);
    static TextureError IncompleteCubemap();

    Kind GetKind() const { return kind_; }
    const std::string& Detail() const { return detail_; }

    std::string Message() const;

private:
    Kind kind_;
    std::string detail_;
};

std::string_view ToString(TextureError::Kind kind);

} // namespace texel::render
