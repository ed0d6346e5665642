// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "texel/app/world.h"
#include "texel/asset/asset_loader.h"
#include "texel/asset/load_context.h"
#include "texel/asset/reader.h"
#include "texel/core/result.h"
#include "texel/render/render_asset.h"
#include "texel/render/texture/compressed_image_formats.h"
#include "texel/render/texture/features.h"
#include "texel/render/texture/image.h"
#include "texel/render/texture/image_format.h"
#include "texel/render/texture/image_sampler.h"
#include "texel/render/texture/texture_error.h"

namespace texel::render {

/**
 * @brief Where the loader takes the container format from
 *
 * FromExtension uses the asset path's extension; Format forces a container and
 * ignores the extension entirely.
 */
class ImageFormatSetting {
public:
    enum class Kind {
        FromExtension,
        Format
    };

    ImageFormatSetting() = default;

    static ImageFormatSetting FromExtension() { return ImageFormatSetting(); }
    static ImageFormatSetting Format(ImageFormat format);

    Kind GetKind() const { return kind_; }
    std::optional<ImageFormat> GetFormat() const;

    bool operator==(const ImageFormatSetting& other) const = default;

private:
    Kind kind_ = Kind::FromExtension;
    ImageFormat format_ = ImageFormat::Png;
};

struct ImageLoaderSettings {
    ImageFormatSetting format;
    bool is_srgb = true;
    ImageSampler sampler;
    RenderAssetPersistencePolicy cpu_persistent_access = RenderAssetPersistencePolicy::Keep;

    bool operator==(const ImageLoaderSettings& other) const = default;
};

void to_json(nlohmann::json& j, const ImageFormatSetting& setting);
void from_json(const nlohmann::json& j, ImageFormatSetting& setting);
void to_json(nlohmann::json& j, const ImageLoaderSettings& settings);
void from_json(const nlohmann::json& j, ImageLoaderSettings& settings);

// Extension whose codec is compiled out, with the feature that would bring it back.
struct DisabledExtension {
    std::string_view extension;
    std::string_view feature;

    bool operator==(const DisabledExtension& other) const = default;
};

struct ImageExtension {
    std::string_view feature;
    std::string_view extension;
    bool enabled;
};

inline constexpr std::array<ImageExtension, 13> kImageExtensions = {{
    {"basis-universal", "basis", features::kBasisUniversal},
    {"bmp", "bmp", features::kBmp},
    {"png", "png", features::kPng},
    {"dds", "dds", features::kDds},
    {"tga", "tga", features::kTga},
    {"jpeg", "jpg", features::kJpeg},
    {"jpeg", "jpeg", features::kJpeg},
    {"ktx2", "ktx2", features::kKtx2},
    {"webp", "webp", features::kWebp},
    {"pnm", "pam", features::kPnm},
    {"pnm", "pbm", features::kPnm},
    {"pnm", "pgm", features::kPnm},
    {"pnm", "ppm", features::kPnm},
}};

// Table order, enabled entries only.
std::vector<std::string_view> EnabledImageExtensions();
std::vector<DisabledExtension> DisabledImageExtensions();

std::string DisabledExtensionHint(const DisabledExtension& disabled);

/**
 * @brief Decode failure qualified with the asset path that produced it
 */
class FileTextureError {
public:
    FileTextureError(TextureError error, std::string path);

    const TextureError& GetError() const { return error_; }
    const std::string& Path() const { return path_; }

    std::string Message() const;

private:
    TextureError error_;
    std::string path_;
};

/**
 * @brief Error surfaced by ImageLoader: either the read failed or the decode did
 */
class ImageLoaderError {
public:
    enum class Kind {
        Io,
        FileTexture
    };

    static ImageLoaderError Io(asset::IoError error);
    static ImageLoaderError FileTexture(FileTextureError error);

    Kind GetKind() const { return error_.index() == 0 ? Kind::Io : Kind::FileTexture; }

    // nullptr when the error is of the other kind.
    const asset::IoError* AsIo() const { return std::get_if<asset::IoError>(&error_); }
    const FileTextureError* AsFileTexture() const { return std::get_if<FileTextureError>(&error_); }

    std::string Message() const;

private:
    explicit ImageLoaderError(std::variant<asset::IoError, FileTextureError> error);

    std::variant<asset::IoError, FileTextureError> error_;
};

/**
 * @brief Asset loader for every image container compiled into this build
 *
 * Stateless per load; the only state is the compressed format set of the render
 * device, fixed at construction.
 */
class ImageLoader final : public asset::AssetLoader<Image, ImageLoaderSettings, ImageLoaderError> {
public:
    explicit ImageLoader(CompressedImageFormats supported_compressed_formats = CompressedImageFormats::NONE);

    /**
     * @brief Build the loader from world resources
     *
     * Reads compressed format support from the RenderDevice resource (none when absent)
     * and registers a hint on the AssetServer resource, if any, for every extension
     * whose feature is compiled out.
     */
    static ImageLoader FromWorld(app::World& world);

    std::future<LoadResult> Load(
        asset::Reader& reader,
        const ImageLoaderSettings& settings,
        asset::LoadContext& context) const override;

    std::vector<std::string> Extensions() const override;
    std::string_view TypeName() const override { return "texel::render::ImageLoader"; }

    CompressedImageFormats SupportedCompressedFormats() const { return supported_compressed_formats_; }

private:
    CompressedImageFormats supported_compressed_formats_;
};

} // namespace texel::render
