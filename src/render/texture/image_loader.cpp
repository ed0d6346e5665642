// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/texture/image_loader.h"
#include "texel/asset/asset_server.h"
#include "texel/core/log.h"
#include "texel/render/render_device.h"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace texel::render {

namespace {

core::Result<ImageType, TextureError> ResolveImageType(
    const ImageFormatSetting& setting, const asset::LoadContext& context)
{
    using R = core::Result<ImageType, TextureError>;

    if (auto format = setting.GetFormat()) {
        return R::Ok(ImageType::Format(*format));
    }

    auto extension = context.Extension();
    if (!extension) {
        return R::Err(TextureError::InvalidImageExtension(
            fmt::format("{} has no extension", context.Path().string())));
    }
    return R::Ok(ImageType::Extension(std::move(*extension)));
}

} // namespace

// ImageFormatSetting

ImageFormatSetting ImageFormatSetting::Format(ImageFormat format) {
    ImageFormatSetting setting;
    setting.kind_ = Kind::Format;
    setting.format_ = format;
    return setting;
}

std::optional<ImageFormat> ImageFormatSetting::GetFormat() const {
    if (kind_ == Kind::Format) {
        return format_;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const ImageFormatSetting& setting) {
    if (auto format = setting.GetFormat()) {
        j = nlohmann::json{{"Format", *format}};
    } else {
        j = "FromExtension";
    }
}

void from_json(const nlohmann::json& j, ImageFormatSetting& setting) {
    if (j.is_string()) {
        const auto name = j.get<std::string>();
        if (name != "FromExtension") {
            throw std::invalid_argument(fmt::format("unknown image format setting '{}'", name));
        }
        setting = ImageFormatSetting::FromExtension();
        return;
    }
    if (j.is_object() && j.size() == 1 && j.contains("Format")) {
        setting = ImageFormatSetting::Format(j.at("Format").get<ImageFormat>());
        return;
    }
    throw std::invalid_argument(fmt::format("invalid image format setting: {}", j.dump()));
}

void to_json(nlohmann::json& j, const ImageLoaderSettings& settings) {
    j = nlohmann::json{
        {"format", settings.format},
        {"is_srgb", settings.is_srgb},
        {"sampler", settings.sampler},
        {"cpu_persistent_access", settings.cpu_persistent_access},
    };
}

void from_json(const nlohmann::json& j, ImageLoaderSettings& settings) {
    if (!j.is_object()) {
        throw std::invalid_argument(fmt::format("image loader settings must be an object: {}", j.dump()));
    }
    settings = ImageLoaderSettings{};
    if (j.contains("format")) {
        settings.format = j.at("format").get<ImageFormatSetting>();
    }
    if (j.contains("is_srgb")) {
        settings.is_srgb = j.at("is_srgb").get<bool>();
    }
    if (j.contains("sampler")) {
        settings.sampler = j.at("sampler").get<ImageSampler>();
    }
    if (j.contains("cpu_persistent_access")) {
        settings.cpu_persistent_access = j.at("cpu_persistent_access").get<RenderAssetPersistencePolicy>();
    }
}

// Extension table

std::vector<std::string_view> EnabledImageExtensions() {
    std::vector<std::string_view> extensions;
    for (const auto& entry : kImageExtensions) {
        if (entry.enabled) {
            extensions.push_back(entry.extension);
        }
    }
    return extensions;
}

std::vector<DisabledExtension> DisabledImageExtensions() {
    std::vector<DisabledExtension> disabled;
    for (const auto& entry : kImageExtensions) {
        if (!entry.enabled) {
            disabled.push_back(DisabledExtension{entry.extension, entry.feature});
        }
    }
    return disabled;
}

std::string DisabledExtensionHint(const DisabledExtension& disabled) {
    return fmt::format("enabling texel feature '{}'", disabled.feature);
}

// Errors

FileTextureError::FileTextureError(TextureError error, std::string path)
    : error_(std::move(error)), path_(std::move(path)) {}

std::string FileTextureError::Message() const {
    return fmt::format("Error reading image file {}: {}, this is an error in texel-render.",
        path_, error_.Message());
}

ImageLoaderError::ImageLoaderError(std::variant<asset::IoError, FileTextureError> error)
    : error_(std::move(error)) {}

ImageLoaderError ImageLoaderError::Io(asset::IoError error) {
    return ImageLoaderError(std::variant<asset::IoError, FileTextureError>(
        std::in_place_index<0>, std::move(error)));
}

ImageLoaderError ImageLoaderError::FileTexture(FileTextureError error) {
    return ImageLoaderError(std::variant<asset::IoError, FileTextureError>(
        std::in_place_index<1>, std::move(error)));
}

std::string ImageLoaderError::Message() const {
    if (const auto* io = AsIo()) {
        return fmt::format("Could not load image: {}", io->Message());
    }
    return fmt::format("Could not load texture file: {}", AsFileTexture()->Message());
}

// ImageLoader

ImageLoader::ImageLoader(CompressedImageFormats supported_compressed_formats)
    : supported_compressed_formats_(supported_compressed_formats) {}

ImageLoader ImageLoader::FromWorld(app::World& world) {
    CompressedImageFormats supported = CompressedImageFormats::NONE;
    if (const auto* device = world.GetResource<RenderDevice>()) {
        supported = CompressedImageFormats::FromFeatures(device->Features());
        TEXEL_LOG_DEBUG("ImageLoader: {} device supports {}", device->Name(), supported.ToString());
    } else {
        TEXEL_LOG_DEBUG("ImageLoader: no render device, compressed formats disabled");
    }

    if (auto* server = world.GetResource<asset::AssetServer>()) {
        for (const auto& disabled : DisabledImageExtensions()) {
            std::string hint = DisabledExtensionHint(disabled);
            TEXEL_LOG_DEBUG("ImageLoader: hint for .{}: {}", disabled.extension, hint);
            server->RegisterExtensionHint(disabled.extension, std::move(hint));
        }
    }

    return ImageLoader(supported);
}

std::vector<std::string> ImageLoader::Extensions() const {
    std::vector<std::string> extensions;
    for (std::string_view extension : EnabledImageExtensions()) {
        extensions.emplace_back(extension);
    }
    return extensions;
}

std::future<ImageLoader::LoadResult> ImageLoader::Load(
    asset::Reader& reader,
    const ImageLoaderSettings& settings,
    asset::LoadContext& context) const
{
    const CompressedImageFormats supported = supported_compressed_formats_;

    return std::async(std::launch::async, [supported, &reader, &settings, &context]() -> LoadResult {
        std::vector<u8> bytes;
        auto read = reader.ReadToEnd(bytes);
        if (!read) {
            return LoadResult::Err(ImageLoaderError::Io(std::move(read).GetError()));
        }

        const std::string path = context.Path().string();
        auto fail = [&path](TextureError error) {
            FileTextureError file_error(std::move(error), path);
            TEXEL_LOG_WARN("{}", file_error.Message());
            return LoadResult::Err(ImageLoaderError::FileTexture(std::move(file_error)));
        };

        auto image_type = ResolveImageType(settings.format, context);
        if (!image_type) {
            return fail(std::move(image_type).GetError());
        }

        TEXEL_LOG_DEBUG("Loading image {} ({} bytes)", path, bytes.size());

        auto image = Image::FromBuffer(
            bytes,
            image_type.Value(),
            supported,
            settings.is_srgb,
            settings.sampler,
            settings.cpu_persistent_access);
        if (!image) {
            return fail(std::move(image).GetError());
        }
        return LoadResult::Ok(std::move(image).Unwrap());
    });
}

} // namespace texel::render
