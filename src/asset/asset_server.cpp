// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/asset/asset_server.h"
#include "texel/core/log.h"

#include <cctype>
#include <fstream>
#include <utility>

#include <fmt/format.h>

namespace texel::asset {

namespace {

std::string Lowercase(std::string_view value) {
    std::string out(value);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

AssetServer::AssetServer(std::filesystem::path root, bool read_meta_files)
    : root_(std::move(root)), read_meta_files_(read_meta_files) {}

AssetServer::AssetServer(const config::AppConfig& config)
    : AssetServer(config.asset_root, config.read_meta_files) {}

void AssetServer::RegisterLoader(std::shared_ptr<ErasedAssetLoader> loader) {
    std::lock_guard<std::mutex> lock(mutex_);
    const usize index = loaders_.size();
    for (const auto& extension : loader->Extensions()) {
        const std::string key = Lowercase(extension);
        if (extension_to_loader_.count(key) != 0) {
            TEXEL_LOG_WARN("Extension '{}' was claimed by {}, now handled by {}",
                key, loaders_[extension_to_loader_[key]]->TypeName(), loader->TypeName());
        }
        extension_to_loader_[key] = index;
    }
    TEXEL_LOG_DEBUG("Registered asset loader {} ({} extensions)", loader->TypeName(), loader->Extensions().size());
    loaders_.push_back(std::move(loader));
}

void AssetServer::RegisterExtensionHint(std::string_view extension, std::string hint) {
    std::lock_guard<std::mutex> lock(mutex_);
    extension_hints_[Lowercase(extension)] = std::move(hint);
}

std::optional<std::string> AssetServer::GetExtensionHint(std::string_view extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extension_hints_.find(Lowercase(extension));
    if (it == extension_hints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<ErasedAssetLoader> AssetServer::GetLoaderForExtension(std::string_view extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extension_to_loader_.find(Lowercase(extension));
    if (it == extension_to_loader_.end()) {
        return nullptr;
    }
    return loaders_[it->second];
}

core::Result<std::shared_ptr<ErasedAssetLoader>> AssetServer::GetLoaderForPath(
    const std::filesystem::path& path) const
{
    using R = core::Result<std::shared_ptr<ErasedAssetLoader>>;

    const std::string extension = path.extension().string();
    if (extension.size() <= 1) {
        return R::Err(fmt::format("asset path '{}' has no extension", path.string()));
    }

    const std::string_view bare = std::string_view(extension).substr(1);
    if (auto loader = GetLoaderForExtension(bare)) {
        return R::Ok(std::move(loader));
    }

    std::string message = fmt::format("no asset loader found for extension '{}' of '{}'", bare, path.string());
    if (auto hint = GetExtensionHint(bare)) {
        message += fmt::format(" ({})", *hint);
    }
    return R::Err(message);
}

core::Result<nlohmann::json> AssetServer::ReadMetaSettings(const std::filesystem::path& path) const {
    using R = core::Result<nlohmann::json>;

    std::filesystem::path meta_path = path;
    meta_path += ".meta";

    std::error_code ec;
    if (!read_meta_files_ || !std::filesystem::exists(meta_path, ec)) {
        return R::Ok(nullptr);
    }

    std::ifstream file(meta_path);
    if (!file.is_open()) {
        return R::Err(fmt::format("failed to open meta file: {}", meta_path.string()));
    }

    nlohmann::json meta = nlohmann::json::parse(file, nullptr, false);
    if (meta.is_discarded()) {
        return R::Err(fmt::format("malformed meta file: {}", meta_path.string()));
    }

    // Either the settings object itself or {"loader_settings": {...}}.
    if (meta.is_object() && meta.contains("loader_settings")) {
        return R::Ok(meta["loader_settings"]);
    }
    return R::Ok(std::move(meta));
}

std::future<core::Result<LoadedAsset>> AssetServer::LoadUntyped(
    std::filesystem::path path, nlohmann::json settings) const
{
    using R = core::Result<LoadedAsset>;

    auto loader_result = GetLoaderForPath(path);
    const std::filesystem::path full_path = root_ / path;

    return std::async(std::launch::async,
        [this, path = std::move(path), full_path, settings = std::move(settings),
         loader_result = std::move(loader_result)]() mutable -> R {
            if (!loader_result) {
                TEXEL_LOG_ERROR("{}", loader_result.GetError().Message);
                return R::Err(std::move(loader_result).GetError());
            }
            std::shared_ptr<ErasedAssetLoader> loader = std::move(loader_result).Unwrap();

            if (settings.is_null()) {
                auto meta = ReadMetaSettings(full_path);
                if (!meta) {
                    return R::Err(std::move(meta).GetError());
                }
                settings = std::move(meta).Unwrap();
            }

            TEXEL_LOG_DEBUG("Loading {} with {}", path.string(), loader->TypeName());

            FileReader reader(full_path);
            LoadContext context(path);
            auto loaded = loader->LoadErased(reader, settings, context).get();
            if (!loaded) {
                return R::Err(std::move(loaded).GetError().WithContext(
                    fmt::format("failed to load asset '{}'", path.string())));
            }
            return loaded;
        });
}

} // namespace texel::asset
