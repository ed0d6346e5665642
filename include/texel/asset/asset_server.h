// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "texel/app/world.h"
#include "texel/asset/asset_loader.h"
#include "texel/core/config.h"
#include "texel/core/result.h"

namespace texel::asset {

/**
 * @brief Owns the registered loaders and loads files from the asset root
 *
 * Extensions are matched case-insensitively. When several loaders claim the same
 * extension the last registered one wins. Hints are shown instead of a bare
 * "no loader" error for extensions that could be supported by rebuilding.
 */
class AssetServer {
public:
    explicit AssetServer(std::filesystem::path root = "assets", bool read_meta_files = true);
    explicit AssetServer(const config::AppConfig& config);

    AssetServer(const AssetServer&) = delete;
    AssetServer& operator=(const AssetServer&) = delete;

    const std::filesystem::path& Root() const { return root_; }

    void RegisterLoader(std::shared_ptr<ErasedAssetLoader> loader);

    // Builds the loader from the world (L::FromWorld when present) and registers it.
    template<typename L>
    void InitLoader(app::World& world) {
        RegisterLoader(std::make_shared<L>(app::FromWorld<L>(world)));
    }

    void RegisterExtensionHint(std::string_view extension, std::string hint);
    std::optional<std::string> GetExtensionHint(std::string_view extension) const;

    std::shared_ptr<ErasedAssetLoader> GetLoaderForExtension(std::string_view extension) const;
    core::Result<std::shared_ptr<ErasedAssetLoader>> GetLoaderForPath(const std::filesystem::path& path) const;

    /**
     * @brief Load a file relative to the asset root
     *
     * @param path Asset path relative to Root()
     * @param settings Loader settings; when null the `<path>.meta` sidecar is used if
     *        present and meta files are enabled, otherwise defaults
     */
    std::future<core::Result<LoadedAsset>> LoadUntyped(
        std::filesystem::path path, nlohmann::json settings = nullptr) const;

    template<typename TAsset>
    std::future<core::Result<std::shared_ptr<TAsset>>> Load(
        std::filesystem::path path, nlohmann::json settings = nullptr) const
    {
        auto untyped = LoadUntyped(std::move(path), std::move(settings));
        return std::async(std::launch::async,
            [untyped = std::move(untyped)]() mutable -> core::Result<std::shared_ptr<TAsset>> {
                auto loaded = untyped.get();
                if (!loaded) {
                    return core::Result<std::shared_ptr<TAsset>>::Err(std::move(loaded).GetError());
                }
                LoadedAsset asset = std::move(loaded).Unwrap();
                if (asset.type != std::type_index(typeid(TAsset))) {
                    return core::Result<std::shared_ptr<TAsset>>::Err(
                        std::string("asset type mismatch: loaded ") + asset.type.name());
                }
                return core::Result<std::shared_ptr<TAsset>>::Ok(std::static_pointer_cast<TAsset>(asset.value));
            });
    }

private:
    core::Result<nlohmann::json> ReadMetaSettings(const std::filesystem::path& path) const;

    std::filesystem::path root_;
    bool read_meta_files_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ErasedAssetLoader>> loaders_;
    std::unordered_map<std::string, usize> extension_to_loader_;
    std::unordered_map<std::string, std::string> extension_hints_;
};

} // namespace texel::asset
