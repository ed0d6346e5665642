// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <exception>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include <nlohmann/json.hpp>

#include "texel/asset/load_context.h"
#include "texel/asset/reader.h"
#include "texel/core/result.h"

namespace texel::asset {

/**
 * @brief Result of a type-erased load: the asset behind a shared_ptr<void> plus its type
 */
struct LoadedAsset {
    std::type_index type;
    std::shared_ptr<void> value;
};

/**
 * @brief Loader interface the AssetServer stores
 *
 * Settings arrive as JSON and are deserialized by the typed loader; a null JSON value
 * means default settings. Errors are flattened to core::Error with the loader's message.
 */
class ErasedAssetLoader {
public:
    virtual ~ErasedAssetLoader() = default;

    virtual std::vector<std::string> Extensions() const = 0;
    virtual std::string_view TypeName() const = 0;
    virtual std::type_index AssetType() const = 0;

    // reader and context must outlive the returned future.
    virtual std::future<core::Result<LoadedAsset>> LoadErased(
        Reader& reader, const nlohmann::json& settings, LoadContext& context) const = 0;
};

/**
 * @brief Typed loader turning bytes into TAsset
 *
 * Implementations override Load; reader, settings and context must outlive the
 * returned future.
 */
template<typename TAsset, typename TSettings, typename TError>
class AssetLoader : public ErasedAssetLoader {
public:
    using Asset = TAsset;
    using Settings = TSettings;
    using Error = TError;
    using LoadResult = core::Result<TAsset, TError>;

    virtual std::future<LoadResult> Load(
        Reader& reader, const TSettings& settings, LoadContext& context) const = 0;

    std::type_index AssetType() const override { return std::type_index(typeid(TAsset)); }

    std::future<core::Result<LoadedAsset>> LoadErased(
        Reader& reader, const nlohmann::json& settings_json, LoadContext& context) const override
    {
        return std::async(std::launch::async,
            [this, &reader, settings_json, &context]() -> core::Result<LoadedAsset> {
                TSettings settings{};
                if (!settings_json.is_null()) {
                    try {
                        settings = settings_json.get<TSettings>();
                    } catch (const std::exception& e) {
                        return core::Result<LoadedAsset>::Err(std::string("invalid loader settings for ")
                            + std::string(TypeName()) + ": " + e.what());
                    }
                }

                LoadResult result = Load(reader, settings, context).get();
                if (!result) {
                    return core::Result<LoadedAsset>::Err(std::move(result).GetError().Message());
                }
                auto asset = std::make_shared<TAsset>(std::move(result).Unwrap());
                return core::Result<LoadedAsset>::Ok(LoadedAsset{AssetType(), std::move(asset)});
            });
    }
};

} // namespace texel::asset
