// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace texel::render {

/**
 * @brief Whether the CPU copy of a render asset survives its upload to the GPU
 */
enum class RenderAssetPersistencePolicy {
    Unload,
    Keep
};

std::string_view ToString(RenderAssetPersistencePolicy policy);

void to_json(nlohmann::json& j, const RenderAssetPersistencePolicy& policy);
void from_json(const nlohmann::json& j, RenderAssetPersistencePolicy& policy);

} // namespace texel::render
