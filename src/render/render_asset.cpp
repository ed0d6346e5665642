// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/render_asset.h"

#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace texel::render {

std::string_view ToString(RenderAssetPersistencePolicy policy) {
    switch (policy) {
        case RenderAssetPersistencePolicy::Unload: return "Unload";
        case RenderAssetPersistencePolicy::Keep: return "Keep";
    }
    return "Keep";
}

void to_json(nlohmann::json& j, const RenderAssetPersistencePolicy& policy) {
    j = std::string(ToString(policy));
}

void from_json(const nlohmann::json& j, RenderAssetPersistencePolicy& policy) {
    const auto name = j.get<std::string>();
    if (name == "Unload") {
        policy = RenderAssetPersistencePolicy::Unload;
    } else if (name == "Keep") {
        policy = RenderAssetPersistencePolicy::Keep;
    } else {
        throw std::invalid_argument(fmt::format("unknown persistence policy '{}'", name));
    }
}

} // namespace texel::render
