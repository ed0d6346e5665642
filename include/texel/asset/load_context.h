// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace texel::asset {

// Per-load state visible to a loader. The path is relative to the asset root.
class LoadContext {
public:
    explicit LoadContext(std::filesystem::path path) : path_(std::move(path)) {}

    const std::filesystem::path& Path() const { return path_; }

    // Last extension without the leading dot, as written in the path.
    std::optional<std::string> Extension() const {
        const std::string extension = path_.extension().string();
        if (extension.size() <= 1) {
            return std::nullopt;
        }
        return extension.substr(1);
    }

private:
    std::filesystem::path path_;
};

} // namespace texel::asset
