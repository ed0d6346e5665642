// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "texel/core/common.h"

namespace texel::render {

enum class ImageAddressMode {
    ClampToEdge,
    Repeat,
    MirrorRepeat,
    ClampToBorder
};

enum class ImageFilterMode {
    Nearest,
    Linear
};

enum class ImageCompareFunction {
    Never,
    Less,
    Equal,
    LessEqual,
    Greater,
    NotEqual,
    GreaterEqual,
    Always
};

enum class ImageSamplerBorderColor {
    TransparentBlack,
    OpaqueBlack,
    OpaqueWhite,
    Zero
};

/**
 * @brief Filtering and wrapping for one texture
 */
struct ImageSamplerDescriptor {
    std::optional<std::string> label;
    ImageAddressMode address_mode_u = ImageAddressMode::ClampToEdge;
    ImageAddressMode address_mode_v = ImageAddressMode::ClampToEdge;
    ImageAddressMode address_mode_w = ImageAddressMode::ClampToEdge;
    ImageFilterMode mag_filter = ImageFilterMode::Nearest;
    ImageFilterMode min_filter = ImageFilterMode::Nearest;
    ImageFilterMode mipmap_filter = ImageFilterMode::Nearest;
    f32 lod_min_clamp = 0.0f;
    f32 lod_max_clamp = 32.0f;
    std::optional<ImageCompareFunction> compare;
    u16 anisotropy_clamp = 1;
    std::optional<ImageSamplerBorderColor> border_color;

    static ImageSamplerDescriptor Nearest();
    static ImageSamplerDescriptor Linear();

    bool operator==(const ImageSamplerDescriptor& other) const = default;
};

/**
 * @brief Sampler attached to an image: the engine default or an explicit descriptor
 */
class ImageSampler {
public:
    ImageSampler() = default;

    static ImageSampler Default() { return ImageSampler(); }
    static ImageSampler Descriptor(ImageSamplerDescriptor descriptor);
    static ImageSampler Nearest() { return Descriptor(ImageSamplerDescriptor::Nearest()); }
    static ImageSampler Linear() { return Descriptor(ImageSamplerDescriptor::Linear()); }

    bool IsDefault() const { return !descriptor_.has_value(); }
    const std::optional<ImageSamplerDescriptor>& GetDescriptor() const { return descriptor_; }

    bool operator==(const ImageSampler& other) const = default;

private:
    std::optional<ImageSamplerDescriptor> descriptor_;
};

void to_json(nlohmann::json& j, const ImageAddressMode& mode);
void from_json(const nlohmann::json& j, ImageAddressMode& mode);
void to_json(nlohmann::json& j, const ImageFilterMode& mode);
void from_json(const nlohmann::json& j, ImageFilterMode& mode);
void to_json(nlohmann::json& j, const ImageCompareFunction& compare);
void from_json(const nlohmann::json& j, ImageCompareFunction& compare);
void to_json(nlohmann::json& j, const ImageSamplerBorderColor& color);
void from_json(const nlohmann::json& j, ImageSamplerBorderColor& color);
void to_json(nlohmann::json& j, const ImageSamplerDescriptor& descriptor);
void from_json(const nlohmann::json& j, ImageSamplerDescriptor& descriptor);
void to_json(nlohmann::json& j, const ImageSampler& sampler);
void from_json(const nlohmann::json& j, ImageSampler& sampler);

} // namespace texel::render
