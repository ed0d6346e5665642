// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/texture/image_sampler.h"

#include <array>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace texel::render {

namespace {

template<typename E, size_t N>
using NameTable = std::array<std::pair<E, std::string_view>, N>;

constexpr NameTable<ImageAddressMode, 4> kAddressModeNames = {{
    {ImageAddressMode::ClampToEdge, "ClampToEdge"},
    {ImageAddressMode::Repeat, "Repeat"},
    {ImageAddressMode::MirrorRepeat, "MirrorRepeat"},
    {ImageAddressMode::ClampToBorder, "ClampToBorder"},
}};

constexpr NameTable<ImageFilterMode, 2> kFilterModeNames = {{
    {ImageFilterMode::Nearest, "Nearest"},
    {ImageFilterMode::Linear, "Linear"},
}};

constexpr NameTable<ImageCompareFunction, 8> kCompareFunctionNames = {{
    {ImageCompareFunction::Never, "Never"},
    {ImageCompareFunction::Less, "Less"},
    {ImageCompareFunction::Equal, "Equal"},
    {ImageCompareFunction::LessEqual, "LessEqual"},
    {ImageCompareFunction::Greater, "Greater"},
    {ImageCompareFunction::NotEqual, "NotEqual"},
    {ImageCompareFunction::GreaterEqual, "GreaterEqual"},
    {ImageCompareFunction::Always, "Always"},
}};

constexpr NameTable<ImageSamplerBorderColor, 4> kBorderColorNames = {{
    {ImageSamplerBorderColor::TransparentBlack, "TransparentBlack"},
    {ImageSamplerBorderColor::OpaqueBlack, "OpaqueBlack"},
    {ImageSamplerBorderColor::OpaqueWhite, "OpaqueWhite"},
    {ImageSamplerBorderColor::Zero, "Zero"},
}};

template<typename E, size_t N>
void WriteName(nlohmann::json& j, const NameTable<E, N>& table, E value) {
    for (const auto& [entry, name] : table) {
        if (entry == value) {
            j = std::string(name);
            return;
        }
    }
    throw std::invalid_argument(fmt::format("unnamed sampler enum value {}", static_cast<int>(value)));
}

template<typename E, size_t N>
void ReadName(const nlohmann::json& j, const NameTable<E, N>& table, E& value, std::string_view what) {
    const auto name = j.get<std::string>();
    for (const auto& [entry, entry_name] : table) {
        if (entry_name == name) {
            value = entry;
            return;
        }
    }
    throw std::invalid_argument(fmt::format("unknown {} '{}'", what, name));
}

} // namespace

ImageSamplerDescriptor ImageSamplerDescriptor::Nearest() {
    return ImageSamplerDescriptor{};
}

ImageSamplerDescriptor ImageSamplerDescriptor::Linear() {
    ImageSamplerDescriptor descriptor{};
    descriptor.mag_filter = ImageFilterMode::Linear;
    descriptor.min_filter = ImageFilterMode::Linear;
    descriptor.mipmap_filter = ImageFilterMode::Linear;
    return descriptor;
}

ImageSampler ImageSampler::Descriptor(ImageSamplerDescriptor descriptor) {
    ImageSampler sampler;
    sampler.descriptor_ = std::move(descriptor);
    return sampler;
}

void to_json(nlohmann::json& j, const ImageAddressMode& mode) { WriteName(j, kAddressModeNames, mode); }
void from_json(const nlohmann::json& j, ImageAddressMode& mode) { ReadName(j, kAddressModeNames, mode, "address mode"); }
void to_json(nlohmann::json& j, const ImageFilterMode& mode) { WriteName(j, kFilterModeNames, mode); }
void from_json(const nlohmann::json& j, ImageFilterMode& mode) { ReadName(j, kFilterModeNames, mode, "filter mode"); }
void to_json(nlohmann::json& j, const ImageCompareFunction& compare) { WriteName(j, kCompareFunctionNames, compare); }
void from_json(const nlohmann::json& j, ImageCompareFunction& compare) {
    ReadName(j, kCompareFunctionNames, compare, "compare function");
}
void to_json(nlohmann::json& j, const ImageSamplerBorderColor& color) { WriteName(j, kBorderColorNames, color); }
void from_json(const nlohmann::json& j, ImageSamplerBorderColor& color) {
    ReadName(j, kBorderColorNames, color, "border color");
}

void to_json(nlohmann::json& j, const ImageSamplerDescriptor& descriptor) {
    j = nlohmann::json::object();
    j["label"] = descriptor.label ? nlohmann::json(*descriptor.label) : nlohmann::json(nullptr);
    j["address_mode_u"] = descriptor.address_mode_u;
    j["address_mode_v"] = descriptor.address_mode_v;
    j["address_mode_w"] = descriptor.address_mode_w;
    j["mag_filter"] = descriptor.mag_filter;
    j["min_filter"] = descriptor.min_filter;
    j["mipmap_filter"] = descriptor.mipmap_filter;
    j["lod_min_clamp"] = descriptor.lod_min_clamp;
    j["lod_max_clamp"] = descriptor.lod_max_clamp;
    j["compare"] = descriptor.compare ? nlohmann::json(*descriptor.compare) : nlohmann::json(nullptr);
    j["anisotropy_clamp"] = descriptor.anisotropy_clamp;
    j["border_color"] = descriptor.border_color ? nlohmann::json(*descriptor.border_color) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, ImageSamplerDescriptor& descriptor) {
    descriptor = ImageSamplerDescriptor{};
    if (auto it = j.find("label"); it != j.end() && !it->is_null()) {
        descriptor.label = it->get<std::string>();
    }
    if (j.contains("address_mode_u")) j.at("address_mode_u").get_to(descriptor.address_mode_u);
    if (j.contains("address_mode_v")) j.at("address_mode_v").get_to(descriptor.address_mode_v);
    if (j.contains("address_mode_w")) j.at("address_mode_w").get_to(descriptor.address_mode_w);
    if (j.contains("mag_filter")) j.at("mag_filter").get_to(descriptor.mag_filter);
    if (j.contains("min_filter")) j.at("min_filter").get_to(descriptor.min_filter);
    if (j.contains("mipmap_filter")) j.at("mipmap_filter").get_to(descriptor.mipmap_filter);
    if (j.contains("lod_min_clamp")) j.at("lod_min_clamp").get_to(descriptor.lod_min_clamp);
    if (j.contains("lod_max_clamp")) j.at("lod_max_clamp").get_to(descriptor.lod_max_clamp);
    if (auto it = j.find("compare"); it != j.end() && !it->is_null()) {
        descriptor.compare = it->get<ImageCompareFunction>();
    }
    if (j.contains("anisotropy_clamp")) j.at("anisotropy_clamp").get_to(descriptor.anisotropy_clamp);
    if (auto it = j.find("border_color"); it != j.end() && !it->is_null()) {
        descriptor.border_color = it->get<ImageSamplerBorderColor>();
    }
}

// "Default" or {"Descriptor": {...}}
void to_json(nlohmann::json& j, const ImageSampler& sampler) {
    if (sampler.IsDefault()) {
        j = "Default";
    } else {
        j = nlohmann::json{{"Descriptor", *sampler.GetDescriptor()}};
    }
}

void from_json(const nlohmann::json& j, ImageSampler& sampler) {
    if (j.is_string()) {
        const auto name = j.get<std::string>();
        if (name != "Default") {
            throw std::invalid_argument(fmt::format("unknown sampler '{}'", name));
        }
        sampler = ImageSampler::Default();
        return;
    }
    if (j.is_object() && j.contains("Descriptor")) {
        sampler = ImageSampler::Descriptor(j.at("Descriptor").get<ImageSamplerDescriptor>());
        return;
    }
    throw std::invalid_argument("sampler must be \"Default\" or {\"Descriptor\": {...}}");
}

} // namespace texel::render
