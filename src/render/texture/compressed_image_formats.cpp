// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "texel/render/texture/compressed_image_formats.h"

#include "texel/render/texture/texture_format.h"

namespace texel::render {

CompressedImageFormats CompressedImageFormats::FromFeatures(const VkPhysicalDeviceFeatures& features) {
    CompressedImageFormats supported = NONE;
    if (features.textureCompressionASTC_LDR) {
        supported |= ASTC_LDR;
    }
    if (features.textureCompressionBC) {
        supported |= BC;
    }
    if (features.textureCompressionETC2) {
        supported |= ETC2;
    }
    return supported;
}

bool CompressedImageFormats::Supports(VkFormat format) const {
    switch (GetCompressionFamily(format)) {
        case CompressionFamily::Bc: return Contains(BC);
        case CompressionFamily::Etc2: return Contains(ETC2);
        case CompressionFamily::Astc: return Contains(ASTC_LDR);
        case CompressionFamily::None: return true;
    }
    return true;
}

std::string CompressedImageFormats::ToString() const {
    if (IsEmpty()) {
        return "NONE";
    }
    std::string out;
    auto append = [&out](const char* name) {
        if (!out.empty()) {
            out += " | ";
        }
        out += name;
    };
    if (Contains(ASTC_LDR)) append("ASTC_LDR");
    if (Contains(BC)) append("BC");
    if (Contains(ETC2)) append("ETC2");
    return out;
}

} // namespace texel::render
