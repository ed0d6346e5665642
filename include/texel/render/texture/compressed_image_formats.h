// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string>

#include <vulkan/vulkan.h>

#include "texel/core/common.h"

namespace texel::render {

/**
 * @brief Block-compressed texture families a device can sample from
 */
class CompressedImageFormats {
public:
    static const CompressedImageFormats NONE;
    static const CompressedImageFormats ASTC_LDR;
    static const CompressedImageFormats BC;
    static const CompressedImageFormats ETC2;

    constexpr CompressedImageFormats() : bits_(0) {}

    static CompressedImageFormats FromFeatures(const VkPhysicalDeviceFeatures& features);

    constexpr u32 Bits() const { return bits_; }
    constexpr bool IsEmpty() const { return bits_ == 0; }
    constexpr bool Contains(CompressedImageFormats other) const {
        return (bits_ & other.bits_) == other.bits_;
    }

    // Uncompressed formats are always supported.
    bool Supports(VkFormat format) const;

    std::string ToString() const;

    constexpr CompressedImageFormats operator|(CompressedImageFormats other) const {
        return CompressedImageFormats(bits_ | other.bits_);
    }
    constexpr CompressedImageFormats& operator|=(CompressedImageFormats other) {
        bits_ |= other.bits_;
        return *this;
    }
    constexpr bool operator==(const CompressedImageFormats& other) const = default;

private:
    constexpr explicit CompressedImageFormats(u32 bits) : bits_(bits) {}

    u32 bits_;
};

inline constexpr CompressedImageFormats CompressedImageFormats::NONE{};
inline constexpr CompressedImageFormats CompressedImageFormats::ASTC_LDR{1u << 0};
inline constexpr CompressedImageFormats CompressedImageFormats::BC{1u << 1};
inline constexpr CompressedImageFormats CompressedImageFormats::ETC2{1u << 2};

} // namespace texel::render
