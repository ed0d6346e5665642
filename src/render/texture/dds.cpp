// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "decoders.h"

#include <algorithm>
#include <bit>
#include <cstring>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace texel::render::detail {

namespace {

// Simple DDS header structures
#pragma pack(push, 1)
struct DDS_PIXELFORMAT {
    uint32_t size;
    uint32_t flags;
    uint32_t fourCC;
    uint32_t RGBBitCount;
    uint32_t RBitMask;
    uint32_t GBitMask;
    uint32_t BBitMask;
    uint32_t ABitMask;
};

struct DDS_HEADER {
    uint32_t size;
    uint32_t flags;
    uint32_t height;
    uint32_t width;
    uint32_t pitchOrLinearSize;
    uint32_t depth;
    uint32_t mipMapCount;
    uint32_t reserved1[11];
    DDS_PIXELFORMAT ddspf;
    uint32_t caps;
    uint32_t caps2;
    uint32_t caps3;
    uint32_t caps4;
    uint32_t reserved2;
};

struct DDS_HEADER_DXT10 {
    uint32_t dxgiFormat;
    uint32_t resourceDimension;
    uint32_t miscFlag;
    uint32_t arraySize;
    uint32_t miscFlags2;
};
#pragma pack(pop)

static_assert(sizeof(DDS_HEADER) == 124, "DDS_HEADER must be 124 bytes");
static_assert(sizeof(DDS_HEADER_DXT10) == 20, "DDS_HEADER_DXT10 must be 20 bytes");

constexpr uint32_t MakeFourCC(char a, char b, char c, char d) {
    return static_cast<uint32_t>(static_cast<u8>(a))
        | (static_cast<uint32_t>(static_cast<u8>(b)) << 8)
        | (static_cast<uint32_t>(static_cast<u8>(c)) << 16)
        | (static_cast<uint32_t>(static_cast<u8>(d)) << 24);
}

constexpr uint32_t DDS_MAGIC = MakeFourCC('D', 'D', 'S', ' ');

constexpr uint32_t DDPF_FOURCC = 0x4;
constexpr uint32_t DDPF_RGB = 0x40;
constexpr uint32_t DDPF_LUMINANCE = 0x20000;

constexpr uint32_t DDSCAPS2_CUBEMAP = 0x200;
constexpr uint32_t DDSCAPS2_CUBEMAP_ALLFACES = 0xFC00;
constexpr uint32_t DDSCAPS2_VOLUME = 0x200000;

constexpr uint32_t D3D10_RESOURCE_DIMENSION_TEXTURE3D = 4;
constexpr uint32_t D3D10_RESOURCE_MISC_TEXTURECUBE = 0x4;

// Largest extent accepted per axis; keeps mip size products inside usize.
constexpr uint32_t kMaxExtent = 1u << 16;

std::optional<VkFormat> FormatFromFourCC(uint32_t fourCC, bool is_srgb) {
    switch (fourCC) {
        case MakeFourCC('D', 'X', 'T', '1'):
            return WithSrgb(VK_FORMAT_BC1_RGBA_UNORM_BLOCK, is_srgb);
        case MakeFourCC('D', 'X', 'T', '2'):
        case MakeFourCC('D', 'X', 'T', '3'):
            return WithSrgb(VK_FORMAT_BC2_UNORM_BLOCK, is_srgb);
        case MakeFourCC('D', 'X', 'T', '4'):
        case MakeFourCC('D', 'X', 'T', '5'):
            return WithSrgb(VK_FORMAT_BC3_UNORM_BLOCK, is_srgb);
        case MakeFourCC('A', 'T', 'I', '1'):
        case MakeFourCC('B', 'C', '4', 'U'):
            return VK_FORMAT_BC4_UNORM_BLOCK;
        case MakeFourCC('B', 'C', '4', 'S'):
            return VK_FORMAT_BC4_SNORM_BLOCK;
        case MakeFourCC('A', 'T', 'I', '2'):
        case MakeFourCC('B', 'C', '5', 'U'):
            return VK_FORMAT_BC5_UNORM_BLOCK;
        case MakeFourCC('B', 'C', '5', 'S'):
            return VK_FORMAT_BC5_SNORM_BLOCK;
        default:
            return std::nullopt;
    }
}

std::optional<VkFormat> FormatFromMasks(const DDS_PIXELFORMAT& pf, bool is_srgb) {
    if ((pf.flags & DDPF_RGB) && pf.RGBBitCount == 32) {
        if (pf.RBitMask == 0x000000ff && pf.GBitMask == 0x0000ff00 && pf.BBitMask == 0x00ff0000) {
            return WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, is_srgb);
        }
        if (pf.RBitMask == 0x00ff0000 && pf.GBitMask == 0x0000ff00 && pf.BBitMask == 0x000000ff) {
            return WithSrgb(VK_FORMAT_B8G8R8A8_UNORM, is_srgb);
        }
    }
    if ((pf.flags & DDPF_LUMINANCE) && pf.RGBBitCount == 8) {
        return VK_FORMAT_R8_UNORM;
    }
    return std::nullopt;
}

// Map DXGI format to Vulkan format
std::optional<VkFormat> FormatFromDxgi(uint32_t dxgiFormat, bool is_srgb) {
    switch (dxgiFormat) {
        case 2: return VK_FORMAT_R32G32B32A32_SFLOAT;    // DXGI_FORMAT_R32G32B32A32_FLOAT
        case 10: return VK_FORMAT_R16G16B16A16_SFLOAT;   // DXGI_FORMAT_R16G16B16A16_FLOAT
        case 11: return VK_FORMAT_R16G16B16A16_UNORM;    // DXGI_FORMAT_R16G16B16A16_UNORM
        case 27:                                         // DXGI_FORMAT_R8G8B8A8_TYPELESS
        case 28:                                         // DXGI_FORMAT_R8G8B8A8_UNORM
        case 29:                                         // DXGI_FORMAT_R8G8B8A8_UNORM_SRGB
            return WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, is_srgb);
        case 41: return VK_FORMAT_R32_SFLOAT;            // DXGI_FORMAT_R32_FLOAT
        case 49: return VK_FORMAT_R8G8_UNORM;            // DXGI_FORMAT_R8G8_UNORM
        case 61: return VK_FORMAT_R8_UNORM;              // DXGI_FORMAT_R8_UNORM
        case 70:                                         // DXGI_FORMAT_BC1_TYPELESS
        case 71:                                         // DXGI_FORMAT_BC1_UNORM
        case 72:                                         // DXGI_FORMAT_BC1_UNORM_SRGB
            return WithSrgb(VK_FORMAT_BC1_RGBA_UNORM_BLOCK, is_srgb);
        case 73:                                         // DXGI_FORMAT_BC2_TYPELESS
        case 74:                                         // DXGI_FORMAT_BC2_UNORM
        case 75:                                         // DXGI_FORMAT_BC2_UNORM_SRGB
            return WithSrgb(VK_FORMAT_BC2_UNORM_BLOCK, is_srgb);
        case 76:                                         // DXGI_FORMAT_BC3_TYPELESS
        case 77:                                         // DXGI_FORMAT_BC3_UNORM
        case 78:                                         // DXGI_FORMAT_BC3_UNORM_SRGB
            return WithSrgb(VK_FORMAT_BC3_UNORM_BLOCK, is_srgb);
        case 79:                                         // DXGI_FORMAT_BC4_TYPELESS
        case 80: return VK_FORMAT_BC4_UNORM_BLOCK;       // DXGI_FORMAT_BC4_UNORM
        case 81: return VK_FORMAT_BC4_SNORM_BLOCK;       // DXGI_FORMAT_BC4_SNORM
        case 82:                                         // DXGI_FORMAT_BC5_TYPELESS
        case 83: return VK_FORMAT_BC5_UNORM_BLOCK;       // DXGI_FORMAT_BC5_UNORM
        case 84: return VK_FORMAT_BC5_SNORM_BLOCK;       // DXGI_FORMAT_BC5_SNORM
        case 87:                                         // DXGI_FORMAT_B8G8R8A8_UNORM
        case 91:                                         // DXGI_FORMAT_B8G8R8A8_UNORM_SRGB
            return WithSrgb(VK_FORMAT_B8G8R8A8_UNORM, is_srgb);
        case 94:                                         // DXGI_FORMAT_BC6H_TYPELESS
        case 95: return VK_FORMAT_BC6H_UFLOAT_BLOCK;     // DXGI_FORMAT_BC6H_UF16
        case 96: return VK_FORMAT_BC6H_SFLOAT_BLOCK;     // DXGI_FORMAT_BC6H_SF16
        case 97:                                         // DXGI_FORMAT_BC7_TYPELESS
        case 98:                                         // DXGI_FORMAT_BC7_UNORM
        case 99:                                         // DXGI_FORMAT_BC7_UNORM_SRGB
            return WithSrgb(VK_FORMAT_BC7_UNORM_BLOCK, is_srgb);
        default:
            return std::nullopt;
    }
}

} // namespace

ImageResult DecodeDds(std::span<const u8> data, CompressedImageFormats supported, bool is_srgb) {
    if (data.size() < 4 + sizeof(DDS_HEADER)) {
        return ImageResult::Err(TextureError::InvalidData("data too small for DDS"));
    }

    // Check magic number
    uint32_t magic = 0;
    std::memcpy(&magic, data.data(), sizeof(magic));
    if (magic != DDS_MAGIC) {
        return ImageResult::Err(TextureError::InvalidData("not a DDS file"));
    }

    DDS_HEADER header{};
    std::memcpy(&header, data.data() + 4, sizeof(DDS_HEADER));
    if (header.size != sizeof(DDS_HEADER)) {
        return ImageResult::Err(TextureError::InvalidData(
            fmt::format("DDS header size is {}, expected {}", header.size, sizeof(DDS_HEADER))));
    }
    if (header.width == 0 || header.height == 0) {
        return ImageResult::Err(TextureError::InvalidData("DDS image has zero extent"));
    }

    usize headerSize = 4 + sizeof(DDS_HEADER);
    std::optional<VkFormat> format;
    uint32_t arraySize = 1;
    bool isCubemap = false;
    bool isVolume = false;

    // Determine format
    if ((header.ddspf.flags & DDPF_FOURCC) && header.ddspf.fourCC == MakeFourCC('D', 'X', '1', '0')) {
        if (data.size() < headerSize + sizeof(DDS_HEADER_DXT10)) {
            return ImageResult::Err(TextureError::InvalidData("DDS DX10 header is truncated"));
        }
        DDS_HEADER_DXT10 dx10{};
        std::memcpy(&dx10, data.data() + headerSize, sizeof(DDS_HEADER_DXT10));
        headerSize += sizeof(DDS_HEADER_DXT10);

        format = FormatFromDxgi(dx10.dxgiFormat, is_srgb);
        if (!format) {
            return ImageResult::Err(TextureError::UnsupportedTextureFormat(
                fmt::format("DXGI format {}", dx10.dxgiFormat)));
        }
        if (dx10.arraySize == 0) {
            return ImageResult::Err(TextureError::InvalidData("DDS DX10 array size is zero"));
        }
        arraySize = dx10.arraySize;
        isCubemap = (dx10.miscFlag & D3D10_RESOURCE_MISC_TEXTURECUBE) != 0;
        isVolume = dx10.resourceDimension == D3D10_RESOURCE_DIMENSION_TEXTURE3D;
    } else {
        if (header.ddspf.flags & DDPF_FOURCC) {
            format = FormatFromFourCC(header.ddspf.fourCC, is_srgb);
            if (!format) {
                const uint32_t fourCC = header.ddspf.fourCC;
                return ImageResult::Err(TextureError::UnsupportedTextureFormat(fmt::format(
                    "DDS FourCC '{}{}{}{}'",
                    static_cast<char>(fourCC & 0xff), static_cast<char>((fourCC >> 8) & 0xff),
                    static_cast<char>((fourCC >> 16) & 0xff), static_cast<char>((fourCC >> 24) & 0xff))));
            }
        } else {
            format = FormatFromMasks(header.ddspf, is_srgb);
            if (!format) {
                return ImageResult::Err(TextureError::UnsupportedTextureFormat(fmt::format(
                    "DDS pixel format flags={:#x} bits={}", header.ddspf.flags, header.ddspf.RGBBitCount)));
            }
        }
        if (header.caps2 & DDSCAPS2_CUBEMAP) {
            if ((header.caps2 & DDSCAPS2_CUBEMAP_ALLFACES) != DDSCAPS2_CUBEMAP_ALLFACES) {
                return ImageResult::Err(TextureError::IncompleteCubemap());
            }
            isCubemap = true;
        }
        isVolume = (header.caps2 & DDSCAPS2_VOLUME) != 0;
    }

    if (!supported.Supports(*format)) {
        return ImageResult::Err(TextureError::UnsupportedTextureFormat(std::string(FormatName(*format))));
    }

    if (header.width > kMaxExtent || header.height > kMaxExtent) {
        return ImageResult::Err(TextureError::InvalidData(
            fmt::format("DDS extent {}x{} exceeds {}", header.width, header.height, kMaxExtent)));
    }

    Image image;
    image.format = *format;
    image.is_cubemap = isCubemap;

    uint32_t depth = 1;
    usize layers = static_cast<usize>(arraySize) * (isCubemap ? 6u : 1u);
    if (isVolume) {
        depth = std::max(1u, header.depth);
        if (depth > kMaxExtent) {
            return ImageResult::Err(TextureError::InvalidData(
                fmt::format("DDS depth {} exceeds {}", depth, kMaxExtent)));
        }
        layers = 1;
    }

    const uint32_t maxMips = static_cast<uint32_t>(std::bit_width(std::max({header.width, header.height, depth})));
    if (header.mipMapCount > maxMips) {
        return ImageResult::Err(TextureError::InvalidData(fmt::format(
            "DDS mip count {} exceeds {} for a {}x{}x{} image",
            header.mipMapCount, maxMips, header.width, header.height, depth)));
    }
    image.mip_level_count = (header.mipMapCount > 0) ? header.mipMapCount : 1;

    // Payload is layer-major, each layer carrying its full mip chain.
    const usize available = data.size() - headerSize;
    usize layerSize = 0;
    for (uint32_t mip = 0; mip < image.mip_level_count; ++mip) {
        const uint32_t mipWidth = std::max(1u, header.width >> mip);
        const uint32_t mipHeight = std::max(1u, header.height >> mip);
        const uint32_t mipDepth = std::max(1u, depth >> mip);
        layerSize += MipLevelSize(image.format, mipWidth, mipHeight, mipDepth);
        if (layerSize > available) {
            break;
        }
    }

    if (layerSize == 0 || layerSize > available || layers > available / layerSize) {
        return ImageResult::Err(TextureError::InvalidData(fmt::format(
            "DDS payload is {} bytes, too small for {} layers of {} bytes", available, layers, layerSize)));
    }
    const usize expected = layerSize * layers;

    if (isVolume) {
        image.dimension = VK_IMAGE_TYPE_3D;
        image.extent = glm::uvec3(header.width, header.height, depth);
    } else {
        image.dimension = VK_IMAGE_TYPE_2D;
        image.extent = glm::uvec3(header.width, header.height, static_cast<uint32_t>(layers));
    }

    image.data.assign(data.begin() + headerSize, data.begin() + headerSize + expected);

    return ImageResult::Ok(std::move(image));
}

} // namespace texel::render::detail
