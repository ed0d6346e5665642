#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <texel/render/texture/features.h>
#include <texel/render/texture/image.h>

#include <cstring>
#include <span>
#include <vector>

#include "test_images.h"

using namespace texel;
using namespace texel::render;

namespace {

core::Result<Image, TextureError> Decode(
    std::span<const u8> bytes,
    const ImageType& type,
    CompressedImageFormats supported = CompressedImageFormats::NONE,
    bool is_srgb = true)
{
    return Image::FromBuffer(bytes, type, supported, is_srgb, ImageSampler::Default(),
        RenderAssetPersistencePolicy::Keep);
}

} // namespace

TEST_CASE("Default image", "[render][image]") {
    auto image = Image::Default();
    REQUIRE(image.Width() == 1);
    REQUIRE(image.Height() == 1);
    REQUIRE(image.format == VK_FORMAT_R8G8B8A8_SRGB);
    REQUIRE(image.data == std::vector<u8>{255, 255, 255, 255});
    REQUIRE(image.sampler.IsDefault());
    REQUIRE_FALSE(image.IsCompressed());
}

TEST_CASE("Decode PNG", "[render][image][png]") {
    if (!features::kPng) {
        SKIP("png feature disabled");
    }

    SECTION("RGBA keeps its channels") {
        auto result = Decode(test::kPngRgba4x3, ImageType::Extension("png"));
        REQUIRE(result.IsOk());

        const Image& image = result.Value();
        REQUIRE(image.Size() == glm::uvec2(4, 3));
        REQUIRE(image.extent.z == 1);
        REQUIRE(image.format == VK_FORMAT_R8G8B8A8_SRGB);
        REQUIRE(image.data.size() == 4 * 3 * 4);
        // pixel (1, 2)
        const usize offset = (2 * 4 + 1) * 4;
        REQUIRE(image.data[offset + 0] == 60);
        REQUIRE(image.data[offset + 1] == 200);
        REQUIRE(image.data[offset + 2] == 200);
        REQUIRE(image.data[offset + 3] == 255);
        REQUIRE(image.AspectRatio() == 0.75f);
    }

    SECTION("Linear color space picks UNORM") {
        auto result = Decode(test::kPngRgba4x3, ImageType::Extension("png"), CompressedImageFormats::NONE, false);
        REQUIRE(result.Value().format == VK_FORMAT_R8G8B8A8_UNORM);
    }

    SECTION("RGB is expanded to RGBA") {
        auto result = Decode(test::kPngRgb5x2, ImageType::MimeType("image/png"));
        REQUIRE(result.IsOk());

        const Image& image = result.Value();
        REQUIRE(image.Size() == glm::uvec2(5, 2));
        REQUIRE(image.data.size() == 5 * 2 * 4);
        REQUIRE(image.data[0] == 255);
        REQUIRE(image.data[1] == 0);
        REQUIRE(image.data[2] == 0);
        REQUIRE(image.data[3] == 255);
    }

    SECTION("Grayscale stays single channel") {
        auto result = Decode(test::kPngGray2x2, ImageType::Format(ImageFormat::Png));
        REQUIRE(result.IsOk());
        REQUIRE(result.Value().format == VK_FORMAT_R8_UNORM);
        REQUIRE(result.Value().data == std::vector<u8>{10, 20, 30, 40});
    }

    SECTION("Truncated data fails with an image error") {
        std::span<const u8> truncated(test::kPngRgba4x3, 40);
        auto result = Decode(truncated, ImageType::Extension("png"));
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::ImageError);
    }
}

TEST_CASE("Decode other stb formats", "[render][image]") {
    SECTION("BMP") {
        if (!features::kBmp) {
            SKIP("bmp feature disabled");
        }
        auto result = Decode(test::kBmpRgb3x2, ImageType::Extension("bmp"));
        REQUIRE(result.IsOk());
        REQUIRE(result.Value().Size() == glm::uvec2(3, 2));
        REQUIRE(result.Value().data[0] == 0);
        REQUIRE(result.Value().data[1] == 255);
        REQUIRE(result.Value().data[2] == 0);
        REQUIRE(result.Value().data[3] == 255);
    }

    SECTION("PGM") {
        if (!features::kPnm) {
            SKIP("pnm feature disabled");
        }
        auto result = Decode(test::kPgmGray2x3, ImageType::Extension("pgm"));
        REQUIRE(result.IsOk());
        REQUIRE(result.Value().Size() == glm::uvec2(2, 3));
        REQUIRE(result.Value().format == VK_FORMAT_R8_UNORM);
        REQUIRE(result.Value().data == std::vector<u8>{0, 50, 100, 150, 200, 250});
    }

    SECTION("TGA") {
        if (!features::kTga) {
            SKIP("tga feature disabled");
        }
        auto result = Decode(test::kTgaRgba2x2, ImageType::Extension("tga"));
        REQUIRE(result.IsOk());
        REQUIRE(result.Value().Size() == glm::uvec2(2, 2));
        REQUIRE(result.Value().data[0] == 0);
        REQUIRE(result.Value().data[1] == 0);
        REQUIRE(result.Value().data[2] == 255);
        REQUIRE(result.Value().data[3] == 255);
    }
}

TEST_CASE("Explicit format must match the bytes", "[render][image]") {
    if (!features::kPng || !features::kJpeg) {
        SKIP("png or jpeg feature disabled");
    }

    SECTION("PNG bytes as Jpeg fail") {
        auto result = Decode(test::kPngRgba4x3, ImageType::Format(ImageFormat::Jpeg));
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::ImageError);
        REQUIRE_THAT(result.GetError().Message(), Catch::Matchers::ContainsSubstring("Jpeg"));
    }

    SECTION("PNG bytes as Tga fail") {
        if (!features::kTga) {
            SKIP("tga feature disabled");
        }
        auto explicit_format = Decode(test::kPngGray2x2, ImageType::Format(ImageFormat::Tga));
        REQUIRE(explicit_format.IsErr());
        REQUIRE(explicit_format.GetError().GetKind() == TextureError::Kind::ImageError);
        REQUIRE_THAT(explicit_format.GetError().Message(), Catch::Matchers::ContainsSubstring("Tga"));

        auto by_extension = Decode(test::kPngGray2x2, ImageType::Extension("tga"));
        REQUIRE(by_extension.IsErr());
        REQUIRE(by_extension.GetError().GetKind() == TextureError::Kind::ImageError);
    }

    SECTION("BMP bytes as Tga fail") {
        if (!features::kTga || !features::kBmp) {
            SKIP("tga or bmp feature disabled");
        }
        auto result = Decode(test::kBmpRgb3x2, ImageType::Format(ImageFormat::Tga));
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::ImageError);
    }

    SECTION("TGA bytes still decode as Tga") {
        if (!features::kTga) {
            SKIP("tga feature disabled");
        }
        auto result = Decode(test::kTgaRgba2x2, ImageType::Format(ImageFormat::Tga));
        REQUIRE(result.IsOk());
        REQUIRE(result.Value().Size() == glm::uvec2(2, 2));
    }
}

TEST_CASE("Unresolvable image types", "[render][image]") {
    auto result = Decode(test::kPngRgba4x3, ImageType::Extension("gif"));
    REQUIRE(result.IsErr());
    REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidImageExtension);
}

TEST_CASE("Compiled-out formats are unsupported", "[render][image]") {
    if (features::kWebp) {
        SKIP("webp feature enabled");
    }

    auto result = Decode(test::kPngRgba4x3, ImageType::Extension("webp"));
    REQUIRE(result.IsErr());
    REQUIRE(result.GetError().GetKind() == TextureError::Kind::UnsupportedTextureFormat);
}

TEST_CASE("Decode DDS", "[render][image][dds]") {
    if (!features::kDds) {
        SKIP("dds feature disabled");
    }

    SECTION("DXT1 needs BC support") {
        auto result = Decode(test::kDdsDxt1_4x4, ImageType::Extension("dds"));
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::UnsupportedTextureFormat);
    }

    SECTION("DXT1 with BC support") {
        auto result = Decode(test::kDdsDxt1_4x4, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsOk());

        const Image& image = result.Value();
        REQUIRE(image.format == VK_FORMAT_BC1_RGBA_SRGB_BLOCK);
        REQUIRE(image.Size() == glm::uvec2(4, 4));
        REQUIRE(image.mip_level_count == 1);
        REQUIRE(image.data.size() == 8);
        REQUIRE(image.IsCompressed());
        REQUIRE_FALSE(image.is_cubemap);
    }

    SECTION("DX10 header with BC7") {
        auto result = Decode(test::kDdsBc7_8x4, ImageType::Extension("dds"), CompressedImageFormats::BC, false);
        REQUIRE(result.IsOk());
        REQUIRE(result.Value().format == VK_FORMAT_BC7_UNORM_BLOCK);
        REQUIRE(result.Value().Size() == glm::uvec2(8, 4));
        REQUIRE(result.Value().data.size() == 32);
    }

    SECTION("Short payload") {
        std::span<const u8> truncated(test::kDdsBc7_8x4, sizeof(test::kDdsBc7_8x4) - 4);
        auto result = Decode(truncated, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidData);
    }

    SECTION("Bad magic") {
        std::vector<u8> bytes(std::begin(test::kDdsDxt1_4x4), std::end(test::kDdsDxt1_4x4));
        bytes[0] = 'X';
        auto result = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidData);
    }

    SECTION("Cubemap missing faces") {
        std::vector<u8> bytes(std::begin(test::kDdsDxt1_4x4), std::end(test::kDdsDxt1_4x4));
        // caps2 lives at byte 4 + 108: CUBEMAP | POSITIVEX only
        const u32 caps2 = 0x200 | 0x400;
        std::memcpy(bytes.data() + 4 + 108, &caps2, sizeof(caps2));
        auto result = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::IncompleteCubemap);
    }

    // mipMapCount lives at byte 4 + 24, the DX10 arraySize at 4 + 124 + 12
    SECTION("Mip count beyond the full chain") {
        std::vector<u8> bytes(std::begin(test::kDdsDxt1_4x4), std::end(test::kDdsDxt1_4x4));
        for (const u32 mips : {4u, 40u, 0xFFFFFFFFu}) {
            std::memcpy(bytes.data() + 4 + 24, &mips, sizeof(mips));
            auto result = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
            REQUIRE(result.IsErr());
            REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidData);
        }
    }

    SECTION("Full mip chain without its payload") {
        std::vector<u8> bytes(std::begin(test::kDdsDxt1_4x4), std::end(test::kDdsDxt1_4x4));
        const u32 mips = 3;
        std::memcpy(bytes.data() + 4 + 24, &mips, sizeof(mips));
        auto result = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidData);

        bytes.resize(bytes.size() + 16, 0);
        auto padded = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(padded.IsOk());
        REQUIRE(padded.Value().mip_level_count == 3);
        REQUIRE(padded.Value().data.size() == 24);
    }

    SECTION("Array size larger than the payload") {
        std::vector<u8> bytes(std::begin(test::kDdsBc7_8x4), std::end(test::kDdsBc7_8x4));
        const u32 array_size = 0x0FFFFFFF;
        std::memcpy(bytes.data() + 4 + 124 + 12, &array_size, sizeof(array_size));
        const u32 mips = 0xFFFFFFFF;
        std::memcpy(bytes.data() + 4 + 24, &mips, sizeof(mips));
        auto result = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidData);

        const u32 one_mip = 1;
        std::memcpy(bytes.data() + 4 + 24, &one_mip, sizeof(one_mip));
        auto layered = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(layered.IsErr());
        REQUIRE(layered.GetError().GetKind() == TextureError::Kind::InvalidData);
    }

    SECTION("Zero array size") {
        std::vector<u8> bytes(std::begin(test::kDdsBc7_8x4), std::end(test::kDdsBc7_8x4));
        const u32 array_size = 0;
        std::memcpy(bytes.data() + 4 + 124 + 12, &array_size, sizeof(array_size));
        auto result = Decode(bytes, ImageType::Extension("dds"), CompressedImageFormats::BC);
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == TextureError::Kind::InvalidData);
    }
}

TEST_CASE("Sampler and persistence policy are attached", "[render][image]") {
    if (!features::kPng) {
        SKIP("png feature disabled");
    }

    auto result = Image::FromBuffer(test::kPngGray2x2, ImageType::Extension("png"), CompressedImageFormats::NONE,
        true, ImageSampler::Linear(), RenderAssetPersistencePolicy::Unload);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().sampler == ImageSampler::Linear());
    REQUIRE(result.Value().cpu_persistent_access == RenderAssetPersistencePolicy::Unload);
}
