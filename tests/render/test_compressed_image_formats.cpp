#include <catch2/catch_test_macros.hpp>
#include <texel/render/texture/compressed_image_formats.h>
#include <texel/render/texture/texture_format.h>

using namespace texel::render;

TEST_CASE("Compressed formats from device features", "[render][compressed]") {
    VkPhysicalDeviceFeatures features{};

    SECTION("No compression features") {
        auto formats = CompressedImageFormats::FromFeatures(features);
        REQUIRE(formats.IsEmpty());
        REQUIRE(formats == CompressedImageFormats::NONE);
        REQUIRE(formats.ToString() == "NONE");
    }

    SECTION("Each flag maps to one family") {
        features.textureCompressionBC = VK_TRUE;
        features.textureCompressionETC2 = VK_TRUE;
        auto formats = CompressedImageFormats::FromFeatures(features);

        REQUIRE(formats.Contains(CompressedImageFormats::BC));
        REQUIRE(formats.Contains(CompressedImageFormats::ETC2));
        REQUIRE_FALSE(formats.Contains(CompressedImageFormats::ASTC_LDR));
        REQUIRE(formats.ToString() == "BC | ETC2");
    }

    SECTION("All flags") {
        features.textureCompressionASTC_LDR = VK_TRUE;
        features.textureCompressionBC = VK_TRUE;
        features.textureCompressionETC2 = VK_TRUE;
        auto formats = CompressedImageFormats::FromFeatures(features);

        REQUIRE(formats == (CompressedImageFormats::ASTC_LDR | CompressedImageFormats::BC | CompressedImageFormats::ETC2));
        REQUIRE(formats.ToString() == "ASTC_LDR | BC | ETC2");
    }
}

TEST_CASE("Compressed format support checks", "[render][compressed]") {
    SECTION("Uncompressed formats are always supported") {
        REQUIRE(CompressedImageFormats::NONE.Supports(VK_FORMAT_R8G8B8A8_SRGB));
        REQUIRE(CompressedImageFormats::NONE.Supports(VK_FORMAT_R16G16B16A16_UNORM));
    }

    SECTION("Block formats need their family") {
        REQUIRE_FALSE(CompressedImageFormats::NONE.Supports(VK_FORMAT_BC7_SRGB_BLOCK));
        REQUIRE(CompressedImageFormats::BC.Supports(VK_FORMAT_BC7_SRGB_BLOCK));
        REQUIRE_FALSE(CompressedImageFormats::BC.Supports(VK_FORMAT_ETC2_R8G8B8A8_UNORM_BLOCK));
        REQUIRE(CompressedImageFormats::ETC2.Supports(VK_FORMAT_EAC_R11_UNORM_BLOCK));
        REQUIRE(CompressedImageFormats::ASTC_LDR.Supports(VK_FORMAT_ASTC_8x8_SRGB_BLOCK));
    }
}

TEST_CASE("Texture format helpers", "[render][texture_format]") {
    SECTION("Compression families") {
        REQUIRE(GetCompressionFamily(VK_FORMAT_BC1_RGB_UNORM_BLOCK) == CompressionFamily::Bc);
        REQUIRE(GetCompressionFamily(VK_FORMAT_ETC2_R8G8B8_SRGB_BLOCK) == CompressionFamily::Etc2);
        REQUIRE(GetCompressionFamily(VK_FORMAT_ASTC_12x12_UNORM_BLOCK) == CompressionFamily::Astc);
        REQUIRE(GetCompressionFamily(VK_FORMAT_R8_UNORM) == CompressionFamily::None);
        REQUIRE(IsBlockCompressed(VK_FORMAT_BC5_UNORM_BLOCK));
        REQUIRE_FALSE(IsBlockCompressed(VK_FORMAT_B8G8R8A8_UNORM));
    }

    SECTION("Mip level sizes round up to whole blocks") {
        REQUIRE(MipLevelSize(VK_FORMAT_R8G8B8A8_UNORM, 4, 3) == 48);
        REQUIRE(MipLevelSize(VK_FORMAT_BC1_RGBA_UNORM_BLOCK, 4, 4) == 8);
        REQUIRE(MipLevelSize(VK_FORMAT_BC1_RGBA_UNORM_BLOCK, 1, 1) == 8);
        REQUIRE(MipLevelSize(VK_FORMAT_BC7_UNORM_BLOCK, 8, 4) == 32);
        REQUIRE(MipLevelSize(VK_FORMAT_BC7_UNORM_BLOCK, 5, 5) == 64);
        REQUIRE(MipLevelSize(VK_FORMAT_R8_UNORM, 2, 2, 3) == 12);
    }

    SECTION("sRGB siblings") {
        REQUIRE(WithSrgb(VK_FORMAT_R8G8B8A8_UNORM, true) == VK_FORMAT_R8G8B8A8_SRGB);
        REQUIRE(WithSrgb(VK_FORMAT_R8G8B8A8_SRGB, false) == VK_FORMAT_R8G8B8A8_UNORM);
        REQUIRE(WithSrgb(VK_FORMAT_BC7_UNORM_BLOCK, true) == VK_FORMAT_BC7_SRGB_BLOCK);
        REQUIRE(WithSrgb(VK_FORMAT_BC4_UNORM_BLOCK, true) == VK_FORMAT_BC4_UNORM_BLOCK);
        REQUIRE(WithSrgb(VK_FORMAT_R8_UNORM, true) == VK_FORMAT_R8_UNORM);
    }

    SECTION("Names") {
        REQUIRE(FormatName(VK_FORMAT_BC7_SRGB_BLOCK) == "BC7_SRGB");
    }
}
