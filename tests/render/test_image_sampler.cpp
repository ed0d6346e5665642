#include <catch2/catch_test_macros.hpp>
#include <texel/render/render_asset.h>
#include <texel/render/texture/image_sampler.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace texel::render;

TEST_CASE("Image sampler construction", "[render][sampler]") {
    SECTION("Default carries no descriptor") {
        auto sampler = ImageSampler::Default();
        REQUIRE(sampler.IsDefault());
        REQUIRE_FALSE(sampler.GetDescriptor().has_value());
    }

    SECTION("Linear filters everything linearly") {
        auto sampler = ImageSampler::Linear();
        REQUIRE_FALSE(sampler.IsDefault());
        REQUIRE(sampler.GetDescriptor()->mag_filter == ImageFilterMode::Linear);
        REQUIRE(sampler.GetDescriptor()->min_filter == ImageFilterMode::Linear);
        REQUIRE(sampler.GetDescriptor()->mipmap_filter == ImageFilterMode::Linear);
        REQUIRE(sampler != ImageSampler::Nearest());
    }

    SECTION("Nearest matches descriptor defaults") {
        REQUIRE(ImageSampler::Nearest() == ImageSampler::Descriptor(ImageSamplerDescriptor{}));
    }
}

TEST_CASE("Image sampler JSON", "[render][sampler]") {
    SECTION("Default is a bare string") {
        nlohmann::json j = ImageSampler::Default();
        REQUIRE(j == "Default");
        REQUIRE(j.get<ImageSampler>().IsDefault());
    }

    SECTION("Descriptor fields survive a round trip") {
        ImageSamplerDescriptor descriptor = ImageSamplerDescriptor::Linear();
        descriptor.label = "terrain";
        descriptor.address_mode_u = ImageAddressMode::Repeat;
        descriptor.address_mode_v = ImageAddressMode::MirrorRepeat;
        descriptor.compare = ImageCompareFunction::LessEqual;
        descriptor.anisotropy_clamp = 16;
        descriptor.border_color = ImageSamplerBorderColor::OpaqueWhite;

        nlohmann::json j = ImageSampler::Descriptor(descriptor);
        REQUIRE(j["Descriptor"]["address_mode_u"] == "Repeat");
        REQUIRE(j["Descriptor"]["compare"] == "LessEqual");

        auto parsed = j.get<ImageSampler>();
        REQUIRE(parsed.GetDescriptor() == descriptor);
    }

    SECTION("Partial descriptor keeps defaults") {
        auto j = nlohmann::json::parse(R"({"Descriptor": {"mag_filter": "Linear"}})");
        auto parsed = j.get<ImageSampler>();

        REQUIRE(parsed.GetDescriptor()->mag_filter == ImageFilterMode::Linear);
        REQUIRE(parsed.GetDescriptor()->min_filter == ImageFilterMode::Nearest);
        REQUIRE(parsed.GetDescriptor()->lod_max_clamp == 32.0f);
        REQUIRE_FALSE(parsed.GetDescriptor()->compare.has_value());
    }

    SECTION("Unknown names are rejected") {
        REQUIRE_THROWS_AS(nlohmann::json("Bilinear").get<ImageSampler>(), std::invalid_argument);
        auto j = nlohmann::json::parse(R"({"Descriptor": {"address_mode_u": "Wrap"}})");
        REQUIRE_THROWS_AS(j.get<ImageSampler>(), std::invalid_argument);
    }
}

TEST_CASE("Persistence policy JSON", "[render][render_asset]") {
    nlohmann::json j = RenderAssetPersistencePolicy::Unload;
    REQUIRE(j == "Unload");
    REQUIRE(nlohmann::json("Keep").get<RenderAssetPersistencePolicy>() == RenderAssetPersistencePolicy::Keep);
    REQUIRE_THROWS_AS(nlohmann::json("Drop").get<RenderAssetPersistencePolicy>(), std::invalid_argument);
    REQUIRE(ToString(RenderAssetPersistencePolicy::Keep) == "Keep");
}
