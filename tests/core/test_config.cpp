#include <catch2/catch_test_macros.hpp>
#include <texel/core/config.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace texel::config;

namespace {

std::filesystem::path WriteTempConfig(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST_CASE("Log level parsing", "[core][config]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("DEBUG") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(parse_log_level("something else") == spdlog::level::info);
}

TEST_CASE("Config loading", "[core][config]") {
    SECTION("Missing file keeps defaults") {
        auto config = load_from_file(std::filesystem::temp_directory_path() / "texel_missing_config.json");

        REQUIRE(config.log_level == spdlog::level::info);
        REQUIRE(config.asset_root == std::filesystem::path("assets"));
        REQUIRE(config.read_meta_files);
        REQUIRE_FALSE(config.device.has_value());
    }

    SECTION("All sections are read") {
        auto path = WriteTempConfig("texel_full_config.json", R"({
            "logging": { "level": "debug" },
            "assets": { "root": "data/textures", "read_meta_files": false },
            "device": { "bc": true, "etc2": true }
        })");

        auto config = load_from_file(path);
        REQUIRE(config.config_path == path);
        REQUIRE(config.log_level == spdlog::level::debug);
        REQUIRE(config.asset_root == std::filesystem::path("data/textures"));
        REQUIRE_FALSE(config.read_meta_files);
        REQUIRE(config.device.has_value());
        REQUIRE(config.device->bc);
        REQUIRE_FALSE(config.device->astc_ldr);
        REQUIRE(config.device->etc2);

        std::filesystem::remove(path);
    }

    SECTION("Malformed file keeps defaults") {
        auto path = WriteTempConfig("texel_broken_config.json", "{ \"logging\": ");

        auto config = load_from_file(path);
        REQUIRE(config.log_level == spdlog::level::info);
        REQUIRE_FALSE(config.device.has_value());

        std::filesystem::remove(path);
    }
}
