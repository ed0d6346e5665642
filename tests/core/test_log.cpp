#include <catch2/catch_test_macros.hpp>
#include <texel/core/log.h>

#include <string>

TEST_CASE("Logging system initialization", "[core][log]") {
    SECTION("Initialize logger") {
        REQUIRE_NOTHROW(texel::log::init());
    }

    SECTION("Repeated init reuses the named logger") {
        texel::log::init(spdlog::level::warn);
        auto first = texel::log::get_logger();
        texel::log::init(spdlog::level::debug);
        auto second = texel::log::get_logger();

        REQUIRE(first == second);
        REQUIRE(second->name() == "texel");
        REQUIRE(second->level() == spdlog::level::debug);
    }

    SECTION("Log messages at different levels") {
        texel::log::init(spdlog::level::trace);

        REQUIRE_NOTHROW(TEXEL_LOG_TRACE("Trace message"));
        REQUIRE_NOTHROW(TEXEL_LOG_DEBUG("Debug message"));
        REQUIRE_NOTHROW(TEXEL_LOG_INFO("Info message"));
        REQUIRE_NOTHROW(TEXEL_LOG_WARN("Warning message"));
        REQUIRE_NOTHROW(TEXEL_LOG_ERROR("Error message"));
    }
}

TEST_CASE("Logging with parameters", "[core][log]") {
    texel::log::init();

    SECTION("Format strings work correctly") {
        int value = 42;
        std::string text = "test";

        REQUIRE_NOTHROW(TEXEL_LOG_INFO("Integer: {}", value));
        REQUIRE_NOTHROW(TEXEL_LOG_INFO("String: {}", text));
        REQUIRE_NOTHROW(TEXEL_LOG_INFO("Multiple: {} and {}", value, text));
    }
}
