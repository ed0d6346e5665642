#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <texel/asset/reader.h>
#include <texel/core/common.h>
#include <texel/core/result.h>
#include <texel/render/texture/texture_error.h>

#include <string>
#include <type_traits>
#include <vector>

using namespace texel;
using namespace texel::core;

namespace {

struct DecodeFailure {
    std::string reason;

    std::string Message() const { return "decode failed: " + reason; }
};

using DecodeResult = Result<std::vector<u8>, render::TextureError>;

DecodeResult DecodeHeader(const std::vector<u8>& bytes) {
    if (bytes.size() < 4) {
        return DecodeResult::Err(render::TextureError::InvalidData("header is 4 bytes"));
    }
    return DecodeResult::Ok(std::vector<u8>(bytes.begin() + 4, bytes.end()));
}

} // namespace

TEST_CASE("Result carrying a texture error", "[core][result]") {
    SECTION("Ok holds the decoded payload") {
        auto result = DecodeHeader({'D', 'D', 'S', ' ', 1, 2});

        REQUIRE(result);
        REQUIRE(result.Value() == std::vector<u8>{1, 2});
        REQUIRE(std::move(result).Map([](std::vector<u8>&& payload) { return payload.size(); }).Value() == 2);
    }

    SECTION("Err keeps the kind and the detail") {
        auto result = DecodeHeader({'D', 'D'});

        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().GetKind() == render::TextureError::Kind::InvalidData);
        REQUIRE(result.GetError().Detail() == "header is 4 bytes");
    }

    SECTION("Value and Unwrap throw the error message") {
        auto result = DecodeHeader({});

        REQUIRE_THROWS_WITH(result.Value(), "invalid data: header is 4 bytes");
        REQUIRE_THROWS_WITH(std::move(result).Expect("decoding dds"),
            Catch::Matchers::StartsWith("decoding dds: invalid data"));
    }

    SECTION("Map keeps the error and changes the value type") {
        auto mapped = DecodeHeader({}).Map([](std::vector<u8>&& payload) { return payload.size(); });

        STATIC_REQUIRE(std::is_same_v<decltype(mapped), Result<std::size_t, render::TextureError>>);
        REQUIRE(mapped.GetError().GetKind() == render::TextureError::Kind::InvalidData);
    }
}

TEST_CASE("Result<void> carrying an I/O error", "[core][result]") {
    using ReadResult = Result<void, asset::IoError>;

    SECTION("Ok") {
        ReadResult result = ReadResult::Ok();
        REQUIRE(result);
        REQUIRE_NOTHROW(result.Unwrap());
    }

    SECTION("Err reports the path") {
        ReadResult result = ReadResult::Err(asset::IoError::NotFound("textures/missing.png"));

        REQUIRE_FALSE(result);
        REQUIRE(result.GetError().GetKind() == asset::IoError::Kind::NotFound);
        REQUIRE_THROWS_WITH(result.Unwrap(), "file not found: textures/missing.png");
    }

    SECTION("MapErr lifts it into the generic error") {
        ReadResult result = ReadResult::Err(asset::IoError::Other("disk unplugged"));
        auto lifted = std::move(result).MapErr([](asset::IoError&& err) { return MakeError(err.Message()); });

        REQUIRE(lifted.IsErr());
        REQUIRE(lifted.GetError().Message == "disk unplugged");
    }
}

TEST_CASE("Result context for asset loads", "[core][result]") {
    SECTION("Load failures are prefixed with the asset path") {
        Result<int> loaded = Result<int>::Err("no asset loader found for extension 'gif' of 'a.gif'");
        auto result = std::move(loaded).WithContext("failed to load asset 'a.gif'");

        REQUIRE(result.GetError().Message
            == "failed to load asset 'a.gif': no asset loader found for extension 'gif' of 'a.gif'");
    }

    SECTION("Context keeps the original location") {
        Error err = MakeError("malformed meta file: a.png.meta");
        const auto line = err.Location.line();
        Error with_context = err.WithContext("failed to load asset 'a.png'");

        REQUIRE(with_context.Location.line() == line);
        REQUIRE(err.Message == "malformed meta file: a.png.meta");
    }

    SECTION("Ok passes through untouched") {
        auto result = Result<void>::Ok().WithContext("failed to load asset 'a.png'");
        REQUIRE(result.IsOk());
    }
}

TEST_CASE("Result with a domain error type", "[core][result]") {
    using FailureResult = Result<int, DecodeFailure>;

    SECTION("Err keeps the domain error") {
        FailureResult result = FailureResult::Err(DecodeFailure{"bad header"});
        REQUIRE(result.IsErr());
        REQUIRE(result.GetError().reason == "bad header");
    }

    SECTION("Unwrap reports the domain message") {
        FailureResult result = FailureResult::Err(DecodeFailure{"bad header"});
        REQUIRE_THROWS_WITH(std::move(result).Unwrap(), "decode failed: bad header");
    }

    SECTION("MapErr converts into the generic error") {
        FailureResult result = FailureResult::Err(DecodeFailure{"truncated"});
        auto mapped = std::move(result).MapErr([](DecodeFailure&& failure) { return MakeError(failure.Message()); });

        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.GetError().Message == "decode failed: truncated");
    }

    SECTION("MapErr leaves Ok untouched") {
        FailureResult result = FailureResult::Ok(7);
        auto mapped = std::move(result).MapErr([](DecodeFailure&& failure) { return MakeError(failure.Message()); });

        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Value() == 7);
    }
}
