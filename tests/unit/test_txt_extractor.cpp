//
// Created by Giuseppe Francione on 13/12/25.
//

#include "../../libcoverthumb/include/image_codec.hpp"
#include "../../libcoverthumb/include/txt_extractor.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace coverthumb;
using namespace coverthumb::test;

namespace {

bool pixel_is(const RgbaImage& img, const std::uint32_t x, const std::uint32_t y,
              const std::array<std::uint8_t, 4> rgba) {
    const std::uint8_t* p = img.at(x, y);
    return p[0] == rgba[0] && p[1] == rgba[1] && p[2] == rgba[2] && p[3] == rgba[3];
}

} // namespace

TEST_CASE("TXT placeholder is a bordered square of the requested size", "[txt]") {
    constexpr std::array<std::uint8_t, 4> kFill = {245, 245, 245, 255};
    constexpr std::array<std::uint8_t, 4> kBorder = {200, 200, 200, 255};

    auto in = as_stream(bytes_of("Chapter 1\n\nIt was a dark and stormy night.\n"));
    TxtExtractor extractor;
    const auto png = extractor.extract(in, 256);
    REQUIRE(png.has_value());

    const RgbaImage img = decode_png(*png);
    REQUIRE(img.width == 256);
    REQUIRE(img.height == 256);

    SECTION("border") {
        CHECK(pixel_is(img, 0, 0, kBorder));
        CHECK(pixel_is(img, 255, 0, kBorder));
        CHECK(pixel_is(img, 0, 255, kBorder));
        CHECK(pixel_is(img, 255, 255, kBorder));
        CHECK(pixel_is(img, 128, 0, kBorder));
        CHECK(pixel_is(img, 0, 77, kBorder));
    }

    SECTION("interior") {
        CHECK(pixel_is(img, 1, 1, kFill));
        CHECK(pixel_is(img, 128, 128, kFill));
        CHECK(pixel_is(img, 254, 254, kFill));
    }
}

TEST_CASE("TXT placeholder does not depend on the text", "[txt]") {
    TxtExtractor extractor;
    auto empty = as_stream({});
    auto text = as_stream(bytes_of("anything at all"));

    const auto a = extractor.extract(empty, 32);
    const auto b = extractor.extract(text, 32);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);

    SECTION("one pixel is all border") {
        auto tiny_in = as_stream({});
        const auto tiny = extractor.extract(tiny_in, 1);
        REQUIRE(tiny.has_value());
        const RgbaImage img = decode_png(*tiny);
        REQUIRE(img.width == 1);
        CHECK(pixel_is(img, 0, 0, {200, 200, 200, 255}));
    }
}
