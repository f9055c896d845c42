//
// Created by Giuseppe Francione on 14/12/25.
//

#include "../../libcoverthumb/include/compositor.hpp"
#include "../../libcoverthumb/include/cover_error.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace coverthumb;
using namespace coverthumb::test;

TEST_CASE("Overlay edge is a fifth of the size clamped to 24..48", "[compositor]") {
    CHECK(Compositor::overlay_edge(64) == 24);
    CHECK(Compositor::overlay_edge(120) == 24);
    CHECK(Compositor::overlay_edge(200) == 40);
    CHECK(Compositor::overlay_edge(240) == 48);
    CHECK(Compositor::overlay_edge(256) == 48);
    CHECK(Compositor::overlay_edge(4096) == 48);
}

TEST_CASE("Covers are fitted inside the square keeping aspect ratio", "[compositor]") {
    using Dim = std::pair<std::uint32_t, std::uint32_t>;
    CHECK(Compositor::fit_dimensions(400, 600, 256) == Dim{171, 256});
    CHECK(Compositor::fit_dimensions(600, 400, 256) == Dim{256, 171});
    CHECK(Compositor::fit_dimensions(256, 256, 256) == Dim{256, 256});
    CHECK(Compositor::fit_dimensions(1000, 10, 100) == Dim{100, 1});
    CHECK(Compositor::fit_dimensions(10, 5000, 64) == Dim{1, 64});
    CHECK(Compositor::fit_dimensions(50, 50, 256) == Dim{256, 256});
}

TEST_CASE("Overlay blending", "[compositor]") {
    RgbaImage base(4, 4, {10, 20, 30, 128});

    RgbaImage overlay(2, 2, {0, 0, 0, 0});
    // (0,0) stays fully transparent
    std::uint8_t* opaque = overlay.at(1, 0);
    opaque[0] = 200; opaque[1] = 100; opaque[2] = 50; opaque[3] = 255;
    std::uint8_t* half = overlay.at(0, 1);
    half[0] = 255; half[1] = 255; half[2] = 255; half[3] = 128;

    Compositor::blend_overlay(base, overlay, 1, 1);

    SECTION("alpha 0 leaves the destination untouched") {
        const std::uint8_t* p = base.at(1, 1);
        CHECK(p[0] == 10);
        CHECK(p[1] == 20);
        CHECK(p[2] == 30);
        CHECK(p[3] == 128);
    }

    SECTION("alpha 255 replaces the colour and makes the pixel opaque") {
        const std::uint8_t* p = base.at(2, 1);
        CHECK(p[0] == 200);
        CHECK(p[1] == 100);
        CHECK(p[2] == 50);
        CHECK(p[3] == 255);
    }

    SECTION("partial alpha mixes and truncates") {
        // 255 * 128/255 + 10 * 127/255 = 132.98
        const std::uint8_t* p = base.at(1, 2);
        CHECK(p[0] == 132);
        CHECK(p[3] == 255);
    }

    SECTION("pixels outside the overlay are untouched") {
        CHECK(base.at(0, 0)[3] == 128);
        CHECK(base.at(3, 3)[3] == 128);
    }
}

TEST_CASE("Overlay is clipped at the image edge", "[compositor]") {
    RgbaImage base(3, 3, {0, 0, 0, 255});
    const RgbaImage overlay(4, 4, {255, 255, 255, 255});

    Compositor::blend_overlay(base, overlay, 2, 2);

    CHECK(base.at(2, 2)[0] == 255);
    CHECK(base.at(1, 1)[0] == 0);
}

TEST_CASE("Compose fits the cover and stamps the bottom-right corner", "[compositor]") {
    const Bytes cover = make_png(400, 600, {255, 0, 0, 255});
    const Compositor compositor(RgbaImage(10, 10, {0, 0, 255, 255}));
    REQUIRE(compositor.has_overlay());

    const RgbaImage out = decode_png(compositor.compose(cover, 256));
    REQUIRE(out.width == 171);
    REQUIRE(out.height == 256);

    // 48 px icon at x = 171 - 52, y = 256 - 52
    SECTION("icon area") {
        const std::uint8_t* p = out.at(140, 230);
        CHECK(p[0] <= 5);
        CHECK(p[2] >= 250);
        CHECK(out.at(119, 204)[2] >= 250);
        CHECK(out.at(166, 251)[2] >= 250);
    }

    SECTION("margin and the rest of the cover") {
        CHECK(out.at(0, 0)[0] >= 250);
        CHECK(out.at(170, 255)[0] >= 250);
        CHECK(out.at(118, 230)[0] >= 250);
        CHECK(out.at(140, 203)[0] >= 250);
        CHECK(out.at(140, 203)[2] <= 5);
    }
}

TEST_CASE("Compose without an overlay", "[compositor]") {
    const Compositor compositor;
    REQUIRE_FALSE(compositor.has_overlay());

    const RgbaImage out = decode_png(compositor.compose(make_jpeg(64, 32, 0, 200, 0), 32));
    REQUIRE(out.width == 32);
    REQUIRE(out.height == 16);
    CHECK(out.at(31, 15)[1] > 180);
}

TEST_CASE("Overlay wider than the cover is pinned to the left edge", "[compositor]") {
    // cover fits to 1x64, icon is 24x24 at (0, 36)
    const Compositor compositor(RgbaImage(8, 8, {255, 255, 255, 255}));
    const RgbaImage out = decode_png(compositor.compose(make_png(2, 100, {0, 0, 0, 255}), 64));
    REQUIRE(out.width == 1);
    REQUIRE(out.height == 64);
    CHECK(out.at(0, 40)[0] >= 250);
    CHECK(out.at(0, 10)[0] <= 5);
    CHECK(out.at(0, 62)[0] <= 5);
}

TEST_CASE("Overlay loading", "[compositor]") {
    SECTION("embedded icon") {
        const auto icon = Compositor::load_overlay(true, {});
        REQUIRE(icon.has_value());
        CHECK(icon->width == 64);
        CHECK(icon->height == 64);
    }

    SECTION("filesystem fallback skips unusable candidates") {
        TempDir tmp;
        const auto junk = tmp.write("junk.png", bytes_of("not a png"));
        const auto good = tmp.write("icon.png", make_png(12, 12, {1, 2, 3, 255}));
        const auto icon = Compositor::load_overlay(false, {tmp.path() / "missing.png", junk, good});
        REQUIRE(icon.has_value());
        CHECK(icon->width == 12);
    }

    SECTION("nothing available is not an error") {
        REQUIRE_FALSE(Compositor::load_overlay(false, {}).has_value());
    }
}

TEST_CASE("Compose rejects undecodable covers", "[compositor][errors]") {
    const Compositor compositor;
    try {
        (void) compositor.compose(bytes_of("garbage bytes"), 64);
        FAIL("expected a DecodeError");
    } catch (const CoverError& e) {
        REQUIRE(e.kind() == ErrorKind::DecodeError);
    }
}
