//
// Created by Giuseppe Francione on 13/12/25.
//

#include "../../libcoverthumb/include/cover_error.hpp"
#include "../../libcoverthumb/include/mobi_extractor.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace coverthumb;
using namespace coverthumb::test;

namespace {

std::optional<CoverBytes> extract_from(const Bytes& book) {
    auto in = as_stream(book);
    MobiExtractor extractor;
    return extractor.extract(in, 256);
}

ErrorKind error_kind_of(const Bytes& book) {
    try {
        (void) extract_from(book);
    } catch (const CoverError& e) {
        return e.kind();
    }
    FAIL("expected a CoverError");
    return ErrorKind::IoError;
}

} // namespace

TEST_CASE("MOBI cover record is first image plus the EXTH 201 offset", "[mobi]") {
    const Bytes img0 = make_jpeg(4, 4, 10, 10, 10);
    const Bytes img1 = make_jpeg(4, 4, 20, 20, 20);
    const Bytes img2 = make_jpeg(6, 6, 30, 30, 30);

    SECTION("offset two picks the third image") {
        const Bytes book = make_mobi({bytes_of("text record"), img0, img1, img2}, 2, 2);
        const auto cover = extract_from(book);
        REQUIRE(cover.has_value());
        REQUIRE(*cover == img2);
    }

    SECTION("missing EXTH 201 uses the first image record") {
        const Bytes book = make_mobi({bytes_of("text record"), img0, img1}, std::nullopt, 2);
        const auto cover = extract_from(book);
        REQUIRE(cover.has_value());
        REQUIRE(*cover == img0);
    }

    SECTION("a later EXTH 201 record overrides an earlier one") {
        const Bytes book = make_mobi({img0, img1, img2}, 0, 1, true,
                                     {make_exth_record(201, be32_bytes(1))});
        const auto cover = extract_from(book);
        REQUIRE(cover.has_value());
        REQUIRE(*cover == img1);
    }

    SECTION("EXTH record shorter than its header is skipped") {
        const Bytes book = make_mobi({img0, img1, img2}, std::nullopt, 1, true,
                                     {make_exth_record(300, {}, 0),
                                      make_exth_record(201, be32_bytes(2))});
        const auto cover = extract_from(book);
        REQUIRE(cover.has_value());
        REQUIRE(*cover == img2);
    }

    SECTION("last record extends to the end of the file") {
        const Bytes png = make_png(3, 3, {1, 2, 3, 255});
        const Bytes book = make_mobi({png}, 0, 1);
        const auto cover = extract_from(book);
        REQUIRE(cover.has_value());
        REQUIRE(*cover == png);
    }
}

TEST_CASE("MOBI structural problems are container errors", "[mobi][errors]") {
    const Bytes img = make_jpeg(4, 4, 1, 1, 1);

    SECTION("wrong database type") {
        Bytes book = make_mobi({img}, 0, 1);
        book[60] = 'X';
        REQUIRE(error_kind_of(book) == ErrorKind::ContainerError);
    }

    SECTION("EXTH flag not set") {
        const Bytes book = make_mobi({img}, std::nullopt, 1, false);
        REQUIRE(error_kind_of(book) == ErrorKind::ContainerError);
    }

    SECTION("truncated file") {
        Bytes book = make_mobi({img}, 0, 1);
        book.resize(70);
        REQUIRE(error_kind_of(book) == ErrorKind::ContainerError);
    }

    SECTION("EXTH walk runs past the end of the file") {
        const Bytes book = make_mobi({img}, 0, 1, true,
                                     {make_exth_record(100, {}, 1U << 20),
                                      make_exth_record(101, bytes_of("Publisher"))});
        REQUIRE(error_kind_of(book) == ErrorKind::ContainerError);
    }
}

TEST_CASE("MOBI cover index problems mean no cover", "[mobi]") {
    SECTION("index past the record table") {
        const Bytes book = make_mobi({make_jpeg(4, 4, 1, 1, 1)}, 7, 1);
        REQUIRE_FALSE(extract_from(book).has_value());
    }

    SECTION("record without an image signature") {
        const Bytes book = make_mobi({bytes_of("FLIS record, not an image")}, 0, 1);
        REQUIRE_FALSE(extract_from(book).has_value());
    }
}
