//
// Created by Giuseppe Francione on 13/12/25.
//

#include "../../libcoverthumb/include/fb2_extractor.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace coverthumb;
using namespace coverthumb::test;

namespace {

std::optional<CoverBytes> extract_from(const std::string& doc) {
    auto in = as_stream(bytes_of(doc));
    Fb2Extractor extractor;
    return extractor.extract(in, 256);
}

std::string wrap_lines(const std::string& b64, const std::size_t width) {
    std::string out = "\n";
    for (std::size_t i = 0; i < b64.size(); i += width) {
        out += "    " + b64.substr(i, width) + "\n";
    }
    return out;
}

} // namespace

TEST_CASE("FB2 picks the binary referenced from <coverpage>", "[fb2]") {
    const Bytes decoy = make_png(2, 2, {255, 0, 0, 255});
    const Bytes cover = make_jpeg(8, 8, 0, 128, 255);

    const std::string doc =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<FictionBook xmlns=\"http://www.gribuser.ru/xml/fictionbook/2.0\" "
        "xmlns:l=\"http://www.w3.org/1999/xlink\">\n"
        "<description><title-info>\n"
        "  <book-title>Test</book-title>\n"
        "  <coverpage><image l:href=\"#im1\"/></coverpage>\n"
        "</title-info></description>\n"
        "<body><p>Text</p></body>\n"
        "<binary id=\"im0\" content-type=\"image/png\">" + base64_encode(decoy) + "</binary>\n"
        "<binary content-type=\"image/jpeg\" id=\"im1\">" + wrap_lines(base64_encode(cover), 76) + "</binary>\n"
        "</FictionBook>\n";

    const auto bytes = extract_from(doc);
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == cover);
}

TEST_CASE("FB2 falls back to the first binary", "[fb2]") {
    const Bytes first = make_png(3, 3, {0, 255, 0, 255});
    const Bytes second = make_png(3, 3, {0, 0, 255, 255});
    const std::string binaries =
        "<binary id=\"a\" content-type=\"image/png\">" + base64_encode(first) + "</binary>"
        "<binary id=\"b\" content-type=\"image/png\">" + base64_encode(second) + "</binary>";

    SECTION("coverpage without a usable href") {
        const auto bytes = extract_from("<FictionBook><coverpage><image/></coverpage>" + binaries + "</FictionBook>");
        REQUIRE(bytes.has_value());
        REQUIRE(*bytes == first);
    }

    SECTION("href naming a binary that does not exist") {
        const auto bytes = extract_from(
            "<FictionBook><coverpage><image xlink:href=\"#zzz\"/></coverpage>" + binaries + "</FictionBook>");
        REQUIRE(bytes.has_value());
        REQUIRE(*bytes == first);
    }
}

TEST_CASE("FB2 without a cover", "[fb2]") {
    const std::string binary = "<binary id=\"a\">" + base64_encode(make_png(2, 2, {0, 0, 0, 255})) + "</binary>";

    SECTION("no coverpage element") {
        REQUIRE_FALSE(extract_from("<FictionBook><body/>" + binary + "</FictionBook>").has_value());
    }

    SECTION("no binaries") {
        REQUIRE_FALSE(extract_from("<FictionBook><coverpage><image l:href=\"#a\"/></coverpage></FictionBook>")
                          .has_value());
    }

    SECTION("payload is not base64") {
        REQUIRE_FALSE(extract_from("<FictionBook><coverpage><image l:href=\"#a\"/></coverpage>"
                                   "<binary id=\"a\">@@@@not base64@@@</binary></FictionBook>")
                          .has_value());
    }
}

TEST_CASE("FB2 base64 decoding", "[fb2]") {
    CHECK(Fb2Extractor::decode_base64("aGVsbG8=") == std::optional<CoverBytes>(bytes_of("hello")));
    CHECK(Fb2Extractor::decode_base64("aGVs\n bG8h") == std::optional<CoverBytes>(bytes_of("hello!")));
    CHECK(Fb2Extractor::decode_base64("aGk=") == std::optional<CoverBytes>(bytes_of("hi")));
    CHECK_FALSE(Fb2Extractor::decode_base64("").has_value());
    CHECK_FALSE(Fb2Extractor::decode_base64("abc").has_value());
    CHECK_FALSE(Fb2Extractor::decode_base64("a=bc").has_value());
}
