//
// Created by Giuseppe Francione on 12/12/25.
//

#include "../../libcoverthumb/include/xml_scan.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace coverthumb;

TEST_CASE("find_tags matches local names", "[xml]") {
    constexpr std::string_view doc =
        R"(<opf:package><opf:manifest>)"
        R"(<opf:item id="a" href="x.png"/>)"
        R"(<!-- <item id="commented"/> -->)"
        R"(<item id='b' href="y.png" ></item>)"
        R"(<itemref idref="a"/>)"
        R"(<![CDATA[<item id="cdata"/>]]>)"
        R"(</opf:manifest></opf:package>)";

    const auto items = xml::find_tags(doc, "item");
    REQUIRE(items.size() == 2);
    CHECK(items[0].local_name == "item");
    CHECK(xml::attribute_value(items[0].attributes, "id") == std::optional<std::string>("a"));
    CHECK(xml::attribute_value(items[1].attributes, "id") == std::optional<std::string>("b"));
    CHECK(doc.substr(items[0].begin, items[0].end - items[0].begin) == R"(<opf:item id="a" href="x.png"/>)");
}

TEST_CASE("find_tags skips '>' inside quoted values", "[xml]") {
    constexpr std::string_view doc = R"(<meta content="a>b" name="cover"/><meta name="x"/>)";
    const auto metas = xml::find_tags(doc, "meta");
    REQUIRE(metas.size() == 2);
    CHECK(xml::attribute_value(metas[0].attributes, "content") == std::optional<std::string>("a>b"));
    CHECK(xml::attribute_value(metas[0].attributes, "name") == std::optional<std::string>("cover"));
}

TEST_CASE("attribute_value", "[xml]") {
    SECTION("requires a whole attribute name") {
        CHECK(xml::attribute_value(R"( data-id="no" id="yes")", "id") == std::optional<std::string>("yes"));
        CHECK_FALSE(xml::attribute_value(R"( idref="a")", "id").has_value());
    }

    SECTION("tolerates spaces around '='") {
        CHECK(xml::attribute_value(R"( href = "p.jpg")", "href") == std::optional<std::string>("p.jpg"));
    }

    SECTION("decodes entities") {
        CHECK(xml::attribute_value(R"( href="a&amp;b&lt;&gt;&quot;&apos;")", "href") ==
              std::optional<std::string>("a&b<>\"'"));
    }

    SECTION("unquoted or unterminated values are ignored") {
        CHECK_FALSE(xml::attribute_value(" href=p.jpg", "href").has_value());
        CHECK_FALSE(xml::attribute_value(R"( href="p.jpg)", "href").has_value());
    }
}

TEST_CASE("decode_entities leaves unknown references alone", "[xml]") {
    CHECK(xml::decode_entities("&copy; &amp;") == "&copy; &");
}
