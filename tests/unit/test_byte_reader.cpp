//
// Created by Giuseppe Francione on 14/12/25.
//

#include "../../libcoverthumb/include/byte_reader.hpp"
#include "../../libcoverthumb/include/cover_error.hpp"
#include "../../libcoverthumb/include/fb2_extractor.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace coverthumb;
using namespace coverthumb::test;

TEST_CASE("read_up_to sizes its buffer by what the stream holds", "[bytes]") {
    SECTION("small document under a large limit") {
        auto in = as_stream(bytes_of("<FictionBook/>"));
        const auto buf = read_up_to(in, Fb2Extractor::kMaxDocumentSize);
        REQUIRE(buf.size() == 14);
        CHECK(buf.capacity() < 1024 * 1024);
    }

    SECTION("limit cuts the read short") {
        const Bytes data(200 * 1024, 0x5A);
        auto in = as_stream(data);
        const auto buf = read_up_to(in, 100 * 1024 + 3);
        REQUIRE(buf.size() == 100 * 1024 + 3);
        CHECK(buf.back() == 0x5A);
    }

    SECTION("empty stream") {
        auto in = as_stream(Bytes{});
        REQUIRE(read_up_to(in, 16).empty());
    }
}

TEST_CASE("read_exact_at reports missing bytes as container errors", "[bytes][errors]") {
    const Bytes data = bytes_of("0123456789");
    auto in = as_stream(data);

    SECTION("reads at an offset") {
        std::array<std::uint8_t, 3> out{};
        read_exact_at(in, 4, out);
        CHECK(out[0] == '4');
        CHECK(out[2] == '6');
    }

    SECTION("read running over the end") {
        std::array<std::uint8_t, 4> out{};
        try {
            read_exact_at(in, 8, out);
            FAIL("expected a CoverError");
        } catch (const CoverError& e) {
            REQUIRE(e.kind() == ErrorKind::ContainerError);
        }
    }

    SECTION("offset beyond the end") {
        std::array<std::uint8_t, 4> out{};
        try {
            read_exact_at(in, 4096, out);
            FAIL("expected a CoverError");
        } catch (const CoverError& e) {
            REQUIRE(e.kind() == ErrorKind::ContainerError);
        }
    }

    SECTION("big-endian loads") {
        const std::uint8_t raw[] = {0x12, 0x34, 0x56, 0x78};
        CHECK(load_be16(raw) == 0x1234);
        CHECK(load_be32(raw) == 0x12345678U);
    }
}
