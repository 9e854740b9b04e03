// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include "codec/decode.hpp"
#include "errors.hpp"

using namespace srcmap;

static const std::vector<std::string> two_sources{"a.js", "b.js"};
static const std::vector<std::string> one_name{"x"};

TEST_CASE("decode a two-line map", "[decode]") {
    const PositionIndex index = decode("AAAAA,ICEG;EACH,IDHKA", two_sources, one_name);

    REQUIRE(index.sources() == two_sources);
    REQUIRE(index.position_count() == 4);
    REQUIRE(*index.find("a.js", 0, 0) == GeneratedPositions{{0, 0, "x"}});
    REQUIRE(*index.find("a.js", 0, 5) == GeneratedPositions{{1, 6, "x"}});
    REQUIRE(*index.find("b.js", 2, 3) == GeneratedPositions{{0, 4, std::nullopt}});
    REQUIRE(*index.find("b.js", 3, 0) == GeneratedPositions{{1, 2, std::nullopt}});
}

TEST_CASE("decoded keys follow the sources array", "[decode]") {
    // The first segment refers to the second source.
    const std::vector<std::string> sources{"b.js", "a.js"};
    const PositionIndex index = decode("ACAA,CDAA", sources, {});
    REQUIRE(index.sources() == sources);
}

TEST_CASE("sources without mappings are absent from the index", "[decode]") {
    const PositionIndex index = decode("AAAA", {"a.js", "unused.js"}, {});
    REQUIRE(index.sources() == std::vector<std::string>{"a.js"});
}

TEST_CASE("decode from a document", "[decode]") {
    const SourceMapDocument doc{
        .file = "out.js",
        .source_root = std::nullopt,
        .sources = {"a.js"},
        .names = {},
        .mappings = ";AACA",
        .line_count = std::nullopt,
    };
    const PositionIndex index = decode(doc);
    REQUIRE(*index.find("a.js", 1, 0) == GeneratedPositions{{1, 0, std::nullopt}});
}

TEST_CASE("decode errors carry their location", "[decode]") {
    SECTION("VLQ errors keep their type") {
        try {
            (void)decode("AAAA;AA!A", two_sources, {});
            FAIL("expected MalformedVlq");
        } catch (const MalformedVlq& e) {
            REQUIRE(e.location() == MappingLocation{1, 5});
            REQUIRE(e.reason() == "invalid base64 character '!'");
        }
    }
    SECTION("wrong field count") {
        try {
            (void)decode("AAAA,CAAAAA", two_sources, {});
            FAIL("expected MalformedMapping");
        } catch (const MalformedMapping& e) {
            REQUIRE(e.generated_line() == 0);
            REQUIRE(e.offset() == 5);
        }
    }
    SECTION("negative original line") {
        REQUIRE_THROWS_AS(decode("AAFA", two_sources, {}), MalformedMapping);
    }
    SECTION("source index out of range") {
        try {
            (void)decode(";;ACAA", {"a.js"}, {});
            FAIL("expected IndexOutOfRange");
        } catch (const IndexOutOfRange& e) {
            REQUIRE(e.location() == MappingLocation{2, 2});
        }
    }
    SECTION("all are source map errors") {
        REQUIRE_THROWS_AS(decode("AAAA,", two_sources, {}), SourceMapError);
    }
}

TEST_CASE("single-field segments", "[decode]") {
    SECTION("rejected by default") {
        REQUIRE_THROWS_AS(decode("AAAA,E", two_sources, {}), MalformedMapping);
    }
    SECTION("skipped when allowed, still advancing the column") {
        const PositionIndex index = decode("E,EAAA", two_sources, {}, {.allow_unmapped_segments = true});
        REQUIRE(index.position_count() == 1);
        REQUIRE(*index.find("a.js", 0, 0) == GeneratedPositions{{0, 4, std::nullopt}});
    }
}
