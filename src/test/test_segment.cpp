// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <stdexcept>

#include "codec/segment.hpp"
#include "errors.hpp"

using namespace srcmap;

TEST_CASE("segment from decoded fields", "[segment]") {
    SECTION("four fields carry no name") {
        const std::vector<int32_t> fields{2, 0, 1, -3};
        const Segment s = segment_from_fields(fields);
        REQUIRE(s == Segment{.generated_column = 2,
                             .source_index = 0,
                             .original_line = 1,
                             .original_column = -3,
                             .name_index = std::nullopt});
    }
    SECTION("five fields carry a name, even a zero delta") {
        const std::vector<int32_t> fields{0, 0, 0, 0, 0};
        const Segment s = segment_from_fields(fields);
        REQUIRE(s.name_index == 0);
    }
    SECTION("other field counts are rejected") {
        for (const size_t count : {0, 1, 2, 3, 6}) {
            const std::vector<int32_t> fields(count, 0);
            REQUIRE_THROWS_AS(segment_from_fields(fields), std::invalid_argument);
        }
    }
    SECTION("wire fields round trip") {
        const std::vector<int32_t> fields{4, -1, -3, 5, 0};
        REQUIRE(segment_fields(segment_from_fields(fields)) == fields);
    }
}

TEST_CASE("combine accumulates relative fields", "[segment]") {
    const SegmentState start{};
    const auto [first, after_first] = combine(Segment{0, 0, 0, 0, 0}, start);
    REQUIRE(first.name_index == 0);

    const auto [second, after_second] = combine(Segment{4, 1, 2, 3, std::nullopt}, after_first);
    REQUIRE(second == Segment{4, 1, 2, 3, std::nullopt});

    SECTION("name index persists across a segment without a name") {
        REQUIRE(after_second.name_index == 0);
        const auto [third, after_third] = combine(Segment{1, 0, 0, 0, 2}, after_second);
        REQUIRE(third.name_index == 2);
        REQUIRE(after_third.name_index == 2);
    }

    SECTION("only the generated column resets at a new line") {
        const SegmentState line = after_second.next_line();
        REQUIRE(line.generated_column == 0);
        REQUIRE(line.source_index == 1);
        REQUIRE(line.original_line == 2);
        REQUIRE(line.original_column == 3);
        const auto [next, _] = combine(Segment{2, 0, 1, -3, std::nullopt}, line);
        REQUIRE(next == Segment{2, 1, 3, 0, std::nullopt});
    }
}

TEST_CASE("encode_offset inverts combine", "[segment]") {
    SegmentState state{};
    const std::vector<Segment> absolutes{
        {0, 0, 0, 0, 0},
        {4, 1, 2, 3, std::nullopt},
        {6, 0, 0, 5, 0},
        {9, 0, 7, 1, 3},
    };
    SegmentState decode_state{};
    for (const Segment& absolute : absolutes) {
        const auto [relative, next] = encode_offset(absolute, state);
        const auto [decoded, decode_next] = combine(relative, decode_state);
        REQUIRE(decoded == absolute);
        REQUIRE(next == decode_next);
        state = next;
        decode_state = decode_next;
    }
}

TEST_CASE("encode_offset emits the name relative to the last name", "[segment]") {
    // Previous name index 3 survives an unnamed segment.
    const SegmentState previous{.generated_column = 5,
                                .source_index = 0,
                                .original_line = 1,
                                .original_column = 1,
                                .name_index = 3};
    const auto [unnamed, after_unnamed] = encode_offset(Segment{6, 0, 1, 2, std::nullopt}, previous);
    REQUIRE_FALSE(unnamed.name_index.has_value());
    REQUIRE(after_unnamed.name_index == 3);

    const auto [named, after_named] = encode_offset(Segment{8, 0, 1, 2, 1}, after_unnamed);
    REQUIRE(named.name_index == -2);
    REQUIRE(after_named.name_index == 1);
}

TEST_CASE("decode_segment resolves tables", "[segment]") {
    const std::vector<std::string> sources{"a.js", "b.js"};
    const std::vector<std::string> names{"x"};

    SECTION("with a name") {
        const OriginalPosition p = decode_segment(Segment{3, 1, 4, 5, 0}, sources, names);
        REQUIRE(p == OriginalPosition{.generated_column = 3,
                                      .source = "b.js",
                                      .original_line = 4,
                                      .original_column = 5,
                                      .name = "x"});
    }
    SECTION("without a name") {
        const OriginalPosition p = decode_segment(Segment{3, 0, 4, 5, std::nullopt}, sources, names);
        REQUIRE(p.source == "a.js");
        REQUIRE_FALSE(p.name.has_value());
    }
    SECTION("out of range") {
        REQUIRE_THROWS_AS(decode_segment(Segment{0, 2, 0, 0, std::nullopt}, sources, names), IndexOutOfRange);
        REQUIRE_THROWS_AS(decode_segment(Segment{0, -1, 0, 0, std::nullopt}, sources, names), IndexOutOfRange);
        REQUIRE_THROWS_WITH(decode_segment(Segment{0, 0, 0, 0, 1}, sources, names),
                            "name index 1 out of range (1 names)");
    }
}
