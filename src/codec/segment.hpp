// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace srcmap {

/// The five fields of one mappings segment, in wire order.
/// Relative to the previous segment on the wire; absolute once combined with a SegmentState.
/// name_index is present only when the segment carries a name.
struct Segment {
    int64_t generated_column{};
    int64_t source_index{};
    int64_t original_line{};
    int64_t original_column{};
    std::optional<int64_t> name_index;

    bool operator==(const Segment&) const = default;
};

/// Running absolute values threaded through a mappings string.
/// Only generated_column resets at a line boundary. name_index keeps the last
/// name seen, across segments that carry none.
struct SegmentState {
    int64_t generated_column{};
    int64_t source_index{};
    int64_t original_line{};
    int64_t original_column{};
    int64_t name_index{};

    [[nodiscard]]
    SegmentState next_line() const {
        SegmentState res = *this;
        res.generated_column = 0;
        return res;
    }

    bool operator==(const SegmentState&) const = default;
};

struct SegmentStep {
    Segment segment;
    SegmentState state;
};

/// A segment resolved against the sources and names tables.
struct OriginalPosition {
    int generated_column{};
    std::string source;
    int original_line{};
    int original_column{};
    std::optional<std::string> name;

    bool operator==(const OriginalPosition&) const = default;
};

/// Build a relative segment from its 4 or 5 decoded fields.
/// @throws std::invalid_argument for any other field count.
Segment segment_from_fields(std::span<const int32_t> fields);

/// The wire fields of a relative segment: 4, or 5 when it carries a name.
std::vector<int32_t> segment_fields(const Segment& relative);

/// Add a relative segment to the running state, field by field.
/// Returns the absolute segment and the state for the next step.
SegmentStep combine(const Segment& relative, const SegmentState& previous);

/// Inverse of combine: the pairwise difference between an absolute segment and
/// the running state, and the state for the next step.
SegmentStep encode_offset(const Segment& absolute, const SegmentState& previous);

/// Resolve an absolute segment against the sources and names tables.
/// @throws IndexOutOfRange if either index falls outside its table.
OriginalPosition decode_segment(const Segment& absolute, const std::vector<std::string>& sources,
                                const std::vector<std::string>& names);

} // namespace srcmap
