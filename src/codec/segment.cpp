// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <stdexcept>

#include <gsl/narrow>

#include "codec/segment.hpp"
#include "errors.hpp"

namespace srcmap {

Segment segment_from_fields(const std::span<const int32_t> fields) {
    if (fields.size() != 4 && fields.size() != 5) {
        throw std::invalid_argument("segment has " + std::to_string(fields.size()) +
                                    (fields.size() == 1 ? " field" : " fields") + ", expected 4 or 5");
    }
    Segment res{
        .generated_column = fields[0],
        .source_index = fields[1],
        .original_line = fields[2],
        .original_column = fields[3],
        .name_index = std::nullopt,
    };
    if (fields.size() == 5) {
        res.name_index = fields[4];
    }
    return res;
}

std::vector<int32_t> segment_fields(const Segment& relative) {
    std::vector<int32_t> fields{
        gsl::narrow<int32_t>(relative.generated_column),
        gsl::narrow<int32_t>(relative.source_index),
        gsl::narrow<int32_t>(relative.original_line),
        gsl::narrow<int32_t>(relative.original_column),
    };
    if (relative.name_index) {
        fields.push_back(gsl::narrow<int32_t>(*relative.name_index));
    }
    return fields;
}

SegmentStep combine(const Segment& relative, const SegmentState& previous) {
    Segment absolute{
        .generated_column = previous.generated_column + relative.generated_column,
        .source_index = previous.source_index + relative.source_index,
        .original_line = previous.original_line + relative.original_line,
        .original_column = previous.original_column + relative.original_column,
        .name_index = std::nullopt,
    };
    SegmentState next{
        .generated_column = absolute.generated_column,
        .source_index = absolute.source_index,
        .original_line = absolute.original_line,
        .original_column = absolute.original_column,
        .name_index = previous.name_index,
    };
    if (relative.name_index) {
        absolute.name_index = previous.name_index + *relative.name_index;
        next.name_index = *absolute.name_index;
    }
    return {absolute, next};
}

SegmentStep encode_offset(const Segment& absolute, const SegmentState& previous) {
    Segment relative{
        .generated_column = absolute.generated_column - previous.generated_column,
        .source_index = absolute.source_index - previous.source_index,
        .original_line = absolute.original_line - previous.original_line,
        .original_column = absolute.original_column - previous.original_column,
        .name_index = std::nullopt,
    };
    SegmentState next{
        .generated_column = absolute.generated_column,
        .source_index = absolute.source_index,
        .original_line = absolute.original_line,
        .original_column = absolute.original_column,
        .name_index = previous.name_index,
    };
    if (absolute.name_index) {
        relative.name_index = *absolute.name_index - previous.name_index;
        next.name_index = *absolute.name_index;
    }
    return {relative, next};
}

OriginalPosition decode_segment(const Segment& absolute, const std::vector<std::string>& sources,
                                const std::vector<std::string>& names) {
    if (absolute.source_index < 0 || absolute.source_index >= gsl::narrow<int64_t>(sources.size())) {
        throw IndexOutOfRange("source index " + std::to_string(absolute.source_index) + " out of range (" +
                              std::to_string(sources.size()) + " sources)");
    }
    OriginalPosition res{
        .generated_column = gsl::narrow<int>(absolute.generated_column),
        .source = sources[gsl::narrow<size_t>(absolute.source_index)],
        .original_line = gsl::narrow<int>(absolute.original_line),
        .original_column = gsl::narrow<int>(absolute.original_column),
        .name = std::nullopt,
    };
    if (absolute.name_index) {
        const int64_t name_index = *absolute.name_index;
        if (name_index < 0 || name_index >= gsl::narrow<int64_t>(names.size())) {
            throw IndexOutOfRange("name index " + std::to_string(name_index) + " out of range (" +
                                  std::to_string(names.size()) + " names)");
        }
        res.name = names[gsl::narrow<size_t>(name_index)];
    }
    return res;
}

} // namespace srcmap
