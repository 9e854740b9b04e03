// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "codec/decode.hpp"
#include "codec/segment.hpp"
#include "codec/vlq.hpp"
#include "errors.hpp"
#include "utils/debug.hpp"

namespace srcmap {

static bool is_blank(const std::string_view group) {
    return std::ranges::all_of(group, [](const char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

namespace {
class Decoder {
    const std::vector<std::string>& sources;
    const std::vector<std::string>& names;
    const decode_options_t& options;

    PositionIndex index;
    SegmentState state;
    int generated_line = 0;
    size_t segment_count = 0;

  public:
    Decoder(const std::vector<std::string>& sources, const std::vector<std::string>& names,
            const decode_options_t& options)
        : sources{sources}, names{names}, options{options}, index{sources} {}

    void decode_line(const std::string_view group, const size_t group_offset) {
        state = state.next_line();
        if (is_blank(group)) {
            return;
        }
        size_t start = 0;
        while (true) {
            const size_t comma = group.find(',', start);
            const size_t end = comma == std::string_view::npos ? group.size() : comma;
            decode_one(group.substr(start, end - start), MappingLocation{generated_line, group_offset + start});
            if (comma == std::string_view::npos) {
                break;
            }
            start = comma + 1;
        }
    }

    void next_line() { ++generated_line; }

    PositionIndex finish() {
        SRCMAP_LOG("decode", std::cerr << "decoded " << segment_count << " segments over " << generated_line + 1
                                       << " generated lines into " << index.size() << " sources\n");
        return std::move(index);
    }

  private:
    void decode_one(const std::string_view token, const MappingLocation& location) {
        if (token.empty()) {
            throw MalformedMapping("empty segment", location);
        }

        std::vector<int32_t> fields;
        try {
            fields = decode_vlq_run(token);
        } catch (const MalformedVlq& e) {
            throw MalformedVlq(e.reason(), location);
        }

        if (fields.size() == 1 && options.allow_unmapped_segments) {
            state.generated_column += fields[0];
            check_non_negative("generated column", state.generated_column, location);
            SRCMAP_WARN("skipping unmapped segment at ", to_string(location));
            return;
        }

        Segment relative;
        try {
            relative = segment_from_fields(fields);
        } catch (const std::invalid_argument& e) {
            throw MalformedMapping(e.what(), location);
        }

        const auto [absolute, next] = combine(relative, state);
        check_non_negative("generated column", absolute.generated_column, location);
        check_non_negative("original line", absolute.original_line, location);
        check_non_negative("original column", absolute.original_column, location);

        OriginalPosition original;
        try {
            original = decode_segment(absolute, sources, names);
        } catch (const IndexOutOfRange& e) {
            throw IndexOutOfRange(e.reason(), location);
        }

        index.insert(original.source, original.original_line, original.original_column,
                     GeneratedPosition{
                         .line = generated_line,
                         .column = original.generated_column,
                         .name = std::move(original.name),
                     });
        state = next;
        ++segment_count;
    }

    static void check_non_negative(const char* what, const int64_t value, const MappingLocation& location) {
        if (value < 0) {
            throw MalformedMapping("negative " + std::string(what) + " " + std::to_string(value), location);
        }
        if (value > std::numeric_limits<int>::max()) {
            throw MalformedMapping(std::string(what) + " " + std::to_string(value) + " out of range", location);
        }
    }
};
} // namespace

PositionIndex decode(const std::string_view mappings, const std::vector<std::string>& sources,
                     const std::vector<std::string>& names, const decode_options_t& options) {
    Decoder decoder{sources, names, options};
    size_t start = 0;
    while (true) {
        const size_t semicolon = mappings.find(';', start);
        const size_t end = semicolon == std::string_view::npos ? mappings.size() : semicolon;
        decoder.decode_line(mappings.substr(start, end - start), start);
        if (semicolon == std::string_view::npos) {
            break;
        }
        decoder.next_line();
        start = semicolon + 1;
    }
    return decoder.finish();
}

PositionIndex decode(const SourceMapDocument& document, const decode_options_t& options) {
    return decode(document.mappings, document.sources, document.names, options);
}

} // namespace srcmap
