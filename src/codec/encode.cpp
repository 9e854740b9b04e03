// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <ranges>
#include <string>
#include <vector>

#include <gsl/narrow>

#include "codec/encode.hpp"
#include "codec/segment.hpp"
#include "codec/vlq.hpp"
#include "errors.hpp"
#include "utils/debug.hpp"

namespace srcmap {

static void check_position(const std::string& source, const int line, const int column) {
    if (line < 0) {
        throw InvalidPosition("negative original line " + std::to_string(line) + " in " + source);
    }
    if (column < 0) {
        throw InvalidPosition("negative original column " + std::to_string(column) + " in " + source + ":" +
                              std::to_string(line));
    }
}

static void check_position(const std::string& source, const int line, const int column,
                           const GeneratedPosition& position) {
    const auto where = [&] { return " for " + source + ":" + std::to_string(line) + ":" + std::to_string(column); };
    if (position.line < 0) {
        throw InvalidPosition("negative generated line " + std::to_string(position.line) + where());
    }
    // The line count that covers this line must itself fit in an int.
    if (position.line == std::numeric_limits<int>::max()) {
        throw InvalidPosition("generated line " + std::to_string(position.line) + " is out of range" + where());
    }
    if (position.column < 0) {
        throw InvalidPosition("negative generated column " + std::to_string(position.column) + where());
    }
}

// Returns the number of generated lines that hold at least one mapping.
static int64_t validate(const PositionIndex& index) {
    int64_t mapped_lines = 0;
    for (const auto& [source, lines] : index) {
        for (const auto& [line, columns] : lines) {
            for (const auto& [column, positions] : columns) {
                check_position(source, line, column);
                for (const GeneratedPosition& position : positions) {
                    check_position(source, line, column, position);
                    mapped_lines = std::max(mapped_lines, int64_t{position.line} + 1);
                }
            }
        }
    }
    return mapped_lines;
}

namespace {
// Assigns name indices in first-use order.
class NameTable {
    std::vector<std::string>& names;
    std::map<std::string, int64_t> index_of;

  public:
    explicit NameTable(std::vector<std::string>& names) : names{names} {
        for (const std::string& name : names) {
            index_of.emplace(name, gsl::narrow<int64_t>(index_of.size()));
        }
    }

    int64_t operator[](const std::string& name) {
        const auto [it, inserted] = index_of.emplace(name, gsl::narrow<int64_t>(names.size()));
        if (inserted) {
            names.push_back(name);
        }
        return it->second;
    }
};
} // namespace

std::string encode_mappings(const PositionIndex& index, std::vector<std::string>& names,
                            const encode_options_t& options) {
    const int64_t mapped_lines = validate(index);
    if (options.line_count && *options.line_count < mapped_lines) {
        throw InvalidPosition("line count " + std::to_string(*options.line_count) + " is smaller than the " +
                              std::to_string(mapped_lines) + " mapped generated lines");
    }

    NameTable name_table{names};
    std::vector<std::vector<Segment>> lines(gsl::narrow<size_t>(std::max<int64_t>(mapped_lines, 1)));
    int64_t source_index = 0;
    for (const LineMap& original_lines : index | std::views::values) {
        for (const auto& [line, columns] : original_lines) {
            for (const auto& [column, positions] : columns) {
                for (const GeneratedPosition& position : positions) {
                    Segment absolute{
                        .generated_column = position.column,
                        .source_index = source_index,
                        .original_line = line,
                        .original_column = column,
                        .name_index = std::nullopt,
                    };
                    if (position.name) {
                        absolute.name_index = name_table[*position.name];
                    }
                    const auto gline = gsl::narrow<size_t>(position.line);
                    if (gline >= lines.size()) {
                        SRCMAP_ERROR("generated line ", gline, " outside the ", lines.size(), " validated lines");
                    }
                    lines[gline].push_back(absolute);
                }
            }
        }
        ++source_index;
    }
    if (options.line_count) {
        lines.resize(gsl::narrow<size_t>(std::max(*options.line_count, 1)));
    }

    std::string mappings;
    SegmentState state;
    size_t segment_count = 0;
    for (size_t gline = 0; gline < lines.size(); ++gline) {
        if (gline > 0) {
            mappings += ';';
        }
        std::vector<Segment>& segments = lines[gline];
        if (options.sort_segments) {
            std::ranges::stable_sort(segments, {}, &Segment::generated_column);
        }
        state = state.next_line();
        for (size_t i = 0; i < segments.size(); ++i) {
            if (i > 0) {
                mappings += ',';
            }
            const auto [relative, next] = encode_offset(segments[i], state);
            for (const int32_t field : segment_fields(relative)) {
                encode_vlq(field, mappings);
            }
            state = next;
            ++segment_count;
        }
    }
    SRCMAP_LOG("encode", std::cerr << "encoded " << segment_count << " segments over " << lines.size()
                                   << " generated lines, " << names.size() << " names\n");
    return mappings;
}

SourceMapDocument encode(const PositionIndex& index, const encode_options_t& options) {
    SourceMapDocument res{
        .file = options.file,
        .source_root = options.source_root,
        .sources = {},
        .names = {},
        .mappings = {},
        .line_count = options.line_count,
    };
    res.mappings = encode_mappings(index, res.names, options);
    for (const std::string& source : index.sources()) {
        res.sources.push_back(options.relativize_path ? options.relativize_path(source) : source);
    }
    return res;
}

} // namespace srcmap
