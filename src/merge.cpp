// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <iostream>
#include <stdexcept>
#include <string>

#include "merge.hpp"
#include "utils/debug.hpp"

namespace srcmap {

static const GeneratedPositions* lookup(const LineMap& lines, const GeneratedPosition& position) {
    const auto line_it = lines.find(position.line);
    if (line_it == lines.end()) {
        return nullptr;
    }
    const auto col_it = line_it->second.find(position.column);
    if (col_it == line_it->second.end()) {
        return nullptr;
    }
    return &col_it->second;
}

static LineMap merge_lines(const std::string& source, const LineMap& first, const LineMap& second,
                           std::vector<DroppedPosition>* dropped, size_t& dropped_count) {
    LineMap res;
    for (const auto& [line, columns] : first) {
        ColumnMap& merged_columns = res[line];
        merged_columns.reserve(columns.size());
        for (const auto& [column, positions] : columns) {
            GeneratedPositions& merged = merged_columns[column];
            for (const GeneratedPosition& intermediate : positions) {
                if (const GeneratedPositions* targets = lookup(second, intermediate)) {
                    merged.insert(merged.end(), targets->begin(), targets->end());
                } else {
                    ++dropped_count;
                    if (dropped) {
                        dropped->push_back(DroppedPosition{
                            .source = source,
                            .line = line,
                            .column = column,
                            .intermediate = intermediate,
                        });
                    }
                }
            }
        }
    }
    return res;
}

LineMap merge(const LineMap& first, const LineMap& second, std::vector<DroppedPosition>* dropped) {
    size_t dropped_count = 0;
    LineMap res = merge_lines({}, first, second, dropped, dropped_count);
    SRCMAP_LOG("merge", std::cerr << "merge dropped " << dropped_count << " positions\n");
    return res;
}

PositionIndex merge(const PositionIndex& first, const PositionIndex& second, std::vector<DroppedPosition>* dropped) {
    if (second.size() > 1) {
        throw std::invalid_argument("second map must describe one intermediate file, got " +
                                    std::to_string(second.size()) + " sources");
    }
    static const LineMap nothing;
    const LineMap& intermediate = second.empty() ? nothing : second.begin()->second;

    PositionIndex res{first.sources()};
    size_t dropped_count = 0;
    for (const auto& [source, lines] : first) {
        res[source] = merge_lines(source, lines, intermediate, dropped, dropped_count);
    }
    SRCMAP_LOG("merge", std::cerr << "merge dropped " << dropped_count << " of " << first.position_count()
                                  << " positions\n");
    return res;
}

} // namespace srcmap
