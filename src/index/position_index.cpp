// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <ranges>
#include <utility>

#include "index/position_index.hpp"

namespace srcmap {

SourceOrder::SourceOrder(const std::vector<std::string>& sources) {
    auto rank = std::make_shared<std::map<std::string, size_t>>();
    for (const auto& source : sources) {
        // The first occurrence defines the rank.
        rank->emplace(source, rank->size());
    }
    rank_ = std::move(rank);
}

std::optional<size_t> SourceOrder::rank_of(const std::string& source) const {
    if (!rank_) {
        return {};
    }
    const auto it = rank_->find(source);
    if (it == rank_->end()) {
        return {};
    }
    return it->second;
}

bool SourceOrder::operator()(const std::string& a, const std::string& b) const {
    const auto ra = rank_of(a);
    const auto rb = rank_of(b);
    if (ra && rb) {
        return *ra < *rb;
    }
    if (ra || rb) {
        return ra.has_value();
    }
    return a < b;
}

void PositionIndex::insert(const std::string& source, const int line, const int column, GeneratedPosition position) {
    files_[source][line][column].push_back(std::move(position));
}

LineMap& PositionIndex::operator[](const std::string& source) { return files_[source]; }

const LineMap* PositionIndex::find(const std::string& source) const {
    const auto it = files_.find(source);
    if (it == files_.end()) {
        return nullptr;
    }
    return &it->second;
}

const GeneratedPositions* PositionIndex::find(const std::string& source, const int line, const int column) const {
    const LineMap* lines = find(source);
    if (!lines) {
        return nullptr;
    }
    const auto line_it = lines->find(line);
    if (line_it == lines->end()) {
        return nullptr;
    }
    const auto col_it = line_it->second.find(column);
    if (col_it == line_it->second.end()) {
        return nullptr;
    }
    return &col_it->second;
}

std::vector<std::string> PositionIndex::sources() const {
    std::vector<std::string> res;
    for (const auto& source : files_ | std::views::keys) {
        res.push_back(source);
    }
    return res;
}

size_t PositionIndex::position_count() const {
    size_t count = 0;
    for (const LineMap& lines : files_ | std::views::values) {
        for (const ColumnMap& columns : lines | std::views::values) {
            for (const auto& [column, positions] : columns) {
                count += positions.size();
            }
        }
    }
    return count;
}

} // namespace srcmap
