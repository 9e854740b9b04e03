// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/container/flat_map.hpp>

namespace srcmap {

/// Where in the generated file an original location ended up.
struct GeneratedPosition {
    int line{};
    int column{};
    std::optional<std::string> name;

    bool operator==(const GeneratedPosition&) const = default;
};

// One original location can map to several generated locations,
// e.g. after an optimizer duplicates code.
using GeneratedPositions = std::vector<GeneratedPosition>;

// Columns per line are few, so a sorted vector beats a tree.
using ColumnMap = boost::container::flat_map<int, GeneratedPositions>;
using LineMap = std::map<int, ColumnMap>;

/// Orders source identifiers by their position in an authoritative sources list.
/// Identifiers missing from the list sort after all listed ones, lexically among themselves.
class SourceOrder {
    std::shared_ptr<const std::map<std::string, size_t>> rank_;

  public:
    SourceOrder() = default;
    explicit SourceOrder(const std::vector<std::string>& sources);

    bool operator()(const std::string& a, const std::string& b) const;

  private:
    [[nodiscard]]
    std::optional<size_t> rank_of(const std::string& source) const;
};

/// Decoded form of a source map: source -> original line -> original column -> generated positions.
/// Iteration follows source rank, then line, then column.
class PositionIndex {
    using Files = std::map<std::string, LineMap, SourceOrder>;
    Files files_;

  public:
    using value_type = Files::value_type;
    using iterator = Files::iterator;
    using const_iterator = Files::const_iterator;

    PositionIndex() = default;
    explicit PositionIndex(const std::vector<std::string>& sources) : files_(SourceOrder{sources}) {}

    /// Append a generated position at [source][line][column]; existing entries are kept.
    void insert(const std::string& source, int line, int column, GeneratedPosition position);

    /// The line map of source, created empty if absent.
    LineMap& operator[](const std::string& source);

    [[nodiscard]]
    const LineMap* find(const std::string& source) const;

    [[nodiscard]]
    const GeneratedPositions* find(const std::string& source, int line, int column) const;

    /// Source identifiers in iteration order.
    [[nodiscard]]
    std::vector<std::string> sources() const;

    /// Total number of generated positions held.
    [[nodiscard]]
    size_t position_count() const;

    [[nodiscard]]
    size_t size() const {
        return files_.size();
    }
    [[nodiscard]]
    bool empty() const {
        return files_.empty();
    }

    iterator begin() { return files_.begin(); }
    iterator end() { return files_.end(); }
    [[nodiscard]]
    const_iterator begin() const {
        return files_.begin();
    }
    [[nodiscard]]
    const_iterator end() const {
        return files_.end();
    }

    // Equal contents in equal order.
    bool operator==(const PositionIndex& other) const { return files_ == other.files_; }
};

} // namespace srcmap
