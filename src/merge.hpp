// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>

#include "index/position_index.hpp"

namespace srcmap {

/// An original position whose generated positions had no counterpart in the second map.
struct DroppedPosition {
    std::string source;
    int line{};
    int column{};
    GeneratedPosition intermediate;

    bool operator==(const DroppedPosition&) const = default;
};

/// Compose two successive maps of one file.
/// first maps original lines and columns to an intermediate file, second maps that
/// intermediate file to the final one. Each position list of first is replaced by
/// the concatenation of second's lists at its intermediate positions.
/// Positions missing from second are dropped; their keys stay, possibly with an empty list.
LineMap merge(const LineMap& first, const LineMap& second, std::vector<DroppedPosition>* dropped = nullptr);

/// Compose two source maps. second must describe a single intermediate file.
/// The result keeps first's sources and their order.
/// @throws std::invalid_argument if second holds more than one source.
PositionIndex merge(const PositionIndex& first, const PositionIndex& second,
                    std::vector<DroppedPosition>* dropped = nullptr);

} // namespace srcmap
