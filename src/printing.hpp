// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "index/position_index.hpp"
#include "merge.hpp"

namespace srcmap {

std::ostream& operator<<(std::ostream& os, const GeneratedPosition& position);
std::ostream& operator<<(std::ostream& os, const DroppedPosition& dropped);

/// One line per original position, "source:line:col -> gline:gcol (name)".
/// Positions whose list is empty print as "source:line:col -> dropped".
std::ostream& operator<<(std::ostream& os, const PositionIndex& index);

/// The lines operator<< would print, without the trailing newlines.
std::vector<std::string> to_strings(const PositionIndex& index);

} // namespace srcmap
