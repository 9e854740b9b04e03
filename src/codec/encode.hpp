// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "index/position_index.hpp"
#include "io/document.hpp"

namespace srcmap {

/// Encode the mappings string of an index.
/// Names are appended to names in first-use order; source indices follow the
/// iteration order of the index.
/// @throws InvalidPosition if any line or column is negative, or if
///         options.line_count is smaller than the number of mapped generated lines.
std::string encode_mappings(const PositionIndex& index, std::vector<std::string>& names,
                            const encode_options_t& options = {});

/// Encode an index into a complete v3 document.
/// Sources are passed through options.relativize_path when it is set.
SourceMapDocument encode(const PositionIndex& index, const encode_options_t& options = {});

} // namespace srcmap
