// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "index/position_index.hpp"
#include "io/document.hpp"

namespace srcmap {

/// Decode a mappings string into a position index ranked by sources.
///
/// Each ';'-separated group is one generated line, each ','-separated segment
/// within it one mapping. Groups holding only whitespace advance the line
/// without inserting anything.
///
/// @throws MalformedVlq, MalformedMapping or IndexOutOfRange, located at the
///         generated line and offset of the failing segment.
PositionIndex decode(std::string_view mappings, const std::vector<std::string>& sources,
                     const std::vector<std::string>& names, const decode_options_t& options = {});

PositionIndex decode(const SourceMapDocument& document, const decode_options_t& options = {});

} // namespace srcmap
