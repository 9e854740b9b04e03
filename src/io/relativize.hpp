// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <map>
#include <optional>
#include <string>

#include "config.hpp"

namespace srcmap {

struct RelativizeContext {
    std::string output_dir;
    // Takes precedence over output_dir as the prefix when set.
    std::optional<std::string> source_map_path;
    // Source identifier -> path relative to the prefix.
    std::map<std::string, std::string> relpaths;
};

/// Rewrite a source identifier for the "sources" array.
/// Paths inside a jar ("x.jar!/a/b.js") keep the part after "!". Other paths are
/// looked up in relpaths and joined to the prefix with '/'.
std::string relativize_path(const std::string& path, const RelativizeContext& context);

PathRelativizer make_relativizer(RelativizeContext context);

/// Keeps only the last '/'-separated component.
PathRelativizer basename_relativizer();

} // namespace srcmap
