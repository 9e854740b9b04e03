// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <functional>
#include <optional>
#include <string>

namespace srcmap {

/// Rewrites a source identifier when it is written to the "sources" array.
/// An empty relativizer leaves identifiers unchanged.
using PathRelativizer = std::function<std::string(const std::string&)>;

struct decode_options_t {
    // Skip single-field segments (a generated column with no original position)
    // instead of rejecting them.
    bool allow_unmapped_segments = false;
};

struct encode_options_t {
    std::string file;
    std::optional<std::string> source_root;

    // Total number of generated lines. When set, mappings are padded with empty groups up to it.
    std::optional<int> line_count;

    PathRelativizer relativize_path;

    // Order segments within a generated line by generated column.
    bool sort_segments = true;
};

struct verbosity_options_t {
    // Print the resulting position index to stderr.
    bool print_index = false;

    // List the original positions a merge dropped.
    bool print_dropped = false;
};

struct srcmap_options_t {
    decode_options_t decode_opts;
    encode_options_t encode_opts;
    verbosity_options_t verbosity_opts;
};

} // namespace srcmap
