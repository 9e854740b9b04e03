// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace srcmap {

constexpr int SOURCE_MAP_VERSION = 3;

/// The JSON envelope of a v3 source map.
struct SourceMapDocument {
    std::string file;
    std::optional<std::string> source_root;
    std::vector<std::string> sources;
    std::vector<std::string> names;
    std::string mappings;
    std::optional<int> line_count;

    bool operator==(const SourceMapDocument&) const = default;
};

/// Parse a v3 source map.
/// @throws InvalidDocument on malformed JSON, a version other than 3, or missing/mistyped fields.
SourceMapDocument parse_document(const std::string& json_text);

/// Fields in the order version, file, sourceRoot, sources, lineCount, mappings, names.
/// Optional fields are omitted when unset.
nlohmann::ordered_json to_json(const SourceMapDocument& document);

std::string dump(const SourceMapDocument& document, int indent = 2);

} // namespace srcmap
