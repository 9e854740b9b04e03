// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <limits>
#include <string>
#include <vector>

#include "errors.hpp"
#include "io/document.hpp"

namespace srcmap {

static const nlohmann::json* field(const nlohmann::json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

static std::string as_string(const nlohmann::json& value, const char* key) {
    if (!value.is_string()) {
        throw InvalidDocument(std::string("\"") + key + "\" must be a string");
    }
    return value.get<std::string>();
}

static std::vector<std::string> as_string_array(const nlohmann::json& value, const char* key) {
    if (!value.is_array()) {
        throw InvalidDocument(std::string("\"") + key + "\" must be an array of strings");
    }
    std::vector<std::string> res;
    res.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw InvalidDocument(std::string("\"") + key + "\" must be an array of strings");
        }
        res.push_back(item.get<std::string>());
    }
    return res;
}

SourceMapDocument parse_document(const std::string& json_text) {
    nlohmann::json obj;
    try {
        obj = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidDocument(std::string("malformed JSON: ") + e.what());
    }
    if (!obj.is_object()) {
        throw InvalidDocument("source map must be a JSON object");
    }

    const nlohmann::json* version = field(obj, "version");
    if (!version || !version->is_number_integer() || version->get<int64_t>() != SOURCE_MAP_VERSION) {
        throw InvalidDocument("unsupported source map version, expected 3");
    }

    SourceMapDocument doc;
    if (const auto* file = field(obj, "file")) {
        doc.file = as_string(*file, "file");
    }
    if (const auto* source_root = field(obj, "sourceRoot")) {
        doc.source_root = as_string(*source_root, "sourceRoot");
    }

    const nlohmann::json* sources = field(obj, "sources");
    if (!sources) {
        throw InvalidDocument("missing \"sources\"");
    }
    doc.sources = as_string_array(*sources, "sources");

    if (const auto* names = field(obj, "names")) {
        doc.names = as_string_array(*names, "names");
    }

    const nlohmann::json* mappings = field(obj, "mappings");
    if (!mappings) {
        throw InvalidDocument("missing \"mappings\"");
    }
    doc.mappings = as_string(*mappings, "mappings");

    if (const auto* line_count = field(obj, "lineCount")) {
        if (!line_count->is_number_integer() || line_count->get<int64_t>() < 0 ||
            line_count->get<int64_t>() > std::numeric_limits<int>::max()) {
            throw InvalidDocument("\"lineCount\" must be a non-negative integer");
        }
        doc.line_count = line_count->get<int>();
    }
    return doc;
}

nlohmann::ordered_json to_json(const SourceMapDocument& document) {
    nlohmann::ordered_json obj;
    obj["version"] = SOURCE_MAP_VERSION;
    obj["file"] = document.file;
    if (document.source_root) {
        obj["sourceRoot"] = *document.source_root;
    }
    obj["sources"] = document.sources;
    if (document.line_count) {
        obj["lineCount"] = *document.line_count;
    }
    obj["mappings"] = document.mappings;
    obj["names"] = document.names;
    return obj;
}

std::string dump(const SourceMapDocument& document, const int indent) { return to_json(document).dump(indent); }

} // namespace srcmap
