// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <string_view>
#include <utility>

#include "io/relativize.hpp"

namespace srcmap {

std::string relativize_path(const std::string& path, const RelativizeContext& context) {
    const std::string& prefix = context.source_map_path ? *context.source_map_path : context.output_dir;
    constexpr std::string_view jar_marker = ".jar!/";
    if (const size_t pos = path.find(jar_marker); pos != std::string::npos) {
        // Keep the '/' that follows '!'.
        return prefix + path.substr(pos + jar_marker.size() - 1);
    }
    const auto it = context.relpaths.find(path);
    return prefix + "/" + (it == context.relpaths.end() ? std::string{} : it->second);
}

PathRelativizer make_relativizer(RelativizeContext context) {
    return [context = std::move(context)](const std::string& path) { return relativize_path(path, context); };
}

PathRelativizer basename_relativizer() {
    return [](const std::string& path) {
        const size_t slash = path.rfind('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    };
}

} // namespace srcmap
