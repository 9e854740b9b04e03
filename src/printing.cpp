// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <iostream>
#include <sstream>

#include "printing.hpp"

using std::string;
using std::vector;

namespace srcmap {

std::ostream& operator<<(std::ostream& os, const GeneratedPosition& position) {
    os << position.line << ":" << position.column;
    if (position.name) {
        os << " (" << *position.name << ")";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const DroppedPosition& dropped) {
    if (!dropped.source.empty()) {
        os << dropped.source << ":";
    }
    return os << dropped.line << ":" << dropped.column << " via " << dropped.intermediate;
}

vector<string> to_strings(const PositionIndex& index) {
    vector<string> res;
    for (const auto& [source, lines] : index) {
        for (const auto& [line, columns] : lines) {
            for (const auto& [column, positions] : columns) {
                const string key = source + ":" + std::to_string(line) + ":" + std::to_string(column);
                if (positions.empty()) {
                    res.push_back(key + " -> dropped");
                }
                for (const GeneratedPosition& position : positions) {
                    std::ostringstream os;
                    os << key << " -> " << position;
                    res.push_back(os.str());
                }
            }
        }
    }
    return res;
}

std::ostream& operator<<(std::ostream& os, const PositionIndex& index) {
    for (const string& line : to_strings(index)) {
        os << line << "\n";
    }
    return os;
}

} // namespace srcmap
