// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace srcmap {

extern bool SrcmapLogFlag;
extern std::set<std::string> SrcmapLog;

#define SRCMAP_LOG(TAG, CODE)                                                  \
    do {                                                                       \
        if (::srcmap::SrcmapLogFlag && ::srcmap::SrcmapLog.contains(TAG)) {    \
            CODE;                                                              \
        }                                                                      \
    } while (0)

void SrcmapEnableLog(const std::string& tag);

template <typename... ArgTypes>
void srcmap_print(std::ostream& os, ArgTypes&&... args) {
    (os << ... << std::forward<ArgTypes>(args));
}

#define SRCMAP_ERROR(...)                                                      \
    do {                                                                       \
        std::ostringstream os;                                                 \
        os << "SRCMAP ERROR: ";                                                \
        ::srcmap::srcmap_print(os, __VA_ARGS__);                               \
        os << "\n";                                                            \
        throw std::runtime_error(os.str());                                    \
    } while (0)

extern bool SrcmapWarningFlag;
void SrcmapEnableWarningMsg(bool b);

#define SRCMAP_WARN(...)                                                       \
    do {                                                                       \
        if (::srcmap::SrcmapWarningFlag) {                                     \
            std::cerr << "SRCMAP WARNING: ";                                   \
            ::srcmap::srcmap_print(std::cerr, __VA_ARGS__);                    \
            std::cerr << "\n";                                                 \
        }                                                                      \
    } while (0)

} // namespace srcmap
