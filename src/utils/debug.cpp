// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include "utils/debug.hpp"

namespace srcmap {
bool SrcmapLogFlag = false;
std::set<std::string> SrcmapLog;

void SrcmapEnableLog(const std::string& tag) {
    SrcmapLog.insert(tag);
    SrcmapLogFlag = true;
}

bool SrcmapWarningFlag = false;
void SrcmapEnableWarningMsg(const bool b) { SrcmapWarningFlag = b; }

} // namespace srcmap
