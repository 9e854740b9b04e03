// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include "codec/decode.hpp"
#include "codec/encode.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "io/document.hpp"
#include "io/relativize.hpp"
#include "merge.hpp"
