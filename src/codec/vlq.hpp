// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace srcmap {

// Each base64 digit carries 5 data bits and a continuation bit.
// The sign lives in the low bit of the first digit.
constexpr int VLQ_BASE_SHIFT = 5;
constexpr int VLQ_BASE = 1 << VLQ_BASE_SHIFT;
constexpr int VLQ_BASE_MASK = VLQ_BASE - 1;
constexpr int VLQ_CONTINUATION_BIT = VLQ_BASE;

struct VlqValue {
    int32_t value{};
    size_t consumed{}; ///< Number of characters read.
};

/// Append the base64 VLQ encoding of value to out.
void encode_vlq(int32_t value, std::string& out);
std::string encode_vlq(int32_t value);

/// Decode the first integer of token.
/// @throws MalformedVlq if token is empty, holds a non-alphabet character,
///         ends in the middle of a continuation chain, or overflows 32 bits.
VlqValue decode_vlq(std::string_view token);

/// Decode every integer in a comma-free run such as "AAgBC".
std::vector<int32_t> decode_vlq_run(std::string_view token);

} // namespace srcmap
