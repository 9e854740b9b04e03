// Copyright (c) srcmap contributors.
// SPDX-License-Identifier: MIT
#include <array>
#include <string>

#include "codec/vlq.hpp"
#include "errors.hpp"

namespace srcmap {

static constexpr std::string_view base64_digits =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Digit value per ASCII character, -1 where the character is not in the alphabet.
static constexpr std::array<int8_t, 128> base64_values = [] {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (size_t i = 0; i < base64_digits.size(); i++) {
        table[static_cast<unsigned char>(base64_digits[i])] = static_cast<int8_t>(i);
    }
    return table;
}();

// Seven digits hold 35 bits: the 32-bit magnitude shifted left by one, plus the sign.
constexpr int MAX_VLQ_SHIFT = 7 * VLQ_BASE_SHIFT;

static int digit_value(const char c) {
    const auto u = static_cast<unsigned char>(c);
    if (u >= base64_values.size() || base64_values[u] < 0) {
        throw MalformedVlq(std::string("invalid base64 character '") + c + "'");
    }
    return base64_values[u];
}

void encode_vlq(const int32_t value, std::string& out) {
    // Widen first so that INT32_MIN can be negated and shifted.
    const int64_t wide = value;
    uint64_t vlq = wide < 0 ? (static_cast<uint64_t>(-wide) << 1) | 1 : static_cast<uint64_t>(wide) << 1;
    do {
        int digit = static_cast<int>(vlq & VLQ_BASE_MASK);
        vlq >>= VLQ_BASE_SHIFT;
        if (vlq > 0) {
            digit |= VLQ_CONTINUATION_BIT;
        }
        out += base64_digits[digit];
    } while (vlq > 0);
}

std::string encode_vlq(const int32_t value) {
    std::string out;
    encode_vlq(value, out);
    return out;
}

VlqValue decode_vlq(const std::string_view token) {
    if (token.empty()) {
        throw MalformedVlq("empty VLQ token");
    }
    uint64_t result = 0;
    int shift = 0;
    size_t pos = 0;
    int digit = 0;
    do {
        if (pos == token.size()) {
            throw MalformedVlq("incomplete VLQ continuation");
        }
        if (shift >= MAX_VLQ_SHIFT) {
            throw MalformedVlq("VLQ value overflows 32 bits");
        }
        digit = digit_value(token[pos++]);
        result |= static_cast<uint64_t>(digit & VLQ_BASE_MASK) << shift;
        shift += VLQ_BASE_SHIFT;
    } while (digit & VLQ_CONTINUATION_BIT);

    const bool negative = (result & 1) != 0;
    const uint64_t magnitude = result >> 1;
    const uint64_t limit = negative ? uint64_t{1} << 31 : (uint64_t{1} << 31) - 1;
    if (magnitude > limit) {
        throw MalformedVlq("VLQ value overflows 32 bits");
    }
    const int64_t value = negative ? -static_cast<int64_t>(magnitude) : static_cast<int64_t>(magnitude);
    return VlqValue{.value = static_cast<int32_t>(value), .consumed = pos};
}

std::vector<int32_t> decode_vlq_run(std::string_view token) {
    if (token.empty()) {
        throw MalformedVlq("empty VLQ token");
    }
    std::vector<int32_t> values;
    while (!token.empty()) {
        const auto [value, consumed] = decode_vlq(token);
        values.push_back(value);
        token.remove_prefix(consumed);
    }
    return values;
}

} // namespace srcmap
