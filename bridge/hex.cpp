// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Hex encoding for addresses, calldata and diagnostics

#include "hex.h"

namespace fheweb3 {
namespace hex {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string encode(const uint8_t* data, size_t len, bool prefix) {
    std::string out;
    out.reserve(len * 2 + 2);
    if (prefix) {
        out += "0x";
    }
    for (size_t i = 0; i < len; i++) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0f];
    }
    return out;
}

std::string encode(const std::vector<uint8_t>& data, bool prefix) {
    return encode(data.data(), data.size(), prefix);
}

Result<std::vector<uint8_t>> decode(const std::string& text) {
    size_t start = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        start = 2;
    }
    const size_t digits = text.size() - start;
    if (digits % 2 != 0) {
        return Error::invalidArgument("hex string has an odd number of digits");
    }

    std::vector<uint8_t> out;
    out.reserve(digits / 2);
    for (size_t i = start; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error::invalidArgument("invalid hex digit in \"" + text + "\"");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace hex
} // namespace fheweb3
