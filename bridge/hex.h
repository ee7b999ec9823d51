// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Hex encoding for addresses, calldata and diagnostics

#ifndef FHEWEB3_HEX_H
#define FHEWEB3_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "error.h"

namespace fheweb3 {
namespace hex {

// Lowercase hex, "0x"-prefixed when prefix is true
std::string encode(const uint8_t* data, size_t len, bool prefix = true);
std::string encode(const std::vector<uint8_t>& data, bool prefix = true);

// Accepts an optional "0x"/"0X" prefix; odd digit counts are rejected
Result<std::vector<uint8_t>> decode(const std::string& text);

} // namespace hex
} // namespace fheweb3

#endif // FHEWEB3_HEX_H
