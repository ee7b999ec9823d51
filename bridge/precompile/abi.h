// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Solidity ABI head/tail encoding for precompile operand tuples
//
// Only the two types the FHE precompile uses are supported: `bytes` (dynamic,
// offset in the head, length-prefixed and zero-padded in the tail) and
// `uint256` (static, one word in the head).

#ifndef FHEWEB3_PRECOMPILE_ABI_H
#define FHEWEB3_PRECOMPILE_ABI_H

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "../error.h"
#include "../types.h"
#include "../uint256.h"

namespace fheweb3 {
namespace abi {

constexpr size_t WORD_SIZE = 32;
constexpr size_t SELECTOR_SIZE = 4;

enum class ParamType : uint8_t {
    Bytes,
    Uint256
};

using Value = std::variant<fheweb3::Bytes, Uint256>;

// Tuple encoding without selector
fheweb3::Bytes encode(const std::vector<Value>& values);

// selector (big-endian) followed by the tuple
fheweb3::Bytes encodeCall(uint32_t selector, const std::vector<Value>& values);

// Strict tuple decoding; any inconsistency is Validation/MalformedAbi
Result<std::vector<Value>> decode(const uint8_t* data, size_t len,
                                  const std::vector<ParamType>& types);

Result<uint32_t> readSelector(const uint8_t* data, size_t len);

} // namespace abi
} // namespace fheweb3

#endif // FHEWEB3_PRECOMPILE_ABI_H
