// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Trailing integrity tag for wire frames
//
// The tag covers header and payload. SHA-256 is used so contracts can
// recompute it with the sha256 precompile at address 0x02.

#ifndef FHEWEB3_INTEGRITY_TAG_H
#define FHEWEB3_INTEGRITY_TAG_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.h"

namespace fheweb3 {

enum class TagAlgorithm : uint8_t {
    None = 0,
    Sha256 = 1
};

namespace integrity {

constexpr size_t SHA256_TAG_SIZE = 32;

size_t tagSize(TagAlgorithm algorithm);

// Empty for TagAlgorithm::None
Result<std::vector<uint8_t>> compute(TagAlgorithm algorithm, const uint8_t* data, size_t len);

// Recomputes the tag over data and compares in constant time
bool verify(TagAlgorithm algorithm, const uint8_t* data, size_t len,
            const uint8_t* tag, size_t tag_len);

} // namespace integrity
} // namespace fheweb3

#endif // FHEWEB3_INTEGRITY_TAG_H
