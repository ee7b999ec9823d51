// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Shared fixtures for the transport tests

#ifndef FHEWEB3_TEST_UTIL_H
#define FHEWEB3_TEST_UTIL_H

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "scheme_registry.h"
#include "types.h"
#include "wire_codec.h"

namespace fheweb3 {
namespace test {

// Deterministic non-trivial bytes
inline Bytes pattern(size_t len, uint8_t seed) {
    Bytes out(len);
    uint32_t x = 0x9e3779b9u ^ seed;
    for (size_t i = 0; i < len; i++) {
        x = x * 1664525u + 1013904223u;
        out[i] = static_cast<uint8_t>(x >> 24);
    }
    return out;
}

inline const SchemeBinding& builtinBinding(SchemeId scheme, ParamSetId param_set) {
    auto binding = SchemeRegistry::builtin()->resolve(scheme, param_set);
    if (!binding) {
        throw std::logic_error(binding.error().toString());
    }
    return *binding.value();
}

inline const SchemeBinding& bfv4096() {
    return builtinBinding(SchemeId::Bfv, SchemeRegistry::kBfv4096);
}

inline const SchemeBinding& bfv8192() {
    return builtinBinding(SchemeId::Bfv, SchemeRegistry::kBfv8192);
}

inline const SchemeBinding& lwe128() {
    return builtinBinding(SchemeId::BinFhe, SchemeRegistry::kLwe128);
}

inline const SchemeBinding& lwe192() {
    return builtinBinding(SchemeId::BinFhe, SchemeRegistry::kLwe192);
}

inline const SchemeBinding& lwe256() {
    return builtinBinding(SchemeId::BinFhe, SchemeRegistry::kLwe256);
}

inline CiphertextHandle makeCiphertext(const SchemeBinding& binding, uint8_t seed) {
    const auto rule = wire::payloadRule(binding, ObjectKind::Ciphertext);
    return CiphertextHandle(binding.key, pattern(rule.min_length, seed));
}

// Smallest admissible key for bounded layouts, exact size otherwise
inline KeyHandle makeKey(KeyHandle::Type type, const SchemeBinding& binding, uint8_t seed,
                         size_t bounded_len = 4096) {
    const auto rule = wire::payloadRule(binding, static_cast<ObjectKind>(type));
    const size_t len = rule.exact() ? rule.min_length : bounded_len;
    return KeyHandle(type, binding.key, pattern(len, seed));
}

inline Bytes frameOf(const DecodedObject& object, const SchemeBinding& binding) {
    auto frame = wire::encode(object, binding);
    if (!frame) {
        throw std::logic_error(frame.error().toString());
    }
    return frame.value();
}

} // namespace test
} // namespace fheweb3

#endif // FHEWEB3_TEST_UTIL_H
