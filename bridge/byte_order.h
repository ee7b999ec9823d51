// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Big-endian integer helpers (EVM byte order)

#ifndef FHEWEB3_BYTE_ORDER_H
#define FHEWEB3_BYTE_ORDER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fheweb3 {
namespace be {

template <typename T>
inline T load(const uint8_t* p) {
    T v = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        v = static_cast<T>((v << 8) | p[i]);
    }
    return v;
}

template <typename T>
inline void store(uint8_t* p, T v) {
    for (size_t i = sizeof(T); i-- > 0;) {
        p[i] = static_cast<uint8_t>(v & 0xff);
        v = static_cast<T>(v >> 8);
    }
}

template <typename T>
inline void append(std::vector<uint8_t>& out, T v) {
    const size_t at = out.size();
    out.resize(at + sizeof(T));
    store<T>(out.data() + at, v);
}

} // namespace be
} // namespace fheweb3

#endif // FHEWEB3_BYTE_ORDER_H
