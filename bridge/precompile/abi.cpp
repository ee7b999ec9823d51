// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Solidity ABI head/tail encoding

#include "abi.h"

#include <algorithm>

#include "../byte_order.h"

namespace fheweb3 {
namespace abi {

namespace {

size_t paddedSize(size_t len) {
    return (len + WORD_SIZE - 1) / WORD_SIZE * WORD_SIZE;
}

void putWord(fheweb3::Bytes& out, size_t at, uint64_t value) {
    std::fill(out.begin() + at, out.begin() + at + WORD_SIZE, 0);
    be::store<uint64_t>(out.data() + at + WORD_SIZE - 8, value);
}

// Offsets and lengths are uint256 on the wire; anything above 2^64 can never
// address into a buffer we hold
bool readSizeWord(const uint8_t* p, uint64_t* out) {
    for (size_t i = 0; i < WORD_SIZE - 8; i++) {
        if (p[i] != 0) {
            return false;
        }
    }
    *out = be::load<uint64_t>(p + WORD_SIZE - 8);
    return true;
}

Error malformed(const char* field, uint64_t expected, uint64_t actual, const char* message) {
    return Error::validation(ValidationCode::MalformedAbi, field, expected, actual, message);
}

} // anonymous namespace

fheweb3::Bytes encode(const std::vector<Value>& values) {
    const size_t head_size = values.size() * WORD_SIZE;
    size_t tail_size = 0;
    for (const auto& v : values) {
        if (const auto* b = std::get_if<fheweb3::Bytes>(&v)) {
            tail_size += WORD_SIZE + paddedSize(b->size());
        }
    }

    fheweb3::Bytes out(head_size + tail_size, 0);
    size_t tail = head_size;
    for (size_t i = 0; i < values.size(); i++) {
        const size_t head = i * WORD_SIZE;
        if (const auto* word = std::get_if<Uint256>(&values[i])) {
            const Uint256::Word w = word->toWord();
            std::copy(w.begin(), w.end(), out.begin() + head);
            continue;
        }
        const auto& b = std::get<fheweb3::Bytes>(values[i]);
        putWord(out, head, tail);
        putWord(out, tail, b.size());
        std::copy(b.begin(), b.end(), out.begin() + tail + WORD_SIZE);
        tail += WORD_SIZE + paddedSize(b.size());
    }
    return out;
}

fheweb3::Bytes encodeCall(uint32_t selector, const std::vector<Value>& values) {
    fheweb3::Bytes out;
    be::append<uint32_t>(out, selector);
    const fheweb3::Bytes tuple = encode(values);
    out.insert(out.end(), tuple.begin(), tuple.end());
    return out;
}

Result<std::vector<Value>> decode(const uint8_t* data, size_t len,
                                  const std::vector<ParamType>& types) {
    const size_t head_size = types.size() * WORD_SIZE;
    if (len < head_size) {
        return malformed("head", head_size, len, "tuple head truncated");
    }

    std::vector<Value> values;
    values.reserve(types.size());
    for (size_t i = 0; i < types.size(); i++) {
        const uint8_t* head = data + i * WORD_SIZE;
        if (types[i] == ParamType::Uint256) {
            Uint256::Word w;
            std::copy(head, head + WORD_SIZE, w.begin());
            values.emplace_back(Uint256::fromWord(w));
            continue;
        }

        uint64_t offset = 0;
        if (!readSizeWord(head, &offset) || offset < head_size || offset % WORD_SIZE != 0 ||
            offset > len - WORD_SIZE) {
            return malformed("offset", head_size, offset, "bytes offset out of range");
        }
        uint64_t length = 0;
        if (!readSizeWord(data + offset, &length)) {
            return malformed("length", len, length, "bytes length wider than 64 bits");
        }
        const uint64_t start = offset + WORD_SIZE;
        if (length > len - start || paddedSize(length) > len - start) {
            return malformed("length", len - start, length, "bytes run past calldata");
        }
        values.emplace_back(fheweb3::Bytes(data + start, data + start + length));
    }
    return values;
}

Result<uint32_t> readSelector(const uint8_t* data, size_t len) {
    if (len < SELECTOR_SIZE) {
        return malformed("selector", SELECTOR_SIZE, len, "calldata shorter than a selector");
    }
    return be::load<uint32_t>(data);
}

} // namespace abi
} // namespace fheweb3
