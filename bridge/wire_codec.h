// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Wire Codec
//
// Deterministic encode/decode between ciphertext, parameter and key objects
// and the frame the FHE precompiles read and write:
//
//   offset  width  field
//   0       2      scheme_id        (big-endian)
//   2       2      param_set_id     (big-endian)
//   4       1      version
//   5       1      object kind
//   6       4      payload_length   (big-endian)
//   10      n      payload
//   10+n    t      integrity tag    (t = 0 or 32, fixed by the binding)
//
// Decoding is strict: the first violated rule fails the whole frame.

#ifndef FHEWEB3_WIRE_CODEC_H
#define FHEWEB3_WIRE_CODEC_H

#include <cstddef>
#include <cstdint>

#include "error.h"
#include "scheme_registry.h"
#include "types.h"

namespace fheweb3 {
namespace wire {

constexpr size_t HEADER_SIZE = 10;

constexpr uint8_t kMinWireVersion = 1;
constexpr uint8_t kMaxWireVersion = 1;

// Hard cap on payload_length, independent of any binding
constexpr uint32_t kMaxPayloadLength = 64u << 20;

struct Header {
    uint16_t scheme_id = 0;
    uint16_t param_set_id = 0;
    uint8_t version = 0;
    uint8_t kind = 0;
    uint32_t payload_length = 0;

    BindingKey key() const {
        return BindingKey{static_cast<SchemeId>(scheme_id), param_set_id};
    }
};

// Parses the fixed header; only fails with Truncated
Result<Header> readHeader(const uint8_t* data, size_t len);
void writeHeader(const Header& header, uint8_t* out);

// Allowed payload sizes for one object kind under one binding
struct PayloadRule {
    uint64_t min_length = 0;
    uint64_t max_length = 0;
    bool canonical = false;   // payload must equal canonicalParameters()

    bool exact() const { return min_length == max_length; }
    bool admits(uint64_t length) const {
        return length >= min_length && length <= max_length;
    }
};

PayloadRule payloadRule(const SchemeBinding& binding, ObjectKind kind);

// The single accepted parameter encoding for a binding
Bytes canonicalParameters(const SchemeBinding& binding);
PublicParameters parametersFor(const SchemeBinding& binding);

// LengthMismatch or NonCanonicalParameters
Status checkPayload(const SchemeBinding& binding, ObjectKind kind,
                    const uint8_t* payload, size_t len);

size_t frameSize(const SchemeBinding& binding, size_t payload_length);

// =============================================================================
// Encode
// =============================================================================

Result<Bytes> encode(const CiphertextHandle& handle, const SchemeBinding& binding);
Result<Bytes> encode(const PublicParameters& params, const SchemeBinding& binding);
Result<Bytes> encode(const KeyHandle& key, const SchemeBinding& binding);
Result<Bytes> encode(const DecodedObject& object, const SchemeBinding& binding);

// =============================================================================
// Decode
// =============================================================================

Result<DecodedObject> decode(const uint8_t* data, size_t len, const SchemeBinding& expected);
Result<DecodedObject> decode(const Bytes& bytes, const SchemeBinding& expected);

// Typed variants additionally fail with KindMismatch
Result<CiphertextHandle> decodeCiphertext(const Bytes& bytes, const SchemeBinding& expected);
Result<PublicParameters> decodeParameters(const Bytes& bytes, const SchemeBinding& expected);
Result<KeyHandle> decodeKey(const Bytes& bytes, const SchemeBinding& expected);

} // namespace wire
} // namespace fheweb3

#endif // FHEWEB3_WIRE_CODEC_H
