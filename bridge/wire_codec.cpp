// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Wire Codec implementation

#include "wire_codec.h"

#include <algorithm>
#include <cstring>

#include "byte_order.h"
#include "integrity_tag.h"

namespace fheweb3 {
namespace wire {

namespace {

constexpr uint64_t kWordBytes = 8;   // coefficients travel as u64

// BFV: degree u32 | plain u64 | polys u32 | count u32 | moduli u64...
constexpr uint64_t kBfvParamsFixed = 4 + 8 + 4 + 4;
// LWE: n u32 | N u32 | q u64 | ksk_base_log u32 | bsk_base_log u32
constexpr uint64_t kLweParamsSize = 4 + 4 + 8 + 4 + 4;

struct PayloadRuleVisitor {
    ObjectKind kind;

    PayloadRule operator()(const BfvLayout& l) const {
        const uint64_t deg = l.poly_degree;
        const uint64_t k = l.coeff_moduli.size();
        uint64_t size = 0;
        bool canonical = false;
        switch (kind) {
            case ObjectKind::Ciphertext:
                size = l.ciphertext_polys * deg * k * kWordBytes;
                break;
            case ObjectKind::PublicKey:
                size = 2 * deg * k * kWordBytes;
                break;
            case ObjectKind::KeySwitchKey:
                // one (b, a) pair per decomposition digit
                size = k * 2 * deg * k * kWordBytes;
                break;
            case ObjectKind::PublicParameters:
                size = kBfvParamsFixed + k * 8;
                canonical = true;
                break;
        }
        return PayloadRule{size, size, canonical};
    }

    PayloadRule operator()(const LweLayout& l) const {
        switch (kind) {
            case ObjectKind::Ciphertext: {
                // a[0..n) followed by b
                const uint64_t size = (static_cast<uint64_t>(l.lwe_dimension) + 1) * kWordBytes;
                return PayloadRule{size, size, false};
            }
            case ObjectKind::PublicParameters:
                return PayloadRule{kLweParamsSize, kLweParamsSize, true};
            case ObjectKind::PublicKey:
            case ObjectKind::KeySwitchKey:
                // OpenFHE key serializations have no fixed size
                return PayloadRule{1, l.max_key_bytes, false};
        }
        return PayloadRule{};
    }
};

struct CanonicalParametersVisitor {
    Bytes operator()(const BfvLayout& l) const {
        Bytes out;
        out.reserve(kBfvParamsFixed + l.coeff_moduli.size() * 8);
        be::append<uint32_t>(out, l.poly_degree);
        be::append<uint64_t>(out, l.plain_modulus);
        be::append<uint32_t>(out, l.ciphertext_polys);
        be::append<uint32_t>(out, static_cast<uint32_t>(l.coeff_moduli.size()));
        for (uint64_t q : l.coeff_moduli) {
            be::append<uint64_t>(out, q);
        }
        return out;
    }

    Bytes operator()(const LweLayout& l) const {
        Bytes out;
        out.reserve(kLweParamsSize);
        be::append<uint32_t>(out, l.lwe_dimension);
        be::append<uint32_t>(out, l.ring_dimension);
        be::append<uint64_t>(out, l.modulus);
        be::append<uint32_t>(out, l.ksk_base_log);
        be::append<uint32_t>(out, l.bsk_base_log);
        return out;
    }
};

Status checkIds(const BindingKey& actual, const SchemeBinding& binding) {
    if (actual.scheme != binding.key.scheme) {
        return Error::schemeMismatch("scheme_id",
                                     static_cast<uint64_t>(binding.key.scheme),
                                     static_cast<uint64_t>(actual.scheme));
    }
    if (actual.param_set != binding.key.param_set) {
        return Error::schemeMismatch("param_set_id", binding.key.param_set, actual.param_set);
    }
    return Status::ok();
}

Result<Bytes> encodeFrame(const BindingKey& ids, ObjectKind kind, const Bytes& payload,
                          const SchemeBinding& binding) {
    Status s = checkIds(ids, binding);
    if (!s) {
        return s.error();
    }
    if (payload.size() > kMaxPayloadLength) {
        return Error::validation(ValidationCode::Oversized, "payload_length",
                                 kMaxPayloadLength, payload.size());
    }
    s = checkPayload(binding, kind, payload.data(), payload.size());
    if (!s) {
        return s.error();
    }

    Header header;
    header.scheme_id = static_cast<uint16_t>(binding.key.scheme);
    header.param_set_id = binding.key.param_set;
    header.version = binding.encoding_version;
    header.kind = static_cast<uint8_t>(kind);
    header.payload_length = static_cast<uint32_t>(payload.size());

    Bytes out(HEADER_SIZE);
    out.reserve(frameSize(binding, payload.size()));
    writeHeader(header, out.data());
    out.insert(out.end(), payload.begin(), payload.end());

    auto tag = integrity::compute(binding.tag, out.data(), out.size());
    if (!tag) {
        return tag.error();
    }
    out.insert(out.end(), tag.value().begin(), tag.value().end());
    return out;
}

} // anonymous namespace

Result<Header> readHeader(const uint8_t* data, size_t len) {
    if (len < HEADER_SIZE) {
        return Error::validation(ValidationCode::Truncated, "header", HEADER_SIZE, len);
    }
    Header h;
    h.scheme_id = be::load<uint16_t>(data);
    h.param_set_id = be::load<uint16_t>(data + 2);
    h.version = data[4];
    h.kind = data[5];
    h.payload_length = be::load<uint32_t>(data + 6);
    return h;
}

void writeHeader(const Header& header, uint8_t* out) {
    be::store<uint16_t>(out, header.scheme_id);
    be::store<uint16_t>(out + 2, header.param_set_id);
    out[4] = header.version;
    out[5] = header.kind;
    be::store<uint32_t>(out + 6, header.payload_length);
}

PayloadRule payloadRule(const SchemeBinding& binding, ObjectKind kind) {
    return std::visit(PayloadRuleVisitor{kind}, binding.layout);
}

Bytes canonicalParameters(const SchemeBinding& binding) {
    return std::visit(CanonicalParametersVisitor{}, binding.layout);
}

PublicParameters parametersFor(const SchemeBinding& binding) {
    return PublicParameters(binding.key, canonicalParameters(binding));
}

Status checkPayload(const SchemeBinding& binding, ObjectKind kind,
                    const uint8_t* payload, size_t len) {
    const PayloadRule rule = payloadRule(binding, kind);
    if (!rule.admits(len)) {
        return Error::validation(ValidationCode::LengthMismatch, "payload_length",
                                 len < rule.min_length ? rule.min_length : rule.max_length, len,
                                 objectKindName(kind));
    }
    if (rule.canonical) {
        const Bytes canonical = canonicalParameters(binding);
        if (len != canonical.size() || !std::equal(canonical.begin(), canonical.end(), payload)) {
            size_t at = 0;
            if (len == canonical.size()) {
                at = static_cast<size_t>(
                    std::mismatch(canonical.begin(), canonical.end(), payload).first - canonical.begin());
            }
            return Error::validation(ValidationCode::NonCanonicalParameters, "payload_offset",
                                     canonical.size(), at,
                                     "parameters differ from the registered encoding");
        }
    }
    return Status::ok();
}

size_t frameSize(const SchemeBinding& binding, size_t payload_length) {
    return HEADER_SIZE + payload_length + integrity::tagSize(binding.tag);
}

// =============================================================================
// Encode
// =============================================================================

Result<Bytes> encode(const CiphertextHandle& handle, const SchemeBinding& binding) {
    return encodeFrame(handle.binding(), ObjectKind::Ciphertext, handle.payload(), binding);
}

Result<Bytes> encode(const PublicParameters& params, const SchemeBinding& binding) {
    return encodeFrame(params.binding(), ObjectKind::PublicParameters, params.payload(), binding);
}

Result<Bytes> encode(const KeyHandle& key, const SchemeBinding& binding) {
    return encodeFrame(key.binding(), key.kind(), key.payload(), binding);
}

Result<Bytes> encode(const DecodedObject& object, const SchemeBinding& binding) {
    return std::visit([&binding](const auto& o) { return encode(o, binding); }, object);
}

// =============================================================================
// Decode
// =============================================================================

Result<DecodedObject> decode(const uint8_t* data, size_t len, const SchemeBinding& expected) {
    auto parsed = readHeader(data, len);
    if (!parsed) {
        return parsed.error();
    }
    const Header& h = parsed.value();

    if (h.version != expected.encoding_version) {
        return Error::validation(ValidationCode::UnsupportedVersion, "version",
                                 expected.encoding_version, h.version);
    }
    if (!isKnownObjectKind(h.kind)) {
        return Error::validation(ValidationCode::UnknownKind, "kind", 0, h.kind);
    }
    Status s = checkIds(h.key(), expected);
    if (!s) {
        return s.error();
    }
    if (h.payload_length > kMaxPayloadLength) {
        return Error::validation(ValidationCode::Oversized, "payload_length",
                                 kMaxPayloadLength, h.payload_length);
    }

    const size_t frame = frameSize(expected, h.payload_length);
    if (len < HEADER_SIZE + h.payload_length) {
        return Error::validation(ValidationCode::PayloadOverrun, "payload_length",
                                 len - HEADER_SIZE, h.payload_length);
    }
    if (len < frame) {
        return Error::validation(ValidationCode::Truncated, "frame_length", frame, len);
    }
    if (len > frame) {
        return Error::validation(ValidationCode::TrailingBytes, "frame_length", frame, len);
    }

    const ObjectKind kind = static_cast<ObjectKind>(h.kind);
    const uint8_t* payload = data + HEADER_SIZE;
    s = checkPayload(expected, kind, payload, h.payload_length);
    if (!s) {
        return s.error();
    }

    const size_t tagged = HEADER_SIZE + h.payload_length;
    if (!integrity::verify(expected.tag, data, tagged, data + tagged, len - tagged)) {
        return Error::validation(ValidationCode::BadIntegrityTag, "integrity_tag",
                                 integrity::tagSize(expected.tag), len - tagged);
    }

    Bytes body(payload, payload + h.payload_length);
    switch (kind) {
        case ObjectKind::Ciphertext:
            return DecodedObject(CiphertextHandle(expected.key, std::move(body)));
        case ObjectKind::PublicParameters:
            return DecodedObject(PublicParameters(expected.key, std::move(body)));
        case ObjectKind::PublicKey:
            return DecodedObject(KeyHandle(KeyHandle::Type::Public, expected.key, std::move(body)));
        case ObjectKind::KeySwitchKey:
            return DecodedObject(KeyHandle(KeyHandle::Type::KeySwitch, expected.key, std::move(body)));
    }
    return Error::validation(ValidationCode::UnknownKind, "kind", 0, h.kind);
}

Result<DecodedObject> decode(const Bytes& bytes, const SchemeBinding& expected) {
    return decode(bytes.data(), bytes.size(), expected);
}

Result<CiphertextHandle> decodeCiphertext(const Bytes& bytes, const SchemeBinding& expected) {
    auto object = decode(bytes, expected);
    if (!object) {
        return object.error();
    }
    if (auto* ct = std::get_if<CiphertextHandle>(&object.value())) {
        return std::move(*ct);
    }
    return Error::validation(ValidationCode::KindMismatch, "kind",
                             static_cast<uint64_t>(ObjectKind::Ciphertext),
                             static_cast<uint64_t>(kindOf(object.value())));
}

Result<PublicParameters> decodeParameters(const Bytes& bytes, const SchemeBinding& expected) {
    auto object = decode(bytes, expected);
    if (!object) {
        return object.error();
    }
    if (auto* params = std::get_if<PublicParameters>(&object.value())) {
        return std::move(*params);
    }
    return Error::validation(ValidationCode::KindMismatch, "kind",
                             static_cast<uint64_t>(ObjectKind::PublicParameters),
                             static_cast<uint64_t>(kindOf(object.value())));
}

Result<KeyHandle> decodeKey(const Bytes& bytes, const SchemeBinding& expected) {
    auto object = decode(bytes, expected);
    if (!object) {
        return object.error();
    }
    if (auto* key = std::get_if<KeyHandle>(&object.value())) {
        return std::move(*key);
    }
    return Error::validation(ValidationCode::KindMismatch, "kind",
                             static_cast<uint64_t>(ObjectKind::PublicKey),
                             static_cast<uint64_t>(kindOf(object.value())));
}

} // namespace wire
} // namespace fheweb3
