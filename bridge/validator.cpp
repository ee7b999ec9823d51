// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Validator implementation

#include "validator.h"

#include <stdexcept>

#include "integrity_tag.h"
#include "log.h"

namespace fheweb3 {

Validator::Validator(std::shared_ptr<const SchemeRegistry> registry)
    : Validator(std::move(registry), Config()) {}

Validator::Validator(std::shared_ptr<const SchemeRegistry> registry, Config config)
    : registry_(std::move(registry)), config_(config) {
    if (!registry_) {
        throw std::invalid_argument("Validator requires a registry");
    }
    if (config_.max_payload_length > wire::kMaxPayloadLength) {
        throw std::invalid_argument("max_payload_length exceeds the wire limit");
    }
    if (config_.min_version == 0 || config_.min_version > config_.max_version) {
        throw std::invalid_argument("invalid supported version range");
    }
}

Result<ValidatedBytes> Validator::validateInbound(const Bytes& bytes) const {
    return validateInbound(bytes.data(), bytes.size());
}

Result<ValidatedBytes> Validator::validateInbound(const uint8_t* data, size_t len) const {
    auto result = check(data, len);
    if (!result) {
        log::Line(log::Level::Debug, "validator") << "rejected " << len
                                                  << " bytes: " << result.error().toString();
    }
    return result;
}

Result<ValidatedBytes> Validator::check(const uint8_t* data, size_t len) const {
    // 1. header present
    auto parsed = wire::readHeader(data, len);
    if (!parsed) {
        return parsed.error();
    }
    const wire::Header h = parsed.value();

    // 2. declared length bounded and backed by the buffer
    if (h.payload_length > config_.max_payload_length) {
        return Error::validation(ValidationCode::Oversized, "payload_length",
                                 config_.max_payload_length, h.payload_length);
    }
    if (h.payload_length > len - wire::HEADER_SIZE) {
        return Error::validation(ValidationCode::PayloadOverrun, "payload_length",
                                 len - wire::HEADER_SIZE, h.payload_length);
    }

    // 3. version in range
    if (h.version < config_.min_version || h.version > config_.max_version) {
        return Error::validation(ValidationCode::UnsupportedVersion, "version",
                                 config_.max_version, h.version);
    }

    // 4. object kind
    if (!isKnownObjectKind(h.kind)) {
        return Error::validation(ValidationCode::UnknownKind, "kind", 0, h.kind);
    }

    // 5. registered binding
    auto resolved = registry_->resolve(h.key());
    if (!resolved) {
        return resolved.error();
    }
    const SchemeBinding* binding = resolved.value();
    if (h.version != binding->encoding_version) {
        return Error::validation(ValidationCode::UnsupportedVersion, "version",
                                 binding->encoding_version, h.version);
    }

    // 6. exact frame for the binding's tag
    const size_t frame = wire::frameSize(*binding, h.payload_length);
    if (len < frame) {
        return Error::validation(ValidationCode::Truncated, "frame_length", frame, len);
    }
    if (len > frame) {
        return Error::validation(ValidationCode::TrailingBytes, "frame_length", frame, len);
    }

    // 7. payload length for the kind
    const ObjectKind kind = static_cast<ObjectKind>(h.kind);
    const wire::PayloadRule rule = wire::payloadRule(*binding, kind);
    if (!rule.admits(h.payload_length)) {
        return Error::validation(ValidationCode::LengthMismatch, "payload_length",
                                 h.payload_length < rule.min_length ? rule.min_length
                                                                    : rule.max_length,
                                 h.payload_length, objectKindName(kind));
    }

    // 8. integrity tag, constant-time comparison
    const size_t tagged = wire::HEADER_SIZE + h.payload_length;
    if (!integrity::verify(binding->tag, data, tagged, data + tagged, len - tagged)) {
        return Error::validation(ValidationCode::BadIntegrityTag, "integrity_tag",
                                 integrity::tagSize(binding->tag), len - tagged);
    }

    ValidatedBytes out;
    out.header = h;
    out.binding = binding;
    out.bytes.assign(data, data + len);
    return out;
}

} // namespace fheweb3
