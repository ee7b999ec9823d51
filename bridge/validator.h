// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Validator
//
// Structural checks on untrusted inbound frames (chain state, precompile
// output, files) before any decoding happens. Checks run in a fixed order and
// the first failure rejects the whole input; nothing is partially decoded.

#ifndef FHEWEB3_VALIDATOR_H
#define FHEWEB3_VALIDATOR_H

#include <cstddef>
#include <cstdint>
#include <memory>

#include "error.h"
#include "scheme_registry.h"
#include "types.h"
#include "wire_codec.h"

namespace fheweb3 {

// A frame that passed every structural check. The binding is owned by the
// registry the Validator was built with.
struct ValidatedBytes {
    wire::Header header;
    const SchemeBinding* binding = nullptr;
    Bytes bytes;

    ObjectKind kind() const { return static_cast<ObjectKind>(header.kind); }
};

class Validator {
public:
    struct Config {
        uint32_t max_payload_length = wire::kMaxPayloadLength;
        uint8_t min_version = wire::kMinWireVersion;
        uint8_t max_version = wire::kMaxWireVersion;
    };

    explicit Validator(std::shared_ptr<const SchemeRegistry> registry);
    Validator(std::shared_ptr<const SchemeRegistry> registry, Config config);

    Result<ValidatedBytes> validateInbound(const uint8_t* data, size_t len) const;
    Result<ValidatedBytes> validateInbound(const Bytes& bytes) const;

    const SchemeRegistry& registry() const { return *registry_; }
    const Config& config() const { return config_; }

private:
    Result<ValidatedBytes> check(const uint8_t* data, size_t len) const;

    std::shared_ptr<const SchemeRegistry> registry_;
    Config config_;
};

} // namespace fheweb3

#endif // FHEWEB3_VALIDATOR_H
