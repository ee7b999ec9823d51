// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Value objects exchanged with the FHE precompiles
//
// CiphertextHandle, PublicParameters and KeyHandle are immutable once
// constructed: the payload and identifiers are fixed by the constructor and
// there are no mutators. Copies are independent.

#ifndef FHEWEB3_TYPES_H
#define FHEWEB3_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "error.h"

namespace fheweb3 {

using Bytes = std::vector<uint8_t>;
using ParamSetId = uint16_t;

// Scheme identifiers as they appear on the wire
enum class SchemeId : uint16_t {
    Bfv = 0x0001,     // BFV over RNS moduli
    BinFhe = 0x0002   // LWE/TFHE (OpenFHE BinFHE)
};

const char* schemeName(SchemeId scheme);

// Object tag carried in every wire header
enum class ObjectKind : uint8_t {
    Ciphertext = 0x01,
    PublicParameters = 0x02,
    PublicKey = 0x03,
    KeySwitchKey = 0x04
};

const char* objectKindName(ObjectKind kind);
bool isKnownObjectKind(uint8_t raw);

// Composite registry key
struct BindingKey {
    SchemeId scheme = SchemeId::Bfv;
    ParamSetId param_set = 0;

    bool operator==(const BindingKey& other) const {
        return scheme == other.scheme && param_set == other.param_set;
    }
    bool operator!=(const BindingKey& other) const { return !(*this == other); }

    // Packed (scheme << 16 | param_set), used for hashing and diagnostics
    uint32_t packed() const {
        return (static_cast<uint32_t>(scheme) << 16) | param_set;
    }
};

struct BindingKeyHash {
    size_t operator()(const BindingKey& key) const {
        return std::hash<uint32_t>()(key.packed());
    }
};

// 20-byte EVM account address
struct Address {
    static constexpr size_t SIZE = 20;
    std::array<uint8_t, SIZE> bytes{};

    static Result<Address> fromHex(const std::string& text);
    std::string toHex() const;

    bool operator==(const Address& other) const { return bytes == other.bytes; }
    bool operator!=(const Address& other) const { return !(*this == other); }
};

// =============================================================================
// CiphertextHandle
// =============================================================================

class CiphertextHandle {
public:
    CiphertextHandle(SchemeId scheme, ParamSetId param_set, Bytes payload)
        : key_{scheme, param_set}, payload_(std::move(payload)) {}
    CiphertextHandle(BindingKey key, Bytes payload)
        : key_(key), payload_(std::move(payload)) {}

    SchemeId scheme() const { return key_.scheme; }
    ParamSetId paramSet() const { return key_.param_set; }
    const BindingKey& binding() const { return key_; }
    const Bytes& payload() const { return payload_; }

    static constexpr ObjectKind kind() { return ObjectKind::Ciphertext; }

    bool operator==(const CiphertextHandle& other) const {
        return key_ == other.key_ && payload_ == other.payload_;
    }
    bool operator!=(const CiphertextHandle& other) const { return !(*this == other); }

private:
    BindingKey key_;
    Bytes payload_;
};

// =============================================================================
// PublicParameters
// =============================================================================

class PublicParameters {
public:
    PublicParameters(SchemeId scheme, ParamSetId param_set, Bytes payload)
        : key_{scheme, param_set}, payload_(std::move(payload)) {}
    PublicParameters(BindingKey key, Bytes payload)
        : key_(key), payload_(std::move(payload)) {}

    SchemeId scheme() const { return key_.scheme; }
    ParamSetId paramSet() const { return key_.param_set; }
    const BindingKey& binding() const { return key_; }
    const Bytes& payload() const { return payload_; }

    static constexpr ObjectKind kind() { return ObjectKind::PublicParameters; }

    bool operator==(const PublicParameters& other) const {
        return key_ == other.key_ && payload_ == other.payload_;
    }
    bool operator!=(const PublicParameters& other) const { return !(*this == other); }

private:
    BindingKey key_;
    Bytes payload_;
};

// =============================================================================
// KeyHandle - public key or key-switching key operand
// =============================================================================

class KeyHandle {
public:
    enum class Type : uint8_t {
        Public = static_cast<uint8_t>(ObjectKind::PublicKey),
        KeySwitch = static_cast<uint8_t>(ObjectKind::KeySwitchKey)
    };

    KeyHandle(Type type, BindingKey key, Bytes payload)
        : type_(type), key_(key), payload_(std::move(payload)) {}

    Type type() const { return type_; }
    SchemeId scheme() const { return key_.scheme; }
    ParamSetId paramSet() const { return key_.param_set; }
    const BindingKey& binding() const { return key_; }
    const Bytes& payload() const { return payload_; }

    ObjectKind kind() const { return static_cast<ObjectKind>(type_); }

    bool operator==(const KeyHandle& other) const {
        return type_ == other.type_ && key_ == other.key_ && payload_ == other.payload_;
    }
    bool operator!=(const KeyHandle& other) const { return !(*this == other); }

private:
    Type type_;
    BindingKey key_;
    Bytes payload_;
};

// Any object the codec can decode
using DecodedObject = std::variant<CiphertextHandle, PublicParameters, KeyHandle>;

ObjectKind kindOf(const DecodedObject& object);
const BindingKey& bindingOf(const DecodedObject& object);

} // namespace fheweb3

#endif // FHEWEB3_TYPES_H
