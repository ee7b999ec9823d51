// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Value objects exchanged with the FHE precompiles

#include "types.h"

#include <algorithm>

#include "hex.h"

namespace fheweb3 {

const char* schemeName(SchemeId scheme) {
    switch (scheme) {
        case SchemeId::Bfv:    return "bfv";
        case SchemeId::BinFhe: return "binfhe";
    }
    return "unknown";
}

const char* objectKindName(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Ciphertext:       return "ciphertext";
        case ObjectKind::PublicParameters: return "public-parameters";
        case ObjectKind::PublicKey:        return "public-key";
        case ObjectKind::KeySwitchKey:     return "key-switch-key";
    }
    return "unknown";
}

bool isKnownObjectKind(uint8_t raw) {
    return raw >= static_cast<uint8_t>(ObjectKind::Ciphertext) &&
           raw <= static_cast<uint8_t>(ObjectKind::KeySwitchKey);
}

Result<Address> Address::fromHex(const std::string& text) {
    auto decoded = hex::decode(text);
    if (!decoded) {
        return decoded.error();
    }
    if (decoded.value().size() != SIZE) {
        return Error::invalidArgument("address must be 20 bytes: \"" + text + "\"");
    }
    Address addr;
    std::copy(decoded.value().begin(), decoded.value().end(), addr.bytes.begin());
    return addr;
}

std::string Address::toHex() const {
    return hex::encode(bytes.data(), bytes.size());
}

ObjectKind kindOf(const DecodedObject& object) {
    return std::visit([](const auto& o) { return o.kind(); }, object);
}

const BindingKey& bindingOf(const DecodedObject& object) {
    return std::visit([](const auto& o) -> const BindingKey& { return o.binding(); }, object);
}

} // namespace fheweb3
