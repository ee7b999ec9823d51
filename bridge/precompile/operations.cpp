// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// FHE precompile operation table

#include "operations.h"

#include <string>

namespace fheweb3 {
namespace precompile {

namespace {

using T = OperandType;

const std::vector<OperationSpec>& table() {
    static const std::vector<OperationSpec> specs = {
        {Operation::Add,               "add",                {T::Ciphertext, T::Ciphertext},   ObjectKind::Ciphertext},
        {Operation::Subtract,          "subtract",           {T::Ciphertext, T::Ciphertext},   ObjectKind::Ciphertext},
        {Operation::Multiply,          "multiply",           {T::Ciphertext, T::Ciphertext},   ObjectKind::Ciphertext},
        {Operation::AddPlain,          "add_plain",          {T::Ciphertext, T::Uint256},      ObjectKind::Ciphertext},
        {Operation::SubtractPlain,     "subtract_plain",     {T::Ciphertext, T::Uint256},      ObjectKind::Ciphertext},
        {Operation::MultiplyPlain,     "multiply_plain",     {T::Ciphertext, T::Uint256},      ObjectKind::Ciphertext},
        {Operation::Negate,            "negate",             {T::Ciphertext},                  ObjectKind::Ciphertext},
        {Operation::KeySwitch,         "key_switch",         {T::Ciphertext, T::KeySwitchKey}, ObjectKind::Ciphertext},
        {Operation::EncryptPlain,      "encrypt_plain",      {T::PublicKey, T::Uint256},       ObjectKind::Ciphertext},
        {Operation::NetworkParameters, "network_parameters", {},                               ObjectKind::PublicParameters},
    };
    return specs;
}

} // anonymous namespace

Address defaultAddress() {
    Address addr;
    addr.bytes[Address::SIZE - 2] = 0x01;
    addr.bytes[Address::SIZE - 1] = 0x00;
    return addr;
}

const char* operandTypeName(OperandType type) {
    switch (type) {
        case OperandType::Ciphertext:   return "ciphertext";
        case OperandType::PublicKey:    return "public-key";
        case OperandType::KeySwitchKey: return "key-switch-key";
        case OperandType::Uint256:      return "uint256";
    }
    return "unknown";
}

bool operandObjectKind(OperandType type, ObjectKind* out) {
    switch (type) {
        case OperandType::Ciphertext:   *out = ObjectKind::Ciphertext; return true;
        case OperandType::PublicKey:    *out = ObjectKind::PublicKey; return true;
        case OperandType::KeySwitchKey: *out = ObjectKind::KeySwitchKey; return true;
        case OperandType::Uint256:      return false;
    }
    return false;
}

const OperationSpec& operationSpec(Operation operation) {
    // table() is ordered by selector starting at 0x01
    return table().at(static_cast<size_t>(operation) - 1);
}

const std::vector<Operation>& allOperations() {
    static const std::vector<Operation> ops = [] {
        std::vector<Operation> out;
        for (const auto& spec : table()) {
            out.push_back(spec.operation);
        }
        return out;
    }();
    return ops;
}

Result<Operation> operationFromSelector(uint32_t selector) {
    for (const auto& spec : table()) {
        if (spec.selector() == selector) {
            return spec.operation;
        }
    }
    return Error::invalidArgument("unknown precompile selector " + std::to_string(selector));
}

} // namespace precompile
} // namespace fheweb3
