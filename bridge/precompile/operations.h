// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// FHE precompile operation table
//
// One precompile address serves every operation; the first four calldata
// bytes carry the opcode big-endian, the remaining bytes the ABI-encoded
// operand tuple.

#ifndef FHEWEB3_PRECOMPILE_OPERATIONS_H
#define FHEWEB3_PRECOMPILE_OPERATIONS_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../error.h"
#include "../types.h"

namespace fheweb3 {
namespace precompile {

// Base address of the FHE precompile (0x...0100)
Address defaultAddress();

enum class Operation : uint32_t {
    Add               = 0x01,   // ct + ct
    Subtract          = 0x02,   // ct - ct
    Multiply          = 0x03,   // ct * ct
    AddPlain          = 0x04,   // ct + uint256
    SubtractPlain     = 0x05,   // ct - uint256
    MultiplyPlain     = 0x06,   // ct * uint256
    Negate            = 0x07,   // -ct
    KeySwitch         = 0x08,   // ct under key-switching key
    EncryptPlain      = 0x09,   // Enc(pk, uint256)
    NetworkParameters = 0x0a    // current network FHE parameters
};

enum class OperandType : uint8_t {
    Ciphertext = 1,
    PublicKey = 2,
    KeySwitchKey = 3,
    Uint256 = 4
};

const char* operandTypeName(OperandType type);

// Object kind an operand must carry in its wire header; Uint256 has none
bool operandObjectKind(OperandType type, ObjectKind* out);

struct OperationSpec {
    Operation operation;
    const char* name;
    std::vector<OperandType> operands;
    ObjectKind result;

    size_t arity() const { return operands.size(); }
    uint32_t selector() const { return static_cast<uint32_t>(operation); }
};

const OperationSpec& operationSpec(Operation operation);

// Every operation, ascending by selector
const std::vector<Operation>& allOperations();

Result<Operation> operationFromSelector(uint32_t selector);

} // namespace precompile
} // namespace fheweb3

#endif // FHEWEB3_PRECOMPILE_OPERATIONS_H
