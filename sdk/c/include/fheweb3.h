// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// fheweb3 C API - ciphertext transport for FHE precompiles
//
// Stable C ABI over the wire codec, validator and precompile adapter.
// Functions return FHEWEB3_OK or an error code; details of the last failure on
// the calling thread are available from fheweb3_last_error_message().
// Byte buffers returned through out-parameters are malloc'd and must be
// released with fheweb3_free_bytes().

#ifndef FHEWEB3_H
#define FHEWEB3_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define FHEWEB3_VERSION_MAJOR 1
#define FHEWEB3_VERSION_MINOR 0
#define FHEWEB3_VERSION_PATCH 0
#define FHEWEB3_VERSION_STRING "1.0.0"

#define FHEWEB3_WIRE_HEADER_SIZE 10
#define FHEWEB3_WORD_SIZE 32

// =============================================================================
// Error Codes
// =============================================================================

typedef enum {
    FHEWEB3_OK = 0,
    FHEWEB3_ERR_NULL_POINTER = -1,
    FHEWEB3_ERR_INVALID_PARAM = -2,
    FHEWEB3_ERR_UNKNOWN_BINDING = -3,
    FHEWEB3_ERR_VALIDATION = -4,
    FHEWEB3_ERR_SCHEME_MISMATCH = -5,
    FHEWEB3_ERR_ARITY = -6,
    FHEWEB3_ERR_PRECOMPILE_FAILURE = -7,
    FHEWEB3_ERR_IO = -8,
    FHEWEB3_ERR_ALLOCATION = -9,
} FheWeb3_Error;

// =============================================================================
// Wire Types
// =============================================================================

typedef enum {
    FHEWEB3_SCHEME_BFV = 1,
    FHEWEB3_SCHEME_BINFHE = 2,
} FheWeb3_Scheme;

typedef enum {
    FHEWEB3_KIND_CIPHERTEXT = 1,
    FHEWEB3_KIND_PUBLIC_PARAMETERS = 2,
    FHEWEB3_KIND_PUBLIC_KEY = 3,
    FHEWEB3_KIND_KEY_SWITCH_KEY = 4,
} FheWeb3_ObjectKind;

typedef struct {
    uint16_t scheme_id;
    uint16_t param_set_id;
    uint8_t version;
    uint8_t kind;
    uint32_t payload_length;
} FheWeb3_Header;

// Precompile operations (4-byte selectors)
typedef enum {
    FHEWEB3_OP_ADD = 0x01,
    FHEWEB3_OP_SUB = 0x02,
    FHEWEB3_OP_MUL = 0x03,
    FHEWEB3_OP_ADD_PLAIN = 0x04,
    FHEWEB3_OP_SUB_PLAIN = 0x05,
    FHEWEB3_OP_MUL_PLAIN = 0x06,
    FHEWEB3_OP_NEG = 0x07,
    FHEWEB3_OP_KEY_SWITCH = 0x08,
    FHEWEB3_OP_ENCRYPT_PLAIN = 0x09,
    FHEWEB3_OP_NETWORK_PARAMETERS = 0x0a,
} FheWeb3_Operation;

typedef enum {
    FHEWEB3_OPERAND_CIPHERTEXT = 1,
    FHEWEB3_OPERAND_PUBLIC_KEY = 2,
    FHEWEB3_OPERAND_KEY_SWITCH_KEY = 3,
    FHEWEB3_OPERAND_UINT256 = 4,
} FheWeb3_OperandType;

// Wire frame for objects, 32-byte big-endian word for FHEWEB3_OPERAND_UINT256
typedef struct {
    FheWeb3_OperandType type;
    const uint8_t* data;
    size_t len;
} FheWeb3_Operand;

// =============================================================================
// Opaque Handle Types
// =============================================================================

typedef struct FheWeb3_Registry_s* FheWeb3_Registry;

// =============================================================================
// Library Info and Errors
// =============================================================================

const char* fheweb3_version(void);
void fheweb3_version_info(int* major, int* minor, int* patch);

const char* fheweb3_error_string(FheWeb3_Error err);

// Last error on the calling thread
FheWeb3_Error fheweb3_last_error(void);
const char* fheweb3_last_error_message(void);
// Validation sub-code of the last error, 0 when not a validation error
int fheweb3_last_validation_code(void);
void fheweb3_clear_error(void);

// 0 off, 1 error, 2 warn, 3 info, 4 debug
void fheweb3_set_log_level(int level);

void fheweb3_free_bytes(uint8_t* data);

// =============================================================================
// Registry
// =============================================================================

// Registry holding the builtin binding table
FheWeb3_Error fheweb3_registry_builtin(FheWeb3_Registry* out);
void fheweb3_registry_free(FheWeb3_Registry registry);

size_t fheweb3_registry_size(FheWeb3_Registry registry);
bool fheweb3_registry_contains(FheWeb3_Registry registry, uint16_t scheme_id, uint16_t param_set_id);

// Canonical public-parameter payload of a binding
FheWeb3_Error fheweb3_registry_parameters(FheWeb3_Registry registry, uint16_t scheme_id,
                                          uint16_t param_set_id, uint8_t** out, size_t* out_len);

// =============================================================================
// Codec and Validator
// =============================================================================

// Frame a raw payload under a registered binding
FheWeb3_Error fheweb3_encode(FheWeb3_Registry registry, uint16_t scheme_id, uint16_t param_set_id,
                             FheWeb3_ObjectKind kind, const uint8_t* payload, size_t payload_len,
                             uint8_t** out, size_t* out_len);

// Validate and decode an untrusted frame that must carry the given binding
FheWeb3_Error fheweb3_decode(FheWeb3_Registry registry, uint16_t scheme_id, uint16_t param_set_id,
                             const uint8_t* data, size_t len, FheWeb3_ObjectKind* out_kind,
                             uint8_t** payload, size_t* payload_len);

// Structural validation only
FheWeb3_Error fheweb3_validate(FheWeb3_Registry registry, const uint8_t* data, size_t len,
                               FheWeb3_Header* out_header);

// =============================================================================
// Precompile Calls
// =============================================================================

// Precompile address (20 bytes) for the default configuration
void fheweb3_precompile_address(uint8_t out[20]);

FheWeb3_Error fheweb3_build_calldata(FheWeb3_Registry registry, FheWeb3_Operation operation,
                                     const FheWeb3_Operand* operands, size_t num_operands,
                                     uint8_t** out, size_t* out_len);

// Parses a precompile response. On FHEWEB3_ERR_PRECOMPILE_FAILURE, *out_status
// holds the precompile status and *payload the diagnostic bytes.
FheWeb3_Error fheweb3_parse_result(FheWeb3_Registry registry, uint16_t scheme_id,
                                   uint16_t param_set_id, const uint8_t* raw, size_t len,
                                   uint8_t* out_status, FheWeb3_ObjectKind* out_kind,
                                   uint8_t** payload, size_t* payload_len);

// =============================================================================
// Values
// =============================================================================

// "1ether", "1.5 gwei", "100", "0x2a" -> 32-byte big-endian wei
FheWeb3_Error fheweb3_parse_ether(const char* text, uint8_t out_word[32]);

#ifdef __cplusplus
}
#endif

#endif // FHEWEB3_H
