// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// C ABI implementation over the transport layer

#include "fheweb3.h"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <variant>
#include <vector>

#include "error.h"
#include "log.h"
#include "precompile/precompile_adapter.h"
#include "scheme_registry.h"
#include "uint256.h"
#include "validator.h"
#include "wire_codec.h"

using namespace fheweb3;

// =============================================================================
// Thread-local error handling
// =============================================================================

static thread_local FheWeb3_Error g_last_error = FHEWEB3_OK;
static thread_local int g_last_validation_code = 0;
static thread_local char g_error_message[256] = "";

static void set_error(FheWeb3_Error err, const char* msg = nullptr) {
    g_last_error = err;
    g_last_validation_code = 0;
    if (msg) {
        strncpy(g_error_message, msg, sizeof(g_error_message) - 1);
        g_error_message[sizeof(g_error_message) - 1] = '\0';
    } else {
        g_error_message[0] = '\0';
    }
}

static FheWeb3_Error map_kind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownBinding:    return FHEWEB3_ERR_UNKNOWN_BINDING;
        case ErrorKind::Validation:        return FHEWEB3_ERR_VALIDATION;
        case ErrorKind::SchemeMismatch:    return FHEWEB3_ERR_SCHEME_MISMATCH;
        case ErrorKind::Arity:             return FHEWEB3_ERR_ARITY;
        case ErrorKind::PrecompileFailure: return FHEWEB3_ERR_PRECOMPILE_FAILURE;
        case ErrorKind::InvalidArgument:   return FHEWEB3_ERR_INVALID_PARAM;
        case ErrorKind::Io:                return FHEWEB3_ERR_IO;
    }
    return FHEWEB3_ERR_INVALID_PARAM;
}

static FheWeb3_Error set_error(const Error& error) {
    const FheWeb3_Error code = map_kind(error.kind);
    set_error(code, error.toString().c_str());
    g_last_validation_code = static_cast<int>(error.code);
    return code;
}

static FheWeb3_Error ok() {
    g_last_error = FHEWEB3_OK;
    g_last_validation_code = 0;
    g_error_message[0] = '\0';
    return FHEWEB3_OK;
}

// Exceptions never cross the C boundary
static FheWeb3_Error set_alloc_error() {
    set_error(FHEWEB3_ERR_ALLOCATION, "out of memory");
    return FHEWEB3_ERR_ALLOCATION;
}

static FheWeb3_Error set_exception_error(const std::exception& e) {
    set_error(FHEWEB3_ERR_INVALID_PARAM, e.what());
    return FHEWEB3_ERR_INVALID_PARAM;
}

// Copies into a malloc'd buffer owned by the caller
static FheWeb3_Error copy_out(const Bytes& data, uint8_t** out, size_t* out_len) {
    *out_len = data.size();
    *out = nullptr;
    if (data.empty()) {
        return ok();
    }
    *out = static_cast<uint8_t*>(malloc(data.size()));
    if (!*out) {
        *out_len = 0;
        set_error(FHEWEB3_ERR_ALLOCATION, "out of memory");
        return FHEWEB3_ERR_ALLOCATION;
    }
    std::memcpy(*out, data.data(), data.size());
    return ok();
}

// =============================================================================
// Internal wrapper types
// =============================================================================

struct FheWeb3_Registry_s {
    std::shared_ptr<const SchemeRegistry> registry;
    Validator validator;
    precompile::PrecompileAdapter adapter;

    explicit FheWeb3_Registry_s(std::shared_ptr<const SchemeRegistry> r)
        : registry(r), validator(r), adapter(r) {}
};

static Result<const SchemeBinding*> resolve(FheWeb3_Registry reg, uint16_t scheme_id,
                                            uint16_t param_set_id) {
    return reg->registry->resolve(static_cast<SchemeId>(scheme_id), param_set_id);
}

static Result<Bytes> encode_payload(ObjectKind kind, Bytes body, const SchemeBinding& binding) {
    switch (kind) {
        case ObjectKind::Ciphertext:
            return wire::encode(CiphertextHandle(binding.key, std::move(body)), binding);
        case ObjectKind::PublicParameters:
            return wire::encode(PublicParameters(binding.key, std::move(body)), binding);
        case ObjectKind::PublicKey:
            return wire::encode(KeyHandle(KeyHandle::Type::Public, binding.key, std::move(body)),
                                binding);
        case ObjectKind::KeySwitchKey:
            return wire::encode(KeyHandle(KeyHandle::Type::KeySwitch, binding.key, std::move(body)),
                                binding);
    }
    return Error::invalidArgument("unknown object kind");
}

// =============================================================================
// Library Info and Errors
// =============================================================================

extern "C" const char* fheweb3_version(void) {
    return FHEWEB3_VERSION_STRING;
}

extern "C" void fheweb3_version_info(int* major, int* minor, int* patch) {
    if (major) *major = FHEWEB3_VERSION_MAJOR;
    if (minor) *minor = FHEWEB3_VERSION_MINOR;
    if (patch) *patch = FHEWEB3_VERSION_PATCH;
}

extern "C" const char* fheweb3_error_string(FheWeb3_Error err) {
    switch (err) {
        case FHEWEB3_OK: return "Success";
        case FHEWEB3_ERR_NULL_POINTER: return "Null pointer";
        case FHEWEB3_ERR_INVALID_PARAM: return "Invalid parameter";
        case FHEWEB3_ERR_UNKNOWN_BINDING: return "Unknown scheme binding";
        case FHEWEB3_ERR_VALIDATION: return "Validation failed";
        case FHEWEB3_ERR_SCHEME_MISMATCH: return "Scheme mismatch";
        case FHEWEB3_ERR_ARITY: return "Operand arity mismatch";
        case FHEWEB3_ERR_PRECOMPILE_FAILURE: return "Precompile reported failure";
        case FHEWEB3_ERR_IO: return "I/O error";
        case FHEWEB3_ERR_ALLOCATION: return "Allocation failed";
        default: return "Unknown error";
    }
}

extern "C" FheWeb3_Error fheweb3_last_error(void) {
    return g_last_error;
}

extern "C" const char* fheweb3_last_error_message(void) {
    return g_error_message;
}

extern "C" int fheweb3_last_validation_code(void) {
    return g_last_validation_code;
}

extern "C" void fheweb3_clear_error(void) {
    ok();
}

extern "C" void fheweb3_set_log_level(int level) {
    if (level < static_cast<int>(log::Level::Off)) level = static_cast<int>(log::Level::Off);
    if (level > static_cast<int>(log::Level::Debug)) level = static_cast<int>(log::Level::Debug);
    log::setLevel(static_cast<log::Level>(level));
}

extern "C" void fheweb3_free_bytes(uint8_t* data) {
    free(data);
}

// =============================================================================
// Registry
// =============================================================================

extern "C" FheWeb3_Error fheweb3_registry_builtin(FheWeb3_Registry* out) {
    if (!out) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    *out = nullptr;
    try {
        *out = new FheWeb3_Registry_s(SchemeRegistry::builtin());
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
    return ok();
}

extern "C" void fheweb3_registry_free(FheWeb3_Registry registry) {
    delete registry;
}

extern "C" size_t fheweb3_registry_size(FheWeb3_Registry registry) {
    return registry ? registry->registry->size() : 0;
}

extern "C" bool fheweb3_registry_contains(FheWeb3_Registry registry, uint16_t scheme_id,
                                          uint16_t param_set_id) {
    if (!registry) {
        return false;
    }
    try {
        return resolve(registry, scheme_id, param_set_id).isOk();
    } catch (const std::exception& e) {
        set_exception_error(e);
        return false;
    }
}

extern "C" FheWeb3_Error fheweb3_registry_parameters(FheWeb3_Registry registry, uint16_t scheme_id,
                                                     uint16_t param_set_id, uint8_t** out,
                                                     size_t* out_len) {
    if (!registry || !out || !out_len) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        auto binding = resolve(registry, scheme_id, param_set_id);
        if (!binding) {
            return set_error(binding.error());
        }
        return copy_out(wire::canonicalParameters(*binding.value()), out, out_len);
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}

// =============================================================================
// Codec and Validator
// =============================================================================

extern "C" FheWeb3_Error fheweb3_encode(FheWeb3_Registry registry, uint16_t scheme_id,
                                        uint16_t param_set_id, FheWeb3_ObjectKind kind,
                                        const uint8_t* payload, size_t payload_len,
                                        uint8_t** out, size_t* out_len) {
    if (!registry || !out || !out_len || (!payload && payload_len > 0)) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        if (!isKnownObjectKind(static_cast<uint8_t>(kind))) {
            set_error(FHEWEB3_ERR_INVALID_PARAM, "unknown object kind");
            return FHEWEB3_ERR_INVALID_PARAM;
        }
        auto binding = resolve(registry, scheme_id, param_set_id);
        if (!binding) {
            return set_error(binding.error());
        }

        Result<Bytes> frame = encode_payload(static_cast<ObjectKind>(kind),
                                             Bytes(payload, payload + payload_len),
                                             *binding.value());
        if (!frame) {
            return set_error(frame.error());
        }
        return copy_out(frame.value(), out, out_len);
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}

extern "C" FheWeb3_Error fheweb3_decode(FheWeb3_Registry registry, uint16_t scheme_id,
                                        uint16_t param_set_id, const uint8_t* data, size_t len,
                                        FheWeb3_ObjectKind* out_kind, uint8_t** payload,
                                        size_t* payload_len) {
    if (!registry || !data || !out_kind || !payload || !payload_len) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        auto expected = resolve(registry, scheme_id, param_set_id);
        if (!expected) {
            return set_error(expected.error());
        }
        auto validated = registry->validator.validateInbound(data, len);
        if (!validated) {
            return set_error(validated.error());
        }
        auto object = wire::decode(validated.value().bytes, *expected.value());
        if (!object) {
            return set_error(object.error());
        }
        *out_kind = static_cast<FheWeb3_ObjectKind>(kindOf(object.value()));
        const Bytes& body = std::visit([](const auto& o) -> const Bytes& { return o.payload(); },
                                       object.value());
        return copy_out(body, payload, payload_len);
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}

extern "C" FheWeb3_Error fheweb3_validate(FheWeb3_Registry registry, const uint8_t* data,
                                          size_t len, FheWeb3_Header* out_header) {
    if (!registry || (!data && len > 0)) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        static const uint8_t kEmpty = 0;
        auto validated = registry->validator.validateInbound(data ? data : &kEmpty, len);
        if (!validated) {
            return set_error(validated.error());
        }
        if (out_header) {
            const wire::Header& h = validated.value().header;
            out_header->scheme_id = h.scheme_id;
            out_header->param_set_id = h.param_set_id;
            out_header->version = h.version;
            out_header->kind = h.kind;
            out_header->payload_length = h.payload_length;
        }
        return ok();
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}

// =============================================================================
// Precompile Calls
// =============================================================================

extern "C" void fheweb3_precompile_address(uint8_t out[20]) {
    if (!out) return;
    const Address addr = precompile::defaultAddress();
    std::memcpy(out, addr.bytes.data(), Address::SIZE);
}

extern "C" FheWeb3_Error fheweb3_build_calldata(FheWeb3_Registry registry,
                                                FheWeb3_Operation operation,
                                                const FheWeb3_Operand* operands,
                                                size_t num_operands, uint8_t** out,
                                                size_t* out_len) {
    if (!registry || !out || !out_len || (!operands && num_operands > 0)) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        auto op = precompile::operationFromSelector(static_cast<uint32_t>(operation));
        if (!op) {
            return set_error(op.error());
        }

        std::vector<precompile::Operand> list;
        list.reserve(num_operands);
        for (size_t i = 0; i < num_operands; i++) {
            if (!operands[i].data && operands[i].len > 0) {
                set_error(FHEWEB3_ERR_NULL_POINTER, "operand data is null");
                return FHEWEB3_ERR_NULL_POINTER;
            }
            const uint8_t* begin = operands[i].data;
            list.push_back(precompile::frameOperand(
                static_cast<precompile::OperandType>(operands[i].type),
                begin ? Bytes(begin, begin + operands[i].len) : Bytes()));
        }

        auto call = registry->adapter.buildCall(op.value(), std::move(list));
        if (!call) {
            return set_error(call.error());
        }
        return copy_out(call.value().calldata(), out, out_len);
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}

extern "C" FheWeb3_Error fheweb3_parse_result(FheWeb3_Registry registry, uint16_t scheme_id,
                                              uint16_t param_set_id, const uint8_t* raw,
                                              size_t len, uint8_t* out_status,
                                              FheWeb3_ObjectKind* out_kind, uint8_t** payload,
                                              size_t* payload_len) {
    if (!registry || (!raw && len > 0) || !out_status || !out_kind || !payload || !payload_len) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        *payload = nullptr;
        *payload_len = 0;
        *out_status = 0;

        auto expected = resolve(registry, scheme_id, param_set_id);
        if (!expected) {
            return set_error(expected.error());
        }

        const Bytes bytes = raw ? Bytes(raw, raw + len) : Bytes();
        const precompile::PrecompileResult result =
            registry->adapter.parseResult(bytes, *expected.value());
        if (!result.isSuccess()) {
            const precompile::PrecompileFailure& failure = result.failure();
            if (failure.status) {
                *out_status = *failure.status;
                FheWeb3_Error copied = copy_out(failure.diagnostics, payload, payload_len);
                if (copied != FHEWEB3_OK) {
                    return copied;
                }
            }
            return set_error(failure.error);
        }

        const DecodedObject& object = result.success().object;
        *out_kind = static_cast<FheWeb3_ObjectKind>(kindOf(object));
        const Bytes& body = std::visit([](const auto& o) -> const Bytes& { return o.payload(); },
                                       object);
        return copy_out(body, payload, payload_len);
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}

// =============================================================================
// Values
// =============================================================================

extern "C" FheWeb3_Error fheweb3_parse_ether(const char* text, uint8_t out_word[32]) {
    if (!text || !out_word) {
        set_error(FHEWEB3_ERR_NULL_POINTER);
        return FHEWEB3_ERR_NULL_POINTER;
    }
    try {
        auto value = parseEtherValue(text);
        if (!value) {
            return set_error(value.error());
        }
        const Uint256::Word word = value.value().toWord();
        std::memcpy(out_word, word.data(), word.size());
        return ok();
    } catch (const std::bad_alloc&) {
        return set_alloc_error();
    } catch (const std::exception& e) {
        return set_exception_error(e);
    }
}
