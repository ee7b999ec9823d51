// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Error taxonomy for the ciphertext transport layer
//
// Every boundary-crossing function returns Status or Result<T>. Errors carry
// enough structure (field, expected, actual) to be logged without re-parsing
// the rejected bytes.

#ifndef FHEWEB3_ERROR_H
#define FHEWEB3_ERROR_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace fheweb3 {

enum class ErrorKind : uint8_t {
    UnknownBinding = 1,     // scheme/parameter-set pair not registered
    Validation = 2,         // malformed untrusted bytes
    SchemeMismatch = 3,     // object bound to a different scheme/parameter set
    Arity = 4,              // precompile operand count or type mismatch
    PrecompileFailure = 5,  // precompile answered with a non-zero status
    InvalidArgument = 6,    // API misuse or bad configuration
    Io = 7                  // filesystem failure
};

enum class ValidationCode : uint8_t {
    None = 0,
    Truncated,
    PayloadOverrun,
    TrailingBytes,
    Oversized,
    UnsupportedVersion,
    UnknownKind,
    KindMismatch,
    LengthMismatch,
    BadIntegrityTag,
    NonCanonicalParameters,
    MalformedAbi,
    CoefficientOutOfRange
};

const char* errorKindName(ErrorKind kind);
const char* validationCodeName(ValidationCode code);

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    ValidationCode code = ValidationCode::None;
    std::string field;
    uint64_t expected = 0;
    uint64_t actual = 0;
    std::string message;

    // "Validation/LengthMismatch: payload_length expected 136 got 128 (...)"
    std::string toString() const;

    static Error validation(ValidationCode code, std::string field,
                            uint64_t expected, uint64_t actual,
                            std::string message = {});
    static Error unknownBinding(uint16_t scheme_id, uint16_t param_set_id);
    static Error schemeMismatch(std::string field, uint64_t expected, uint64_t actual);
    static Error arity(std::string field, uint64_t expected, uint64_t actual,
                       std::string message = {});
    static Error invalidArgument(std::string message);
    static Error io(std::string path, std::string message);
};

class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}  // NOLINT: implicit by intent

    static Status ok() { return Status(); }

    bool isOk() const { return !error_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

template <typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}     // NOLINT
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}  // NOLINT

    bool isOk() const { return state_.index() == 0; }
    explicit operator bool() const { return isOk(); }

    T& value() & { return std::get<0>(state_); }
    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    const Error& error() const { return std::get<1>(state_); }

    Status status() const {
        return isOk() ? Status() : Status(error());
    }

private:
    std::variant<T, Error> state_;
};

} // namespace fheweb3

#endif // FHEWEB3_ERROR_H
