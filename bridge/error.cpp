// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Error taxonomy implementation

#include "error.h"

#include <sstream>

namespace fheweb3 {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownBinding:    return "UnknownBinding";
        case ErrorKind::Validation:        return "Validation";
        case ErrorKind::SchemeMismatch:    return "SchemeMismatch";
        case ErrorKind::Arity:             return "Arity";
        case ErrorKind::PrecompileFailure: return "PrecompileFailure";
        case ErrorKind::InvalidArgument:   return "InvalidArgument";
        case ErrorKind::Io:                return "Io";
    }
    return "Unknown";
}

const char* validationCodeName(ValidationCode code) {
    switch (code) {
        case ValidationCode::None:                   return "None";
        case ValidationCode::Truncated:              return "Truncated";
        case ValidationCode::PayloadOverrun:         return "PayloadOverrun";
        case ValidationCode::TrailingBytes:          return "TrailingBytes";
        case ValidationCode::Oversized:              return "Oversized";
        case ValidationCode::UnsupportedVersion:     return "UnsupportedVersion";
        case ValidationCode::UnknownKind:            return "UnknownKind";
        case ValidationCode::KindMismatch:           return "KindMismatch";
        case ValidationCode::LengthMismatch:         return "LengthMismatch";
        case ValidationCode::BadIntegrityTag:        return "BadIntegrityTag";
        case ValidationCode::NonCanonicalParameters: return "NonCanonicalParameters";
        case ValidationCode::MalformedAbi:           return "MalformedAbi";
        case ValidationCode::CoefficientOutOfRange:  return "CoefficientOutOfRange";
    }
    return "Unknown";
}

std::string Error::toString() const {
    std::ostringstream os;
    os << errorKindName(kind);
    if (code != ValidationCode::None) {
        os << '/' << validationCodeName(code);
    }
    if (!field.empty()) {
        os << ": " << field << " expected " << expected << " got " << actual;
    }
    if (!message.empty()) {
        os << (field.empty() ? ": " : " (") << message << (field.empty() ? "" : ")");
    }
    return os.str();
}

Error Error::validation(ValidationCode code, std::string field,
                        uint64_t expected, uint64_t actual, std::string message) {
    Error e;
    e.kind = ErrorKind::Validation;
    e.code = code;
    e.field = std::move(field);
    e.expected = expected;
    e.actual = actual;
    e.message = std::move(message);
    return e;
}

Error Error::unknownBinding(uint16_t scheme_id, uint16_t param_set_id) {
    Error e;
    e.kind = ErrorKind::UnknownBinding;
    e.field = "param_set_id";
    e.actual = param_set_id;
    std::ostringstream os;
    os << "no binding registered for scheme " << scheme_id
       << " parameter set " << param_set_id;
    e.message = os.str();
    return e;
}

Error Error::schemeMismatch(std::string field, uint64_t expected, uint64_t actual) {
    Error e;
    e.kind = ErrorKind::SchemeMismatch;
    e.field = std::move(field);
    e.expected = expected;
    e.actual = actual;
    return e;
}

Error Error::arity(std::string field, uint64_t expected, uint64_t actual,
                   std::string message) {
    Error e;
    e.kind = ErrorKind::Arity;
    e.field = std::move(field);
    e.expected = expected;
    e.actual = actual;
    e.message = std::move(message);
    return e;
}

Error Error::invalidArgument(std::string message) {
    Error e;
    e.kind = ErrorKind::InvalidArgument;
    e.message = std::move(message);
    return e;
}

Error Error::io(std::string path, std::string message) {
    Error e;
    e.kind = ErrorKind::Io;
    e.message = path + ": " + message;
    return e;
}

} // namespace fheweb3
