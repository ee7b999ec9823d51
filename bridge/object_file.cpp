// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// File persistence for encoded objects

#include "object_file.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include "log.h"
#include "wire_codec.h"

namespace fheweb3 {

namespace {

std::string lastOsError() {
    return errno != 0 ? std::strerror(errno) : "stream error";
}

template <typename T>
Result<T> loadAs(const std::string& path, const Validator& validator,
                 const SchemeBinding& expected, ObjectKind want) {
    auto object = loadObject(path, validator, expected);
    if (!object) {
        return object.error();
    }
    if (auto* typed = std::get_if<T>(&object.value())) {
        return std::move(*typed);
    }
    return Error::validation(ValidationCode::KindMismatch, "kind", static_cast<uint64_t>(want),
                             static_cast<uint64_t>(kindOf(object.value())), path);
}

} // anonymous namespace

Result<Bytes> readFile(const std::string& path) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error::io(path, lastOsError());
    }
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error::io(path, lastOsError());
    }
    return data;
}

Status writeFile(const std::string& path, const Bytes& data) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error::io(path, lastOsError());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return Error::io(path, lastOsError());
    }
    return Status::ok();
}

Status saveObject(const std::string& path, const DecodedObject& object, const SchemeBinding& binding) {
    auto frame = wire::encode(object, binding);
    if (!frame) {
        return frame.error();
    }
    Status s = writeFile(path, frame.value());
    if (s) {
        log::Line(log::Level::Info, "file") << "wrote " << objectKindName(kindOf(object))
                                            << " (" << frame.value().size() << " bytes) to " << path;
    }
    return s;
}

Result<DecodedObject> loadObject(const std::string& path, const Validator& validator,
                                 const SchemeBinding& expected) {
    auto data = readFile(path);
    if (!data) {
        return data.error();
    }
    auto validated = validator.validateInbound(data.value());
    if (!validated) {
        return validated.error();
    }
    auto object = wire::decode(validated.value().bytes, *validated.value().binding);
    if (!object) {
        return object.error();
    }
    Status match = validator.registry().assertMatch(object.value(), expected);
    if (!match) {
        return match.error();
    }
    return object;
}

Result<CiphertextHandle> loadCiphertext(const std::string& path, const Validator& validator,
                                        const SchemeBinding& expected) {
    return loadAs<CiphertextHandle>(path, validator, expected, ObjectKind::Ciphertext);
}

Result<PublicParameters> loadParameters(const std::string& path, const Validator& validator,
                                        const SchemeBinding& expected) {
    return loadAs<PublicParameters>(path, validator, expected, ObjectKind::PublicParameters);
}

Result<KeyHandle> loadKey(const std::string& path, const Validator& validator,
                          const SchemeBinding& expected) {
    return loadAs<KeyHandle>(path, validator, expected, ObjectKind::PublicKey);
}

} // namespace fheweb3
