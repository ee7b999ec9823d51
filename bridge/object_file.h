// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// File persistence for encoded objects
//
// Files hold exactly the wire frame. Loading treats the file as untrusted and
// runs it through the Validator before decoding.

#ifndef FHEWEB3_OBJECT_FILE_H
#define FHEWEB3_OBJECT_FILE_H

#include <string>

#include "error.h"
#include "scheme_registry.h"
#include "types.h"
#include "validator.h"

namespace fheweb3 {

Result<Bytes> readFile(const std::string& path);
Status writeFile(const std::string& path, const Bytes& data);

Status saveObject(const std::string& path, const DecodedObject& object, const SchemeBinding& binding);

// The file's binding must be the expected one
Result<DecodedObject> loadObject(const std::string& path, const Validator& validator,
                                 const SchemeBinding& expected);

Result<CiphertextHandle> loadCiphertext(const std::string& path, const Validator& validator,
                                        const SchemeBinding& expected);
Result<PublicParameters> loadParameters(const std::string& path, const Validator& validator,
                                        const SchemeBinding& expected);
Result<KeyHandle> loadKey(const std::string& path, const Validator& validator,
                          const SchemeBinding& expected);

} // namespace fheweb3

#endif // FHEWEB3_OBJECT_FILE_H
