// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// OpenFHE BinFHE raw-byte export/import
//
// Ciphertexts leave OpenFHE as the fixed-width LWE payload the precompile
// reads: a[0..n) then b, each coefficient a big-endian u64. Keys have no
// fixed layout and travel as OpenFHE binary serializations, bounded by the
// binding's max_key_bytes.

#ifndef FHEWEB3_OPENFHE_BINFHE_EXPORT_H
#define FHEWEB3_OPENFHE_BINFHE_EXPORT_H

#include <binfhecontext.h>

#include <cstdint>
#include <string>

#include "../error.h"
#include "../scheme_registry.h"
#include "../types.h"

namespace fheweb3 {
namespace openfhe {

constexpr uint32_t kDefaultMaxKeyBytes = 32u << 20;

// Layout of an already generated context (GenerateBinFHEContext called)
Result<LweLayout> layoutFromContext(lbcrypto::BinFHEContext& cc,
                                    uint32_t max_key_bytes = kDefaultMaxKeyBytes);

// Binding for a context; register it before using it with the codec
Result<SchemeBinding> bindingFromContext(lbcrypto::BinFHEContext& cc, ParamSetId param_set,
                                         std::string name,
                                         uint32_t max_key_bytes = kDefaultMaxKeyBytes);

// Fails with SchemeMismatch when the context does not produce the binding's layout
Result<PublicParameters> exportParameters(lbcrypto::BinFHEContext& cc, const SchemeBinding& binding);

// =============================================================================
// Ciphertexts
// =============================================================================

Result<CiphertextHandle> exportCiphertext(const lbcrypto::LWECiphertext& ct,
                                          const SchemeBinding& binding);
Result<lbcrypto::LWECiphertext> importCiphertext(const CiphertextHandle& handle,
                                                 const SchemeBinding& binding);

// =============================================================================
// Keys
// =============================================================================

Result<KeyHandle> exportPublicKey(const lbcrypto::LWEPublicKey& pk, const SchemeBinding& binding);
Result<lbcrypto::LWEPublicKey> importPublicKey(const KeyHandle& key, const SchemeBinding& binding);

// Key-switching key generated by BTKeyGen
Result<KeyHandle> exportSwitchKey(lbcrypto::BinFHEContext& cc, const SchemeBinding& binding);
Result<lbcrypto::LWESwitchingKey> importSwitchKey(const KeyHandle& key, const SchemeBinding& binding);

} // namespace openfhe
} // namespace fheweb3

#endif // FHEWEB3_OPENFHE_BINFHE_EXPORT_H
