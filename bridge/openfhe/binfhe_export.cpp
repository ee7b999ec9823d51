// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// OpenFHE BinFHE raw-byte export/import

#include "binfhe_export.h"

#include <binfhecontext-ser.h>
#include <utils/serial.h>

#include <sstream>

#include "../byte_order.h"
#include "../log.h"
#include "../wire_codec.h"

using namespace lbcrypto;

namespace fheweb3 {
namespace openfhe {

namespace {

constexpr size_t kCoeffBytes = 8;

// Bits per decomposition digit; BinFHE bases are not always powers of two
Result<uint32_t> digitBits(uint64_t base, const char* what) {
    if (base < 2) {
        return Error::invalidArgument(std::string(what) + " must be at least 2");
    }
    uint32_t bits = 0;
    for (uint64_t v = base - 1; v != 0; v >>= 1) {
        bits++;
    }
    return bits;
}

Result<const LweLayout*> lweLayout(const SchemeBinding& binding) {
    const auto* layout = std::get_if<LweLayout>(&binding.layout);
    if (!layout) {
        return Error::schemeMismatch("scheme_id", static_cast<uint64_t>(SchemeId::BinFhe),
                                     static_cast<uint64_t>(binding.key.scheme));
    }
    return layout;
}

// Compares everything except the key size bound
Status compareLayouts(const LweLayout& expected, const LweLayout& actual) {
    if (actual.lwe_dimension != expected.lwe_dimension) {
        return Error::schemeMismatch("lwe_dimension", expected.lwe_dimension, actual.lwe_dimension);
    }
    if (actual.ring_dimension != expected.ring_dimension) {
        return Error::schemeMismatch("ring_dimension", expected.ring_dimension, actual.ring_dimension);
    }
    if (actual.modulus != expected.modulus) {
        return Error::schemeMismatch("modulus", expected.modulus, actual.modulus);
    }
    if (actual.ksk_base_log != expected.ksk_base_log) {
        return Error::schemeMismatch("ksk_base_log", expected.ksk_base_log, actual.ksk_base_log);
    }
    if (actual.bsk_base_log != expected.bsk_base_log) {
        return Error::schemeMismatch("bsk_base_log", expected.bsk_base_log, actual.bsk_base_log);
    }
    return Status::ok();
}

template <typename T>
Result<Bytes> serializeBinary(const T& obj) {
    try {
        std::stringstream ss;
        Serial::Serialize(obj, ss, SerType::BINARY);
        const std::string data = ss.str();
        return Bytes(data.begin(), data.end());
    } catch (const std::exception& e) {
        return Error::invalidArgument(std::string("OpenFHE serialization failed: ") + e.what());
    }
}

template <typename T>
Result<T> deserializeBinary(const Bytes& data) {
    try {
        std::stringstream ss(std::string(reinterpret_cast<const char*>(data.data()), data.size()));
        T obj;
        Serial::Deserialize(obj, ss, SerType::BINARY);
        if (!obj) {
            return Error::invalidArgument("OpenFHE deserialization produced no object");
        }
        return obj;
    } catch (const std::exception& e) {
        return Error::invalidArgument(std::string("OpenFHE deserialization failed: ") + e.what());
    }
}

Result<KeyHandle> wrapKey(KeyHandle::Type type, Bytes payload, const SchemeBinding& binding) {
    KeyHandle key(type, binding.key, std::move(payload));
    Status s = wire::checkPayload(binding, key.kind(), key.payload().data(), key.payload().size());
    if (!s) {
        return s.error();
    }
    return key;
}

Status checkKey(const KeyHandle& key, KeyHandle::Type type, const SchemeBinding& binding) {
    if (key.binding() != binding.key) {
        return Error::schemeMismatch("param_set_id", binding.key.param_set, key.paramSet());
    }
    if (key.type() != type) {
        return Error::validation(ValidationCode::KindMismatch, "kind",
                                 static_cast<uint64_t>(type), static_cast<uint64_t>(key.type()));
    }
    return wire::checkPayload(binding, key.kind(), key.payload().data(), key.payload().size());
}

} // anonymous namespace

Result<LweLayout> layoutFromContext(BinFHEContext& cc, uint32_t max_key_bytes) {
    const auto& params = cc.GetParams();
    if (!params) {
        return Error::invalidArgument("BinFHE context has not been generated");
    }
    const auto& lwe = params->GetLWEParams();
    const auto& rgsw = params->GetRingGSWParams();

    auto ks_log = digitBits(lwe->GetBaseKS(), "key-switching base");
    if (!ks_log) {
        return ks_log.error();
    }
    auto bs_log = digitBits(rgsw->GetBaseG(), "bootstrapping gadget base");
    if (!bs_log) {
        return bs_log.error();
    }

    LweLayout layout;
    layout.lwe_dimension = lwe->Getn();
    layout.ring_dimension = lwe->GetN();
    layout.modulus = lwe->Getq().ConvertToInt<uint64_t>();
    layout.ksk_base_log = ks_log.value();
    layout.bsk_base_log = bs_log.value();
    layout.max_key_bytes = max_key_bytes;
    return layout;
}

Result<SchemeBinding> bindingFromContext(BinFHEContext& cc, ParamSetId param_set, std::string name,
                                         uint32_t max_key_bytes) {
    auto layout = layoutFromContext(cc, max_key_bytes);
    if (!layout) {
        return layout.error();
    }
    SchemeBinding binding;
    binding.key = {SchemeId::BinFhe, param_set};
    binding.name = std::move(name);
    binding.tag = TagAlgorithm::None;
    binding.layout = layout.value();
    return binding;
}

Result<PublicParameters> exportParameters(BinFHEContext& cc, const SchemeBinding& binding) {
    auto expected = lweLayout(binding);
    if (!expected) {
        return expected.error();
    }
    auto actual = layoutFromContext(cc);
    if (!actual) {
        return actual.error();
    }
    Status s = compareLayouts(*expected.value(), actual.value());
    if (!s) {
        return s.error();
    }
    return wire::parametersFor(binding);
}

// =============================================================================
// Ciphertexts
// =============================================================================

Result<CiphertextHandle> exportCiphertext(const LWECiphertext& ct, const SchemeBinding& binding) {
    auto layout = lweLayout(binding);
    if (!layout) {
        return layout.error();
    }
    if (!ct) {
        return Error::invalidArgument("null ciphertext");
    }
    const LweLayout& l = *layout.value();

    const NativeVector& a = ct->GetA();
    if (a.GetLength() != l.lwe_dimension) {
        return Error::schemeMismatch("lwe_dimension", l.lwe_dimension, a.GetLength());
    }
    const uint64_t q = ct->GetModulus().ConvertToInt<uint64_t>();
    if (q != l.modulus) {
        return Error::schemeMismatch("modulus", l.modulus, q);
    }

    Bytes payload;
    payload.reserve((static_cast<size_t>(l.lwe_dimension) + 1) * kCoeffBytes);
    for (size_t i = 0; i < a.GetLength(); i++) {
        be::append<uint64_t>(payload, a[i].ConvertToInt<uint64_t>());
    }
    be::append<uint64_t>(payload, ct->GetB().ConvertToInt<uint64_t>());
    return CiphertextHandle(binding.key, std::move(payload));
}

Result<LWECiphertext> importCiphertext(const CiphertextHandle& handle, const SchemeBinding& binding) {
    auto layout = lweLayout(binding);
    if (!layout) {
        return layout.error();
    }
    if (handle.binding() != binding.key) {
        return Error::schemeMismatch("param_set_id", binding.key.param_set, handle.paramSet());
    }
    Status s = wire::checkPayload(binding, ObjectKind::Ciphertext, handle.payload().data(),
                                  handle.payload().size());
    if (!s) {
        return s.error();
    }
    const LweLayout& l = *layout.value();
    const uint8_t* p = handle.payload().data();

    NativeVector a(l.lwe_dimension, NativeInteger(l.modulus));
    for (uint32_t i = 0; i < l.lwe_dimension; i++) {
        const uint64_t coeff = be::load<uint64_t>(p + i * kCoeffBytes);
        if (coeff >= l.modulus) {
            return Error::validation(ValidationCode::CoefficientOutOfRange, "coefficient",
                                     l.modulus, coeff, "coefficient not reduced modulo q");
        }
        a[i] = NativeInteger(coeff);
    }
    const uint64_t b = be::load<uint64_t>(p + static_cast<size_t>(l.lwe_dimension) * kCoeffBytes);
    if (b >= l.modulus) {
        return Error::validation(ValidationCode::CoefficientOutOfRange, "coefficient", l.modulus,
                                 b, "coefficient not reduced modulo q");
    }
    return std::make_shared<LWECiphertextImpl>(std::move(a), NativeInteger(b));
}

// =============================================================================
// Keys
// =============================================================================

Result<KeyHandle> exportPublicKey(const LWEPublicKey& pk, const SchemeBinding& binding) {
    auto layout = lweLayout(binding);
    if (!layout) {
        return layout.error();
    }
    if (!pk) {
        return Error::invalidArgument("null public key");
    }
    auto data = serializeBinary(pk);
    if (!data) {
        return data.error();
    }
    return wrapKey(KeyHandle::Type::Public, std::move(data).value(), binding);
}

Result<LWEPublicKey> importPublicKey(const KeyHandle& key, const SchemeBinding& binding) {
    auto layout = lweLayout(binding);
    if (!layout) {
        return layout.error();
    }
    Status s = checkKey(key, KeyHandle::Type::Public, binding);
    if (!s) {
        return s.error();
    }
    return deserializeBinary<LWEPublicKey>(key.payload());
}

Result<KeyHandle> exportSwitchKey(BinFHEContext& cc, const SchemeBinding& binding) {
    auto layout = lweLayout(binding);
    if (!layout) {
        return layout.error();
    }
    const LWESwitchingKey ksk = cc.GetSwitchKey();
    if (!ksk) {
        return Error::invalidArgument("context has no key-switching key; run BTKeyGen first");
    }
    auto data = serializeBinary(ksk);
    if (!data) {
        return data.error();
    }
    log::Line(log::Level::Info, "openfhe") << "exported key-switching key, "
                                           << data.value().size() << " bytes";
    return wrapKey(KeyHandle::Type::KeySwitch, std::move(data).value(), binding);
}

Result<LWESwitchingKey> importSwitchKey(const KeyHandle& key, const SchemeBinding& binding) {
    auto layout = lweLayout(binding);
    if (!layout) {
        return layout.error();
    }
    Status s = checkKey(key, KeyHandle::Type::KeySwitch, binding);
    if (!s) {
        return s.error();
    }
    return deserializeBinary<LWESwitchingKey>(key.payload());
}

} // namespace openfhe
} // namespace fheweb3
