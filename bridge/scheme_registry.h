// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Scheme Binding Registry
//
// Associates (scheme id, parameter-set id) with the layout descriptor the
// codec needs: encoding version, integrity tag and a scheme-specific layout.
// A registry is assembled once through SchemeRegistry::Builder and published
// as std::shared_ptr<const SchemeRegistry>; it is never mutated afterwards, so
// lookups from any thread need no locking.

#ifndef FHEWEB3_SCHEME_REGISTRY_H
#define FHEWEB3_SCHEME_REGISTRY_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "error.h"
#include "integrity_tag.h"
#include "types.h"

namespace fheweb3 {

// =============================================================================
// Layout Descriptors (one alternative per supported scheme)
// =============================================================================

// BFV over an RNS coefficient modulus
struct BfvLayout {
    uint32_t poly_degree = 0;
    uint64_t plain_modulus = 0;
    std::vector<uint64_t> coeff_moduli;
    uint32_t ciphertext_polys = 2;   // 2 for fresh/relinearized ciphertexts
};

// LWE ciphertexts as produced by OpenFHE BinFHE
struct LweLayout {
    uint32_t lwe_dimension = 0;      // n
    uint32_t ring_dimension = 0;     // N
    uint64_t modulus = 0;            // q
    uint32_t ksk_base_log = 0;
    uint32_t bsk_base_log = 0;
    uint32_t max_key_bytes = 0;      // upper bound for serialized keys
};

using LayoutDescriptor = std::variant<BfvLayout, LweLayout>;

SchemeId schemeOf(const LayoutDescriptor& layout);

struct SchemeBinding {
    BindingKey key;
    std::string name;
    uint8_t encoding_version = 1;
    TagAlgorithm tag = TagAlgorithm::None;
    LayoutDescriptor layout;
};

// =============================================================================
// SchemeRegistry
// =============================================================================

class SchemeRegistry {
public:
    // Version of the builtin binding table; bumped only by additive changes
    static constexpr uint32_t kBuiltinTableVersion = 1;

    // Builtin parameter-set identifiers
    static constexpr ParamSetId kBfv4096 = 0x0001;
    static constexpr ParamSetId kBfv8192 = 0x0002;
    static constexpr ParamSetId kLwe128 = 0x0001;
    static constexpr ParamSetId kLwe192 = 0x0002;
    static constexpr ParamSetId kLwe256 = 0x0003;

    class Builder {
    public:
        Builder() = default;

        // Rejects duplicates, layouts of the wrong scheme and empty layouts
        Status registerBinding(SchemeBinding binding);

        // Adds every entry of the builtin table
        Status registerBuiltinTable();

        size_t size() const { return bindings_.size(); }

        // Publishes the registry; the builder is left empty
        std::shared_ptr<const SchemeRegistry> build();

    private:
        std::unordered_map<BindingKey, SchemeBinding, BindingKeyHash> bindings_;
    };

    // Registry holding exactly the builtin table
    static std::shared_ptr<const SchemeRegistry> builtin();

    SchemeRegistry(const SchemeRegistry&) = delete;
    SchemeRegistry& operator=(const SchemeRegistry&) = delete;

    Result<const SchemeBinding*> resolve(SchemeId scheme, ParamSetId param_set) const;
    Result<const SchemeBinding*> resolve(const BindingKey& key) const;

    // Ok only when the object carries exactly the expected (scheme, parameter
    // set) and that binding is registered here
    Status assertMatch(const CiphertextHandle& handle, const SchemeBinding& expected) const;
    Status assertMatch(const PublicParameters& params, const SchemeBinding& expected) const;
    Status assertMatch(const KeyHandle& key, const SchemeBinding& expected) const;
    Status assertMatch(const DecodedObject& object, const SchemeBinding& expected) const;

    size_t size() const { return bindings_.size(); }

    // Registered keys in ascending (scheme, parameter set) order
    std::vector<BindingKey> keys() const;

private:
    explicit SchemeRegistry(std::unordered_map<BindingKey, SchemeBinding, BindingKeyHash> bindings);

    Status assertKeyMatch(const BindingKey& actual, const SchemeBinding& expected) const;

    const std::unordered_map<BindingKey, SchemeBinding, BindingKeyHash> bindings_;
};

} // namespace fheweb3

#endif // FHEWEB3_SCHEME_REGISTRY_H
