// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Scheme Binding Registry implementation

#include "scheme_registry.h"

#include <algorithm>

#include "log.h"

namespace fheweb3 {

namespace {

struct SchemeOfVisitor {
    SchemeId operator()(const BfvLayout&) const { return SchemeId::Bfv; }
    SchemeId operator()(const LweLayout&) const { return SchemeId::BinFhe; }
};

struct LayoutCheckVisitor {
    Status operator()(const BfvLayout& l) const {
        if (l.poly_degree == 0 || (l.poly_degree & (l.poly_degree - 1)) != 0) {
            return Error::invalidArgument("BFV polynomial degree must be a power of two");
        }
        if (l.plain_modulus < 2) {
            return Error::invalidArgument("BFV plain modulus must be at least 2");
        }
        if (l.coeff_moduli.empty()) {
            return Error::invalidArgument("BFV layout needs at least one coefficient modulus");
        }
        if (l.ciphertext_polys < 2) {
            return Error::invalidArgument("BFV ciphertexts have at least two polynomials");
        }
        return Status::ok();
    }

    Status operator()(const LweLayout& l) const {
        if (l.lwe_dimension == 0 || l.ring_dimension == 0) {
            return Error::invalidArgument("LWE dimensions must be non-zero");
        }
        if (l.modulus < 2) {
            return Error::invalidArgument("LWE modulus must be at least 2");
        }
        if (l.ksk_base_log == 0 || l.bsk_base_log == 0) {
            return Error::invalidArgument("LWE decomposition base logs must be non-zero");
        }
        if (l.max_key_bytes == 0) {
            return Error::invalidArgument("LWE layout needs a key size bound");
        }
        return Status::ok();
    }
};

constexpr uint32_t kMaxLweKeyBytes = 32u << 20;

// Builtin binding table, version kBuiltinTableVersion.
// New entries may be appended; existing entries never change.
std::vector<SchemeBinding> builtinTable() {
    std::vector<SchemeBinding> table;

    {
        SchemeBinding b;
        b.key = {SchemeId::Bfv, SchemeRegistry::kBfv4096};
        b.name = "bfv-4096";
        b.tag = TagAlgorithm::Sha256;
        BfvLayout l;
        l.poly_degree = 4096;
        l.plain_modulus = 1032193;
        l.coeff_moduli = {0xffffee001ULL, 0xffffc4001ULL, 0x1ffffe0001ULL};
        b.layout = l;
        table.push_back(std::move(b));
    }
    {
        SchemeBinding b;
        b.key = {SchemeId::Bfv, SchemeRegistry::kBfv8192};
        b.name = "bfv-8192";
        b.tag = TagAlgorithm::Sha256;
        BfvLayout l;
        l.poly_degree = 8192;
        l.plain_modulus = 1032193;
        l.coeff_moduli = {0x7fffffd8001ULL, 0x7fffffc8001ULL, 0xfffffffc001ULL,
                          0xffffff6c001ULL, 0xfffffebc001ULL};
        b.layout = l;
        table.push_back(std::move(b));
    }

    // LWE rows are the OpenFHE BinFHE STD128/STD192/STD256 sets as
    // layoutFromContext reports them: base logs are bits per digit of
    // baseKS and baseG, q is the ciphertext modulus
    struct LweRow {
        ParamSetId id;
        const char* name;
        uint32_t n;
        uint32_t N;
        uint64_t q;
        uint32_t ksk_base_log;
        uint32_t bsk_base_log;
    };
    const LweRow rows[] = {
        {SchemeRegistry::kLwe128, "lwe-128", 503, 1024, 1024, 5, 9},
        {SchemeRegistry::kLwe192, "lwe-192", 805, 2048, 1024, 5, 13},
        {SchemeRegistry::kLwe256, "lwe-256", 990, 2048, 2048, 7, 8},
    };
    for (const auto& row : rows) {
        SchemeBinding b;
        b.key = {SchemeId::BinFhe, row.id};
        b.name = row.name;
        b.tag = TagAlgorithm::None;
        LweLayout l;
        l.lwe_dimension = row.n;
        l.ring_dimension = row.N;
        l.modulus = row.q;
        l.ksk_base_log = row.ksk_base_log;
        l.bsk_base_log = row.bsk_base_log;
        l.max_key_bytes = kMaxLweKeyBytes;
        b.layout = l;
        table.push_back(std::move(b));
    }
    return table;
}

} // anonymous namespace

SchemeId schemeOf(const LayoutDescriptor& layout) {
    return std::visit(SchemeOfVisitor{}, layout);
}

// =============================================================================
// Builder
// =============================================================================

Status SchemeRegistry::Builder::registerBinding(SchemeBinding binding) {
    if (schemeOf(binding.layout) != binding.key.scheme) {
        return Error::schemeMismatch("layout_scheme",
                                     static_cast<uint64_t>(binding.key.scheme),
                                     static_cast<uint64_t>(schemeOf(binding.layout)));
    }
    if (binding.encoding_version == 0) {
        return Error::invalidArgument("encoding version 0 is reserved");
    }
    Status layout_ok = std::visit(LayoutCheckVisitor{}, binding.layout);
    if (!layout_ok) {
        return layout_ok;
    }
    if (bindings_.count(binding.key) != 0) {
        return Error::invalidArgument("binding for scheme " +
                                      std::to_string(static_cast<unsigned>(binding.key.scheme)) +
                                      " parameter set " +
                                      std::to_string(binding.key.param_set) +
                                      " already registered");
    }
    const BindingKey key = binding.key;
    bindings_.emplace(key, std::move(binding));
    return Status::ok();
}

Status SchemeRegistry::Builder::registerBuiltinTable() {
    for (auto& binding : builtinTable()) {
        Status s = registerBinding(std::move(binding));
        if (!s) {
            return s;
        }
    }
    return Status::ok();
}

std::shared_ptr<const SchemeRegistry> SchemeRegistry::Builder::build() {
    std::shared_ptr<const SchemeRegistry> registry(new SchemeRegistry(std::move(bindings_)));
    bindings_.clear();
    log::Line(log::Level::Info, "registry") << "published " << registry->size() << " bindings";
    return registry;
}

// =============================================================================
// SchemeRegistry
// =============================================================================

SchemeRegistry::SchemeRegistry(std::unordered_map<BindingKey, SchemeBinding, BindingKeyHash> bindings)
    : bindings_(std::move(bindings)) {}

std::shared_ptr<const SchemeRegistry> SchemeRegistry::builtin() {
    // Built on first use; C++11 guarantees thread-safe initialization
    static const std::shared_ptr<const SchemeRegistry> instance = [] {
        Builder builder;
        Status s = builder.registerBuiltinTable();
        if (!s) {
            log::write(log::Level::Error, "registry", s.error().toString());
        }
        return builder.build();
    }();
    return instance;
}

Result<const SchemeBinding*> SchemeRegistry::resolve(SchemeId scheme, ParamSetId param_set) const {
    return resolve(BindingKey{scheme, param_set});
}

Result<const SchemeBinding*> SchemeRegistry::resolve(const BindingKey& key) const {
    auto it = bindings_.find(key);
    if (it == bindings_.end()) {
        return Error::unknownBinding(static_cast<uint16_t>(key.scheme), key.param_set);
    }
    return &it->second;
}

Status SchemeRegistry::assertKeyMatch(const BindingKey& actual, const SchemeBinding& expected) const {
    if (bindings_.count(expected.key) == 0) {
        return Error::unknownBinding(static_cast<uint16_t>(expected.key.scheme),
                                     expected.key.param_set);
    }
    if (actual.scheme != expected.key.scheme) {
        return Error::schemeMismatch("scheme_id",
                                     static_cast<uint64_t>(expected.key.scheme),
                                     static_cast<uint64_t>(actual.scheme));
    }
    if (actual.param_set != expected.key.param_set) {
        return Error::schemeMismatch("param_set_id", expected.key.param_set, actual.param_set);
    }
    return Status::ok();
}

Status SchemeRegistry::assertMatch(const CiphertextHandle& handle, const SchemeBinding& expected) const {
    return assertKeyMatch(handle.binding(), expected);
}

Status SchemeRegistry::assertMatch(const PublicParameters& params, const SchemeBinding& expected) const {
    return assertKeyMatch(params.binding(), expected);
}

Status SchemeRegistry::assertMatch(const KeyHandle& key, const SchemeBinding& expected) const {
    return assertKeyMatch(key.binding(), expected);
}

Status SchemeRegistry::assertMatch(const DecodedObject& object, const SchemeBinding& expected) const {
    return assertKeyMatch(bindingOf(object), expected);
}

std::vector<BindingKey> SchemeRegistry::keys() const {
    std::vector<BindingKey> out;
    out.reserve(bindings_.size());
    for (const auto& entry : bindings_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end(), [](const BindingKey& a, const BindingKey& b) {
        return a.packed() < b.packed();
    });
    return out;
}

} // namespace fheweb3
