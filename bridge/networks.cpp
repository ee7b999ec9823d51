// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Known networks with an FHE precompile

#include "networks.h"

#include <stdexcept>

#include "scheme_registry.h"

namespace fheweb3 {

namespace {

constexpr const char* kFhePrecompile = "0x0000000000000000000000000000000000000100";

Address constantAddress(const char* hex) {
    auto addr = Address::fromHex(hex);
    if (!addr) {
        throw std::logic_error(addr.error().toString());
    }
    return addr.value();
}

Network makeParasol() {
    Network n;
    n.name = "parasol";
    n.chain_id = 574;
    n.rpc_url = "https://rpc.sunscreen.tech/parasol";
    n.faucet_url = "https://faucet.sunscreen.tech/";
    n.fhe_precompile = constantAddress(kFhePrecompile);
    n.scheme = SchemeId::Bfv;
    n.default_param_set = SchemeRegistry::kBfv4096;
    return n;
}

Network makeLocalDevNode() {
    Network n;
    n.name = "local";
    n.chain_id = 31337;
    n.rpc_url = "http://127.0.0.1:8545";
    n.fhe_precompile = constantAddress(kFhePrecompile);
    n.scheme = SchemeId::Bfv;
    n.default_param_set = SchemeRegistry::kBfv4096;
    n.dev_accounts = {
        constantAddress("0xb5f27c716e44ffe48fd6622983c651355ad8c75a"),
        constantAddress("0x00d88e763c5764e69dd667fa8073d48022a4afef"),
    };
    return n;
}

} // anonymous namespace

const char* const kDevNodeMnemonic =
    "gas monster ski craft below illegal discover limit dog bundle bus artefact";

const std::vector<Network>& knownNetworks() {
    static const std::vector<Network> networks = {makeParasol(), makeLocalDevNode()};
    return networks;
}

const Network& parasol() {
    return knownNetworks()[0];
}

const Network& localDevNode() {
    return knownNetworks()[1];
}

Result<Network> networkByName(const std::string& name) {
    for (const auto& n : knownNetworks()) {
        if (n.name == name) {
            return n;
        }
    }
    return Error::invalidArgument("unknown network \"" + name + "\"");
}

Result<Network> networkByChainId(uint64_t chain_id) {
    for (const auto& n : knownNetworks()) {
        if (n.chain_id == chain_id) {
            return n;
        }
    }
    return Error::invalidArgument("unknown chain id " + std::to_string(chain_id));
}

} // namespace fheweb3
