// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Known networks with an FHE precompile

#ifndef FHEWEB3_NETWORKS_H
#define FHEWEB3_NETWORKS_H

#include <cstdint>
#include <string>
#include <vector>

#include "error.h"
#include "types.h"

namespace fheweb3 {

struct Network {
    std::string name;
    uint64_t chain_id = 0;
    std::string rpc_url;
    std::string faucet_url;          // empty when the network has no faucet
    Address fhe_precompile;
    ParamSetId default_param_set = 0;
    SchemeId scheme = SchemeId::Bfv;
    std::vector<Address> dev_accounts; // funded accounts on development nodes
};

// Sunscreen Parasol testnet, chain id 574
const Network& parasol();

// Local anvil-style development node, chain id 31337. Started with
// kDevNodeMnemonic so dev_accounts are funded deterministically.
const Network& localDevNode();

extern const char* const kDevNodeMnemonic;

const std::vector<Network>& knownNetworks();

// Case-sensitive name lookup ("parasol", "local")
Result<Network> networkByName(const std::string& name);
Result<Network> networkByChainId(uint64_t chain_id);

} // namespace fheweb3

#endif // FHEWEB3_NETWORKS_H
