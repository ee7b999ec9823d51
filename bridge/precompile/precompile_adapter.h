// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Precompile Call Adapter
//
// Builds calldata for the FHE precompile from encoded operands and turns raw
// precompile output back into typed objects. Arity, operand types and binding
// agreement are checked before anything reaches the chain client.
//
// Response envelope:
//   byte 0      status (0 = success)
//   bytes 1..   wire frame on success, diagnostic bytes otherwise

#ifndef FHEWEB3_PRECOMPILE_ADAPTER_H
#define FHEWEB3_PRECOMPILE_ADAPTER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "../error.h"
#include "../scheme_registry.h"
#include "../types.h"
#include "../uint256.h"
#include "../validator.h"
#include "operations.h"

namespace fheweb3 {

struct Network;

namespace precompile {

// =============================================================================
// Operands
// =============================================================================

struct Operand {
    OperandType type;
    Bytes encoded;   // wire frame for objects, 32-byte big-endian word for Uint256
};

Result<Operand> ciphertextOperand(const CiphertextHandle& handle, const SchemeBinding& binding);
Result<Operand> keyOperand(const KeyHandle& key, const SchemeBinding& binding);
Operand plaintextOperand(const Uint256& value);

// Wraps an already encoded frame (for example one read from chain state)
Operand frameOperand(OperandType type, Bytes frame);

// =============================================================================
// Chain client collaborator
// =============================================================================

// eth_call-style transport. Retries, timeouts and cancellation are the
// implementation's business.
class ChainClient {
public:
    virtual ~ChainClient() = default;
    virtual Result<Bytes> call(const Address& to, const Bytes& calldata) = 0;
};

// =============================================================================
// PrecompileCall
// =============================================================================

class PrecompileCall {
public:
    enum class State : uint8_t {
        Built,
        Submitted,
        ResultReceived,
        Validated,
        Rejected
    };

    const Address& address() const { return address_; }
    Operation operation() const { return operation_; }
    uint32_t selector() const { return static_cast<uint32_t>(operation_); }
    const std::vector<Operand>& operands() const { return operands_; }
    const Bytes& calldata() const { return calldata_; }

    // Binding shared by the object operands; empty for operand-free calls
    const std::optional<BindingKey>& binding() const { return binding_; }

    State state() const { return state_; }

    // Built -> Submitted
    Status markSubmitted();
    // Submitted -> ResultReceived
    Status markResultReceived();
    // ResultReceived -> Validated | Rejected, or Submitted -> Rejected when
    // the chain client failed
    Status finish(bool validated);

private:
    friend class PrecompileAdapter;

    PrecompileCall(Address address, Operation operation, std::vector<Operand> operands,
                   Bytes calldata, std::optional<BindingKey> binding);

    Status transition(State from, State to);

    Address address_;
    Operation operation_;
    std::vector<Operand> operands_;
    Bytes calldata_;
    std::optional<BindingKey> binding_;
    State state_ = State::Built;
};

const char* callStateName(PrecompileCall::State state);

// =============================================================================
// PrecompileResult
// =============================================================================

struct PrecompileSuccess {
    DecodedObject object;
};

struct PrecompileFailure {
    Error error;
    std::optional<uint8_t> status;   // set when the precompile itself reported failure
    Bytes diagnostics;
};

class PrecompileResult {
public:
    PrecompileResult(PrecompileSuccess success) : value_(std::move(success)) {}  // NOLINT
    PrecompileResult(PrecompileFailure failure) : value_(std::move(failure)) {}  // NOLINT

    static PrecompileResult fail(Error error) {
        return PrecompileFailure{std::move(error), std::nullopt, {}};
    }

    bool isSuccess() const { return std::holds_alternative<PrecompileSuccess>(value_); }

    const PrecompileSuccess& success() const { return std::get<PrecompileSuccess>(value_); }
    const PrecompileFailure& failure() const { return std::get<PrecompileFailure>(value_); }

    const std::variant<PrecompileSuccess, PrecompileFailure>& value() const { return value_; }

private:
    std::variant<PrecompileSuccess, PrecompileFailure> value_;
};

// =============================================================================
// PrecompileAdapter
// =============================================================================

class PrecompileAdapter {
public:
    struct Config {
        Address precompile_address = defaultAddress();
        Validator::Config validator;

        static Config forNetwork(const Network& network);
    };

    explicit PrecompileAdapter(std::shared_ptr<const SchemeRegistry> registry);
    PrecompileAdapter(std::shared_ptr<const SchemeRegistry> registry, Config config);

    Result<PrecompileCall> buildCall(Operation operation, std::vector<Operand> operands) const;

    // Rebuilds a call from calldata, e.g. read back from a transaction. Same
    // checks as buildCall; calldata must be the canonical ABI encoding
    Result<PrecompileCall> parseCall(const Bytes& calldata) const;

    // One-shot: Validator, then Codec under the frame's own binding, then
    // assertMatch against the expected binding
    PrecompileResult parseResult(const Bytes& raw, const SchemeBinding& expected) const;

    // Same, bound to a call in ResultReceived: also checks the result kind
    // against the operation and moves the call to Validated or Rejected
    PrecompileResult parseResult(PrecompileCall& call, const Bytes& raw,
                                 const SchemeBinding& expected) const;

    // Submits a Built call through the client and parses its response
    PrecompileResult invoke(PrecompileCall& call, ChainClient& client,
                            const SchemeBinding& expected) const;

    const Config& config() const { return config_; }
    const SchemeRegistry& registry() const { return *registry_; }

private:
    Status checkOperand(size_t index, OperandType declared, const Operand& operand,
                        std::optional<BindingKey>* binding) const;

    std::shared_ptr<const SchemeRegistry> registry_;
    Config config_;
    Validator validator_;
};

} // namespace precompile
} // namespace fheweb3

#endif // FHEWEB3_PRECOMPILE_ADAPTER_H
