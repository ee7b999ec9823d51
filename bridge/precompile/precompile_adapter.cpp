// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Precompile Call Adapter implementation

#include "precompile_adapter.h"

#include <algorithm>
#include <string>
#include <vector>

#include "../log.h"
#include "../networks.h"
#include "../wire_codec.h"
#include "abi.h"

namespace fheweb3 {
namespace precompile {

namespace {

constexpr uint8_t kStatusOk = 0;

std::string operandField(size_t index, const char* suffix) {
    return "operand[" + std::to_string(index) + "]." + suffix;
}

std::vector<abi::ParamType> abiTypes(const OperationSpec& spec) {
    std::vector<abi::ParamType> types;
    types.reserve(spec.operands.size());
    for (OperandType t : spec.operands) {
        types.push_back(t == OperandType::Uint256 ? abi::ParamType::Uint256 : abi::ParamType::Bytes);
    }
    return types;
}

} // anonymous namespace

// =============================================================================
// Operands
// =============================================================================

Result<Operand> ciphertextOperand(const CiphertextHandle& handle, const SchemeBinding& binding) {
    auto frame = wire::encode(handle, binding);
    if (!frame) {
        return frame.error();
    }
    return Operand{OperandType::Ciphertext, std::move(frame).value()};
}

Result<Operand> keyOperand(const KeyHandle& key, const SchemeBinding& binding) {
    auto frame = wire::encode(key, binding);
    if (!frame) {
        return frame.error();
    }
    const OperandType type = key.type() == KeyHandle::Type::Public ? OperandType::PublicKey
                                                                   : OperandType::KeySwitchKey;
    return Operand{type, std::move(frame).value()};
}

Operand plaintextOperand(const Uint256& value) {
    const Uint256::Word word = value.toWord();
    return Operand{OperandType::Uint256, Bytes(word.begin(), word.end())};
}

Operand frameOperand(OperandType type, Bytes frame) {
    return Operand{type, std::move(frame)};
}

// =============================================================================
// PrecompileCall
// =============================================================================

const char* callStateName(PrecompileCall::State state) {
    switch (state) {
        case PrecompileCall::State::Built:          return "built";
        case PrecompileCall::State::Submitted:      return "submitted";
        case PrecompileCall::State::ResultReceived: return "result-received";
        case PrecompileCall::State::Validated:      return "validated";
        case PrecompileCall::State::Rejected:       return "rejected";
    }
    return "unknown";
}

PrecompileCall::PrecompileCall(Address address, Operation operation, std::vector<Operand> operands,
                               Bytes calldata, std::optional<BindingKey> binding)
    : address_(address),
      operation_(operation),
      operands_(std::move(operands)),
      calldata_(std::move(calldata)),
      binding_(binding) {}

Status PrecompileCall::transition(State from, State to) {
    if (state_ != from) {
        return Error::invalidArgument(std::string("illegal call transition ") +
                                      callStateName(state_) + " -> " + callStateName(to));
    }
    state_ = to;
    return Status::ok();
}

Status PrecompileCall::markSubmitted() {
    return transition(State::Built, State::Submitted);
}

Status PrecompileCall::markResultReceived() {
    return transition(State::Submitted, State::ResultReceived);
}

Status PrecompileCall::finish(bool validated) {
    if (validated) {
        return transition(State::ResultReceived, State::Validated);
    }
    if (state_ == State::Submitted) {
        return transition(State::Submitted, State::Rejected);
    }
    return transition(State::ResultReceived, State::Rejected);
}

// =============================================================================
// PrecompileAdapter
// =============================================================================

PrecompileAdapter::Config PrecompileAdapter::Config::forNetwork(const Network& network) {
    Config config;
    config.precompile_address = network.fhe_precompile;
    return config;
}

PrecompileAdapter::PrecompileAdapter(std::shared_ptr<const SchemeRegistry> registry)
    : PrecompileAdapter(std::move(registry), Config()) {}

PrecompileAdapter::PrecompileAdapter(std::shared_ptr<const SchemeRegistry> registry, Config config)
    : registry_(registry), config_(config), validator_(registry, config.validator) {}

Status PrecompileAdapter::checkOperand(size_t index, OperandType declared, const Operand& operand,
                                       std::optional<BindingKey>* binding) const {
    if (operand.type != declared) {
        return Error::arity(operandField(index, "type"), static_cast<uint64_t>(declared),
                            static_cast<uint64_t>(operand.type),
                            std::string("expected ") + operandTypeName(declared) + ", got " +
                                operandTypeName(operand.type));
    }

    ObjectKind kind;
    if (!operandObjectKind(declared, &kind)) {
        if (operand.encoded.size() != abi::WORD_SIZE) {
            return Error::arity(operandField(index, "length"), abi::WORD_SIZE,
                                operand.encoded.size(), "uint256 operand must be one word");
        }
        return Status::ok();
    }

    // Operands go through the same checks as inbound bytes, so a corrupt
    // frame never reaches the chain
    auto validated = validator_.validateInbound(operand.encoded);
    if (!validated) {
        return validated.error();
    }
    const wire::Header& h = validated.value().header;
    if (h.kind != static_cast<uint8_t>(kind)) {
        return Error::arity(operandField(index, "kind"), static_cast<uint64_t>(kind), h.kind,
                            std::string("operand frame carries ") +
                                objectKindName(validated.value().kind()));
    }

    const BindingKey key = h.key();
    if (!binding->has_value()) {
        *binding = key;
        return Status::ok();
    }
    const BindingKey& first = **binding;
    if (key.scheme != first.scheme) {
        return Error::schemeMismatch(operandField(index, "scheme_id"),
                                     static_cast<uint64_t>(first.scheme),
                                     static_cast<uint64_t>(key.scheme));
    }
    if (key.param_set != first.param_set) {
        return Error::schemeMismatch(operandField(index, "param_set_id"), first.param_set,
                                     key.param_set);
    }
    return Status::ok();
}

Result<PrecompileCall> PrecompileAdapter::buildCall(Operation operation,
                                                    std::vector<Operand> operands) const {
    auto known = operationFromSelector(static_cast<uint32_t>(operation));
    if (!known) {
        return known.error();
    }
    const OperationSpec& spec = operationSpec(known.value());
    if (operands.size() != spec.arity()) {
        return Error::arity("operands", spec.arity(), operands.size(),
                            std::string("operation ") + spec.name);
    }

    std::optional<BindingKey> binding;
    std::vector<abi::Value> values;
    values.reserve(operands.size());
    for (size_t i = 0; i < operands.size(); i++) {
        Status s = checkOperand(i, spec.operands[i], operands[i], &binding);
        if (!s) {
            log::Line(log::Level::Debug, "precompile") << spec.name << ": " << s.error().toString();
            return s.error();
        }
        if (operands[i].type == OperandType::Uint256) {
            Uint256::Word word;
            std::copy(operands[i].encoded.begin(), operands[i].encoded.end(), word.begin());
            values.emplace_back(Uint256::fromWord(word));
        } else {
            values.emplace_back(operands[i].encoded);
        }
    }

    Bytes calldata = abi::encodeCall(spec.selector(), values);
    log::Line(log::Level::Debug, "precompile") << "built " << spec.name << " call, "
                                               << calldata.size() << " bytes of calldata";
    return PrecompileCall(config_.precompile_address, operation, std::move(operands),
                          std::move(calldata), binding);
}

Result<PrecompileCall> PrecompileAdapter::parseCall(const Bytes& calldata) const {
    auto selector = abi::readSelector(calldata.data(), calldata.size());
    if (!selector) {
        return selector.error();
    }
    auto operation = operationFromSelector(selector.value());
    if (!operation) {
        return operation.error();
    }
    const OperationSpec& spec = operationSpec(operation.value());

    auto values = abi::decode(calldata.data() + abi::SELECTOR_SIZE,
                              calldata.size() - abi::SELECTOR_SIZE, abiTypes(spec));
    if (!values) {
        return values.error();
    }

    std::vector<Operand> operands;
    operands.reserve(values.value().size());
    for (size_t i = 0; i < values.value().size(); i++) {
        if (const auto* word = std::get_if<Uint256>(&values.value()[i])) {
            operands.push_back(plaintextOperand(*word));
        } else {
            operands.push_back(frameOperand(spec.operands[i], std::get<Bytes>(values.value()[i])));
        }
    }

    auto call = buildCall(operation.value(), std::move(operands));
    if (!call) {
        return call.error();
    }
    // Offsets or padding that decode but differ from what buildCall emits
    if (call.value().calldata() != calldata) {
        return Error::validation(ValidationCode::MalformedAbi, "calldata",
                                 call.value().calldata().size(), calldata.size(),
                                 "calldata is not canonically encoded");
    }
    return call;
}

PrecompileResult PrecompileAdapter::parseResult(const Bytes& raw, const SchemeBinding& expected) const {
    if (raw.empty()) {
        return PrecompileResult::fail(
            Error::validation(ValidationCode::Truncated, "status", 1, 0, "empty precompile output"));
    }

    const uint8_t status = raw[0];
    if (status != kStatusOk) {
        Error err;
        err.kind = ErrorKind::PrecompileFailure;
        err.field = "status";
        err.expected = kStatusOk;
        err.actual = status;
        err.message = "precompile reported failure";
        log::Line(log::Level::Warn, "precompile") << "status " << static_cast<unsigned>(status)
                                                  << " with " << raw.size() - 1
                                                  << " diagnostic bytes";
        return PrecompileFailure{std::move(err), status, Bytes(raw.begin() + 1, raw.end())};
    }

    auto validated = validator_.validateInbound(raw.data() + 1, raw.size() - 1);
    if (!validated) {
        return PrecompileResult::fail(validated.error());
    }
    auto object = wire::decode(validated.value().bytes, *validated.value().binding);
    if (!object) {
        return PrecompileResult::fail(object.error());
    }
    Status match = registry_->assertMatch(object.value(), expected);
    if (!match) {
        log::Line(log::Level::Warn, "precompile") << match.error().toString();
        return PrecompileResult::fail(match.error());
    }
    return PrecompileSuccess{std::move(object).value()};
}

PrecompileResult PrecompileAdapter::parseResult(PrecompileCall& call, const Bytes& raw,
                                                const SchemeBinding& expected) const {
    if (call.state() != PrecompileCall::State::ResultReceived) {
        return PrecompileResult::fail(Error::invalidArgument(
            std::string("cannot parse a result for a call in state ") +
            callStateName(call.state())));
    }

    PrecompileResult result = parseResult(raw, expected);
    if (result.isSuccess()) {
        const ObjectKind want = operationSpec(call.operation()).result;
        const ObjectKind got = kindOf(result.success().object);
        if (got != want) {
            result = PrecompileResult::fail(
                Error::validation(ValidationCode::KindMismatch, "kind",
                                  static_cast<uint64_t>(want), static_cast<uint64_t>(got),
                                  std::string("result of ") + operationSpec(call.operation()).name));
        }
    }

    Status s = call.finish(result.isSuccess());
    if (!s) {
        return PrecompileResult::fail(s.error());
    }
    return result;
}

PrecompileResult PrecompileAdapter::invoke(PrecompileCall& call, ChainClient& client,
                                           const SchemeBinding& expected) const {
    Status s = call.markSubmitted();
    if (!s) {
        return PrecompileResult::fail(s.error());
    }

    Result<Bytes> raw = client.call(call.address(), call.calldata());
    if (!raw) {
        log::Line(log::Level::Warn, "precompile") << "chain call failed: "
                                                  << raw.error().toString();
        Status finished = call.finish(false);
        if (!finished) {
            return PrecompileResult::fail(finished.error());
        }
        return PrecompileResult::fail(raw.error());
    }

    s = call.markResultReceived();
    if (!s) {
        return PrecompileResult::fail(s.error());
    }
    return parseResult(call, raw.value(), expected);
}

} // namespace precompile
} // namespace fheweb3
