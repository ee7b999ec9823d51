// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include <gtest/gtest.h>

#include <string>

#include "precompile/abi.h"
#include "precompile/precompile_adapter.h"
#include "test_util.h"

using namespace fheweb3;
using namespace fheweb3::precompile;

namespace {

Bytes withStatus(uint8_t status, const Bytes& body) {
    Bytes out;
    out.push_back(status);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Operand mustOperand(Result<Operand> operand) {
    if (!operand) {
        throw std::logic_error(operand.error().toString());
    }
    return std::move(operand).value();
}

// Well-formed operand of the given type under a binding
Operand operandFor(OperandType type, const SchemeBinding& binding, uint8_t seed) {
    switch (type) {
        case OperandType::Ciphertext:
            return mustOperand(ciphertextOperand(test::makeCiphertext(binding, seed), binding));
        case OperandType::PublicKey:
            return mustOperand(keyOperand(test::makeKey(KeyHandle::Type::Public, binding, seed), binding));
        case OperandType::KeySwitchKey:
            return mustOperand(
                keyOperand(test::makeKey(KeyHandle::Type::KeySwitch, binding, seed), binding));
        case OperandType::Uint256:
            return plaintextOperand(Uint256(seed));
    }
    throw std::logic_error("unknown operand type");
}

std::vector<Operand> operandsFor(Operation op, const SchemeBinding& binding) {
    std::vector<Operand> out;
    uint8_t seed = 1;
    for (OperandType type : operationSpec(op).operands) {
        out.push_back(operandFor(type, binding, seed++));
    }
    return out;
}

// Answers every call with a canned response and records what it saw
class FakeChainClient : public ChainClient {
public:
    explicit FakeChainClient(Result<Bytes> response) : response_(std::move(response)) {}

    Result<Bytes> call(const Address& to, const Bytes& calldata) override {
        calls++;
        last_to = to;
        last_calldata = calldata;
        return response_;
    }

    int calls = 0;
    Address last_to;
    Bytes last_calldata;

private:
    Result<Bytes> response_;
};

class PrecompileAdapterTest : public ::testing::Test {
protected:
    PrecompileAdapterTest() : adapter_(SchemeRegistry::builtin()) {}

    PrecompileCall build(Operation op, std::vector<Operand> operands) {
        auto call = adapter_.buildCall(op, std::move(operands));
        if (!call) {
            throw std::logic_error(call.error().toString());
        }
        return std::move(call).value();
    }

    PrecompileAdapter adapter_;
};

} // namespace

// =============================================================================
// Operation table
// =============================================================================

TEST(OperationTableTest, SelectorsAndArity) {
    const auto& ops = allOperations();
    ASSERT_EQ(ops.size(), 10u);
    for (size_t i = 0; i < ops.size(); i++) {
        EXPECT_EQ(operationSpec(ops[i]).selector(), i + 1);
        auto back = operationFromSelector(static_cast<uint32_t>(i + 1));
        ASSERT_TRUE(back.isOk());
        EXPECT_EQ(back.value(), ops[i]);
    }

    EXPECT_EQ(operationSpec(Operation::Add).arity(), 2u);
    EXPECT_EQ(operationSpec(Operation::MultiplyPlain).arity(), 2u);
    EXPECT_EQ(operationSpec(Operation::Negate).arity(), 1u);
    EXPECT_EQ(operationSpec(Operation::NetworkParameters).arity(), 0u);
    EXPECT_EQ(operationSpec(Operation::NetworkParameters).result, ObjectKind::PublicParameters);
    EXPECT_STREQ(operationSpec(Operation::KeySwitch).name, "key_switch");
}

TEST(OperationTableTest, UnknownSelector) {
    EXPECT_FALSE(operationFromSelector(0).isOk());
    auto r = operationFromSelector(0x0b);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
}

TEST(OperationTableTest, DefaultAddress) {
    EXPECT_EQ(defaultAddress().toHex(), "0x0000000000000000000000000000000000000100");
}

// =============================================================================
// buildCall
// =============================================================================

TEST_F(PrecompileAdapterTest, BuildsEveryOperation) {
    const SchemeBinding& b = test::lwe128();
    for (Operation op : allOperations()) {
        const OperationSpec& spec = operationSpec(op);
        std::vector<Operand> operands = operandsFor(op, b);
        const std::vector<Operand> sent = operands;

        PrecompileCall call = build(op, std::move(operands));
        EXPECT_EQ(call.state(), PrecompileCall::State::Built);
        EXPECT_EQ(call.address(), defaultAddress());
        EXPECT_EQ(call.selector(), spec.selector());

        auto selector = fheweb3::abi::readSelector(call.calldata().data(), call.calldata().size());
        ASSERT_TRUE(selector.isOk());
        EXPECT_EQ(selector.value(), spec.selector());

        std::vector<fheweb3::abi::ParamType> types;
        for (OperandType t : spec.operands) {
            types.push_back(t == OperandType::Uint256 ? fheweb3::abi::ParamType::Uint256 : fheweb3::abi::ParamType::Bytes);
        }
        auto args = fheweb3::abi::decode(call.calldata().data() + fheweb3::abi::SELECTOR_SIZE,
                                call.calldata().size() - fheweb3::abi::SELECTOR_SIZE, types);
        ASSERT_TRUE(args.isOk()) << spec.name << ": " << args.error().toString();
        ASSERT_EQ(args.value().size(), sent.size());
        for (size_t i = 0; i < sent.size(); i++) {
            if (const auto* bytes = std::get_if<Bytes>(&args.value()[i])) {
                EXPECT_EQ(*bytes, sent[i].encoded) << spec.name << " operand " << i;
            } else {
                const Uint256::Word w = std::get<Uint256>(args.value()[i]).toWord();
                EXPECT_EQ(Bytes(w.begin(), w.end()), sent[i].encoded) << spec.name << " operand " << i;
            }
        }

        if (op == Operation::NetworkParameters) {
            EXPECT_FALSE(call.binding().has_value());
            EXPECT_EQ(call.calldata().size(), fheweb3::abi::SELECTOR_SIZE);
        } else {
            ASSERT_TRUE(call.binding().has_value()) << spec.name;
            EXPECT_EQ(*call.binding(), b.key);
        }
    }
}

TEST_F(PrecompileAdapterTest, RejectsWrongOperandCount) {
    const SchemeBinding& b = test::lwe128();
    for (Operation op : allOperations()) {
        const size_t arity = operationSpec(op).arity();

        std::vector<Operand> tooMany = operandsFor(op, b);
        tooMany.push_back(operandFor(OperandType::Ciphertext, b, 99));
        auto over = adapter_.buildCall(op, tooMany);
        ASSERT_FALSE(over.isOk());
        EXPECT_EQ(over.error().kind, ErrorKind::Arity);
        EXPECT_EQ(over.error().field, "operands");
        EXPECT_EQ(over.error().expected, arity);
        EXPECT_EQ(over.error().actual, arity + 1);

        if (arity > 0) {
            std::vector<Operand> tooFew = operandsFor(op, b);
            tooFew.pop_back();
            auto under = adapter_.buildCall(op, tooFew);
            ASSERT_FALSE(under.isOk());
            EXPECT_EQ(under.error().kind, ErrorKind::Arity);
            EXPECT_EQ(under.error().actual, arity - 1);
        }
    }
}

TEST_F(PrecompileAdapterTest, RejectsWrongOperandType) {
    const SchemeBinding& b = test::lwe128();
    auto r = adapter_.buildCall(Operation::Add, {operandFor(OperandType::Ciphertext, b, 1),
                                                 plaintextOperand(Uint256(5))});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::Arity);
    EXPECT_EQ(r.error().field, "operand[1].type");
}

TEST_F(PrecompileAdapterTest, RejectsShortPlaintextWord) {
    const SchemeBinding& b = test::lwe128();
    auto r = adapter_.buildCall(Operation::AddPlain, {operandFor(OperandType::Ciphertext, b, 1),
                                                      frameOperand(OperandType::Uint256, Bytes(31, 0))});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::Arity);
    EXPECT_EQ(r.error().field, "operand[1].length");
}

TEST_F(PrecompileAdapterTest, RejectsFrameOfWrongKind) {
    const SchemeBinding& b = test::lwe128();
    const Bytes keyFrame = test::frameOf(test::makeKey(KeyHandle::Type::Public, b, 2), b);
    auto r = adapter_.buildCall(Operation::Add, {operandFor(OperandType::Ciphertext, b, 1),
                                                 frameOperand(OperandType::Ciphertext, keyFrame)});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::Arity);
    EXPECT_EQ(r.error().field, "operand[1].kind");
}

TEST_F(PrecompileAdapterTest, RejectsMixedBindings) {
    auto sameScheme = adapter_.buildCall(
        Operation::Add, {operandFor(OperandType::Ciphertext, test::lwe128(), 1),
                         operandFor(OperandType::Ciphertext, test::lwe192(), 2)});
    ASSERT_FALSE(sameScheme.isOk());
    EXPECT_EQ(sameScheme.error().kind, ErrorKind::SchemeMismatch);
    EXPECT_EQ(sameScheme.error().field, "operand[1].param_set_id");

    auto otherScheme = adapter_.buildCall(
        Operation::KeySwitch, {operandFor(OperandType::Ciphertext, test::lwe128(), 1),
                               operandFor(OperandType::KeySwitchKey, test::bfv4096(), 2)});
    ASSERT_FALSE(otherScheme.isOk());
    EXPECT_EQ(otherScheme.error().kind, ErrorKind::SchemeMismatch);
    EXPECT_EQ(otherScheme.error().field, "operand[1].scheme_id");
}

TEST_F(PrecompileAdapterTest, RejectsCorruptOperandFrame) {
    const SchemeBinding& b = test::bfv4096();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 1), b);
    frame.back() ^= 0x01;
    auto r = adapter_.buildCall(Operation::Negate, {frameOperand(OperandType::Ciphertext, frame)});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::Validation);
    EXPECT_EQ(r.error().code, ValidationCode::BadIntegrityTag);
}

TEST_F(PrecompileAdapterTest, ConfiguredAddress) {
    PrecompileAdapter::Config config;
    auto addr = Address::fromHex("0x00000000000000000000000000000000000000ff");
    ASSERT_TRUE(addr.isOk());
    config.precompile_address = addr.value();
    PrecompileAdapter adapter(SchemeRegistry::builtin(), config);

    auto call = adapter.buildCall(Operation::NetworkParameters, {});
    ASSERT_TRUE(call.isOk());
    EXPECT_EQ(call.value().address(), addr.value());
}

TEST_F(PrecompileAdapterTest, RejectsOperationOutsideTable) {
    auto r = adapter_.buildCall(static_cast<Operation>(0x0b), {});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);

    auto zero = adapter_.buildCall(static_cast<Operation>(0), {});
    ASSERT_FALSE(zero.isOk());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidArgument);
}

// =============================================================================
// parseCall
// =============================================================================

TEST_F(PrecompileAdapterTest, ParseCallRebuildsEveryOperation) {
    const SchemeBinding& b = test::bfv4096();
    for (Operation op : allOperations()) {
        const PrecompileCall built = build(op, operandsFor(op, b));

        auto parsed = adapter_.parseCall(built.calldata());
        ASSERT_TRUE(parsed.isOk()) << operationSpec(op).name << ": " << parsed.error().toString();
        EXPECT_EQ(parsed.value().state(), PrecompileCall::State::Built);
        EXPECT_EQ(parsed.value().operation(), op);
        EXPECT_EQ(parsed.value().calldata(), built.calldata());
        EXPECT_EQ(parsed.value().binding(), built.binding());
        ASSERT_EQ(parsed.value().operands().size(), built.operands().size());
        for (size_t i = 0; i < built.operands().size(); i++) {
            EXPECT_EQ(parsed.value().operands()[i].type, built.operands()[i].type);
            EXPECT_EQ(parsed.value().operands()[i].encoded, built.operands()[i].encoded);
        }
    }
}

TEST_F(PrecompileAdapterTest, ParseCallRejectsUnknownSelector) {
    auto r = adapter_.parseCall({0x00, 0x00, 0x00, 0x0b});
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);

    auto shortSelector = adapter_.parseCall({0x00, 0x01});
    ASSERT_FALSE(shortSelector.isOk());
    EXPECT_EQ(shortSelector.error().code, ValidationCode::MalformedAbi);
}

TEST_F(PrecompileAdapterTest, ParseCallRejectsNonCanonicalEncoding) {
    const SchemeBinding& b = test::lwe128();
    Bytes calldata = build(Operation::Negate, operandsFor(Operation::Negate, b)).calldata();
    calldata.insert(calldata.end(), fheweb3::abi::WORD_SIZE, 0);

    auto r = adapter_.parseCall(calldata);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ValidationCode::MalformedAbi);
}

TEST_F(PrecompileAdapterTest, ParseCallChecksOperands) {
    const Bytes lwe128 = test::frameOf(test::makeCiphertext(test::lwe128(), 1), test::lwe128());
    const Bytes lwe192 = test::frameOf(test::makeCiphertext(test::lwe192(), 2), test::lwe192());
    const Bytes mixed = fheweb3::abi::encodeCall(operationSpec(Operation::Add).selector(),
                                        {fheweb3::abi::Value(lwe128), fheweb3::abi::Value(lwe192)});
    auto r = adapter_.parseCall(mixed);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::SchemeMismatch);
    EXPECT_EQ(r.error().field, "operand[1].param_set_id");

    Bytes corrupt = lwe128;
    corrupt.pop_back();
    const Bytes truncated = fheweb3::abi::encodeCall(operationSpec(Operation::Negate).selector(),
                                            {fheweb3::abi::Value(corrupt)});
    auto t = adapter_.parseCall(truncated);
    ASSERT_FALSE(t.isOk());
    EXPECT_EQ(t.error().kind, ErrorKind::Validation);
}

// =============================================================================
// parseResult
// =============================================================================

TEST_F(PrecompileAdapterTest, AddUnderOneParameterSetOnly) {
    const SchemeBinding& p1 = test::bfv4096();
    const SchemeBinding& p2 = test::bfv8192();

    PrecompileCall call = build(Operation::Add, {operandFor(OperandType::Ciphertext, p1, 1),
                                                 operandFor(OperandType::Ciphertext, p1, 2)});
    ASSERT_TRUE(call.markSubmitted().isOk());
    ASSERT_TRUE(call.markResultReceived().isOk());

    const CiphertextHandle sum = test::makeCiphertext(p1, 3);
    const Bytes response = withStatus(0x00, test::frameOf(sum, p1));

    PrecompileResult result = adapter_.parseResult(call, response, p1);
    ASSERT_TRUE(result.isSuccess()) << result.failure().error.toString();
    const auto* ct = std::get_if<CiphertextHandle>(&result.success().object);
    ASSERT_NE(ct, nullptr);
    EXPECT_EQ(ct->binding(), p1.key);
    EXPECT_EQ(*ct, sum);
    EXPECT_EQ(call.state(), PrecompileCall::State::Validated);

    // The same bytes never decode as a ciphertext of another parameter set
    PrecompileResult other = adapter_.parseResult(response, p2);
    ASSERT_FALSE(other.isSuccess());
    EXPECT_EQ(other.failure().error.kind, ErrorKind::SchemeMismatch);
    EXPECT_FALSE(other.failure().status.has_value());
}

TEST_F(PrecompileAdapterTest, FailureStatusCarriesDiagnostics) {
    const std::string text = "operand decode failed";
    const Bytes response = withStatus(0x03, Bytes(text.begin(), text.end()));

    PrecompileResult result = adapter_.parseResult(response, test::bfv4096());
    ASSERT_FALSE(result.isSuccess());
    const PrecompileFailure& failure = result.failure();
    EXPECT_EQ(failure.error.kind, ErrorKind::PrecompileFailure);
    ASSERT_TRUE(failure.status.has_value());
    EXPECT_EQ(*failure.status, 0x03);
    EXPECT_EQ(std::string(failure.diagnostics.begin(), failure.diagnostics.end()), text);
}

TEST_F(PrecompileAdapterTest, EmptyResponse) {
    PrecompileResult result = adapter_.parseResult(Bytes(), test::bfv4096());
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(result.failure().error.kind, ErrorKind::Validation);
    EXPECT_EQ(result.failure().error.code, ValidationCode::Truncated);
}

TEST_F(PrecompileAdapterTest, MalformedFrameInResponse) {
    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 4), b);
    frame.pop_back();
    PrecompileResult result = adapter_.parseResult(withStatus(0x00, frame), b);
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(result.failure().error.code, ValidationCode::PayloadOverrun);
}

TEST_F(PrecompileAdapterTest, NonCanonicalParametersInResponse) {
    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(wire::parametersFor(b), b);
    frame[wire::HEADER_SIZE + 7] ^= 0x01;
    PrecompileResult result = adapter_.parseResult(withStatus(0x00, frame), b);
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(result.failure().error.code, ValidationCode::NonCanonicalParameters);
}

TEST_F(PrecompileAdapterTest, ResultKindMustMatchOperation) {
    const SchemeBinding& b = test::lwe128();
    PrecompileCall call = build(Operation::Negate, {operandFor(OperandType::Ciphertext, b, 1)});
    ASSERT_TRUE(call.markSubmitted().isOk());
    ASSERT_TRUE(call.markResultReceived().isOk());

    const Bytes response = withStatus(0x00, test::frameOf(wire::parametersFor(b), b));
    PrecompileResult result = adapter_.parseResult(call, response, b);
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(result.failure().error.code, ValidationCode::KindMismatch);
    EXPECT_EQ(call.state(), PrecompileCall::State::Rejected);
}

TEST_F(PrecompileAdapterTest, NetworkParametersResult) {
    const SchemeBinding& b = test::bfv4096();
    PrecompileCall call = build(Operation::NetworkParameters, {});
    ASSERT_TRUE(call.markSubmitted().isOk());
    ASSERT_TRUE(call.markResultReceived().isOk());

    const Bytes response = withStatus(0x00, test::frameOf(wire::parametersFor(b), b));
    PrecompileResult result = adapter_.parseResult(call, response, b);
    ASSERT_TRUE(result.isSuccess()) << result.failure().error.toString();
    EXPECT_EQ(kindOf(result.success().object), ObjectKind::PublicParameters);
}

// =============================================================================
// Call lifecycle
// =============================================================================

TEST_F(PrecompileAdapterTest, IllegalTransitions) {
    PrecompileCall call = build(Operation::NetworkParameters, {});
    EXPECT_FALSE(call.markResultReceived().isOk());
    EXPECT_FALSE(call.finish(true).isOk());
    EXPECT_FALSE(call.finish(false).isOk());
    EXPECT_EQ(call.state(), PrecompileCall::State::Built);

    ASSERT_TRUE(call.markSubmitted().isOk());
    Status again = call.markSubmitted();
    ASSERT_FALSE(again.isOk());
    EXPECT_EQ(again.error().kind, ErrorKind::InvalidArgument);
    EXPECT_FALSE(call.finish(true).isOk());
    EXPECT_EQ(call.state(), PrecompileCall::State::Submitted);

    ASSERT_TRUE(call.finish(false).isOk());
    EXPECT_EQ(call.state(), PrecompileCall::State::Rejected);
    EXPECT_FALSE(call.markSubmitted().isOk());
}

TEST_F(PrecompileAdapterTest, ParseRequiresReceivedResult) {
    const SchemeBinding& b = test::bfv4096();
    PrecompileCall call = build(Operation::NetworkParameters, {});
    const Bytes response = withStatus(0x00, test::frameOf(wire::parametersFor(b), b));

    PrecompileResult result = adapter_.parseResult(call, response, b);
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(result.failure().error.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(call.state(), PrecompileCall::State::Built);
}

TEST_F(PrecompileAdapterTest, InvokeThroughClient) {
    const SchemeBinding& b = test::bfv4096();
    PrecompileCall call = build(Operation::AddPlain, {operandFor(OperandType::Ciphertext, b, 1),
                                                      plaintextOperand(Uint256(42))});

    const CiphertextHandle sum = test::makeCiphertext(b, 7);
    FakeChainClient client(withStatus(0x00, test::frameOf(sum, b)));

    PrecompileResult result = adapter_.invoke(call, client, b);
    ASSERT_TRUE(result.isSuccess()) << result.failure().error.toString();
    EXPECT_EQ(call.state(), PrecompileCall::State::Validated);
    EXPECT_EQ(client.calls, 1);
    EXPECT_EQ(client.last_to, defaultAddress());
    EXPECT_EQ(client.last_calldata, call.calldata());

    // The precompile sees the plaintext as the second head word
    auto args = fheweb3::abi::decode(client.last_calldata.data() + fheweb3::abi::SELECTOR_SIZE,
                            client.last_calldata.size() - fheweb3::abi::SELECTOR_SIZE,
                            {fheweb3::abi::ParamType::Bytes, fheweb3::abi::ParamType::Uint256});
    ASSERT_TRUE(args.isOk());
    EXPECT_EQ(std::get<Uint256>(args.value()[1]), Uint256(42));

    // A finished call cannot be sent again
    PrecompileResult again = adapter_.invoke(call, client, b);
    ASSERT_FALSE(again.isSuccess());
    EXPECT_EQ(again.failure().error.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(client.calls, 1);
}

TEST_F(PrecompileAdapterTest, InvokeClientFailure) {
    const SchemeBinding& b = test::lwe128();
    PrecompileCall call = build(Operation::Negate, {operandFor(OperandType::Ciphertext, b, 1)});
    FakeChainClient client(Error::io("http://127.0.0.1:8545", "connection refused"));

    PrecompileResult result = adapter_.invoke(call, client, b);
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(result.failure().error.kind, ErrorKind::Io);
    EXPECT_EQ(call.state(), PrecompileCall::State::Rejected);
}

TEST_F(PrecompileAdapterTest, InvokeRejectedResponse) {
    const SchemeBinding& b = test::lwe128();
    PrecompileCall call = build(Operation::Negate, {operandFor(OperandType::Ciphertext, b, 1)});
    FakeChainClient client(withStatus(0x01, Bytes{0xde, 0xad}));

    PrecompileResult result = adapter_.invoke(call, client, b);
    ASSERT_FALSE(result.isSuccess());
    EXPECT_EQ(*result.failure().status, 0x01);
    EXPECT_EQ(call.state(), PrecompileCall::State::Rejected);
}
