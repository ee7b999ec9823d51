// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include <gtest/gtest.h>

#include <stdexcept>

#include "test_util.h"
#include "validator.h"

using namespace fheweb3;

namespace {

class ValidatorTest : public ::testing::Test {
protected:
    ValidatorTest() : validator_(SchemeRegistry::builtin()) {}

    static Bytes headerOnly(uint16_t scheme, uint16_t param_set, uint8_t version,
                            uint8_t kind, uint32_t payload_length) {
        wire::Header h;
        h.scheme_id = scheme;
        h.param_set_id = param_set;
        h.version = version;
        h.kind = kind;
        h.payload_length = payload_length;
        Bytes out(wire::HEADER_SIZE);
        wire::writeHeader(h, out.data());
        return out;
    }

    void expectRejected(const Bytes& input, ValidationCode code) {
        auto r = validator_.validateInbound(input);
        ASSERT_FALSE(r.isOk());
        EXPECT_EQ(r.error().kind, ErrorKind::Validation) << r.error().toString();
        EXPECT_EQ(r.error().code, code) << r.error().toString();
    }

    Validator validator_;
};

} // namespace

// =============================================================================
// Accepted input
// =============================================================================

TEST_F(ValidatorTest, AcceptsWellFormedFrames) {
    auto registry = SchemeRegistry::builtin();
    for (const BindingKey& key : registry->keys()) {
        const SchemeBinding* b = registry->resolve(key).value();
        const Bytes frame = test::frameOf(test::makeCiphertext(*b, 1), *b);
        auto r = validator_.validateInbound(frame);
        ASSERT_TRUE(r.isOk()) << b->name << ": " << r.error().toString();
        EXPECT_EQ(r.value().binding, b);
        EXPECT_EQ(r.value().kind(), ObjectKind::Ciphertext);
        EXPECT_EQ(r.value().bytes, frame);
    }
}

TEST_F(ValidatorTest, AcceptsBoundedKeys) {
    const SchemeBinding& b = test::lwe128();
    const Bytes frame = test::frameOf(test::makeKey(KeyHandle::Type::KeySwitch, b, 2, 777), b);
    auto r = validator_.validateInbound(frame);
    ASSERT_TRUE(r.isOk()) << r.error().toString();
    EXPECT_EQ(r.value().header.payload_length, 777u);
}

// =============================================================================
// Rejections, in check order
// =============================================================================

TEST_F(ValidatorTest, RejectsMissingHeader) {
    expectRejected(Bytes(), ValidationCode::Truncated);
    expectRejected(Bytes(wire::HEADER_SIZE - 1, 0), ValidationCode::Truncated);
}

TEST_F(ValidatorTest, RejectsEveryPrefix) {
    const SchemeBinding& b = test::lwe128();
    const Bytes frame = test::frameOf(test::makeCiphertext(b, 3), b);
    for (size_t len = 0; len < frame.size(); len++) {
        auto r = validator_.validateInbound(frame.data(), len);
        ASSERT_FALSE(r.isOk()) << "prefix " << len;
        const ValidationCode expected =
            len < wire::HEADER_SIZE ? ValidationCode::Truncated : ValidationCode::PayloadOverrun;
        EXPECT_EQ(r.error().code, expected) << "prefix " << len;
    }
}

TEST_F(ValidatorTest, RejectsHugeDeclaredLengthBeforeReading) {
    expectRejected(headerOnly(1, 1, 1, 1, 0xffffffffu), ValidationCode::Oversized);
}

TEST_F(ValidatorTest, RejectsPayloadOverrun) {
    Bytes input = headerOnly(2, 1, 1, 1, 504 * 8);
    input.resize(input.size() + 100);
    expectRejected(input, ValidationCode::PayloadOverrun);
}

TEST_F(ValidatorTest, RejectsUnsupportedVersion) {
    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 4), b);
    frame[4] = 0;
    expectRejected(frame, ValidationCode::UnsupportedVersion);
    frame[4] = 2;
    expectRejected(frame, ValidationCode::UnsupportedVersion);
}

TEST_F(ValidatorTest, RejectsUnknownKind) {
    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 5), b);
    frame[5] = 0x00;
    expectRejected(frame, ValidationCode::UnknownKind);
    frame[5] = 0x05;
    expectRejected(frame, ValidationCode::UnknownKind);
}

TEST_F(ValidatorTest, RejectsUnregisteredBinding) {
    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 6), b);
    frame[3] = 0x99;
    auto r = validator_.validateInbound(frame);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownBinding);
    EXPECT_EQ(r.error().actual, 0x0099u);
}

TEST_F(ValidatorTest, EarlierCheckWins) {
    // unknown kind and unknown binding: kind is checked first
    Bytes a = headerOnly(2, 0x0099, 1, 0x07, 0);
    expectRejected(a, ValidationCode::UnknownKind);

    // bad version and unknown kind: version is checked first
    Bytes b = headerOnly(2, 1, 9, 0x07, 0);
    expectRejected(b, ValidationCode::UnsupportedVersion);

    // overrun and bad version: length is checked first
    Bytes c = headerOnly(2, 1, 9, 0x01, 64);
    expectRejected(c, ValidationCode::PayloadOverrun);
}

TEST_F(ValidatorTest, RejectsTrailingBytes) {
    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 7), b);
    frame.push_back(0xaa);
    expectRejected(frame, ValidationCode::TrailingBytes);
}

TEST_F(ValidatorTest, RejectsMissingTag) {
    const SchemeBinding& b = test::bfv4096();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 8), b);
    frame.resize(frame.size() - integrity::SHA256_TAG_SIZE);
    expectRejected(frame, ValidationCode::Truncated);
}

TEST_F(ValidatorTest, RejectsLengthForKind) {
    Bytes input = headerOnly(2, 1, 1, 1, 16);
    input.resize(input.size() + 16);
    auto r = validator_.validateInbound(input);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ValidationCode::LengthMismatch);
    EXPECT_EQ(r.error().expected, 504u * 8);
    EXPECT_EQ(r.error().actual, 16u);
}

TEST_F(ValidatorTest, RejectsRelabelledFrame) {
    // bfv-4096 bytes claiming to be bfv-8192
    const SchemeBinding& b = test::bfv4096();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 9), b);
    frame[3] = static_cast<uint8_t>(SchemeRegistry::kBfv8192);
    expectRejected(frame, ValidationCode::LengthMismatch);
}

TEST_F(ValidatorTest, RejectsTamperedTag) {
    const SchemeBinding& b = test::bfv4096();
    const Bytes frame = test::frameOf(test::makeCiphertext(b, 10), b);
    for (size_t i = frame.size() - integrity::SHA256_TAG_SIZE; i < frame.size(); i += 7) {
        Bytes tampered = frame;
        tampered[i] ^= 0x01;
        expectRejected(tampered, ValidationCode::BadIntegrityTag);
    }
}

TEST_F(ValidatorTest, RejectsTamperedPayload) {
    const SchemeBinding& b = test::bfv8192();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 11), b);
    frame[wire::HEADER_SIZE] ^= 0xff;
    expectRejected(frame, ValidationCode::BadIntegrityTag);
}

// =============================================================================
// Configuration
// =============================================================================

TEST(ValidatorConfigTest, LowerPayloadCap) {
    Validator::Config config;
    config.max_payload_length = 4096;
    Validator validator(SchemeRegistry::builtin(), config);

    const SchemeBinding& lwe = test::lwe128();
    EXPECT_FALSE(validator.validateInbound(test::frameOf(test::makeCiphertext(lwe, 1), lwe)).isOk());

    const SchemeBinding& bfv = test::bfv4096();
    auto r = validator.validateInbound(test::frameOf(test::makeCiphertext(bfv, 1), bfv));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ValidationCode::Oversized);
    EXPECT_EQ(r.error().expected, 4096u);

    Validator::Config roomy;
    roomy.max_payload_length = 8192;
    Validator accepting(SchemeRegistry::builtin(), roomy);
    EXPECT_TRUE(accepting.validateInbound(test::frameOf(test::makeCiphertext(lwe, 1), lwe)).isOk());
}

TEST(ValidatorConfigTest, WiderVersionRangeStillRequiresBindingVersion) {
    Validator::Config config;
    config.max_version = 2;
    Validator validator(SchemeRegistry::builtin(), config);

    const SchemeBinding& b = test::lwe128();
    Bytes frame = test::frameOf(test::makeCiphertext(b, 2), b);
    frame[4] = 2;
    auto r = validator.validateInbound(frame);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ValidationCode::UnsupportedVersion);
    EXPECT_EQ(r.error().expected, 1u);
}

TEST(ValidatorConfigTest, RegistryScopesAcceptance) {
    SchemeRegistry::Builder builder;
    SchemeBinding only = test::lwe192();
    ASSERT_TRUE(builder.registerBinding(only).isOk());
    Validator validator(builder.build());

    const SchemeBinding& lwe128 = test::lwe128();
    auto r = validator.validateInbound(test::frameOf(test::makeCiphertext(lwe128, 3), lwe128));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownBinding);

    const Bytes accepted = test::frameOf(test::makeCiphertext(only, 3), only);
    EXPECT_TRUE(validator.validateInbound(accepted).isOk());
}

TEST(ValidatorConfigTest, RejectsInvalidConstruction) {
    EXPECT_THROW(Validator(nullptr), std::invalid_argument);

    Validator::Config tooLarge;
    tooLarge.max_payload_length = wire::kMaxPayloadLength + 1;
    EXPECT_THROW(Validator(SchemeRegistry::builtin(), tooLarge), std::invalid_argument);

    Validator::Config noVersions;
    noVersions.min_version = 0;
    EXPECT_THROW(Validator(SchemeRegistry::builtin(), noVersions), std::invalid_argument);

    Validator::Config inverted;
    inverted.min_version = 2;
    inverted.max_version = 1;
    EXPECT_THROW(Validator(SchemeRegistry::builtin(), inverted), std::invalid_argument);
}
