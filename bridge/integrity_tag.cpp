// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Trailing integrity tag for wire frames

#include "integrity_tag.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace fheweb3 {
namespace integrity {

size_t tagSize(TagAlgorithm algorithm) {
    switch (algorithm) {
        case TagAlgorithm::None:   return 0;
        case TagAlgorithm::Sha256: return SHA256_TAG_SIZE;
    }
    return 0;
}

Result<std::vector<uint8_t>> compute(TagAlgorithm algorithm, const uint8_t* data, size_t len) {
    switch (algorithm) {
        case TagAlgorithm::None:
            return std::vector<uint8_t>();
        case TagAlgorithm::Sha256: {
            std::vector<uint8_t> digest(SHA256_TAG_SIZE);
            unsigned int out_len = 0;
            if (EVP_Digest(data, len, digest.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
                out_len != SHA256_TAG_SIZE) {
                return Error::invalidArgument("EVP_Digest(sha256) failed");
            }
            return digest;
        }
    }
    return Error::invalidArgument("unknown tag algorithm");
}

bool verify(TagAlgorithm algorithm, const uint8_t* data, size_t len,
            const uint8_t* tag, size_t tag_len) {
    if (tag_len != tagSize(algorithm)) {
        return false;
    }
    if (algorithm == TagAlgorithm::None) {
        return true;
    }
    auto expected = compute(algorithm, data, len);
    if (!expected) {
        return false;
    }
    return CRYPTO_memcmp(expected.value().data(), tag, tag_len) == 0;
}

} // namespace integrity
} // namespace fheweb3
