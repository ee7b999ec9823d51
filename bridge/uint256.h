// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// 256-bit unsigned EVM word
//
// Two representations are bijective: four 64-bit limbs (limb 0 least
// significant, the layout FHE uint256 plaintexts use) and the 32-byte
// big-endian word the EVM uses in calldata and storage.

#ifndef FHEWEB3_UINT256_H
#define FHEWEB3_UINT256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "error.h"

namespace fheweb3 {

class Uint256 {
public:
    static constexpr size_t WORD_SIZE = 32;
    using Limbs = std::array<uint64_t, 4>;
    using Word = std::array<uint8_t, WORD_SIZE>;

    Uint256() = default;
    explicit Uint256(uint64_t value) { limbs_[0] = value; }

    static Uint256 fromLimbs(const Limbs& limbs);
    const Limbs& limbs() const { return limbs_; }

    static Uint256 fromWord(const Word& word);
    Word toWord() const;

    // Big-endian, at most 32 bytes, left-padded with zeros
    static Result<Uint256> fromBigEndian(const uint8_t* data, size_t len);

    static Result<Uint256> fromDecimal(const std::string& text);
    // Optional 0x prefix, at most 64 digits
    static Result<Uint256> fromHex(const std::string& text);

    std::string toDecimal() const;
    std::string toHex() const;

    bool isZero() const;

    // Checked arithmetic: on overflow returns false and leaves *this unchanged
    bool checkedMul(uint64_t factor);
    bool checkedAdd(const Uint256& other);

    // In-place division by a small divisor, returns the remainder
    uint64_t divSmall(uint64_t divisor);

    bool operator==(const Uint256& other) const { return limbs_ == other.limbs_; }
    bool operator!=(const Uint256& other) const { return !(*this == other); }
    bool operator<(const Uint256& other) const;

private:
    Limbs limbs_{};
};

// Parse an ether amount into wei.
//
//   "100"          -> 100 wei
//   "0x2a"         -> 42 wei
//   "1ether"       -> 10^18 wei
//   "1.5 gwei"     -> 1500000000 wei
//
// Units: ether, gwei (also nano, nanoether), wei. A fractional part is only
// accepted together with a unit and may not exceed the unit's decimals.
Result<Uint256> parseEtherValue(const std::string& value);

} // namespace fheweb3

#endif // FHEWEB3_UINT256_H
