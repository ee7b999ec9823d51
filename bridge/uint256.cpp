// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// 256-bit unsigned EVM word

#include "uint256.h"

#include <algorithm>
#include <cctype>

namespace fheweb3 {

namespace {

using u128 = unsigned __int128;

bool allDigits(const std::string& s, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

struct EtherUnit {
    const char* name;
    uint32_t decimals;
};

// Longest names first so "nanoether" is not read as "nano" + garbage
constexpr EtherUnit kUnits[] = {
    {"nanoether", 9},
    {"ether", 18},
    {"gwei", 9},
    {"nano", 9},
    {"wei", 0},
};

} // anonymous namespace

Uint256 Uint256::fromLimbs(const Limbs& limbs) {
    Uint256 v;
    v.limbs_ = limbs;
    return v;
}

Uint256 Uint256::fromWord(const Word& word) {
    Uint256 v;
    for (size_t limb = 0; limb < 4; limb++) {
        uint64_t x = 0;
        // limb 0 is the last 8 bytes of the big-endian word
        const size_t base = WORD_SIZE - (limb + 1) * 8;
        for (size_t i = 0; i < 8; i++) {
            x = (x << 8) | word[base + i];
        }
        v.limbs_[limb] = x;
    }
    return v;
}

Uint256::Word Uint256::toWord() const {
    Word word{};
    for (size_t limb = 0; limb < 4; limb++) {
        const size_t base = WORD_SIZE - (limb + 1) * 8;
        uint64_t x = limbs_[limb];
        for (size_t i = 0; i < 8; i++) {
            word[base + 7 - i] = static_cast<uint8_t>(x & 0xff);
            x >>= 8;
        }
    }
    return word;
}

Result<Uint256> Uint256::fromBigEndian(const uint8_t* data, size_t len) {
    if (len > WORD_SIZE) {
        return Error::invalidArgument("value wider than 32 bytes");
    }
    Word word{};
    std::copy(data, data + len, word.begin() + (WORD_SIZE - len));
    return fromWord(word);
}

Result<Uint256> Uint256::fromDecimal(const std::string& text) {
    if (!allDigits(text, 0, text.size())) {
        return Error::invalidArgument("invalid decimal integer \"" + text + "\"");
    }
    Uint256 v;
    for (char c : text) {
        if (!v.checkedMul(10) || !v.checkedAdd(Uint256(static_cast<uint64_t>(c - '0')))) {
            return Error::invalidArgument("integer overflows 256 bits: \"" + text + "\"");
        }
    }
    return v;
}

Result<Uint256> Uint256::fromHex(const std::string& text) {
    size_t start = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        start = 2;
    }
    if (start >= text.size()) {
        return Error::invalidArgument("empty hex integer");
    }
    while (start + 1 < text.size() && text[start] == '0') {
        start++;
    }
    if (text.size() - start > WORD_SIZE * 2) {
        return Error::invalidArgument("hex integer overflows 256 bits: \"" + text + "\"");
    }

    Uint256 v;
    for (size_t i = start; i < text.size(); i++) {
        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
        uint64_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<uint64_t>(c - 'a' + 10);
        } else {
            return Error::invalidArgument("invalid hex integer \"" + text + "\"");
        }
        // shift left by one nibble
        for (size_t limb = 3; limb > 0; limb--) {
            v.limbs_[limb] = (v.limbs_[limb] << 4) | (v.limbs_[limb - 1] >> 60);
        }
        v.limbs_[0] = (v.limbs_[0] << 4) | digit;
    }
    return v;
}

std::string Uint256::toDecimal() const {
    if (isZero()) {
        return "0";
    }
    Uint256 tmp = *this;
    std::string digits;
    while (!tmp.isZero()) {
        digits.push_back(static_cast<char>('0' + tmp.divSmall(10)));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string Uint256::toHex() const {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    bool leading = true;
    for (size_t limb = 4; limb-- > 0;) {
        for (int shift = 60; shift >= 0; shift -= 4) {
            const unsigned d = static_cast<unsigned>((limbs_[limb] >> shift) & 0xf);
            if (leading && d == 0) continue;
            leading = false;
            out += kDigits[d];
        }
    }
    return "0x" + (out.empty() ? std::string("0") : out);
}

bool Uint256::isZero() const {
    return limbs_[0] == 0 && limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0;
}

bool Uint256::checkedMul(uint64_t factor) {
    Limbs out{};
    uint64_t carry = 0;
    for (size_t i = 0; i < 4; i++) {
        const u128 prod = static_cast<u128>(limbs_[i]) * factor + carry;
        out[i] = static_cast<uint64_t>(prod);
        carry = static_cast<uint64_t>(prod >> 64);
    }
    if (carry != 0) {
        return false;
    }
    limbs_ = out;
    return true;
}

bool Uint256::checkedAdd(const Uint256& other) {
    Limbs out{};
    uint64_t carry = 0;
    for (size_t i = 0; i < 4; i++) {
        const u128 sum = static_cast<u128>(limbs_[i]) + other.limbs_[i] + carry;
        out[i] = static_cast<uint64_t>(sum);
        carry = static_cast<uint64_t>(sum >> 64);
    }
    if (carry != 0) {
        return false;
    }
    limbs_ = out;
    return true;
}

uint64_t Uint256::divSmall(uint64_t divisor) {
    u128 rem = 0;
    for (size_t limb = 4; limb-- > 0;) {
        const u128 cur = (rem << 64) | limbs_[limb];
        limbs_[limb] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    return static_cast<uint64_t>(rem);
}

bool Uint256::operator<(const Uint256& other) const {
    for (size_t limb = 4; limb-- > 0;) {
        if (limbs_[limb] != other.limbs_[limb]) {
            return limbs_[limb] < other.limbs_[limb];
        }
    }
    return false;
}

// =============================================================================
// Ether value parsing
// =============================================================================

Result<Uint256> parseEtherValue(const std::string& value) {
    if (value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        return Uint256::fromHex(value);
    }
    if (allDigits(value, 0, value.size())) {
        return Uint256::fromDecimal(value);
    }

    // Number[.Fraction][Spaces]Unit
    const EtherUnit* unit = nullptr;
    size_t number_end = value.size();
    for (const auto& candidate : kUnits) {
        const std::string name(candidate.name);
        if (value.size() > name.size() &&
            value.compare(value.size() - name.size(), name.size(), name) == 0) {
            unit = &candidate;
            number_end = value.size() - name.size();
            break;
        }
    }
    if (!unit) {
        return Error::invalidArgument("unrecognized ether value \"" + value + "\"");
    }
    while (number_end > 0 && std::isspace(static_cast<unsigned char>(value[number_end - 1]))) {
        number_end--;
    }

    const size_t dot = value.find('.');
    const size_t int_end = (dot != std::string::npos && dot < number_end) ? dot : number_end;
    if (!allDigits(value, 0, int_end)) {
        return Error::invalidArgument("invalid ether amount \"" + value + "\"");
    }

    std::string fraction;
    if (int_end != number_end) {
        if (!allDigits(value, int_end + 1, number_end)) {
            return Error::invalidArgument("invalid fractional part in \"" + value + "\"");
        }
        fraction = value.substr(int_end + 1, number_end - int_end - 1);
    }
    if (fraction.size() > unit->decimals) {
        return Error::invalidArgument("more than " + std::to_string(unit->decimals) +
                                      " decimals for unit " + unit->name);
    }

    // integer digits followed by the fraction padded to the unit's decimals
    std::string digits = value.substr(0, int_end) + fraction;
    digits.append(unit->decimals - fraction.size(), '0');
    return Uint256::fromDecimal(digits);
}

} // namespace fheweb3
