// STRATA - 256-bit Unsigned Arithmetic Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/arith.h"
#include <stdexcept>

namespace strata {

// ============================================================================
// Queries
// ============================================================================

bool ArithUint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

unsigned int ArithUint256::bits() const {
    for (int i = NUM_LIMBS - 1; i >= 0; --i) {
        if (limbs[i] != 0) {
            return 64 * i + (64 - __builtin_clzll(limbs[i]));
        }
    }
    return 0;
}

std::string ArithUint256::ToString() const {
    return ArithToUint256(*this).ToHex();
}

int ArithUint256::CompareTo(const ArithUint256& other) const {
    for (int i = NUM_LIMBS - 1; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return -1;
        if (limbs[i] > other.limbs[i]) return 1;
    }
    return 0;
}

// ============================================================================
// Bitwise
// ============================================================================

ArithUint256 ArithUint256::operator~() const {
    ArithUint256 r;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        r.limbs[i] = ~limbs[i];
    }
    return r;
}

ArithUint256& ArithUint256::operator<<=(unsigned int shift) {
    if (shift >= 256) {
        limbs.fill(0);
        return *this;
    }
    const unsigned int limbShift = shift / 64;
    const unsigned int bitShift = shift % 64;
    std::array<uint64_t, NUM_LIMBS> out{0, 0, 0, 0};
    for (int i = NUM_LIMBS - 1; i >= static_cast<int>(limbShift); --i) {
        out[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i - static_cast<int>(limbShift) - 1 >= 0) {
            out[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    limbs = out;
    return *this;
}

ArithUint256& ArithUint256::operator>>=(unsigned int shift) {
    if (shift >= 256) {
        limbs.fill(0);
        return *this;
    }
    const unsigned int limbShift = shift / 64;
    const unsigned int bitShift = shift % 64;
    std::array<uint64_t, NUM_LIMBS> out{0, 0, 0, 0};
    for (size_t i = 0; i + limbShift < NUM_LIMBS; ++i) {
        out[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < NUM_LIMBS) {
            out[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    limbs = out;
    return *this;
}

// ============================================================================
// Arithmetic
// ============================================================================

ArithUint256& ArithUint256::operator+=(const ArithUint256& other) {
    __uint128_t carry = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(limbs[i]) + other.limbs[i] + carry;
        limbs[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }
    return *this;
}

ArithUint256& ArithUint256::operator-=(const ArithUint256& other) {
    uint64_t borrow = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(limbs[i]) - other.limbs[i] - borrow;
        limbs[i] = static_cast<uint64_t>(diff);
        borrow = (diff >> 127) ? 1 : 0;
    }
    return *this;
}

ArithUint256& ArithUint256::operator*=(uint64_t factor) {
    __uint128_t carry = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t prod = static_cast<__uint128_t>(limbs[i]) * factor + carry;
        limbs[i] = static_cast<uint64_t>(prod);
        carry = prod >> 64;
    }
    return *this;
}

ArithUint256& ArithUint256::operator/=(const ArithUint256& divisor) {
    const unsigned int divBits = divisor.bits();
    if (divBits == 0) {
        throw std::domain_error("ArithUint256: division by zero");
    }

    ArithUint256 num = *this;
    ArithUint256 div = divisor;
    limbs.fill(0);

    const unsigned int numBits = num.bits();
    if (divBits > numBits) {
        return *this;
    }

    int shift = static_cast<int>(numBits - divBits);
    div <<= shift;
    while (shift >= 0) {
        if (num >= div) {
            num -= div;
            limbs[shift / 64] |= (uint64_t{1} << (shift % 64));
        }
        div >>= 1;
        --shift;
    }
    return *this;
}

// ============================================================================
// Compact Encoding
// ============================================================================

ArithUint256& ArithUint256::SetCompact(uint32_t nCompact, bool* pfNegative,
                                       bool* pfOverflow) {
    const unsigned int nSize = nCompact >> 24;
    uint32_t nWord = nCompact & 0x007fffff;
    if (nSize <= 3) {
        nWord >>= 8 * (3 - nSize);
        *this = ArithUint256(nWord);
    } else {
        *this = ArithUint256(nWord);
        *this <<= 8 * (nSize - 3);
    }
    if (pfNegative) {
        *pfNegative = nWord != 0 && (nCompact & 0x00800000) != 0;
    }
    if (pfOverflow) {
        *pfOverflow = nWord != 0 && ((nSize > 34) ||
                                     (nWord > 0xff && nSize > 33) ||
                                     (nWord > 0xffff && nSize > 32));
    }
    return *this;
}

uint32_t ArithUint256::GetCompact() const {
    unsigned int nSize = (bits() + 7) / 8;
    uint32_t nCompact = 0;
    if (nSize <= 3) {
        nCompact = static_cast<uint32_t>(GetLow64() << (8 * (3 - nSize)));
    } else {
        ArithUint256 bn = *this >> (8 * (nSize - 3));
        nCompact = static_cast<uint32_t>(bn.GetLow64());
    }
    // Keep the sign bit clear by moving one byte into the exponent
    if (nCompact & 0x00800000) {
        nCompact >>= 8;
        nSize++;
    }
    nCompact |= nSize << 24;
    return nCompact;
}

// ============================================================================
// Conversions
// ============================================================================

ArithUint256 UintToArith256(const Hash256& hash) {
    ArithUint256 r;
    for (size_t i = 0; i < ArithUint256::NUM_LIMBS; ++i) {
        uint64_t limb = 0;
        for (size_t b = 0; b < 8; ++b) {
            limb |= static_cast<uint64_t>(hash[i * 8 + b]) << (8 * b);
        }
        r.limbs[i] = limb;
    }
    return r;
}

Hash256 ArithToUint256(const ArithUint256& value) {
    Hash256 h;
    for (size_t i = 0; i < ArithUint256::NUM_LIMBS; ++i) {
        for (size_t b = 0; b < 8; ++b) {
            h[i * 8 + b] = static_cast<Byte>(value.limbs[i] >> (8 * b));
        }
    }
    return h;
}

ArithUint256 GetBlockProof(uint32_t nBits) {
    bool fNegative = false;
    bool fOverflow = false;
    ArithUint256 target;
    target.SetCompact(nBits, &fNegative, &fOverflow);
    if (fNegative || fOverflow || target.IsZero()) {
        return ArithUint256();
    }
    // 2^256 / (target + 1) == ~target / (target + 1) + 1
    return (~target / (target + ArithUint256(1))) + ArithUint256(1);
}

} // namespace strata
