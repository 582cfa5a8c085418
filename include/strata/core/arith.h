// STRATA - 256-bit Unsigned Arithmetic
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Integer arithmetic over 256-bit values, used for proof-of-work targets
// and cumulative chain work.

#ifndef STRATA_CORE_ARITH_H
#define STRATA_CORE_ARITH_H

#include "strata/core/types.h"
#include <array>
#include <cstdint>
#include <string>

namespace strata {

// ============================================================================
// ArithUint256
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class ArithUint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limbs[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    constexpr ArithUint256() : limbs{0, 0, 0, 0} {}
    constexpr ArithUint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    bool IsZero() const;

    /// Number of significant bits (0 for zero)
    unsigned int bits() const;

    uint64_t GetLow64() const { return limbs[0]; }

    /// Display-order hex, 64 digits
    std::string ToString() const;

    // Comparison
    int CompareTo(const ArithUint256& other) const;
    bool operator==(const ArithUint256& other) const { return limbs == other.limbs; }
    bool operator!=(const ArithUint256& other) const { return limbs != other.limbs; }
    bool operator<(const ArithUint256& other) const { return CompareTo(other) < 0; }
    bool operator<=(const ArithUint256& other) const { return CompareTo(other) <= 0; }
    bool operator>(const ArithUint256& other) const { return CompareTo(other) > 0; }
    bool operator>=(const ArithUint256& other) const { return CompareTo(other) >= 0; }

    // Bitwise
    ArithUint256 operator~() const;
    ArithUint256& operator<<=(unsigned int shift);
    ArithUint256& operator>>=(unsigned int shift);
    ArithUint256 operator<<(unsigned int shift) const { ArithUint256 r(*this); r <<= shift; return r; }
    ArithUint256 operator>>(unsigned int shift) const { ArithUint256 r(*this); r >>= shift; return r; }

    // Arithmetic (wraps modulo 2^256)
    ArithUint256& operator+=(const ArithUint256& other);
    ArithUint256& operator-=(const ArithUint256& other);
    ArithUint256& operator*=(uint64_t factor);
    /// Throws std::domain_error on division by zero
    ArithUint256& operator/=(const ArithUint256& divisor);

    ArithUint256 operator+(const ArithUint256& o) const { ArithUint256 r(*this); r += o; return r; }
    ArithUint256 operator-(const ArithUint256& o) const { ArithUint256 r(*this); r -= o; return r; }
    ArithUint256 operator*(uint64_t f) const { ArithUint256 r(*this); r *= f; return r; }
    ArithUint256 operator/(const ArithUint256& o) const { ArithUint256 r(*this); r /= o; return r; }

    /**
     * Decode a compact ("nBits") target: the high byte is a base-256
     * exponent, the low 23 bits the mantissa, and bit 23 a sign.
     * pfNegative / pfOverflow report encodings that cannot be valid targets.
     */
    ArithUint256& SetCompact(uint32_t nCompact, bool* pfNegative = nullptr,
                             bool* pfOverflow = nullptr);

    /// Encode to compact form, rounding down to 23 significant bits
    uint32_t GetCompact() const;
};

/// Reinterpret a little-endian hash as a number
ArithUint256 UintToArith256(const Hash256& hash);

/// Inverse of UintToArith256
Hash256 ArithToUint256(const ArithUint256& value);

/// Expected number of hashes to meet a compact target: 2^256 / (target + 1).
/// Invalid targets yield zero work.
ArithUint256 GetBlockProof(uint32_t nBits);

} // namespace strata

#endif // STRATA_CORE_ARITH_H
