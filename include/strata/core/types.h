// STRATA - Core Types Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines fundamental types used throughout STRATA.

#ifndef STRATA_CORE_TYPES_H
#define STRATA_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstring>

namespace strata {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Constants
constexpr Amount COIN = 100000000LL;
constexpr Amount MAX_MONEY = 21000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Get current time in milliseconds
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque hash. Bytes are stored little-endian; ToHex() prints
/// them most significant first.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes; short input is zero padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Numeric ordering (most significant byte is stored last)
    bool operator<(const BaseHash& other) const noexcept {
        for (size_t i = SIZE; i-- > 0;) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Low 64 bits, used for hash-table bucketing
    uint64_t GetCheapHash() const noexcept {
        uint64_t v;
        std::memcpy(&v, data_.data(), sizeof(v));
        return v;
    }

    std::string ToHex() const;

    /// Parse a display-order hex string; throws std::invalid_argument
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// Block hash (256-bit)
class BlockHash : public Hash256 {
public:
    using Hash256::Hash256;
    BlockHash() = default;
    explicit BlockHash(const Hash256& h) : Hash256(h) {}

    static BlockHash FromHex(const std::string& hex) {
        return BlockHash(Hash256::FromHex(hex));
    }
};

/// Transaction hash (256-bit)
class TxHash : public Hash256 {
public:
    using Hash256::Hash256;
    TxHash() = default;
    explicit TxHash(const Hash256& h) : Hash256(h) {}

    static TxHash FromHex(const std::string& hex) {
        return TxHash(Hash256::FromHex(hex));
    }
};

/// Hasher for unordered containers keyed by any 256-bit hash type
struct Hash256Hasher {
    size_t operator()(const BaseHash<256>& hash) const noexcept {
        return static_cast<size_t>(hash.GetCheapHash());
    }
};

// ============================================================================
// CompactSize Encoding
// ============================================================================

/// Get size of compact size encoding for a value
inline size_t GetCompactSizeSize(uint64_t value) {
    if (value < 253) return 1;
    if (value <= 0xFFFF) return 3;
    if (value <= 0xFFFFFFFF) return 5;
    return 9;
}

} // namespace strata

#endif // STRATA_CORE_TYPES_H
