// STRATA - Core Types Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/types.h"
#include "strata/core/hex.h"

namespace strata {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    std::array<Byte, SIZE> reversed;
    std::reverse_copy(data_.begin(), data_.end(), reversed.begin());
    return BytesToHex(reversed.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("hash hex must be " + std::to_string(SIZE * 2) + " characters");
    }
    std::vector<Byte> bytes = HexToBytes(hex);
    std::reverse(bytes.begin(), bytes.end());
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<256>;

} // namespace strata
