// STRATA - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/hex.h"

#include <stdexcept>

namespace strata {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = DigitValue(hex[i]);
        int lo = DigitValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (DigitValue(c) < 0) return false;
    }
    return true;
}

} // namespace strata
