// STRATA - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STRATA Developers
// MIT License

#ifndef STRATA_CORE_HEX_H
#define STRATA_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace strata {

/// Lowercase hex of a byte range, in storage order
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Parse hex into bytes; throws std::invalid_argument on odd length or bad digits
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// True for a non-empty, even-length string of hex digits
bool IsValidHex(const std::string& str);

} // namespace strata

#endif // STRATA_CORE_HEX_H
