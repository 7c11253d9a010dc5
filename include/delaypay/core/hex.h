// DELAYPAY - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#ifndef DELAYPAY_CORE_HEX_H
#define DELAYPAY_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>

namespace delaypay {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes (an optional "0x" prefix is ignored)
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, non-empty hex (optional "0x" prefix)
bool IsValidHex(const std::string& str);

/// Remove a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& hex);

} // namespace delaypay

#endif // DELAYPAY_CORE_HEX_H
