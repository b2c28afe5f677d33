// TRIBUTARY - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#ifndef TRIBUTARY_CORE_HEX_H
#define TRIBUTARY_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tributary {

/// Convert bytes to lowercase hex (no prefix)
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex to bytes. A leading "0x" is accepted.
/// @return std::nullopt if the string has odd length or a non-hex digit
std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional 0x prefix, even length)
bool IsValidHex(const std::string& str);

/// Strip a leading "0x" or "0X"
std::string StripHexPrefix(const std::string& str);

} // namespace tributary

#endif // TRIBUTARY_CORE_HEX_H
