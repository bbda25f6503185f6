// ANCHORZK - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#ifndef ANCHORZK_CORE_HEX_H
#define ANCHORZK_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anchorzk {

/// Convert bytes to a lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument on odd
/// length or a non-hex character. An optional "0x" prefix is accepted.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Non-throwing variant of HexToBytes
std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace anchorzk

#endif // ANCHORZK_CORE_HEX_H
