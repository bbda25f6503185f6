// ANCHORZK - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/core/hex.h"

#include <stdexcept>
#include <utility>

namespace anchorzk {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

/// Value of one hex digit, or -1
int DigitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    char lower = static_cast<char>(c | 0x20);
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

/// Digits after an optional 0x/0X
std::pair<const char*, size_t> Digits(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] | 0x20) == 'x') {
        return {hex.data() + 2, hex.size() - 2};
    }
    return {hex.data(), hex.size()};
}

} // anonymous namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0f];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex) {
    auto [digits, count] = Digits(hex);
    if (count % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(count / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        int hi = DigitValue(digits[2 * i]);
        int lo = DigitValue(digits[2 * i + 1]);
        if ((hi | lo) < 0) {
            return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return bytes;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (Digits(hex).second % 2 != 0) {
        throw std::invalid_argument("HexToBytes: odd number of digits");
    }
    std::optional<std::vector<uint8_t>> bytes = TryHexToBytes(hex);
    if (!bytes) {
        throw std::invalid_argument("HexToBytes: non-hex character in '" + hex + "'");
    }
    return *bytes;
}

bool IsValidHex(const std::string& str) {
    // No prefix allowed here
    return !str.empty() && Digits(str).first == str.data() && TryHexToBytes(str).has_value();
}

} // namespace anchorzk
