// ANCHORZK - Core Types Header
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Fundamental byte and hash types shared by every module.

#ifndef ANCHORZK_CORE_TYPES_H
#define ANCHORZK_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace anchorzk {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size digest stored in the order it was produced.
///
/// Field-element digests are stored big-endian, so the byte-wise ordering
/// below matches numeric ordering.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Null (all zero) hash
    BaseHash() noexcept { data_.fill(0); }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Copies min(len, SIZE) bytes and zero-fills the rest
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    const std::array<Byte, SIZE>& ToArray() const noexcept { return data_; }

    bool operator==(const BaseHash& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const BaseHash& other) const noexcept { return !(*this == other); }
    bool operator<(const BaseHash& other) const noexcept { return data_ < other.data_; }

    /// Hex string in storage order
    std::string ToHex() const;

    /// Parse a hex string of exactly 2*SIZE characters (throws on bad input)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes). Merkle leaves and nodes use this type.
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    Hash256() = default;
    explicit Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

// ============================================================================
// Endian Helpers
// ============================================================================

/// Append a 64-bit value in big-endian byte order
inline void WriteBE64(Bytes& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<Byte>(value >> shift));
    }
}

/// Append a 32-bit value in little-endian byte order
inline void WriteLE32(Bytes& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<Byte>(value >> shift));
    }
}

inline uint32_t ReadLE32(const Byte* data) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

inline uint64_t ReadBE64(const Byte* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

} // namespace anchorzk

#endif // ANCHORZK_CORE_TYPES_H
