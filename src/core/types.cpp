// ANCHORZK - Core Types Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/core/types.h"
#include "anchorzk/core/hex.h"

#include <stdexcept>

namespace anchorzk {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::optional<std::vector<Byte>> raw = TryHexToBytes(hex);
    if (!raw || raw->size() != SIZE) {
        throw std::invalid_argument("BaseHash::FromHex: expected " +
                                    std::to_string(SIZE * 2) + " hex digits");
    }
    return BaseHash(raw->data(), raw->size());
}

template class BaseHash<256>;

} // namespace anchorzk
