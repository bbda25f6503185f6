// ANCHORZK - SHA256 Hash Function
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef ANCHORZK_CRYPTO_SHA256_H
#define ANCHORZK_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "anchorzk/core/types.h"

struct evp_md_ctx_st;

namespace anchorzk {

/// Streaming SHA-256 over an EVP_MD_CTX
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if OpenSSL cannot allocate a context
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Absorb `len` bytes; returns *this
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write OUTPUT_SIZE bytes to `hash`.
    /// The hasher must be Reset() before it is written to again.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Start a fresh digest
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

/// One-shot digest
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace anchorzk

#endif // ANCHORZK_CRYPTO_SHA256_H
