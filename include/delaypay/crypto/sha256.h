// DELAYPAY - SHA256 Hash Function
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by OpenSSL's EVP digest interface.

#ifndef DELAYPAY_CRYPTO_SHA256_H
#define DELAYPAY_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include "delaypay/core/types.h"

// Forward declaration from <openssl/evp.h>
struct evp_md_ctx_st;

namespace delaypay {

/// SHA-256 hasher class
/// Provides incremental hashing; Write() calls may be chained.
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @throws std::runtime_error if the digest context fails
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write OUTPUT_SIZE bytes to hash.
    /// The hasher must be Reset() before it is written again.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& text) {
    return SHA256Hash(reinterpret_cast<const Byte*>(text.data()), text.size());
}

} // namespace delaypay

#endif // DELAYPAY_CRYPTO_SHA256_H
