// DELAYPAY - SHA256 Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/crypto/sha256.h"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace delaypay {

void SHA256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> hash;

    hasher.Write(data, len);
    hasher.Finalize(hash.data());

    return Hash256(hash);
}

} // namespace delaypay
