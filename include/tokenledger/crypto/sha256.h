// TOKENLEDGER - SHA-256
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL EVP. Used for state commitments.

#ifndef TOKENLEDGER_CRYPTO_SHA256_H
#define TOKENLEDGER_CRYPTO_SHA256_H

#include "tokenledger/core/types.h"

#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace tokenledger {

/// SHA-256 hasher class
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize the hash and write to output
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// Compute SHA-256 hash of data
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace tokenledger

#endif // TOKENLEDGER_CRYPTO_SHA256_H
