#pragma once

#include "brightchain/error.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <memory>

namespace brightchain::crypto::detail {

// RAII owners for OpenSSL handles
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

struct EcGroupDeleter {
    void operator()(EC_GROUP* group) const noexcept { EC_GROUP_free(group); }
};

struct EcPointDeleter {
    void operator()(EC_POINT* point) const noexcept { EC_POINT_clear_free(point); }
};

struct BignumDeleter {
    void operator()(BIGNUM* bn) const noexcept { BN_clear_free(bn); }
};

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using UniqueEcGroup = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using UniqueEcPoint = std::unique_ptr<EC_POINT, EcPointDeleter>;
using UniqueBignum = std::unique_ptr<BIGNUM, BignumDeleter>;
using UniqueBnCtx = std::unique_ptr<BN_CTX, BnCtxDeleter>;

// Throws CryptoException when an OpenSSL call reports failure
inline void ensure(bool ok, const char* message) {
    if (!ok) {
        throw CryptoException(ErrorCode::CryptoOperationFailed, message);
    }
}

} // namespace brightchain::crypto::detail
