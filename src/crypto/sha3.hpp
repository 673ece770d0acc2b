#pragma once

#include "brightchain/common.hpp"
#include "openssl_utils.hpp"
#include <string>

namespace brightchain::crypto {

/**
 * SHA3 digests (FIPS 202) through OpenSSL EVP
 */
class Sha3 {
public:
    static ChecksumBytes hash512(const byte* data, size_t len);
    static ChecksumBytes hash512(const bytes& data);

    static fixed_bytes<32> hash256(const byte* data, size_t len);
    static fixed_bytes<32> hash256(const bytes& data);
};

/**
 * Incremental SHA3-512; no digest is exposed before finalize()
 */
class Sha3_512Hasher {
public:
    Sha3_512Hasher();

    void update(const byte* data, size_t len);
    void update(const bytes& data) { update(data.data(), data.size()); }

    /**
     * Finish the digest; the hasher cannot be updated afterwards
     */
    ChecksumBytes finalize();

private:
    detail::UniqueMdCtx ctx_;
    bool finalized_ = false;
};

} // namespace brightchain::crypto
