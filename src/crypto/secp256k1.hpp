#pragma once

#include "brightchain/common.hpp"
#include <optional>

namespace brightchain::crypto {

/**
 * secp256k1 point arithmetic: key generation, ECDH and recoverable ECDSA
 *
 * Malformed inputs yield nullopt or false; OpenSSL failures throw CryptoException.
 */
class Secp256k1 {
public:
    /**
     * Random scalar in [1, n)
     */
    static PrivateKeyBytes generate_private_key();

    static bool is_valid_private_key(const PrivateKeyBytes& private_key);

    /**
     * Public key for a private scalar
     * @param compressed 33-byte form when true, else 65-byte 0x04 form
     */
    static bytes public_key(const PrivateKeyBytes& private_key, bool compressed = false);

    /**
     * Parse a 65-byte, 64-byte raw or 33-byte compressed key
     * @return 65-byte uncompressed key, nullopt when malformed or off-curve
     */
    static std::optional<bytes> normalize_public_key(const byte* data, size_t len);
    static std::optional<bytes> normalize_public_key(const bytes& key) {
        return normalize_public_key(key.data(), key.size());
    }

    /**
     * Shared secret: x coordinate of private_key * public_key
     */
    static std::optional<fixed_bytes<32>> ecdh(const PrivateKeyBytes& private_key, const bytes& public_key);

    /**
     * Sign a 32-byte digest; low-s normalised
     * @return r(32) || s(32) || recovery id (0 or 1)
     */
    static SignatureBytes sign_digest(const fixed_bytes<32>& digest, const PrivateKeyBytes& private_key);

    /**
     * Recover the signer's 65-byte public key; recovery id may be 0..3 or 27..30
     */
    static std::optional<bytes> recover(const fixed_bytes<32>& digest, const SignatureBytes& signature);

    /**
     * (a + b) mod n, nullopt when the sum is zero or a tweak is out of range
     */
    static std::optional<PrivateKeyBytes> add_private_keys(const PrivateKeyBytes& a, const PrivateKeyBytes& b);
};

} // namespace brightchain::crypto
