#pragma once

#include "brightchain/error.hpp"
#include <string>

namespace brightchain::crypto {

/**
 * Extended private key (BIP-32)
 */
struct HdKey {
    PrivateKeyBytes private_key{};
    fixed_bytes<32> chain_code{};
    uint8_t depth = 0;
    uint32_t index = 0;

    bytes public_key(bool compressed = true) const;
};

/**
 * Hierarchical deterministic derivation over secp256k1
 */
class Bip32 {
public:
    static constexpr uint32_t HARDENED_OFFSET = 0x80000000u;

    /**
     * Master key from HMAC-SHA512("Bitcoin seed", seed)
     * @param seed 16 to 64 bytes
     */
    static Result<HdKey> master_from_seed(const bytes& seed);

    /**
     * Private child derivation; indices >= 2^31 are hardened
     */
    static Result<HdKey> derive_child(const HdKey& parent, uint32_t index);

    /**
     * Walk a path such as m/44'/60'/0'/0/0 (h or H also mark hardening)
     * @return Derived key, InvalidDerivationPath on malformed paths
     */
    static Result<HdKey> derive_path(const HdKey& master, const std::string& path);
};

} // namespace brightchain::crypto
