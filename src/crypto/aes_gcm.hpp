#pragma once

#include "brightchain/common.hpp"
#include <optional>

namespace brightchain::crypto {

/**
 * AES-256-GCM with a 16-byte IV and 16-byte tag
 */
class AesGcm {
public:
    struct Sealed {
        bytes ciphertext;
        fixed_bytes<constants::ecies::AUTH_TAG_LENGTH> tag;
    };

    /**
     * Encrypt plaintext
     * @param key 32-byte key
     * @param iv 16-byte IV
     * @return Ciphertext and tag; throws CryptoException on library failure
     */
    static Sealed encrypt(const byte* key, const byte* iv, const byte* plaintext, size_t len);
    static Sealed encrypt(const bytes& key, const bytes& iv, const bytes& plaintext);

    /**
     * Decrypt and authenticate
     * @return Plaintext, nullopt if authentication fails
     */
    static std::optional<bytes> decrypt(const byte* key, const byte* iv,
                                        const byte* ciphertext, size_t len, const byte* tag);
    static std::optional<bytes> decrypt(const bytes& key, const bytes& iv,
                                        const bytes& ciphertext, const bytes& tag);
};

} // namespace brightchain::crypto
