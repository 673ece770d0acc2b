#pragma once

#include "brightchain/error.hpp"
#include <string>
#include <vector>

namespace brightchain::identity {
class Member;
}

namespace brightchain::services {

/**
 * Key pair derived from a mnemonic
 */
struct KeyPair {
    PrivateKeyBytes private_key{};
    bytes public_key;  // 65 bytes, 0x04 prefixed
};

/**
 * Encryption target: identifier plus public key
 */
struct Recipient {
    MemberId id;
    bytes public_key;
};

/**
 * Length accounting for block-aligned single-recipient encryption
 */
struct EncryptedLengthInfo {
    uint64_t blocks_needed = 0;
    uint64_t capacity_per_block = 0;
    uint64_t padding = 0;
    uint64_t total_encrypted_size = 0;
    uint64_t encrypted_data_length = 0;
};

/**
 * Parsed multi-recipient payload (layout version 2)
 *
 * dataLength u64 | recipientCount u16 | ids (16 each) | wrapped keys (129 each)
 * | iv (16) | tag (16) | AES-GCM(crc16 | plaintext)
 */
struct MultiRecipientMessage {
    uint64_t data_length = 0;
    std::vector<MemberId> recipient_ids;
    std::vector<bytes> recipient_keys;
    fixed_bytes<constants::ecies::IV_LENGTH> iv{};
    fixed_bytes<constants::ecies::AUTH_TAG_LENGTH> auth_tag{};
    bytes encrypted_message;

    bytes serialize() const;
    size_t serialized_size() const;

    /**
     * Parse a layout; bytes after the ciphertext are ignored
     */
    static Result<MultiRecipientMessage> parse(const byte* data, size_t len);
    static Result<MultiRecipientMessage> parse(const bytes& data) { return parse(data.data(), data.size()); }
};

/**
 * ECIES over secp256k1 with AES-256-GCM
 *
 * Stateless apart from the recipient bound; safe to share across threads.
 */
class ECIESService {
public:
    /**
     * @throws BrightChainException(InvalidConfiguration) unless 1 <= max_recipients <= 65535,
     *         the range the u16 recipient count on the wire can carry
     */
    explicit ECIESService(size_t max_recipients = constants::ecies::multiple::MAX_RECIPIENTS);

    size_t max_recipients() const { return max_recipients_; }

    // Key management

    /**
     * Fresh BIP-39 mnemonic
     * @param strength_bits Entropy bits, default 256
     */
    Result<std::string> generate_new_mnemonic(size_t strength_bits = constants::ecies::MNEMONIC_STRENGTH) const;

    /**
     * Derive the key pair at the primary path m/44'/60'/0'/0/0
     * @return Keys, InvalidMnemonic when the mnemonic fails validation
     */
    Result<KeyPair> mnemonic_to_key_pair(const std::string& mnemonic, const std::string& passphrase = "") const;

    bytes get_public_key(const PrivateKeyBytes& private_key) const;

    /**
     * @return 65-byte key, InvalidSenderPublicKey when malformed or off-curve
     */
    Result<bytes> normalize_public_key(const bytes& public_key) const;

    // Single recipient

    /**
     * Encrypt for one public key
     * @return ephemeralPublicKey(65) | iv(16) | tag(16) | ciphertext
     */
    Result<bytes> encrypt(const bytes& receiver_public_key, const bytes& message) const;

    /**
     * Decrypt a single-recipient payload
     * @return Plaintext, InvalidEphemeralPublicKey or DecryptionFailed
     */
    Result<bytes> decrypt(const PrivateKeyBytes& private_key, const bytes& encrypted) const;

    Result<EncryptedLengthInfo> compute_encrypted_length(uint64_t data_length, uint32_t block_size) const;

    /**
     * Inverse of compute_encrypted_length
     * @return Plaintext length, InvalidEncryptedDataLength when not block aligned
     */
    Result<uint64_t> compute_decrypted_length(uint64_t encrypted_length, uint32_t block_size,
                                              uint64_t padding) const;

    // Multiple recipients

    Result<MultiRecipientMessage> encrypt_multiple(const std::vector<Recipient>& recipients,
                                                   const bytes& message) const;

    Result<bytes> decrypt_multiple_for_recipient(const MultiRecipientMessage& message, const MemberId& recipient_id,
                                                 const PrivateKeyBytes* private_key) const;
    Result<bytes> decrypt_multiple_for_recipient(const MultiRecipientMessage& message,
                                                 const identity::Member& recipient) const;

    /**
     * Bytes a multi-recipient layout adds to its plaintext
     */
    static size_t multi_recipient_overhead(size_t recipient_count);

    /**
     * Structured MultiEncrypted block: prefix | layout | random padding
     * @return block_size bytes, DataTooLarge when the layout does not fit
     */
    Result<bytes> encrypt_multiple_to_block(const std::vector<Recipient>& recipients, const bytes& message,
                                            uint32_t block_size) const;

    /**
     * @return Plaintext, UnsupportedLayoutVersion for a non-v2 block
     */
    Result<bytes> decrypt_multiple_block_for_recipient(const bytes& block, const identity::Member& recipient) const;

    // Signatures

    static fixed_bytes<32> personal_message_digest(const bytes& message);

    /**
     * @return r(32) | s(32) | recovery id
     */
    SignatureBytes sign_message(const PrivateKeyBytes& private_key, const bytes& message) const;

    /**
     * Recover the signer and compare addresses
     * @return true on match, false on mismatch, InvalidSignature on malformed length
     */
    Result<bool> verify_message(const bytes& public_key, const bytes& message, const bytes& signature) const;

    Result<Address> address_from_public_key(const bytes& public_key) const;

private:
    size_t max_recipients_;
};

} // namespace brightchain::services
