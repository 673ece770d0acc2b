#include "ecies_service.hpp"
#include "crypto/aes_gcm.hpp"
#include "crypto/bip32.hpp"
#include "crypto/bip39.hpp"
#include "crypto/random.hpp"
#include "crypto/secp256k1.hpp"
#include "crypto/sha3.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace brightchain::services {

using namespace constants::ecies;

namespace {
    constexpr const char* PERSONAL_MESSAGE_PREFIX = "\x19" "Ethereum Signed Message:\n";
}

ECIESService::ECIESService(size_t max_recipients) : max_recipients_(max_recipients) {
    if (max_recipients == 0 || max_recipients > constants::ecies::multiple::MAX_RECIPIENTS) {
        throw BrightChainException(ErrorCode::InvalidConfiguration,
            "max_recipients " + std::to_string(max_recipients) + " outside [1, " +
            std::to_string(constants::ecies::multiple::MAX_RECIPIENTS) + "]");
    }
}

Result<std::string> ECIESService::generate_new_mnemonic(size_t strength_bits) const {
    return crypto::Bip39::generate_mnemonic(strength_bits);
}

Result<KeyPair> ECIESService::mnemonic_to_key_pair(const std::string& mnemonic, const std::string& passphrase) const {
    if (!crypto::Bip39::validate(mnemonic)) {
        return Result<KeyPair>::Err(ErrorCode::InvalidMnemonic, "Mnemonic failed validation");
    }

    bytes seed = crypto::Bip39::mnemonic_to_seed(mnemonic, passphrase);
    auto master = crypto::Bip32::master_from_seed(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    BRIGHTCHAIN_TRY(master);

    BRIGHTCHAIN_TRY_UNWRAP(derived, crypto::Bip32::derive_path(master.value(), PRIMARY_KEY_DERIVATION_PATH));
    OPENSSL_cleanse(master.value().private_key.data(), PRIVATE_KEY_LENGTH);

    KeyPair pair;
    pair.private_key = derived.private_key;
    pair.public_key = crypto::Secp256k1::public_key(derived.private_key, false);
    OPENSSL_cleanse(derived.private_key.data(), PRIVATE_KEY_LENGTH);
    return Result<KeyPair>::Ok(std::move(pair));
}

bytes ECIESService::get_public_key(const PrivateKeyBytes& private_key) const {
    return crypto::Secp256k1::public_key(private_key, false);
}

Result<bytes> ECIESService::normalize_public_key(const bytes& public_key) const {
    auto normalized = crypto::Secp256k1::normalize_public_key(public_key);
    if (!normalized) {
        return Result<bytes>::Err(ErrorCode::InvalidSenderPublicKey,
            "Public key of " + std::to_string(public_key.size()) + " bytes is malformed or off-curve");
    }
    return Result<bytes>::Ok(std::move(*normalized));
}

Result<bytes> ECIESService::encrypt(const bytes& receiver_public_key, const bytes& message) const {
    BRIGHTCHAIN_TRY_UNWRAP(receiver, normalize_public_key(receiver_public_key));

    PrivateKeyBytes ephemeral = crypto::Secp256k1::generate_private_key();
    bytes ephemeral_public = crypto::Secp256k1::public_key(ephemeral, false);
    auto shared = crypto::Secp256k1::ecdh(ephemeral, receiver);
    OPENSSL_cleanse(ephemeral.data(), ephemeral.size());
    if (!shared) {
        return Result<bytes>::Err(ErrorCode::InvalidSenderPublicKey, "ECDH with receiver key failed");
    }

    fixed_bytes<IV_LENGTH> iv;
    crypto::Random::generate_into(iv.data(), iv.size());
    auto sealed = crypto::AesGcm::encrypt(shared->data(), iv.data(), message.data(), message.size());
    OPENSSL_cleanse(shared->data(), shared->size());

    bytes out;
    out.reserve(OVERHEAD_LENGTH + sealed.ciphertext.size());
    out.insert(out.end(), ephemeral_public.begin(), ephemeral_public.end());
    out.insert(out.end(), iv.begin(), iv.end());
    out.insert(out.end(), sealed.tag.begin(), sealed.tag.end());
    out.insert(out.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
    return Result<bytes>::Ok(std::move(out));
}

Result<bytes> ECIESService::decrypt(const PrivateKeyBytes& private_key, const bytes& encrypted) const {
    if (encrypted.size() < OVERHEAD_LENGTH) {
        return Result<bytes>::Err(ErrorCode::DataTooShort,
            "Encrypted payload of " + std::to_string(encrypted.size()) + " bytes is shorter than the ECIES overhead");
    }
    if (encrypted[0] != PUBLIC_KEY_MAGIC) {
        return Result<bytes>::Err(ErrorCode::InvalidEphemeralPublicKey, "Ephemeral key lacks 0x04 prefix");
    }

    bytes ephemeral(encrypted.begin(), encrypted.begin() + PUBLIC_KEY_LENGTH);
    auto shared = crypto::Secp256k1::ecdh(private_key, ephemeral);
    if (!shared) {
        return Result<bytes>::Err(ErrorCode::InvalidEphemeralPublicKey, "Ephemeral key is not on secp256k1");
    }

    const byte* iv = encrypted.data() + PUBLIC_KEY_LENGTH;
    const byte* tag = iv + IV_LENGTH;
    const byte* ciphertext = tag + AUTH_TAG_LENGTH;
    auto plaintext = crypto::AesGcm::decrypt(shared->data(), iv, ciphertext,
                                             encrypted.size() - OVERHEAD_LENGTH, tag);
    OPENSSL_cleanse(shared->data(), shared->size());
    if (!plaintext) {
        return Result<bytes>::Err(ErrorCode::DecryptionFailed, "Authentication failed");
    }
    return Result<bytes>::Ok(std::move(*plaintext));
}

Result<EncryptedLengthInfo> ECIESService::compute_encrypted_length(uint64_t data_length, uint32_t block_size) const {
    if (block_size <= OVERHEAD_LENGTH) {
        return Result<EncryptedLengthInfo>::Err(ErrorCode::InvalidBlockSize,
            "Block size " + std::to_string(block_size) + " cannot hold the ECIES overhead");
    }
    EncryptedLengthInfo info;
    info.capacity_per_block = block_size - OVERHEAD_LENGTH;
    info.blocks_needed = (data_length + info.capacity_per_block - 1) / info.capacity_per_block;
    info.padding = (info.capacity_per_block - data_length % info.capacity_per_block) % info.capacity_per_block;
    info.total_encrypted_size = info.blocks_needed * block_size;
    info.encrypted_data_length = info.total_encrypted_size - info.padding;
    return Result<EncryptedLengthInfo>::Ok(info);
}

Result<uint64_t> ECIESService::compute_decrypted_length(uint64_t encrypted_length, uint32_t block_size,
                                                        uint64_t padding) const {
    if (block_size <= OVERHEAD_LENGTH) {
        return Result<uint64_t>::Err(ErrorCode::InvalidBlockSize,
            "Block size " + std::to_string(block_size) + " cannot hold the ECIES overhead");
    }
    if (encrypted_length % block_size != 0) {
        return Result<uint64_t>::Err(ErrorCode::InvalidEncryptedDataLength,
            "Encrypted length " + std::to_string(encrypted_length) + " is not a multiple of " +
            std::to_string(block_size));
    }
    const uint64_t blocks = encrypted_length / block_size;
    const uint64_t payload = encrypted_length - blocks * OVERHEAD_LENGTH;
    if (padding > payload || (blocks > 0 && padding >= block_size - OVERHEAD_LENGTH)) {
        return Result<uint64_t>::Err(ErrorCode::InvalidEncryptedDataLength,
            "Padding " + std::to_string(padding) + " exceeds the encrypted payload");
    }
    return Result<uint64_t>::Ok(payload - padding);
}

fixed_bytes<32> ECIESService::personal_message_digest(const bytes& message) {
    std::string prefix = std::string(PERSONAL_MESSAGE_PREFIX) + std::to_string(message.size());
    bytes buffer(prefix.begin(), prefix.end());
    buffer.insert(buffer.end(), message.begin(), message.end());
    return crypto::Sha3::hash256(buffer);
}

SignatureBytes ECIESService::sign_message(const PrivateKeyBytes& private_key, const bytes& message) const {
    return crypto::Secp256k1::sign_digest(personal_message_digest(message), private_key);
}

Result<bool> ECIESService::verify_message(const bytes& public_key, const bytes& message,
                                          const bytes& signature) const {
    if (signature.size() != SIGNATURE_LENGTH) {
        return Result<bool>::Err(ErrorCode::InvalidSignature,
            "Signature must be " + std::to_string(SIGNATURE_LENGTH) + " bytes, got " +
            std::to_string(signature.size()));
    }
    BRIGHTCHAIN_TRY_UNWRAP(expected, address_from_public_key(public_key));

    SignatureBytes sig;
    std::copy(signature.begin(), signature.end(), sig.begin());
    auto recovered = crypto::Secp256k1::recover(personal_message_digest(message), sig);
    if (!recovered) {
        return Result<bool>::Ok(false);
    }
    BRIGHTCHAIN_TRY_UNWRAP(actual, address_from_public_key(*recovered));
    return Result<bool>::Ok(actual == expected);
}

Result<Address> ECIESService::address_from_public_key(const bytes& public_key) const {
    BRIGHTCHAIN_TRY_UNWRAP(normalized, normalize_public_key(public_key));
    auto hash = crypto::Sha3::hash256(normalized.data() + 1, RAW_PUBLIC_KEY_LENGTH);
    Address address;
    std::copy(hash.end() - ADDRESS_LENGTH, hash.end(), address.begin());
    return Result<Address>::Ok(address);
}

} // namespace brightchain::services
