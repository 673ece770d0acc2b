#include "aes_gcm.hpp"
#include "openssl_utils.hpp"

namespace brightchain::crypto {

using detail::ensure;

namespace {
    constexpr int IV_LEN = static_cast<int>(constants::ecies::IV_LENGTH);
    constexpr int TAG_LEN = static_cast<int>(constants::ecies::AUTH_TAG_LENGTH);

    void check_sizes(const bytes& key, const bytes& iv) {
        if (key.size() != constants::ecies::SYMMETRIC_KEY_LENGTH) {
            throw CryptoException(ErrorCode::InvalidArgument, "AES-GCM expects 32-byte key");
        }
        if (iv.size() != constants::ecies::IV_LENGTH) {
            throw CryptoException(ErrorCode::InvalidArgument, "AES-GCM expects 16-byte IV");
        }
    }
}

AesGcm::Sealed AesGcm::encrypt(const byte* key, const byte* iv, const byte* plaintext, size_t len) {
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    ensure(ctx != nullptr, "AES-GCM context allocation failed");

    ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) == 1,
           "AES-GCM set iv length failed");
    ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, iv) == 1, "AES-GCM set key failed");

    Sealed sealed;
    sealed.ciphertext.resize(len);
    int out_len = 0;
    int total = 0;
    if (len > 0) {
        ensure(EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &out_len, plaintext,
                                 static_cast<int>(len)) == 1,
               "AES-GCM encrypt failed");
        total = out_len;
    }
    ensure(EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + total, &out_len) == 1,
           "AES-GCM final failed");
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, sealed.tag.data()) == 1,
           "AES-GCM get tag failed");
    return sealed;
}

AesGcm::Sealed AesGcm::encrypt(const bytes& key, const bytes& iv, const bytes& plaintext) {
    check_sizes(key, iv);
    return encrypt(key.data(), iv.data(), plaintext.data(), plaintext.size());
}

std::optional<bytes> AesGcm::decrypt(const byte* key, const byte* iv,
                                     const byte* ciphertext, size_t len, const byte* tag) {
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    ensure(ctx != nullptr, "AES-GCM context allocation failed");

    ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) == 1,
           "AES-GCM set iv length failed");
    ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, iv) == 1, "AES-GCM set key failed");

    bytes plaintext(len);
    int out_len = 0;
    int total = 0;
    if (len > 0) {
        ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ciphertext,
                                 static_cast<int>(len)) == 1,
               "AES-GCM decrypt failed");
        total = out_len;
    }
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN, const_cast<byte*>(tag)) == 1,
           "AES-GCM set tag failed");

    // Final fails only on tag mismatch
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &out_len) != 1) {
        return std::nullopt;
    }
    return plaintext;
}

std::optional<bytes> AesGcm::decrypt(const bytes& key, const bytes& iv,
                                     const bytes& ciphertext, const bytes& tag) {
    check_sizes(key, iv);
    if (tag.size() != constants::ecies::AUTH_TAG_LENGTH) {
        return std::nullopt;
    }
    return decrypt(key.data(), iv.data(), ciphertext.data(), ciphertext.size(), tag.data());
}

} // namespace brightchain::crypto
