#include "bip39.hpp"
#include "openssl_utils.hpp"
#include "random.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <cstring>
#include <sstream>
#include <vector>

namespace brightchain::crypto {

using detail::ensure;

namespace {
    constexpr int PBKDF2_ROUNDS = 2048;
    constexpr size_t SEED_LENGTH = 64;

    fixed_bytes<32> sha256(const bytes& data) {
        fixed_bytes<32> out;
        unsigned int len = 0;
        ensure(EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) == 1,
               "SHA-256 digest failed");
        return out;
    }

    std::vector<std::string> split_words(const std::string& mnemonic) {
        std::vector<std::string> words;
        std::istringstream iss(mnemonic);
        std::string word;
        while (iss >> word) {
            words.push_back(word);
        }
        return words;
    }

    bool bit_at(const bytes& data, size_t bit) {
        return (data[bit / 8] >> (7 - bit % 8)) & 1;
    }
}

int Bip39::word_index(const std::string& word) {
    auto it = std::lower_bound(WORDLIST.begin(), WORDLIST.end(), word,
                               [](const char* entry, const std::string& value) {
                                   return std::strcmp(entry, value.c_str()) < 0;
                               });
    if (it == WORDLIST.end() || word != *it) {
        return -1;
    }
    return static_cast<int>(it - WORDLIST.begin());
}

Result<std::string> Bip39::generate_mnemonic(size_t strength_bits) {
    if (strength_bits < 128 || strength_bits > 256 || strength_bits % 32 != 0) {
        return Result<std::string>::Err(ErrorCode::InvalidArgument,
            "Mnemonic strength must be a multiple of 32 in [128, 256]");
    }
    bytes entropy = Random::generate(strength_bits / 8);
    auto mnemonic = entropy_to_mnemonic(entropy);
    OPENSSL_cleanse(entropy.data(), entropy.size());
    return mnemonic;
}

Result<std::string> Bip39::entropy_to_mnemonic(const bytes& entropy) {
    if (entropy.size() < 16 || entropy.size() > 32 || entropy.size() % 4 != 0) {
        return Result<std::string>::Err(ErrorCode::InvalidArgument,
            "Entropy must be 16 to 32 bytes in steps of 4");
    }

    const size_t entropy_bits = entropy.size() * 8;
    const size_t checksum_bits = entropy_bits / 32;

    bytes bits = entropy;
    auto hash = sha256(entropy);
    bits.push_back(hash[0]);

    std::string mnemonic;
    const size_t word_count = (entropy_bits + checksum_bits) / 11;
    for (size_t w = 0; w < word_count; ++w) {
        uint32_t index = 0;
        for (size_t b = 0; b < 11; ++b) {
            index = (index << 1) | (bit_at(bits, w * 11 + b) ? 1u : 0u);
        }
        if (!mnemonic.empty()) {
            mnemonic.push_back(' ');
        }
        mnemonic += WORDLIST[index];
    }
    OPENSSL_cleanse(bits.data(), bits.size());
    return Result<std::string>::Ok(std::move(mnemonic));
}

Result<bytes> Bip39::mnemonic_to_entropy(const std::string& mnemonic) {
    auto words = split_words(mnemonic);
    if (words.size() < 12 || words.size() > 24 || words.size() % 3 != 0) {
        return Result<bytes>::Err(ErrorCode::InvalidMnemonic,
            "Mnemonic must have 12, 15, 18, 21 or 24 words, got " + std::to_string(words.size()));
    }

    const size_t total_bits = words.size() * 11;
    const size_t checksum_bits = total_bits / 33;
    const size_t entropy_bits = total_bits - checksum_bits;

    bytes bits((total_bits + 7) / 8, 0);
    for (size_t w = 0; w < words.size(); ++w) {
        int index = word_index(words[w]);
        if (index < 0) {
            return Result<bytes>::Err(ErrorCode::InvalidMnemonic, "Unknown mnemonic word at position " +
                                      std::to_string(w + 1));
        }
        for (size_t b = 0; b < 11; ++b) {
            if ((index >> (10 - b)) & 1) {
                size_t bit = w * 11 + b;
                bits[bit / 8] |= static_cast<byte>(0x80 >> (bit % 8));
            }
        }
    }

    bytes entropy(bits.begin(), bits.begin() + entropy_bits / 8);
    auto hash = sha256(entropy);
    for (size_t b = 0; b < checksum_bits; ++b) {
        if (bit_at(bits, entropy_bits + b) != (((hash[0] >> (7 - b)) & 1) != 0)) {
            OPENSSL_cleanse(entropy.data(), entropy.size());
            return Result<bytes>::Err(ErrorCode::InvalidMnemonic, "Mnemonic checksum mismatch");
        }
    }
    OPENSSL_cleanse(bits.data(), bits.size());
    return Result<bytes>::Ok(std::move(entropy));
}

bool Bip39::validate(const std::string& mnemonic) {
    auto entropy = mnemonic_to_entropy(mnemonic);
    if (entropy.is_err()) {
        return false;
    }
    OPENSSL_cleanse(entropy.value().data(), entropy.value().size());
    return true;
}

bytes Bip39::mnemonic_to_seed(const std::string& mnemonic, const std::string& passphrase) {
    // Words are re-joined with single spaces so stray whitespace cannot change the seed
    std::string normalized;
    for (const auto& word : split_words(mnemonic)) {
        if (!normalized.empty()) {
            normalized.push_back(' ');
        }
        normalized += word;
    }
    const std::string salt = "mnemonic" + passphrase;

    bytes seed(SEED_LENGTH);
    ensure(PKCS5_PBKDF2_HMAC(normalized.data(), static_cast<int>(normalized.size()),
                             reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                             PBKDF2_ROUNDS, EVP_sha512(), static_cast<int>(seed.size()), seed.data()) == 1,
           "PBKDF2 derivation failed");
    OPENSSL_cleanse(normalized.data(), normalized.size());
    return seed;
}

} // namespace brightchain::crypto
