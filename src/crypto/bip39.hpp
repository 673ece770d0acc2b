#pragma once

#include "brightchain/error.hpp"
#include <array>
#include <string>

namespace brightchain::crypto {

/**
 * BIP-39 mnemonic codes (English wordlist)
 */
class Bip39 {
public:
    static constexpr size_t WORDLIST_SIZE = 2048;
    static const std::array<const char*, WORDLIST_SIZE> WORDLIST;

    /**
     * Generate a fresh mnemonic
     * @param strength_bits Entropy bits: 128, 160, 192, 224 or 256
     * @return Space separated words
     */
    static Result<std::string> generate_mnemonic(size_t strength_bits = constants::ecies::MNEMONIC_STRENGTH);

    /**
     * Encode entropy (16 to 32 bytes, multiple of 4) as words
     */
    static Result<std::string> entropy_to_mnemonic(const bytes& entropy);

    /**
     * Decode words back to entropy, checking the embedded checksum
     * @return Entropy, InvalidMnemonic on unknown words, bad length or checksum
     */
    static Result<bytes> mnemonic_to_entropy(const std::string& mnemonic);

    static bool validate(const std::string& mnemonic);

    /**
     * PBKDF2-HMAC-SHA512, 2048 rounds, salt "mnemonic" + passphrase
     * @return 64-byte seed
     */
    static bytes mnemonic_to_seed(const std::string& mnemonic, const std::string& passphrase = "");

    /**
     * Index of a word in the wordlist, -1 if absent
     */
    static int word_index(const std::string& word);
};

} // namespace brightchain::crypto
