#include <gtest/gtest.h>
#include "../src/crypto/sha3.hpp"
#include "../src/crypto/blake3.hpp"
#include "../src/crypto/aes_gcm.hpp"
#include "../src/crypto/random.hpp"
#include "../src/crypto/secp256k1.hpp"
#include "../src/crypto/bip39.hpp"
#include "../src/crypto/bip32.hpp"
#include "../src/services/checksum_service.hpp"
#include <algorithm>
#include <atomic>
#include <sstream>
#include <thread>

using namespace brightchain;
using namespace brightchain::crypto;

namespace {

bytes ascii(const std::string& s) {
    return bytes(s.begin(), s.end());
}

const char* ABANDON_ABOUT =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

} // namespace

TEST(Sha3Test, KnownAnswers) {
    auto empty = Sha3::hash512(bytes{});
    EXPECT_EQ(to_hex(empty.data(), empty.size()),
              "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
              "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");

    auto abc = Sha3::hash512(ascii("abc"));
    EXPECT_EQ(to_hex(abc.data(), abc.size()),
              "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
              "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
}

TEST(Sha3Test, IncrementalMatchesOneShot) {
    bytes data(10000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<byte>(i * 31);
    }
    Sha3_512Hasher hasher;
    hasher.update(data.data(), 4000);
    hasher.update(data.data() + 4000, data.size() - 4000);
    EXPECT_EQ(hasher.finalize(), Sha3::hash512(data));
}

TEST(ChecksumServiceTest, DeterministicAndValidates) {
    services::ChecksumService service;
    bytes data = ascii("content addressed");
    auto first = service.calculate(data);
    EXPECT_EQ(first, service.calculate(data));
    EXPECT_TRUE(service.validate(data, first));

    data.back() ^= 0x01;
    EXPECT_FALSE(service.validate(data, first));
}

TEST(ChecksumServiceTest, StreamMatchesBuffer) {
    services::ChecksumService service;
    std::string payload(200000, 'x');
    for (size_t i = 0; i < payload.size(); i += 7) {
        payload[i] = static_cast<char>('a' + i % 26);
    }
    std::istringstream stream(payload);
    auto streamed = service.calculate_stream(stream);
    ASSERT_TRUE(streamed.is_ok());
    EXPECT_EQ(streamed.value(), service.calculate(ascii(payload)));
}

TEST(ChecksumServiceTest, HexRoundTrip) {
    services::ChecksumService service;
    auto checksum = service.calculate(ascii("abc"));
    auto parsed = service.from_hex(service.to_hex(checksum));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), checksum);
    EXPECT_EQ(service.from_hex("abcd").code(), ErrorCode::InvalidHexStringLength);
}

TEST(Blake3Test, KeystreamIsDeterministicPerInstance) {
    fixed_bytes<16> id_a{};
    fixed_bytes<16> id_b{};
    id_b[0] = 1;
    auto a1 = Blake3::keystream(id_a, 100);
    auto a2 = Blake3::keystream(id_a, 100);
    auto b = Blake3::keystream(id_b, 100);
    EXPECT_EQ(a1.size(), 100u);
    EXPECT_EQ(a1, a2);
    EXPECT_NE(a1, b);
}

TEST(RandomTest, GeneratesFreshBytes) {
    auto a = Random::generate(32);
    auto b = Random::generate(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    for (int i = 0; i < 100; ++i) {
        EXPECT_LT(Random::uniform(10), 10u);
    }
}

TEST(AesGcmTest, EncryptDecrypt) {
    auto key = Random::generate(32);
    auto iv = Random::generate(16);
    auto plaintext = ascii("Hello BrightChain");

    auto sealed = AesGcm::encrypt(key, iv, plaintext);
    EXPECT_EQ(sealed.ciphertext.size(), plaintext.size());
    bytes tag(sealed.tag.begin(), sealed.tag.end());

    auto opened = AesGcm::decrypt(key, iv, sealed.ciphertext, tag);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);
}

TEST(AesGcmTest, TamperingIsDetected) {
    auto key = Random::generate(32);
    auto iv = Random::generate(16);
    auto sealed = AesGcm::encrypt(key, iv, ascii("integrity"));
    bytes tag(sealed.tag.begin(), sealed.tag.end());

    sealed.ciphertext[0] ^= 0x80;
    EXPECT_FALSE(AesGcm::decrypt(key, iv, sealed.ciphertext, tag).has_value());

    auto wrong_key = Random::generate(32);
    sealed.ciphertext[0] ^= 0x80;
    EXPECT_FALSE(AesGcm::decrypt(wrong_key, iv, sealed.ciphertext, tag).has_value());
}

TEST(Secp256k1Test, PublicKeyEncodings) {
    auto priv = Secp256k1::generate_private_key();
    ASSERT_TRUE(Secp256k1::is_valid_private_key(priv));

    auto full = Secp256k1::public_key(priv);
    auto compressed = Secp256k1::public_key(priv, true);
    EXPECT_EQ(full.size(), 65u);
    EXPECT_EQ(full[0], 0x04);
    EXPECT_EQ(compressed.size(), 33u);

    bytes raw(full.begin() + 1, full.end());
    EXPECT_EQ(Secp256k1::normalize_public_key(raw).value_or(bytes{}), full);
    EXPECT_EQ(Secp256k1::normalize_public_key(compressed).value_or(bytes{}), full);
    EXPECT_EQ(Secp256k1::normalize_public_key(full).value_or(bytes{}), full);

    bytes off_curve = full;
    off_curve[64] ^= 0x01;
    EXPECT_FALSE(Secp256k1::normalize_public_key(off_curve).has_value());
    EXPECT_FALSE(Secp256k1::normalize_public_key(bytes(40, 0x01)).has_value());
}

TEST(Secp256k1Test, RejectsZeroPrivateKey) {
    PrivateKeyBytes zero{};
    EXPECT_FALSE(Secp256k1::is_valid_private_key(zero));
    EXPECT_THROW(Secp256k1::public_key(zero), CryptoException);
}

TEST(Secp256k1Test, EcdhAgrees) {
    auto a = Secp256k1::generate_private_key();
    auto b = Secp256k1::generate_private_key();
    auto ab = Secp256k1::ecdh(a, Secp256k1::public_key(b));
    auto ba = Secp256k1::ecdh(b, Secp256k1::public_key(a));
    ASSERT_TRUE(ab.has_value());
    ASSERT_TRUE(ba.has_value());
    EXPECT_EQ(*ab, *ba);
}

TEST(Secp256k1Test, SignAndRecover) {
    auto priv = Secp256k1::generate_private_key();
    auto digest = Sha3::hash256(ascii("recoverable"));

    auto signature = Secp256k1::sign_digest(digest, priv);
    EXPECT_LE(signature[64], 1);

    auto recovered = Secp256k1::recover(digest, signature);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, Secp256k1::public_key(priv));

    // Ethereum style v is accepted too
    signature[64] = static_cast<byte>(signature[64] + 27);
    recovered = Secp256k1::recover(digest, signature);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, Secp256k1::public_key(priv));

    auto other_digest = Sha3::hash256(ascii("something else"));
    auto wrong = Secp256k1::recover(other_digest, signature);
    EXPECT_TRUE(!wrong.has_value() || *wrong != Secp256k1::public_key(priv));
}

TEST(Secp256k1Test, SignaturesAreLowSAndRecoverable) {
    // n / 2 for secp256k1
    const std::string half_order = "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0";
    auto priv = Secp256k1::generate_private_key();
    const auto expected = Secp256k1::public_key(priv);

    for (int i = 0; i < 16; ++i) {
        auto digest = Sha3::hash256(ascii("message " + std::to_string(i)));
        auto signature = Secp256k1::sign_digest(digest, priv);
        EXPECT_LE(to_hex(signature.data() + 32, 32), half_order);

        auto recovered = Secp256k1::recover(digest, signature);
        ASSERT_TRUE(recovered.has_value());
        EXPECT_EQ(*recovered, expected);
    }
}

TEST(Secp256k1Test, ConcurrentSigningSharesTheCurve) {
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&failures, t]() {
            auto priv = Secp256k1::generate_private_key();
            for (int i = 0; i < 10; ++i) {
                auto digest = Sha3::hash256(ascii("worker " + std::to_string(t * 100 + i)));
                auto recovered = Secp256k1::recover(digest, Secp256k1::sign_digest(digest, priv));
                if (!recovered || *recovered != Secp256k1::public_key(priv)) {
                    failures++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

TEST(Bip39Test, KnownVectors) {
    EXPECT_TRUE(Bip39::validate(ABANDON_ABOUT));
    auto seed = Bip39::mnemonic_to_seed(ABANDON_ABOUT);
    EXPECT_EQ(to_hex(seed),
              "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
              "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4");

    auto mnemonic = Bip39::entropy_to_mnemonic(bytes(16, 0x7f));
    ASSERT_TRUE(mnemonic.is_ok());
    EXPECT_EQ(mnemonic.value(), "legal winner thank year wave sausage worth useful legal winner thank yellow");

    auto entropy = Bip39::mnemonic_to_entropy(mnemonic.value());
    ASSERT_TRUE(entropy.is_ok());
    EXPECT_EQ(entropy.value(), bytes(16, 0x7f));
}

TEST(Bip39Test, RejectsBadChecksumAndUnknownWords) {
    EXPECT_FALSE(Bip39::validate(
        "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon"));
    EXPECT_EQ(Bip39::mnemonic_to_entropy("abandon abandon notaword").code(), ErrorCode::InvalidMnemonic);
    EXPECT_EQ(Bip39::word_index("zoo"), 2047);
    EXPECT_EQ(Bip39::word_index("brightchain"), -1);
}

TEST(Bip39Test, GeneratedMnemonicsValidate) {
    auto mnemonic = Bip39::generate_mnemonic(256);
    ASSERT_TRUE(mnemonic.is_ok());
    EXPECT_TRUE(Bip39::validate(mnemonic.value()));
    EXPECT_EQ(std::count(mnemonic.value().begin(), mnemonic.value().end(), ' '), 23);
}

TEST(Bip32Test, DerivesKnownAccountKey) {
    auto seed = Bip39::mnemonic_to_seed("test test test test test test test test test test test junk");
    auto master = Bip32::master_from_seed(seed);
    ASSERT_TRUE(master.is_ok());

    auto account = Bip32::derive_path(master.value(), constants::ecies::PRIMARY_KEY_DERIVATION_PATH);
    ASSERT_TRUE(account.is_ok());
    EXPECT_EQ(to_hex(account.value().private_key.data(), account.value().private_key.size()),
              "ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80");
    EXPECT_EQ(account.value().depth, 5);
}

TEST(Bip32Test, RejectsMalformedPaths) {
    auto master = Bip32::master_from_seed(Bip39::mnemonic_to_seed(ABANDON_ABOUT));
    ASSERT_TRUE(master.is_ok());
    EXPECT_EQ(Bip32::derive_path(master.value(), "44'/60'").code(), ErrorCode::InvalidDerivationPath);
    EXPECT_EQ(Bip32::derive_path(master.value(), "m/44'/x").code(), ErrorCode::InvalidDerivationPath);
    EXPECT_EQ(Bip32::master_from_seed(bytes(8, 1)).code(), ErrorCode::InvalidArgument);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
