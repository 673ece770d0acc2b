#include <gtest/gtest.h>
#include "services/ecies_service.hpp"
#include "identity/member.hpp"
#include "blocks/block_type.hpp"
#include "crypto/aes_gcm.hpp"
#include "crypto/random.hpp"
#include "utils/crc.hpp"
#include <memory>

using namespace brightchain;
using namespace brightchain::services;
using brightchain::identity::Member;

namespace {

const char* ABANDON_ABOUT =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

bytes ascii(const std::string& s) {
    return bytes(s.begin(), s.end());
}

} // namespace

class EciesTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto first = Member::generate(ecies, "alice");
        ASSERT_TRUE(first.is_ok());
        alice = std::make_unique<Member>(std::move(first.value().member));

        auto second = Member::generate(ecies, "bob");
        ASSERT_TRUE(second.is_ok());
        bob = std::make_unique<Member>(std::move(second.value().member));
    }

    void TearDown() override {
        alice.reset();
        bob.reset();
    }

    PrivateKeyBytes key_of(const Member& member) {
        auto key = member.private_key();
        EXPECT_TRUE(key.is_ok());
        return key.value_or(PrivateKeyBytes{});
    }

    ECIESService ecies;
    std::unique_ptr<Member> alice;
    std::unique_ptr<Member> bob;
};

TEST_F(EciesTest, MnemonicDerivesPrimaryAccountKey) {
    auto pair = ecies.mnemonic_to_key_pair(ABANDON_ABOUT);
    ASSERT_TRUE(pair.is_ok());
    EXPECT_EQ(to_hex(pair.value().private_key.data(), pair.value().private_key.size()),
              "1ab42cc412b618bdea3a599e3c9bae199ebf030895b039e9db1e30dafb12b727");
    EXPECT_EQ(pair.value().public_key.size(), constants::ecies::PUBLIC_KEY_LENGTH);
    EXPECT_EQ(pair.value().public_key, ecies.get_public_key(pair.value().private_key));

    EXPECT_EQ(ecies.mnemonic_to_key_pair("abandon abandon abandon").code(), ErrorCode::InvalidMnemonic);
}

TEST_F(EciesTest, SingleRecipientRoundTrip) {
    auto message = ascii("single recipient payload");
    auto encrypted = ecies.encrypt(alice->public_key(), message);
    ASSERT_TRUE(encrypted.is_ok());
    EXPECT_EQ(encrypted.value().size(), constants::ecies::OVERHEAD_LENGTH + message.size());

    auto decrypted = ecies.decrypt(key_of(*alice), encrypted.value());
    ASSERT_TRUE(decrypted.is_ok());
    EXPECT_EQ(decrypted.value(), message);
}

TEST_F(EciesTest, SingleRecipientFailures) {
    auto encrypted = ecies.encrypt(alice->public_key(), ascii("for alice only"));
    ASSERT_TRUE(encrypted.is_ok());

    EXPECT_EQ(ecies.decrypt(key_of(*bob), encrypted.value()).code(), ErrorCode::DecryptionFailed);
    EXPECT_EQ(ecies.decrypt(key_of(*alice), bytes(50, 0x04)).code(), ErrorCode::DataTooShort);

    bytes bad_prefix = encrypted.value();
    bad_prefix[0] = 0x02;
    EXPECT_EQ(ecies.decrypt(key_of(*alice), bad_prefix).code(), ErrorCode::InvalidEphemeralPublicKey);

    EXPECT_EQ(ecies.encrypt(bytes(12, 0x01), ascii("x")).code(), ErrorCode::InvalidSenderPublicKey);
}

TEST_F(EciesTest, OffCurveEphemeralKeyIsRejected) {
    auto encrypted = ecies.encrypt(alice->public_key(), ascii("for alice only"));
    ASSERT_TRUE(encrypted.is_ok());

    // Keep the uncompressed prefix but move the point off the curve
    bytes off_curve = encrypted.value();
    ASSERT_EQ(off_curve[0], 0x04);
    off_curve[64] ^= 0x01;
    EXPECT_EQ(ecies.decrypt(key_of(*alice), off_curve).code(), ErrorCode::InvalidEphemeralPublicKey);
}

TEST_F(EciesTest, EncryptedLengthAccounting) {
    auto info = ecies.compute_encrypted_length(1000, 512);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().capacity_per_block, 415u);
    EXPECT_EQ(info.value().blocks_needed, 3u);
    EXPECT_EQ(info.value().padding, 245u);
    EXPECT_EQ(info.value().total_encrypted_size, 1536u);
    EXPECT_EQ(info.value().encrypted_data_length, 1291u);

    auto back = ecies.compute_decrypted_length(info.value().total_encrypted_size, 512, info.value().padding);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value(), 1000u);

    auto exact = ecies.compute_encrypted_length(830, 512);
    ASSERT_TRUE(exact.is_ok());
    EXPECT_EQ(exact.value().padding, 0u);

    EXPECT_EQ(ecies.compute_decrypted_length(1000, 512, 0).code(), ErrorCode::InvalidEncryptedDataLength);
    EXPECT_EQ(ecies.compute_encrypted_length(10, 97).code(), ErrorCode::InvalidBlockSize);
}

TEST_F(EciesTest, MultiRecipientEachRecipientDecrypts) {
    std::vector<std::unique_ptr<Member>> members;
    std::vector<Recipient> recipients;
    for (int i = 0; i < 4; ++i) {
        auto generated = Member::generate(ecies, "member" + std::to_string(i));
        ASSERT_TRUE(generated.is_ok());
        members.push_back(std::make_unique<Member>(std::move(generated.value().member)));
        recipients.push_back(members.back()->as_recipient());
    }

    auto message = ascii("broadcast to four members");
    auto encrypted = ecies.encrypt_multiple(recipients, message);
    ASSERT_TRUE(encrypted.is_ok());
    EXPECT_EQ(encrypted.value().recipient_ids.size(), 4u);
    EXPECT_EQ(encrypted.value().serialized_size(),
              ECIESService::multi_recipient_overhead(4) + message.size());

    auto parsed = MultiRecipientMessage::parse(encrypted.value().serialize());
    ASSERT_TRUE(parsed.is_ok());

    for (const auto& member : members) {
        auto decrypted = ecies.decrypt_multiple_for_recipient(parsed.value(), *member);
        ASSERT_TRUE(decrypted.is_ok()) << decrypted.error().to_string();
        EXPECT_EQ(decrypted.value(), message);
    }
}

TEST_F(EciesTest, MultiRecipientAccessErrors) {
    auto encrypted = ecies.encrypt_multiple({alice->as_recipient()}, ascii("alice only"));
    ASSERT_TRUE(encrypted.is_ok());

    EXPECT_EQ(ecies.decrypt_multiple_for_recipient(encrypted.value(), *bob).code(), ErrorCode::RecipientNotFound);

    alice->unload_private_key();
    EXPECT_FALSE(alice->has_private_key());
    EXPECT_EQ(ecies.decrypt_multiple_for_recipient(encrypted.value(), *alice).code(),
              ErrorCode::PrivateKeyNotLoaded);

    EXPECT_EQ(ecies.encrypt_multiple({}, ascii("nobody")).code(), ErrorCode::InvalidArgument);
}

TEST_F(EciesTest, PayloadCrcIsChecked) {
    const bytes payload = ascii("crc framed payload");
    const bytes key = crypto::Random::generate(32);
    const bytes iv = crypto::Random::generate(constants::ecies::IV_LENGTH);

    auto seal = [&](uint16_t crc) {
        MultiRecipientMessage message;
        message.data_length = payload.size();
        message.recipient_ids = {alice->id()};
        auto wrapped = ecies.encrypt(alice->public_key(), key);
        EXPECT_TRUE(wrapped.is_ok());
        message.recipient_keys = {wrapped.value_or(bytes{})};
        std::copy(iv.begin(), iv.end(), message.iv.begin());

        bytes framed = {static_cast<byte>(crc >> 8), static_cast<byte>(crc)};
        framed.insert(framed.end(), payload.begin(), payload.end());
        auto sealed = crypto::AesGcm::encrypt(key, iv, framed);
        message.auth_tag = sealed.tag;
        message.encrypted_message = std::move(sealed.ciphertext);
        return message;
    };

    const uint16_t crc = utils::crc16(payload);
    auto good = ecies.decrypt_multiple_for_recipient(seal(crc), *alice);
    ASSERT_TRUE(good.is_ok()) << good.error().to_string();
    EXPECT_EQ(good.value(), payload);

    // Authenticates, but the CRC inside does not match
    auto bad = ecies.decrypt_multiple_for_recipient(seal(static_cast<uint16_t>(crc ^ 0x0101)), *alice);
    EXPECT_EQ(bad.code(), ErrorCode::InvalidMessageCrc);
}

TEST_F(EciesTest, RecipientLimitIsEnforced) {
    ECIESService limited(1);
    auto result = limited.encrypt_multiple({alice->as_recipient(), bob->as_recipient()}, ascii("two"));
    EXPECT_EQ(result.code(), ErrorCode::TooManyRecipients);
    EXPECT_EQ(limited.encrypt_multiple_to_block({alice->as_recipient(), bob->as_recipient()}, ascii("two"), 4096)
                  .code(),
              ErrorCode::TooManyRecipients);
}

TEST_F(EciesTest, RecipientLimitMustFitTheWireFormat) {
    EXPECT_NO_THROW(ECIESService(65535));
    EXPECT_THROW(ECIESService(65536), BrightChainException);
    EXPECT_THROW(ECIESService(0), BrightChainException);
}

TEST_F(EciesTest, TamperedCiphertextFailsAuthentication) {
    auto encrypted = ecies.encrypt_multiple({alice->as_recipient()}, ascii("integrity checked"));
    ASSERT_TRUE(encrypted.is_ok());
    auto message = encrypted.value();
    message.encrypted_message.back() ^= 0x01;
    EXPECT_EQ(ecies.decrypt_multiple_for_recipient(message, *alice).code(), ErrorCode::DecryptionFailed);
}

TEST_F(EciesTest, BlockFormRoundTrip) {
    auto message = ascii("block sized payload");
    auto block = ecies.encrypt_multiple_to_block({alice->as_recipient(), bob->as_recipient()}, message, 1024);
    ASSERT_TRUE(block.is_ok());
    EXPECT_EQ(block.value().size(), 1024u);
    EXPECT_EQ(block.value()[0], constants::block_header::MAGIC_PREFIX);
    EXPECT_EQ(block.value()[1], static_cast<byte>(blocks::StructuredBlockType::MultiEncrypted));
    EXPECT_EQ(block.value()[2], constants::ecies::multiple::LAYOUT_VERSION);

    for (const Member* member : {alice.get(), bob.get()}) {
        auto decrypted = ecies.decrypt_multiple_block_for_recipient(block.value(), *member);
        ASSERT_TRUE(decrypted.is_ok());
        EXPECT_EQ(decrypted.value(), message);
    }

    EXPECT_EQ(ecies.encrypt_multiple_to_block({alice->as_recipient()}, bytes(1000, 0), 512).code(),
              ErrorCode::DataTooLarge);
}

TEST_F(EciesTest, OlderLayoutVersionIsRejected) {
    auto block = ecies.encrypt_multiple_to_block({alice->as_recipient()}, ascii("v2"), 512);
    ASSERT_TRUE(block.is_ok());
    bytes legacy = block.value();
    legacy[2] = 0x01;
    legacy[3] = utils::crc8(legacy.data(), 3);
    EXPECT_EQ(ecies.decrypt_multiple_block_for_recipient(legacy, *alice).code(),
              ErrorCode::UnsupportedLayoutVersion);
}

TEST_F(EciesTest, SignAndVerify) {
    auto message = ascii("signed statement");
    auto signature = alice->sign(ecies, message);
    ASSERT_TRUE(signature.is_ok());
    bytes sig(signature.value().begin(), signature.value().end());

    auto valid = alice->verify(ecies, message, sig);
    ASSERT_TRUE(valid.is_ok());
    EXPECT_TRUE(valid.value());

    auto other_message = alice->verify(ecies, ascii("different statement"), sig);
    ASSERT_TRUE(other_message.is_ok());
    EXPECT_FALSE(other_message.value());

    auto other_signer = bob->verify(ecies, message, sig);
    ASSERT_TRUE(other_signer.is_ok());
    EXPECT_FALSE(other_signer.value());

    sig.pop_back();
    EXPECT_EQ(alice->verify(ecies, message, sig).code(), ErrorCode::InvalidSignature);
}

TEST_F(EciesTest, MemberRebuiltFromMnemonicMatches) {
    auto generated = Member::generate(ecies, "carol");
    ASSERT_TRUE(generated.is_ok());
    const auto& original = generated.value().member;

    auto rebuilt = Member::from_mnemonic(ecies, original.id(), "carol", generated.value().mnemonic.value());
    ASSERT_TRUE(rebuilt.is_ok());
    EXPECT_EQ(rebuilt.value().public_key(), original.public_key());
    EXPECT_EQ(rebuilt.value().id(), original.id());

    auto public_only = Member::from_public_key(ecies, original.id(), "carol", original.public_key());
    ASSERT_TRUE(public_only.is_ok());
    EXPECT_FALSE(public_only.value().has_private_key());
    EXPECT_EQ(public_only.value().sign(ecies, ascii("x")).code(), ErrorCode::PrivateKeyNotLoaded);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
