#include <gtest/gtest.h>
#include "services/block_service.hpp"
#include "identity/member.hpp"
#include "fec/fec_service.hpp"
#include "crypto/random.hpp"
#include <memory>

using namespace brightchain;
using namespace brightchain::services;
using brightchain::identity::Member;

class BlockServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        fec = std::make_shared<fec::ReedSolomonFecService>();
        tuples = std::make_unique<XorTupleService>(settings, fec);
        cbl = std::make_unique<CBLService>(ecies, checksums, settings);
        use_block_size(blocks::BlockSize::Small);

        creator = make_member("creator");
        alice = make_member("alice");
        stranger = make_member("stranger");
    }

    void TearDown() override {
        service.reset();
        store.reset();
    }

    void use_block_size(blocks::BlockSize size) {
        service.reset();
        store = std::make_unique<storage::MemoryBlockStore>(size, checksums, *tuples, fec);
        service = std::make_unique<BlockService>(ecies, checksums, *tuples, *cbl, *store);
    }

    std::unique_ptr<Member> make_member(const std::string& name) {
        auto generated = Member::generate(ecies, name);
        EXPECT_TRUE(generated.is_ok());
        return std::make_unique<Member>(std::move(generated.value().member));
    }

    std::vector<Recipient> recipients() const {
        return {creator->as_recipient(), alice->as_recipient()};
    }

    ECIESService ecies;
    ChecksumService checksums;
    utils::EngineSettings settings;
    std::shared_ptr<fec::ReedSolomonFecService> fec;
    std::unique_ptr<XorTupleService> tuples;
    std::unique_ptr<CBLService> cbl;
    std::unique_ptr<storage::MemoryBlockStore> store;
    std::unique_ptr<BlockService> service;
    std::unique_ptr<Member> creator;
    std::unique_ptr<Member> alice;
    std::unique_ptr<Member> stranger;
};

TEST_F(BlockServiceTest, EveryRecipientDecodes) {
    const bytes data = crypto::Random::generate(256);
    auto encoded = service->encode(data, *creator, recipients());
    ASSERT_TRUE(encoded.is_ok()) << encoded.error().to_string();
    EXPECT_FALSE(encoded.value().super_cbl);
    EXPECT_EQ(encoded.value().data_block_count, 3u);
    EXPECT_EQ(encoded.value().magnet.block_size, 4096u);
    EXPECT_EQ(encoded.value().magnet_url.rfind("magnet:?xt=urn:brightchain:cbl", 0), 0u);
    // One tuple plus the whitened root; its randomizer is one of the stored blocks
    EXPECT_EQ(store->size(), 4u);

    for (const Member* member : {creator.get(), alice.get()}) {
        auto decoded = service->decode(encoded.value().magnet_url, *member, creator.get());
        ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
        EXPECT_EQ(decoded.value(), data);
    }
}

TEST_F(BlockServiceTest, NonRecipientCannotDecode) {
    auto encoded = service->encode(crypto::Random::generate(100), *creator, recipients());
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(service->decode(encoded.value().magnet_url, *stranger).code(), ErrorCode::RecipientNotFound);
}

TEST_F(BlockServiceTest, CreatorSignatureIsChecked) {
    auto encoded = service->encode(crypto::Random::generate(100), *creator, recipients());
    ASSERT_TRUE(encoded.is_ok());

    EXPECT_TRUE(service->decode(encoded.value().magnet_url, *alice, creator.get()).is_ok());
    EXPECT_EQ(service->decode(encoded.value().magnet_url, *alice, stranger.get()).code(),
              ErrorCode::InvalidSignature);
    // Without a creator only the structure and checksum are checked
    EXPECT_TRUE(service->decode(encoded.value().magnet_url, *alice).is_ok());
}

TEST_F(BlockServiceTest, MultiChunkAndEmptyInput) {
    const size_t capacity = service->chunk_capacity(2);
    EXPECT_EQ(capacity, 4096u - ECIESService::multi_recipient_overhead(2) - 4u);

    const bytes data = crypto::Random::generate(capacity * 3 + 17);
    auto encoded = service->encode(data, *creator, recipients());
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(encoded.value().data_block_count, 12u);
    auto decoded = service->decode(encoded.value().magnet_url, *alice);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), data);

    auto empty = service->encode(bytes{}, *creator, recipients());
    ASSERT_TRUE(empty.is_ok());
    auto decoded_empty = service->decode(empty.value().magnet_url, *creator);
    ASSERT_TRUE(decoded_empty.is_ok());
    EXPECT_TRUE(decoded_empty.value().empty());
}

TEST_F(BlockServiceTest, ExtendedMetadataReachesTheRoot) {
    EncodeOptions options;
    options.metadata = ExtendedCblMetadata{"photo.png", "image/png"};
    auto encoded = service->encode(crypto::Random::generate(64), *creator, recipients(), options);
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_TRUE(CBLService::is_extended(encoded.value().root));

    auto root = service->fetch_root(encoded.value().magnet_url);
    ASSERT_TRUE(root.is_ok());
    EXPECT_EQ(root.value(), encoded.value().root);
    auto header = cbl->parse_cbl_header(root.value());
    ASSERT_TRUE(header.is_ok());
    EXPECT_EQ(header.value().extended->file_name, "photo.png");

    options.metadata = ExtendedCblMetadata{"bad/name", "image/png"};
    EXPECT_EQ(service->encode(bytes(10, 0), *creator, recipients(), options).code(), ErrorCode::InvalidFileName);
}

TEST_F(BlockServiceTest, LargeInputUsesSuperCbl) {
    use_block_size(blocks::BlockSize::Tiny);
    const std::vector<Recipient> single = {alice->as_recipient()};
    const size_t capacity = service->chunk_capacity(1);
    // 13 chunks need 39 addresses, more than the 12 one Tiny CBL holds
    const bytes data = crypto::Random::generate(capacity * 12 + 100);

    auto encoded = service->encode(data, *creator, single);
    ASSERT_TRUE(encoded.is_ok()) << encoded.error().to_string();
    EXPECT_TRUE(encoded.value().super_cbl);
    EXPECT_TRUE(CBLService::is_super_cbl(encoded.value().root));
    EXPECT_EQ(encoded.value().sub_cbl_count, 4u);
    EXPECT_EQ(encoded.value().data_block_count, 39u);

    auto decoded = service->decode(encoded.value().magnet_url, *alice, creator.get());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value(), data);
}

TEST_F(BlockServiceTest, SubCblsAreStoredUnderTheirOwnChecksum) {
    use_block_size(blocks::BlockSize::Tiny);
    const size_t capacity = service->chunk_capacity(1);
    const bytes data = crypto::Random::generate(capacity * 12 + 100);
    auto encoded = service->encode(data, *creator, {alice->as_recipient()});
    ASSERT_TRUE(encoded.is_ok()) << encoded.error().to_string();

    auto sub_ids = cbl->address_list(encoded.value().root);
    ASSERT_TRUE(sub_ids.is_ok());
    ASSERT_EQ(sub_ids.value().size(), 4u);
    size_t listed = 0;
    for (const auto& sub_id : sub_ids.value()) {
        auto sub_block = store->get(sub_id);
        ASSERT_TRUE(sub_block.is_ok());
        EXPECT_EQ(sub_block.value().type(), blocks::BlockType::ConstituentBlockList);

        // Readable without the root, but it names ciphertext only
        auto addresses = cbl->address_list(sub_block.value().data());
        ASSERT_TRUE(addresses.is_ok()) << addresses.error().to_string();
        for (const auto& address : addresses.value()) {
            auto meta = store->metadata(address);
            ASSERT_TRUE(meta.is_ok());
            EXPECT_EQ(meta.value().type, blocks::BlockType::MultiEncrypted);
        }
        listed += addresses.value().size();
    }
    EXPECT_EQ(listed, encoded.value().data_block_count);
}

TEST_F(BlockServiceTest, CapacityLimits) {
    use_block_size(blocks::BlockSize::Tiny);
    const size_t capacity = service->chunk_capacity(1);
    // 13 sub-CBLs of 4 tuples each is the most one Tiny SuperCBL reaches
    EXPECT_EQ(service->encode(bytes(capacity * 52 + 1, 0), *creator, {alice->as_recipient()}).code(),
              ErrorCode::InsufficientCapacity);
    EXPECT_EQ(store->size(), 0u);

    use_block_size(blocks::BlockSize::Message);
    EXPECT_EQ(service->encode(bytes(10, 0), *creator, {alice->as_recipient()}).code(),
              ErrorCode::InsufficientCapacity);

    EXPECT_EQ(service->encode(bytes(10, 0), *creator, {}).code(), ErrorCode::InvalidArgument);
}

TEST_F(BlockServiceTest, WrongChecksumInCblIsDetected) {
    const bytes data = crypto::Random::generate(300);
    auto encoded = service->encode(data, *creator, recipients());
    ASSERT_TRUE(encoded.is_ok());

    auto header = cbl->parse_cbl_header(encoded.value().root);
    ASSERT_TRUE(header.is_ok());
    auto addresses = cbl->address_list(encoded.value().root);
    ASSERT_TRUE(addresses.is_ok());
    bytes address_list;
    for (const auto& address : addresses.value()) {
        address_list.insert(address_list.end(), address.value.begin(), address.value.end());
    }

    // Same blocks, but the root records the checksum of different content
    bytes other = data;
    other[0] ^= 0xFF;
    auto forged = cbl->make_cbl_header(*creator, header.value().date_created_ms, header.value().address_count,
                                       header.value().tuple_size, data.size(), checksums.calculate(other),
                                       address_list, 4096);
    ASSERT_TRUE(forged.is_ok());
    auto stored = store->store_cbl_with_whitening(forged.value());
    ASSERT_TRUE(stored.is_ok());

    EXPECT_EQ(service->decode(stored.value().magnet_url, *alice, creator.get()).code(),
              ErrorCode::OriginalDataChecksumMismatch);
}

TEST_F(BlockServiceTest, LostBlocksAreRecovered) {
    EncodeOptions options;
    options.register_tuples = true;
    options.tuple_parity_count = 2;
    options.root_parity_count = 1;

    const bytes data = crypto::Random::generate(5000);
    auto encoded = service->encode(data, *creator, recipients(), options);
    ASSERT_TRUE(encoded.is_ok()) << encoded.error().to_string();
    const auto& magnet = encoded.value().magnet;
    ASSERT_FALSE(magnet.block2_parity.empty());

    auto addresses = cbl->address_list(encoded.value().root);
    ASSERT_TRUE(addresses.is_ok());
    ASSERT_EQ(addresses.value().size(), 6u);

    // Two members of the first tuple, one of the second, and the whitened half of the root.
    // The root randomizer is a reused data block without parity of its own, so it stays.
    for (size_t index : {0, 2, 4}) {
        if (addresses.value()[index] != magnet.block1) {
            ASSERT_TRUE(store->evict(addresses.value()[index]).is_ok());
        }
    }
    ASSERT_TRUE(store->evict(magnet.block2).is_ok());

    auto decoded = service->decode(encoded.value().magnet_url, *alice, creator.get());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value(), data);
}

TEST_F(BlockServiceTest, UnrecoverableLossFailsDecode) {
    auto encoded = service->encode(crypto::Random::generate(100), *creator, recipients());
    ASSERT_TRUE(encoded.is_ok());
    auto addresses = cbl->address_list(encoded.value().root);
    ASSERT_TRUE(addresses.is_ok());

    const auto victim = addresses.value()[0] != encoded.value().magnet.block1 ? addresses.value()[0]
                                                                              : addresses.value()[1];
    ASSERT_TRUE(store->remove(victim).is_ok());
    EXPECT_EQ(service->decode(encoded.value().magnet_url, *alice).code(), ErrorCode::BlockNotFound);
}

TEST_F(BlockServiceTest, MagnetForAnotherBlockSizeIsRejected) {
    auto encoded = service->encode(crypto::Random::generate(100), *creator, recipients());
    ASSERT_TRUE(encoded.is_ok());
    const std::string url = encoded.value().magnet_url;

    use_block_size(blocks::BlockSize::Tiny);
    EXPECT_EQ(service->decode(url, *alice).code(), ErrorCode::BlockSizeMismatch);
    EXPECT_EQ(service->decode("magnet:?xt=urn:brightchain:cbl", *alice).code(), ErrorCode::InvalidMagnetURLMissing);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
