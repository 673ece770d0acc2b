#include <gtest/gtest.h>
#include "storage/block_store.hpp"
#include "storage/magnet.hpp"
#include "crypto/random.hpp"
#include <atomic>
#include <thread>

using namespace brightchain;
using namespace brightchain::blocks;
using namespace brightchain::storage;

namespace {

Block random_block(BlockType type = BlockType::RawData) {
    auto block = Block::create(BlockSize::Message, type, crypto::Random::generate(512));
    if (block.is_err()) {
        throw BrightChainException(block.error().code(), block.error().message());
    }
    return block.take();
}

Checksum checksum_of(byte seed) {
    services::ChecksumService service;
    return service.calculate(bytes(8, seed));
}

// Real Reed-Solomon whose single-block recovery hands back one wrong byte
class CorruptingFec : public fec::IFecProvider {
public:
    Result<std::vector<fec::ParityShard>> encode(const bytes& block, size_t parity_count) const override {
        return inner_.encode(block, parity_count);
    }

    Result<bytes> recover(const std::optional<bytes>& damaged, const std::vector<fec::ParityShard>& parity,
                          size_t block_size) const override {
        auto rebuilt = inner_.recover(damaged, parity, block_size);
        if (rebuilt.is_ok()) {
            bytes data = rebuilt.take();
            data[0] ^= 0xff;
            return Result<bytes>::Ok(std::move(data));
        }
        return rebuilt;
    }

    Result<std::vector<fec::ParityShard>> encode_tuple(const std::vector<bytes>& members,
                                                       size_t parity_count) const override {
        return inner_.encode_tuple(members, parity_count);
    }

    Result<std::vector<bytes>> recover_tuple(const std::vector<std::optional<bytes>>& members,
                                             const std::vector<fec::ParityShard>& parity) const override {
        return inner_.recover_tuple(members, parity);
    }

private:
    fec::ReedSolomonFecService inner_;
};

} // namespace

class BlockStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        fec = std::make_shared<fec::ReedSolomonFecService>();
        tuples = std::make_unique<services::XorTupleService>(settings, fec);
        store = std::make_unique<MemoryBlockStore>(BlockSize::Message, checksums, *tuples, fec);
    }

    void TearDown() override {
        store.reset();
    }

    Checksum put_random() {
        auto id = store->put(random_block());
        EXPECT_TRUE(id.is_ok());
        return id.value_or(Checksum{});
    }

    utils::EngineSettings settings;
    services::ChecksumService checksums;
    std::shared_ptr<fec::ReedSolomonFecService> fec;
    std::unique_ptr<services::XorTupleService> tuples;
    std::unique_ptr<MemoryBlockStore> store;
};

TEST_F(BlockStoreTest, PutAndGet) {
    auto block = random_block();
    auto id = store->put(block);
    ASSERT_TRUE(id.is_ok());
    EXPECT_EQ(id.value(), block.checksum());
    EXPECT_TRUE(store->has(id.value()));
    EXPECT_EQ(store->size(), 1u);

    auto fetched = store->get(id.value());
    ASSERT_TRUE(fetched.is_ok());
    EXPECT_EQ(fetched.value().data(), block.data());

    auto meta = store->metadata(id.value());
    ASSERT_TRUE(meta.is_ok());
    EXPECT_EQ(meta.value().length, 512u);
    EXPECT_EQ(meta.value().size, BlockSize::Message);
    EXPECT_GT(meta.value().created_at_ms, 0u);
    EXPECT_FALSE(meta.value().tuple_id.has_value());
}

TEST_F(BlockStoreTest, PutRejectsDuplicatesAndWrongSize) {
    auto block = random_block();
    ASSERT_TRUE(store->put(block).is_ok());
    EXPECT_EQ(store->put(block).code(), ErrorCode::BlockAlreadyExists);

    auto tiny = Block::create(BlockSize::Tiny, BlockType::RawData, bytes(1024, 0x01));
    ASSERT_TRUE(tiny.is_ok());
    EXPECT_EQ(store->put(tiny.value()).code(), ErrorCode::BlockSizeMismatch);
}

TEST_F(BlockStoreTest, UnknownBlocks) {
    const auto unknown = checksum_of(0x01);
    EXPECT_FALSE(store->has(unknown));
    EXPECT_EQ(store->get(unknown).code(), ErrorCode::BlockNotFound);
    EXPECT_EQ(store->metadata(unknown).code(), ErrorCode::BlockMetadataNotFound);
    EXPECT_EQ(store->recover(unknown).code(), ErrorCode::BlockMetadataNotFound);
    EXPECT_EQ(store->remove(unknown).code(), ErrorCode::BlockNotFound);
    EXPECT_EQ(store->evict(unknown).code(), ErrorCode::BlockNotFound);
    EXPECT_TRUE(store->parity_ids(unknown).empty());
}

TEST_F(BlockStoreTest, RemoveDropsEverything) {
    auto id = store->put(random_block(), PutOptions{2});
    ASSERT_TRUE(id.is_ok());
    EXPECT_EQ(store->parity_ids(id.value()).size(), 2u);

    ASSERT_TRUE(store->remove(id.value()).is_ok());
    EXPECT_FALSE(store->has(id.value()));
    EXPECT_EQ(store->metadata(id.value()).code(), ErrorCode::BlockMetadataNotFound);
    EXPECT_TRUE(store->parity_ids(id.value()).empty());
    EXPECT_EQ(store->get(id.value()).code(), ErrorCode::BlockNotFound);
}

TEST_F(BlockStoreTest, EvictedBlockWithoutRedundancyCannotRecover) {
    const auto id = put_random();
    ASSERT_TRUE(store->evict(id).is_ok());
    EXPECT_FALSE(store->has(id));
    EXPECT_TRUE(store->metadata(id).is_ok());
    EXPECT_EQ(store->get(id).code(), ErrorCode::RecoveryFailedInsufficientParityData);
}

TEST_F(BlockStoreTest, RecoversFromPerBlockParity) {
    auto block = random_block();
    auto id = store->put(block, PutOptions{2});
    ASSERT_TRUE(id.is_ok());

    ASSERT_TRUE(store->evict(id.value()).is_ok());
    auto fetched = store->get(id.value());
    ASSERT_TRUE(fetched.is_ok()) << fetched.error().to_string();
    EXPECT_EQ(fetched.value().data(), block.data());
    EXPECT_TRUE(store->has(id.value()));
}

TEST_F(BlockStoreTest, RecoveredDataFailingItsChecksumIsReported) {
    MemoryBlockStore corrupting(BlockSize::Message, checksums, *tuples, std::make_shared<CorruptingFec>());
    auto id = corrupting.put(random_block(), PutOptions{1});
    ASSERT_TRUE(id.is_ok());

    ASSERT_TRUE(corrupting.evict(id.value()).is_ok());
    EXPECT_EQ(corrupting.get(id.value()).code(), ErrorCode::UnknownRecoveryError);
    EXPECT_FALSE(corrupting.has(id.value()));
}

TEST_F(BlockStoreTest, RecoversSingleTupleMemberByXor) {
    std::vector<Checksum> members = {put_random(), put_random(), put_random()};
    ASSERT_TRUE(store->register_tuple(members, 0).is_ok());
    auto meta = store->metadata(members[1]);
    ASSERT_TRUE(meta.is_ok());
    EXPECT_EQ(meta.value().tuple_id, std::optional<size_t>(0));

    auto original = store->get(members[1]);
    ASSERT_TRUE(original.is_ok());
    ASSERT_TRUE(store->evict(members[1]).is_ok());

    auto recovered = store->recover(members[1]);
    ASSERT_TRUE(recovered.is_ok()) << recovered.error().to_string();
    EXPECT_EQ(recovered.value().data(), original.value().data());
}

TEST_F(BlockStoreTest, RecoversTwoTupleMembersWithReedSolomon) {
    std::vector<Checksum> members = {put_random(), put_random(), put_random()};
    std::vector<bytes> originals;
    for (const auto& id : members) {
        originals.push_back(store->get(id).value().data());
    }
    ASSERT_TRUE(store->register_tuple(members, 2).is_ok());

    ASSERT_TRUE(store->evict(members[0]).is_ok());
    ASSERT_TRUE(store->evict(members[2]).is_ok());

    auto first = store->get(members[0]);
    ASSERT_TRUE(first.is_ok()) << first.error().to_string();
    EXPECT_EQ(first.value().data(), originals[0]);

    auto last = store->get(members[2]);
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value().data(), originals[2]);
}

TEST_F(BlockStoreTest, TupleLossBeyondParityFails) {
    std::vector<Checksum> members = {put_random(), put_random(), put_random()};
    ASSERT_TRUE(store->register_tuple(members, 1).is_ok());
    ASSERT_TRUE(store->evict(members[0]).is_ok());
    ASSERT_TRUE(store->evict(members[1]).is_ok());
    EXPECT_EQ(store->get(members[0]).code(), ErrorCode::RecoveryFailedInsufficientParityData);
}

TEST_F(BlockStoreTest, RemovingAMemberDissolvesItsTuple) {
    std::vector<Checksum> members = {put_random(), put_random(), put_random()};
    ASSERT_TRUE(store->register_tuple(members, 1).is_ok());
    EXPECT_EQ(store->tuple_count(), 1u);
    EXPECT_EQ(store->register_tuple({members[0], put_random()}, 0).code(), ErrorCode::InvalidArgument);

    ASSERT_TRUE(store->remove(members[1]).is_ok());
    EXPECT_EQ(store->tuple_count(), 0u);
    for (const auto& sibling : {members[0], members[2]}) {
        auto meta = store->metadata(sibling);
        ASSERT_TRUE(meta.is_ok());
        EXPECT_FALSE(meta.value().tuple_id.has_value());
    }

    // Survivors can join a new tuple, whose id is not reused
    ASSERT_TRUE(store->register_tuple({members[0], members[2]}, 0).is_ok());
    EXPECT_EQ(store->tuple_count(), 1u);
    EXPECT_EQ(store->metadata(members[0]).value().tuple_id, std::optional<size_t>(1));
}

TEST_F(BlockStoreTest, RegisterTupleValidation) {
    const auto a = put_random();
    EXPECT_EQ(store->register_tuple({a}, 0).code(), ErrorCode::InvalidTupleSize);
    EXPECT_EQ(store->register_tuple({a, checksum_of(0x02)}, 0).code(), ErrorCode::BlockNotFound);

    auto short_block = Block::create(BlockSize::Message, BlockType::RawData, bytes(100, 0x07));
    ASSERT_TRUE(short_block.is_ok());
    auto b = store->put(short_block.value());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(store->register_tuple({a, b.value()}, 0).code(), ErrorCode::BlockSizeMismatch);

    MemoryBlockStore no_fec(BlockSize::Message, checksums, *tuples, nullptr);
    const auto c = no_fec.put(random_block());
    ASSERT_TRUE(c.is_ok());
    EXPECT_EQ(no_fec.generate_parity(c.value(), 2).code(), ErrorCode::InvalidConfiguration);
}

TEST_F(BlockStoreTest, CblPadding) {
    bytes cbl(100, 0xCB);
    auto padded = MemoryBlockStore::pad_cbl(cbl, 512);
    ASSERT_TRUE(padded.is_ok());
    ASSERT_EQ(padded.value().size(), 512u);
    EXPECT_EQ(padded.value()[3], 100);

    auto unpadded = MemoryBlockStore::unpad_cbl(padded.value());
    ASSERT_TRUE(unpadded.is_ok());
    EXPECT_EQ(unpadded.value(), cbl);

    EXPECT_EQ(MemoryBlockStore::pad_cbl(bytes(509, 0), 512).code(), ErrorCode::DataTooLarge);
    EXPECT_EQ(MemoryBlockStore::unpad_cbl(bytes{0, 0}).code(), ErrorCode::DataTooShort);
    EXPECT_EQ(MemoryBlockStore::unpad_cbl(bytes{0, 0, 1, 0, 0xAA}).code(), ErrorCode::DataTooShort);
}

TEST_F(BlockStoreTest, WhitenedCblRoundTrip) {
    bytes cbl(300);
    for (size_t i = 0; i < cbl.size(); ++i) {
        cbl[i] = static_cast<byte>(i);
    }
    auto stored = store->store_cbl_with_whitening(cbl, CblWhiteningOptions{1, true});
    ASSERT_TRUE(stored.is_ok()) << stored.error().to_string();
    const auto& magnet = stored.value().magnet;
    EXPECT_EQ(magnet.block_size, 512u);
    EXPECT_TRUE(magnet.encrypted);
    EXPECT_EQ(magnet.block2_parity.size(), 1u);

    auto block2 = store->get(magnet.block2);
    ASSERT_TRUE(block2.is_ok());
    EXPECT_EQ(block2.value().type(), BlockType::Whitened);

    auto parsed = CblMagnet::parse(stored.value().magnet_url);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), magnet);

    auto retrieved = store->retrieve_cbl(magnet.block1, magnet.block2, magnet.block1_parity, magnet.block2_parity);
    ASSERT_TRUE(retrieved.is_ok());
    EXPECT_EQ(retrieved.value(), cbl);

    EXPECT_EQ(store->store_cbl_with_whitening(bytes{}).code(), ErrorCode::InvalidArgument);
}

TEST_F(BlockStoreTest, RandomizerBlocksAreReused) {
    const auto existing = put_random();
    auto stored = store->store_cbl_with_whitening(bytes(50, 0x01));
    ASSERT_TRUE(stored.is_ok());
    // The only full-length block in the store serves as the randomizer
    EXPECT_EQ(stored.value().magnet.block1, existing);
    EXPECT_EQ(store->size(), 2u);
}

TEST_F(BlockStoreTest, RetrieveReportsMissingHalves) {
    auto stored = store->store_cbl_with_whitening(bytes(64, 0x42), CblWhiteningOptions{2, false});
    ASSERT_TRUE(stored.is_ok());
    const auto magnet = stored.value().magnet;

    ASSERT_TRUE(store->evict(magnet.block1).is_ok());
    EXPECT_EQ(store->retrieve_cbl(magnet.block1, magnet.block2).code(), ErrorCode::Block1NotFound);

    // With parity ids the evicted half is rebuilt
    auto rebuilt = store->retrieve_cbl(magnet.block1, magnet.block2, magnet.block1_parity, magnet.block2_parity);
    ASSERT_TRUE(rebuilt.is_ok()) << rebuilt.error().to_string();
    EXPECT_EQ(rebuilt.value(), bytes(64, 0x42));

    ASSERT_TRUE(store->remove(magnet.block2).is_ok());
    EXPECT_EQ(store->retrieve_cbl(magnet.block1, magnet.block2, {}, magnet.block2_parity).code(),
              ErrorCode::Block2NotFound);
}

TEST_F(BlockStoreTest, ConcurrentReaders) {
    std::vector<Checksum> ids;
    for (int i = 0; i < 16; ++i) {
        ids.push_back(put_random());
    }
    std::atomic<int> found{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            for (const auto& id : ids) {
                if (store->get(id).is_ok()) {
                    found++;
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(found.load(), 64);
}

TEST(MagnetTest, UriLayout) {
    CblMagnet magnet;
    magnet.block_size = 4096;
    magnet.block1 = checksum_of(0x10);
    magnet.block2 = checksum_of(0x20);
    magnet.block2_parity = {checksum_of(0x30), checksum_of(0x40)};

    const auto uri = magnet.to_uri();
    EXPECT_EQ(uri.rfind("magnet:?xt=urn:brightchain:cbl&bs=4096&b1=" + magnet.block1.to_hex(), 0), 0u);
    EXPECT_NE(uri.find("&p2=" + checksum_of(0x30).to_hex() + "," + checksum_of(0x40).to_hex()), std::string::npos);
    EXPECT_EQ(uri.find("p1="), std::string::npos);
    EXPECT_EQ(uri.find("enc="), std::string::npos);

    auto parsed = CblMagnet::parse(uri);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), magnet);
}

TEST(MagnetTest, ParseAcceptsEncodedTopic) {
    const std::string b1 = checksum_of(1).to_hex();
    const std::string b2 = checksum_of(2).to_hex();
    auto parsed = CblMagnet::parse("magnet:?xt=urn%3Abrightchain%3Acbl&b2=" + b2 + "&bs=512&b1=" + b1 + "&enc=1");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().block_size, 512u);
    EXPECT_EQ(parsed.value().block1, checksum_of(1));
    EXPECT_TRUE(parsed.value().encrypted);
}

TEST(MagnetTest, ParseErrors) {
    const std::string b1 = checksum_of(1).to_hex();
    const std::string b2 = checksum_of(2).to_hex();
    const std::string base = "magnet:?xt=urn:brightchain:cbl";

    EXPECT_EQ(CblMagnet::parse("https://example.com").code(), ErrorCode::InvalidMagnetURL);
    EXPECT_EQ(CblMagnet::parse("magnet:?xt=urn:btih:abc&bs=512&b1=" + b1 + "&b2=" + b2).code(),
              ErrorCode::InvalidMagnetURLXT);
    EXPECT_EQ(CblMagnet::parse("magnet:?bs=512&b1=" + b1 + "&b2=" + b2).code(), ErrorCode::InvalidMagnetURLXT);
    EXPECT_EQ(CblMagnet::parse(base + "&bs=512&b1=" + b1).code(), ErrorCode::InvalidMagnetURLMissing);
    EXPECT_EQ(CblMagnet::parse(base + "&bs=&b1=" + b1 + "&b2=" + b2).code(), ErrorCode::InvalidMagnetURLMissing);
    EXPECT_EQ(CblMagnet::parse(base + "&bs=big&b1=" + b1 + "&b2=" + b2).code(),
              ErrorCode::InvalidMagnetURLInvalidBlockSize);
    EXPECT_EQ(CblMagnet::parse(base + "&bs=1000&b1=" + b1 + "&b2=" + b2).code(),
              ErrorCode::InvalidMagnetURLInvalidBlockSize);
    EXPECT_EQ(CblMagnet::parse(base + "&bs=512&b1=xyz&b2=" + b2).code(), ErrorCode::InvalidMagnetURL);
    EXPECT_EQ(CblMagnet::parse(base + "%G1&bs=512&b1=" + b1 + "&b2=" + b2).code(), ErrorCode::InvalidMagnetURL);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
