#pragma once

#include "magnet.hpp"
#include "blocks/block.hpp"
#include "fec/fec_service.hpp"
#include "services/checksum_service.hpp"
#include "services/xor_tuple_service.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace brightchain::storage {

/**
 * Bookkeeping kept for every stored block; survives eviction of the payload
 */
struct BlockMetadata {
    Checksum checksum;
    blocks::BlockSize size = blocks::BlockSize::Unknown;
    blocks::BlockType type = blocks::BlockType::RawData;
    size_t length = 0;
    uint64_t created_at_ms = 0;
    std::vector<Checksum> parity_block_ids;
    std::optional<size_t> tuple_id;
};

struct PutOptions {
    // FEC parity shards generated for the block, 0 for none
    size_t parity_count = 0;
};

struct CblWhiteningOptions {
    size_t parity_count = 0;
    bool encrypted = false;
};

struct CblStorageResult {
    CblMagnet magnet;
    std::string magnet_url;
};

/**
 * Content-addressed block store keyed by SHA3-512 checksum
 */
class IBlockStore {
public:
    virtual ~IBlockStore() = default;

    virtual blocks::BlockSize block_size() const = 0;
    virtual bool has(const Checksum& checksum) const = 0;

    /**
     * Fetch a block; a missing or corrupted payload goes through recover()
     */
    virtual Result<blocks::Block> get(const Checksum& checksum) = 0;

    /**
     * Store a block under its checksum
     * @return Checksum, BlockAlreadyExists or BlockSizeMismatch
     */
    virtual Result<Checksum> put(const blocks::Block& block, const PutOptions& options = {}) = 0;

    /**
     * Delete a block with its metadata, parity and tuple membership
     */
    virtual Result<void> remove(const Checksum& checksum) = 0;

    /**
     * Drop the payload only; metadata and parity stay so the block can be recovered
     */
    virtual Result<void> evict(const Checksum& checksum) = 0;

    virtual Result<BlockMetadata> metadata(const Checksum& checksum) const = 0;

    /**
     * Compute and keep FEC parity for a stored block
     * @return Checksums of the parity shards
     */
    virtual Result<std::vector<Checksum>> generate_parity(const Checksum& checksum, size_t parity_count) = 0;
    virtual std::vector<Checksum> parity_ids(const Checksum& checksum) const = 0;

    /**
     * Record a tuple so any member can be rebuilt from its siblings
     * Keeps the XOR of all members plus parity_count Reed-Solomon shards.
     * A block belongs to at most one tuple; remove() of a member dissolves it.
     */
    virtual Result<void> register_tuple(const std::vector<Checksum>& members, size_t parity_count) = 0;

    /**
     * Rebuild a block: tuple XOR, then per-block parity, then tuple Reed-Solomon
     */
    virtual Result<blocks::Block> recover(const Checksum& checksum) = 0;

    virtual Result<CblStorageResult> store_cbl_with_whitening(const bytes& cbl,
                                                              const CblWhiteningOptions& options = {}) = 0;

    /**
     * Rebuild a CBL stored by store_cbl_with_whitening
     * @return CBL bytes, Block1NotFound or Block2NotFound when a half cannot be read or recovered
     */
    virtual Result<bytes> retrieve_cbl(const Checksum& block1, const Checksum& block2,
                                       const std::vector<Checksum>& block1_parity = {},
                                       const std::vector<Checksum>& block2_parity = {}) = 0;

    virtual size_t size() const = 0;
};

/**
 * In-memory IBlockStore
 * Readers share the lock, writers take it exclusively.
 */
class MemoryBlockStore : public IBlockStore {
public:
    MemoryBlockStore(blocks::BlockSize block_size, const services::ChecksumService& checksums,
                     const services::XorTupleService& tuples, std::shared_ptr<const fec::IFecProvider> fec);

    MemoryBlockStore(const MemoryBlockStore&) = delete;
    MemoryBlockStore& operator=(const MemoryBlockStore&) = delete;

    blocks::BlockSize block_size() const override { return block_size_; }
    bool has(const Checksum& checksum) const override;
    Result<blocks::Block> get(const Checksum& checksum) override;
    Result<Checksum> put(const blocks::Block& block, const PutOptions& options = {}) override;
    Result<void> remove(const Checksum& checksum) override;
    Result<void> evict(const Checksum& checksum) override;
    Result<BlockMetadata> metadata(const Checksum& checksum) const override;
    Result<std::vector<Checksum>> generate_parity(const Checksum& checksum, size_t parity_count) override;
    std::vector<Checksum> parity_ids(const Checksum& checksum) const override;
    Result<void> register_tuple(const std::vector<Checksum>& members, size_t parity_count) override;
    Result<blocks::Block> recover(const Checksum& checksum) override;
    Result<CblStorageResult> store_cbl_with_whitening(const bytes& cbl,
                                                      const CblWhiteningOptions& options = {}) override;
    Result<bytes> retrieve_cbl(const Checksum& block1, const Checksum& block2,
                               const std::vector<Checksum>& block1_parity = {},
                               const std::vector<Checksum>& block2_parity = {}) override;
    size_t size() const override;

    /**
     * Tuples currently registered; removing any member dissolves its tuple
     */
    size_t tuple_count() const;

    /**
     * Frame a CBL as [length u32 BE][cbl][zeros] of exactly block_bytes
     */
    static Result<bytes> pad_cbl(const bytes& cbl, uint32_t block_bytes);
    static Result<bytes> unpad_cbl(const bytes& padded);

private:
    struct TupleRecord {
        std::vector<Checksum> members;
        bytes xor_parity;
        std::vector<fec::ParityShard> parity;
    };

    // Callers hold the lock
    std::optional<blocks::Block> healthy_block_locked(const Checksum& checksum) const;
    void dissolve_tuple_locked(size_t tuple_id);
    Result<blocks::Block> recover_from_tuple(const Checksum& checksum, const BlockMetadata& meta, bool allow_fec);
    Result<blocks::Block> recover_from_parity(const Checksum& checksum, const BlockMetadata& meta);
    Result<blocks::Block> finish_recovery(const Checksum& checksum, const BlockMetadata& meta, bytes data);
    Result<bytes> select_randomizer(uint32_t length) const;
    Result<bytes> fetch_cbl_half(const Checksum& checksum, const std::vector<Checksum>& parity, ErrorCode not_found);

    blocks::BlockSize block_size_;
    const services::ChecksumService& checksums_;
    const services::XorTupleService& tuples_;
    std::shared_ptr<const fec::IFecProvider> fec_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<Checksum, blocks::Block> blocks_;
    std::unordered_map<Checksum, BlockMetadata> metadata_;
    std::unordered_map<Checksum, std::vector<fec::ParityShard>> parity_;
    std::unordered_map<size_t, TupleRecord> tuple_records_;
    size_t next_tuple_id_ = 0;
};

} // namespace brightchain::storage
