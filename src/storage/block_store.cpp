#include "block_store.hpp"
#include "brightchain/time_utils.hpp"
#include "crypto/random.hpp"
#include "utils/byte_io.hpp"
#include "utils/logger.hpp"
#include <mutex>

namespace brightchain::storage {

using blocks::Block;
using blocks::BlockType;

namespace {

std::string short_id(const Checksum& checksum) {
    return checksum.to_hex().substr(0, 16);
}

} // namespace

MemoryBlockStore::MemoryBlockStore(blocks::BlockSize block_size, const services::ChecksumService& checksums,
                                   const services::XorTupleService& tuples,
                                   std::shared_ptr<const fec::IFecProvider> fec)
    : block_size_(block_size), checksums_(checksums), tuples_(tuples), fec_(std::move(fec)) {}

std::optional<Block> MemoryBlockStore::healthy_block_locked(const Checksum& checksum) const {
    auto it = blocks_.find(checksum);
    if (it == blocks_.end() || !checksums_.validate(it->second.data(), checksum)) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryBlockStore::has(const Checksum& checksum) const {
    std::shared_lock lock(mutex_);
    return blocks_.find(checksum) != blocks_.end();
}

size_t MemoryBlockStore::size() const {
    std::shared_lock lock(mutex_);
    return blocks_.size();
}

Result<Block> MemoryBlockStore::get(const Checksum& checksum) {
    {
        std::shared_lock lock(mutex_);
        if (auto block = healthy_block_locked(checksum)) {
            return Result<Block>::Ok(std::move(*block));
        }
        if (metadata_.find(checksum) == metadata_.end()) {
            return Result<Block>::Err(ErrorCode::BlockNotFound, "Block " + short_id(checksum) + " not found");
        }
    }
    BRIGHTCHAIN_LOG_WARN("Block {} is missing or corrupt, attempting recovery", short_id(checksum));
    return recover(checksum);
}

Result<Checksum> MemoryBlockStore::put(const Block& block, const PutOptions& options) {
    if (block.size() != block_size_) {
        return Result<Checksum>::Err(ErrorCode::BlockSizeMismatch,
            std::string("Block is ") + blocks::block_size_name(block.size()) + ", store holds " +
            blocks::block_size_name(block_size_));
    }
    const Checksum checksum = checksums_.calculate(block.data());
    {
        std::unique_lock lock(mutex_);
        if (healthy_block_locked(checksum)) {
            return Result<Checksum>::Err(ErrorCode::BlockAlreadyExists,
                "Block " + short_id(checksum) + " already exists");
        }
        blocks_.erase(checksum);
        blocks_.emplace(checksum, block);

        // An evicted block put back keeps its parity and tuple membership
        auto meta = metadata_.find(checksum);
        if (meta == metadata_.end()) {
            BlockMetadata fresh;
            fresh.checksum = checksum;
            fresh.size = block.size();
            fresh.type = block.type();
            fresh.length = block.data().size();
            fresh.created_at_ms = time::timestamp_milliseconds();
            metadata_.emplace(checksum, std::move(fresh));
        }
    }
    BRIGHTCHAIN_LOG_TRACE("Stored {} block {}", blocks::block_type_name(block.type()), short_id(checksum));

    if (options.parity_count > 0) {
        BRIGHTCHAIN_TRY(generate_parity(checksum, options.parity_count));
    }
    return Result<Checksum>::Ok(checksum);
}

Result<void> MemoryBlockStore::remove(const Checksum& checksum) {
    std::unique_lock lock(mutex_);
    // A tuple missing a removed member is no longer recoverable as a whole
    auto meta = metadata_.find(checksum);
    if (meta != metadata_.end() && meta->second.tuple_id) {
        dissolve_tuple_locked(*meta->second.tuple_id);
    }
    const size_t erased = blocks_.erase(checksum) + metadata_.erase(checksum);
    parity_.erase(checksum);
    if (erased == 0) {
        return Result<void>::Err(ErrorCode::BlockNotFound, "Block " + short_id(checksum) + " not found");
    }
    return Result<void>::Ok();
}

Result<void> MemoryBlockStore::evict(const Checksum& checksum) {
    std::unique_lock lock(mutex_);
    if (blocks_.erase(checksum) == 0) {
        return Result<void>::Err(ErrorCode::BlockNotFound, "Block " + short_id(checksum) + " not found");
    }
    return Result<void>::Ok();
}

Result<BlockMetadata> MemoryBlockStore::metadata(const Checksum& checksum) const {
    std::shared_lock lock(mutex_);
    auto it = metadata_.find(checksum);
    if (it == metadata_.end()) {
        return Result<BlockMetadata>::Err(ErrorCode::BlockMetadataNotFound,
            "No metadata for block " + short_id(checksum));
    }
    return Result<BlockMetadata>::Ok(it->second);
}

Result<std::vector<Checksum>> MemoryBlockStore::generate_parity(const Checksum& checksum, size_t parity_count) {
    using R = Result<std::vector<Checksum>>;
    if (!fec_) {
        return R::Err(ErrorCode::InvalidConfiguration, "Block store has no FEC provider");
    }
    bytes data;
    {
        std::shared_lock lock(mutex_);
        auto block = healthy_block_locked(checksum);
        if (!block) {
            return R::Err(ErrorCode::BlockNotFound, "Block " + short_id(checksum) + " not found");
        }
        data = block->data();
    }

    BRIGHTCHAIN_TRY_UNWRAP(shards, fec_->encode(data, parity_count));
    std::vector<Checksum> ids;
    ids.reserve(shards.size());
    for (const auto& shard : shards) {
        ids.push_back(checksums_.calculate(shard.data));
    }

    std::unique_lock lock(mutex_);
    auto meta = metadata_.find(checksum);
    if (meta == metadata_.end()) {
        return R::Err(ErrorCode::BlockMetadataNotFound, "Block " + short_id(checksum) + " was removed");
    }
    meta->second.parity_block_ids = ids;
    parity_[checksum] = std::move(shards);
    BRIGHTCHAIN_LOG_DEBUG("Generated {} parity shards for {}", ids.size(), short_id(checksum));
    return R::Ok(std::move(ids));
}

std::vector<Checksum> MemoryBlockStore::parity_ids(const Checksum& checksum) const {
    std::shared_lock lock(mutex_);
    auto it = metadata_.find(checksum);
    if (it == metadata_.end()) {
        return {};
    }
    return it->second.parity_block_ids;
}

Result<void> MemoryBlockStore::register_tuple(const std::vector<Checksum>& members, size_t parity_count) {
    BRIGHTCHAIN_TRY(tuples_.validate_tuple_size(members.size()));
    if (parity_count > 0 && !fec_) {
        return Result<void>::Err(ErrorCode::InvalidConfiguration, "Block store has no FEC provider");
    }

    std::vector<bytes> data;
    data.reserve(members.size());
    {
        std::shared_lock lock(mutex_);
        for (const auto& member : members) {
            auto block = healthy_block_locked(member);
            if (!block) {
                return Result<void>::Err(ErrorCode::BlockNotFound, "Tuple member " + short_id(member) + " not found");
            }
            data.push_back(block->data());
        }
    }

    TupleRecord record;
    record.members = members;
    record.xor_parity = data.front();
    for (size_t i = 1; i < data.size(); ++i) {
        if (data[i].size() != record.xor_parity.size()) {
            return Result<void>::Err(ErrorCode::BlockSizeMismatch, "Tuple members differ in length");
        }
        xor_into(record.xor_parity, data[i]);
    }
    if (parity_count > 0) {
        BRIGHTCHAIN_TRY_UNWRAP(parity, fec_->encode_tuple(data, parity_count));
        record.parity = std::move(parity);
    }

    std::unique_lock lock(mutex_);
    for (const auto& member : members) {
        auto meta = metadata_.find(member);
        if (meta == metadata_.end()) {
            return Result<void>::Err(ErrorCode::BlockNotFound, "Tuple member " + short_id(member) + " was removed");
        }
        if (meta->second.tuple_id) {
            return Result<void>::Err(ErrorCode::InvalidArgument,
                "Block " + short_id(member) + " already belongs to tuple " + std::to_string(*meta->second.tuple_id));
        }
    }
    const size_t tuple_id = next_tuple_id_++;
    tuple_records_.emplace(tuple_id, std::move(record));
    for (const auto& member : members) {
        metadata_[member].tuple_id = tuple_id;
    }
    return Result<void>::Ok();
}

size_t MemoryBlockStore::tuple_count() const {
    std::shared_lock lock(mutex_);
    return tuple_records_.size();
}

void MemoryBlockStore::dissolve_tuple_locked(size_t tuple_id) {
    auto record = tuple_records_.find(tuple_id);
    if (record == tuple_records_.end()) {
        return;
    }
    for (const auto& member : record->second.members) {
        auto meta = metadata_.find(member);
        if (meta != metadata_.end()) {
            meta->second.tuple_id.reset();
        }
    }
    tuple_records_.erase(record);
}

Result<Block> MemoryBlockStore::recover(const Checksum& checksum) {
    BlockMetadata meta;
    {
        std::shared_lock lock(mutex_);
        auto it = metadata_.find(checksum);
        if (it == metadata_.end()) {
            return Result<Block>::Err(ErrorCode::BlockMetadataNotFound,
                "No metadata for block " + short_id(checksum));
        }
        meta = it->second;
        if (auto block = healthy_block_locked(checksum)) {
            return Result<Block>::Ok(std::move(*block));
        }
    }

    std::optional<Error> last_error;
    if (meta.tuple_id) {
        auto recovered = recover_from_tuple(checksum, meta, false);
        if (recovered.is_ok()) {
            return recovered;
        }
        last_error = recovered.error();
    }
    if (!meta.parity_block_ids.empty()) {
        auto recovered = recover_from_parity(checksum, meta);
        if (recovered.is_ok()) {
            return recovered;
        }
        last_error = recovered.error();
    }
    if (meta.tuple_id) {
        auto recovered = recover_from_tuple(checksum, meta, true);
        if (recovered.is_ok()) {
            return recovered;
        }
        last_error = recovered.error();
    }

    if (!last_error) {
        return Result<Block>::Err(ErrorCode::RecoveryFailedInsufficientParityData,
            "Block " + short_id(checksum) + " has neither parity nor tuple siblings");
    }
    BRIGHTCHAIN_LOG_ERROR("Recovery of {} failed: {}", short_id(checksum), last_error->to_string());
    return Result<Block>::Err(*last_error);
}

Result<Block> MemoryBlockStore::recover_from_tuple(const Checksum& checksum, const BlockMetadata& meta,
                                                   bool allow_fec) {
    TupleRecord record;
    std::vector<std::optional<bytes>> members;
    size_t target = 0;
    {
        std::shared_lock lock(mutex_);
        auto found = tuple_records_.find(*meta.tuple_id);
        if (found == tuple_records_.end()) {
            return Result<Block>::Err(ErrorCode::RecoveryFailedInsufficientParityData,
                "Tuple " + std::to_string(*meta.tuple_id) + " was dissolved");
        }
        record = found->second;
        for (size_t i = 0; i < record.members.size(); ++i) {
            if (record.members[i] == checksum) {
                target = i;
                members.emplace_back(std::nullopt);
                continue;
            }
            auto block = healthy_block_locked(record.members[i]);
            members.push_back(block ? std::optional<bytes>(block->data()) : std::nullopt);
        }
    }

    size_t missing = 0;
    for (const auto& member : members) {
        missing += member ? 0 : 1;
    }
    if (!allow_fec && missing != 1) {
        return Result<Block>::Err(ErrorCode::RecoveryFailedInsufficientParityData,
            std::to_string(missing) + " tuple members missing, XOR rebuilds exactly one");
    }
    if (allow_fec && record.parity.empty()) {
        return Result<Block>::Err(ErrorCode::RecoveryFailedInsufficientParityData, "Tuple has no FEC parity");
    }

    std::optional<bytes> xor_parity;
    std::vector<fec::ParityShard> fec_parity;
    if (allow_fec) {
        fec_parity = record.parity;
    } else {
        xor_parity = record.xor_parity;
    }
    BRIGHTCHAIN_TRY_UNWRAP(rebuilt, tuples_.recover_with_fec(members, xor_parity, fec_parity));
    BRIGHTCHAIN_LOG_INFO("Rebuilt {} from its tuple by {}", short_id(checksum), allow_fec ? "Reed-Solomon" : "XOR");
    return finish_recovery(checksum, meta, std::move(rebuilt[target]));
}

Result<Block> MemoryBlockStore::recover_from_parity(const Checksum& checksum, const BlockMetadata& meta) {
    if (!fec_) {
        return Result<Block>::Err(ErrorCode::RecoveryFailedInsufficientParityData,
            "Block store has no FEC provider");
    }
    std::vector<fec::ParityShard> shards;
    std::optional<bytes> damaged;
    {
        std::shared_lock lock(mutex_);
        auto parity = parity_.find(checksum);
        if (parity == parity_.end() || parity->second.empty()) {
            return Result<Block>::Err(ErrorCode::RecoveryFailedInsufficientParityData,
                "No parity data for block " + short_id(checksum));
        }
        shards = parity->second;
        auto block = blocks_.find(checksum);
        if (block != blocks_.end()) {
            damaged = block->second.data();
        }
    }
    BRIGHTCHAIN_TRY_UNWRAP(rebuilt, fec_->recover(damaged, shards, meta.length));
    BRIGHTCHAIN_LOG_INFO("Rebuilt {} from {} parity shards", short_id(checksum), shards.size());
    return finish_recovery(checksum, meta, std::move(rebuilt));
}

Result<Block> MemoryBlockStore::finish_recovery(const Checksum& checksum, const BlockMetadata& meta, bytes data) {
    if (!checksums_.validate(data, checksum)) {
        return Result<Block>::Err(ErrorCode::UnknownRecoveryError,
            "Recovered data for " + short_id(checksum) + " does not match its checksum");
    }
    BRIGHTCHAIN_TRY_UNWRAP(block, Block::create(meta.size, meta.type, std::move(data)));

    std::unique_lock lock(mutex_);
    // Removed while recovering: hand the block back without resurrecting it
    if (metadata_.find(checksum) == metadata_.end()) {
        return Result<Block>::Ok(std::move(block));
    }
    if (auto healthy = healthy_block_locked(checksum)) {
        return Result<Block>::Ok(std::move(*healthy));
    }
    blocks_.erase(checksum);
    blocks_.emplace(checksum, block);
    return Result<Block>::Ok(std::move(block));
}

Result<bytes> MemoryBlockStore::pad_cbl(const bytes& cbl, uint32_t block_bytes) {
    if (cbl.size() + constants::UINT32_SIZE > block_bytes) {
        return Result<bytes>::Err(ErrorCode::DataTooLarge,
            "CBL of " + std::to_string(cbl.size()) + " bytes does not fit a " + std::to_string(block_bytes) +
            " byte block");
    }
    utils::ByteWriter writer(block_bytes);
    writer.write_u32(static_cast<uint32_t>(cbl.size()));
    writer.write_bytes(cbl);
    writer.write_zeros(block_bytes - writer.size());
    return Result<bytes>::Ok(writer.take());
}

Result<bytes> MemoryBlockStore::unpad_cbl(const bytes& padded) {
    if (padded.size() < constants::UINT32_SIZE) {
        return Result<bytes>::Err(ErrorCode::DataTooShort, "Padded CBL is shorter than its length prefix");
    }
    utils::ByteReader reader(padded);
    const uint32_t length = reader.read_u32();
    if (length > reader.remaining()) {
        return Result<bytes>::Err(ErrorCode::DataTooShort,
            "Padded CBL declares " + std::to_string(length) + " bytes, holds " + std::to_string(reader.remaining()));
    }
    return Result<bytes>::Ok(reader.read_bytes(length));
}

Result<bytes> MemoryBlockStore::select_randomizer(uint32_t length) const {
    std::vector<const Block*> candidates;
    {
        std::shared_lock lock(mutex_);
        for (const auto& entry : blocks_) {
            if (entry.second.data().size() == length) {
                candidates.push_back(&entry.second);
            }
        }
        if (!candidates.empty()) {
            const auto pick = crypto::Random::uniform(static_cast<uint32_t>(candidates.size()));
            return Result<bytes>::Ok(candidates[pick]->data());
        }
    }
    return Result<bytes>::Ok(crypto::Random::generate(length));
}

Result<CblStorageResult> MemoryBlockStore::store_cbl_with_whitening(const bytes& cbl,
                                                                    const CblWhiteningOptions& options) {
    using R = Result<CblStorageResult>;
    if (cbl.empty()) {
        return R::Err(ErrorCode::InvalidArgument, "CBL data cannot be empty");
    }
    const uint32_t block_bytes = blocks::block_size_bytes(block_size_);
    BRIGHTCHAIN_TRY_UNWRAP(padded, pad_cbl(cbl, block_bytes));
    BRIGHTCHAIN_TRY_UNWRAP(randomizer, select_randomizer(block_bytes));
    bytes whitened = xor_bytes(padded, randomizer);

    BRIGHTCHAIN_TRY_UNWRAP(block1, Block::create(block_size_, BlockType::Random, std::move(randomizer)));
    BRIGHTCHAIN_TRY_UNWRAP(block2, Block::create(block_size_, BlockType::Whitened, std::move(whitened)));
    const PutOptions put_options{options.parity_count};

    const Checksum id1 = block1.checksum();
    bool stored_block1 = false;
    if (!has(id1)) {
        BRIGHTCHAIN_TRY(put(block1, put_options));
        stored_block1 = true;
    }
    auto id2 = put(block2, put_options);
    if (id2.is_err()) {
        if (stored_block1) {
            auto rollback = remove(id1);
            if (rollback.is_err()) {
                BRIGHTCHAIN_LOG_WARN("Rollback of randomizer {} failed: {}", short_id(id1),
                                     rollback.error().to_string());
            }
        }
        return id2.error();
    }

    CblStorageResult result;
    result.magnet.block_size = block_bytes;
    result.magnet.block1 = id1;
    result.magnet.block2 = id2.value();
    result.magnet.block1_parity = parity_ids(id1);
    result.magnet.block2_parity = parity_ids(id2.value());
    result.magnet.encrypted = options.encrypted;
    result.magnet_url = result.magnet.to_uri();
    BRIGHTCHAIN_LOG_DEBUG("Stored whitened CBL as {} + {}", short_id(id1), short_id(id2.value()));
    return R::Ok(std::move(result));
}

Result<bytes> MemoryBlockStore::fetch_cbl_half(const Checksum& checksum, const std::vector<Checksum>& parity,
                                               ErrorCode not_found) {
    {
        std::shared_lock lock(mutex_);
        if (auto block = healthy_block_locked(checksum)) {
            return Result<bytes>::Ok(block->data());
        }
    }
    if (parity.empty()) {
        return Result<bytes>::Err(not_found, "Block " + short_id(checksum) + " not found");
    }
    auto recovered = recover(checksum);
    if (recovered.is_err()) {
        return Result<bytes>::Err(not_found,
            "Block " + short_id(checksum) + " not found and recovery failed: " + recovered.error().message());
    }
    return Result<bytes>::Ok(recovered.value().data());
}

Result<bytes> MemoryBlockStore::retrieve_cbl(const Checksum& block1, const Checksum& block2,
                                             const std::vector<Checksum>& block1_parity,
                                             const std::vector<Checksum>& block2_parity) {
    BRIGHTCHAIN_TRY_UNWRAP(half1, fetch_cbl_half(block1, block1_parity, ErrorCode::Block1NotFound));
    BRIGHTCHAIN_TRY_UNWRAP(half2, fetch_cbl_half(block2, block2_parity, ErrorCode::Block2NotFound));
    if (half1.size() != half2.size()) {
        return Result<bytes>::Err(ErrorCode::BlockSizeMismatch, "CBL halves differ in length");
    }
    xor_into(half1, half2);
    return unpad_cbl(half1);
}

} // namespace brightchain::storage
