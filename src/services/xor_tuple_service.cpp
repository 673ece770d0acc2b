#include "xor_tuple_service.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"

namespace brightchain::services {

using blocks::Block;
using blocks::BlockType;

XorTupleService::XorTupleService(const utils::EngineSettings& settings,
                                 std::shared_ptr<const fec::IFecProvider> fec)
    : tuple_size_(settings.tuple_size),
      tuple_min_size_(settings.tuple_min_size),
      tuple_max_size_(settings.tuple_max_size),
      fec_(std::move(fec)) {}

Result<void> XorTupleService::validate_tuple_size(size_t size) const {
    if (size < tuple_min_size_ || size > tuple_max_size_) {
        return Result<void>::Err(ErrorCode::InvalidTupleSize,
            "Tuple size " + std::to_string(size) + " outside [" + std::to_string(tuple_min_size_) + ", " +
            std::to_string(tuple_max_size_) + "]");
    }
    return Result<void>::Ok();
}

Result<Block> XorTupleService::whiten(const std::vector<Block>& tuple) const {
    if (tuple.empty()) {
        return Result<Block>::Err(ErrorCode::NoBlocksToXor, "No blocks to XOR");
    }
    const auto& first = tuple.front();
    bytes result = first.data();
    for (size_t i = 1; i < tuple.size(); ++i) {
        if (tuple[i].size() != first.size() || tuple[i].data().size() != result.size()) {
            return Result<Block>::Err(ErrorCode::BlockSizeMismatch,
                "Tuple member " + std::to_string(i) + " differs in size from the first member");
        }
        xor_into(result, tuple[i].data());
    }
    return Block::create(first.size(), BlockType::Whitened, std::move(result));
}

Result<Block> XorTupleService::reconstruct(const std::vector<Block>& known, const Block& whitened,
                                           BlockType type) const {
    return reconstruct_member(known, whitened, tuple_size_, type);
}

Result<Block> XorTupleService::reconstruct_member(const std::vector<Block>& known, const Block& whitened,
                                                  size_t tuple_size, BlockType type) const {
    BRIGHTCHAIN_TRY(validate_tuple_size(tuple_size));
    if (known.size() + 1 != tuple_size) {
        return Result<Block>::Err(ErrorCode::InvalidTupleSize,
            std::to_string(known.size()) + " known members for a tuple of " + std::to_string(tuple_size) +
            "; XOR rebuilds exactly one missing member, use recover_with_fec for more");
    }

    std::vector<Block> members;
    members.reserve(known.size() + 1);
    members.push_back(whitened);
    members.insert(members.end(), known.begin(), known.end());
    BRIGHTCHAIN_TRY_UNWRAP(combined, whiten(members));
    return Block::create(combined.size(), type, combined.data());
}

Result<std::vector<Block>> XorTupleService::make_tuple_blocks(const Block& data) const {
    BRIGHTCHAIN_TRY(validate_tuple_size(tuple_size_));

    const uint32_t length = data.capacity();
    std::vector<Block> randomizers;
    randomizers.reserve(tuple_size_ - 1);
    for (size_t i = 0; i + 1 < tuple_size_; ++i) {
        BRIGHTCHAIN_TRY_UNWRAP(randomizer, Block::create(data.size(), BlockType::Random, crypto::Random::generate(length)));
        randomizers.push_back(std::move(randomizer));
    }

    BRIGHTCHAIN_TRY_UNWRAP(padded, Block::create(data.size(), data.type(), data.padded()));
    std::vector<Block> members;
    members.reserve(tuple_size_);
    members.push_back(std::move(padded));
    members.insert(members.end(), randomizers.begin(), randomizers.end());
    BRIGHTCHAIN_TRY_UNWRAP(whitened, whiten(members));

    std::vector<Block> out;
    out.reserve(tuple_size_);
    out.push_back(std::move(whitened));
    out.insert(out.end(), randomizers.begin(), randomizers.end());
    return Result<std::vector<Block>>::Ok(std::move(out));
}

Result<Block> XorTupleService::unwhiten(const Block& whitened, const std::vector<Block>& randomizers) const {
    return reconstruct_member(randomizers, whitened, tuple_size_, BlockType::RawData);
}

Result<Block> XorTupleService::unwhiten(const Block& whitened, const std::vector<Block>& randomizers,
                                        size_t tuple_size) const {
    return reconstruct_member(randomizers, whitened, tuple_size, BlockType::RawData);
}

Result<std::vector<bytes>> XorTupleService::recover_with_fec(const std::vector<std::optional<bytes>>& members,
                                                             const std::optional<bytes>& xor_parity,
                                                             const std::vector<fec::ParityShard>& fec_parity) const {
    using R = Result<std::vector<bytes>>;
    size_t missing = 0;
    size_t missing_index = 0;
    for (size_t i = 0; i < members.size(); ++i) {
        if (!members[i]) {
            ++missing;
            missing_index = i;
        }
    }
    if (missing == 0) {
        return R::Err(ErrorCode::DamagedBlockRequired, "No tuple member is missing");
    }

    if (missing == 1 && xor_parity) {
        bytes rebuilt = *xor_parity;
        for (const auto& member : members) {
            if (!member) {
                continue;
            }
            if (member->size() != rebuilt.size()) {
                return R::Err(ErrorCode::BlockSizeMismatch, "Tuple member differs in size from the XOR parity");
            }
            xor_into(rebuilt, *member);
        }
        std::vector<bytes> out;
        out.reserve(members.size());
        for (size_t i = 0; i < members.size(); ++i) {
            out.push_back(i == missing_index ? rebuilt : *members[i]);
        }
        BRIGHTCHAIN_LOG_DEBUG("Reconstructed tuple member {} by XOR", missing_index);
        return R::Ok(std::move(out));
    }

    if (!fec_) {
        return R::Err(ErrorCode::RecoveryFailedInsufficientParityData,
            std::to_string(missing) + " members missing and no FEC provider configured");
    }
    return fec_->recover_tuple(members, fec_parity);
}

} // namespace brightchain::services
