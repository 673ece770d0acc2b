#include "fec_service.hpp"
#include "utils/logger.hpp"
#include <isa-l/erasure_code.h>
#include <algorithm>

namespace brightchain::fec {

namespace {

using Matrix = std::vector<unsigned char>;

// Rows 0..k-1 are the identity, row k+i is the coefficient row of parity shard i
Matrix cauchy_matrix(size_t data_shards, size_t parity_rows) {
    const int k = static_cast<int>(data_shards);
    const int m = static_cast<int>(data_shards + parity_rows);
    Matrix matrix(static_cast<size_t>(m) * data_shards);
    gf_gen_cauchy1_matrix(matrix.data(), m, k);
    return matrix;
}

// ISA-L takes non-const source pointers but never writes through them
unsigned char* source_ptr(const bytes& shard) {
    return const_cast<unsigned char*>(shard.data());
}

/**
 * Apply `rows` coefficient rows (k bytes each) to k source shards
 */
std::vector<bytes> apply_rows(const Matrix& rows, size_t row_count, const std::vector<const bytes*>& sources,
                              size_t shard_len) {
    const int k = static_cast<int>(sources.size());
    const int out_rows = static_cast<int>(row_count);
    std::vector<unsigned char> tables(sources.size() * row_count * 32);
    ec_init_tables(k, out_rows, const_cast<unsigned char*>(rows.data()), tables.data());

    std::vector<unsigned char*> in(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        in[i] = source_ptr(*sources[i]);
    }
    std::vector<bytes> out(row_count, bytes(shard_len, 0));
    std::vector<unsigned char*> out_ptrs(row_count);
    for (size_t i = 0; i < row_count; ++i) {
        out_ptrs[i] = out[i].data();
    }
    ec_encode_data(static_cast<int>(shard_len), k, out_rows, tables.data(), in.data(), out_ptrs.data());
    return out;
}

Result<void> check_parity(const std::vector<ParityShard>& parity, size_t data_shards, size_t& shard_len) {
    if (parity.empty()) {
        return Result<void>::Err(ErrorCode::ParityBlocksRequired, "No parity blocks supplied");
    }
    shard_len = parity[0].data.size();
    for (const auto& shard : parity) {
        if (shard.data.size() != shard_len || shard_len == 0) {
            return Result<void>::Err(ErrorCode::InvalidParityBlockSize,
                "Parity block " + std::to_string(shard.index) + " has " + std::to_string(shard.data.size()) +
                " bytes, expected " + std::to_string(shard_len));
        }
        if (data_shards + shard.index >= constants::fec::MAX_TOTAL_SHARDS) {
            return Result<void>::Err(ErrorCode::InvalidArgument,
                "Parity index " + std::to_string(shard.index) + " out of range");
        }
    }
    return Result<void>::Ok();
}

size_t parity_rows(const std::vector<ParityShard>& parity) {
    uint32_t max_index = 0;
    for (const auto& shard : parity) {
        max_index = std::max(max_index, shard.index);
    }
    return static_cast<size_t>(max_index) + 1;
}

} // namespace

Result<std::vector<ParityShard>> ReedSolomonFecService::encode(const bytes& block, size_t parity_count) const {
    return encode_tuple({block}, parity_count);
}

Result<bytes> ReedSolomonFecService::recover(const std::optional<bytes>& damaged, const std::vector<ParityShard>& parity,
                                             size_t block_size) const {
    size_t shard_len = 0;
    BRIGHTCHAIN_TRY(check_parity(parity, 1, shard_len));
    // The damaged copy is treated as erased
    BRIGHTCHAIN_LOG_DEBUG("Recovering {} byte block from {} parity shards (damaged copy {})",
                          block_size, parity.size(), damaged ? "present" : "absent");

    BRIGHTCHAIN_TRY_UNWRAP(members, recover_tuple({std::nullopt}, parity));
    if (members[0].size() != block_size) {
        return Result<bytes>::Err(ErrorCode::InvalidRecoveredBlockSize,
            "Recovered " + std::to_string(members[0].size()) + " bytes, expected " + std::to_string(block_size));
    }
    return Result<bytes>::Ok(std::move(members[0]));
}

Result<std::vector<ParityShard>> ReedSolomonFecService::encode_tuple(const std::vector<bytes>& members,
                                                                     size_t parity_count) const {
    using R = Result<std::vector<ParityShard>>;
    if (parity_count == 0) {
        return R::Err(ErrorCode::ParityBlocksRequired, "Parity count must be positive");
    }
    if (members.empty()) {
        return R::Err(ErrorCode::NoBlocksToXor, "No blocks to encode");
    }
    if (members.size() + parity_count > constants::fec::MAX_TOTAL_SHARDS) {
        return R::Err(ErrorCode::InvalidArgument,
            "Data plus parity shards exceed " + std::to_string(constants::fec::MAX_TOTAL_SHARDS));
    }
    const size_t len = members[0].size();
    for (const auto& member : members) {
        if (member.size() != len || len == 0) {
            return R::Err(ErrorCode::BlockSizeMismatch, "Tuple members must share one non-zero length");
        }
    }

    const size_t k = members.size();
    const Matrix matrix = cauchy_matrix(k, parity_count);
    const Matrix parity_part(matrix.begin() + static_cast<std::ptrdiff_t>(k * k), matrix.end());

    std::vector<const bytes*> sources;
    sources.reserve(k);
    for (const auto& member : members) {
        sources.push_back(&member);
    }
    auto parity = apply_rows(parity_part, parity_count, sources, len);

    std::vector<ParityShard> out;
    out.reserve(parity.size());
    for (size_t i = 0; i < parity.size(); ++i) {
        out.push_back(ParityShard{static_cast<uint32_t>(i), std::move(parity[i])});
    }
    return R::Ok(std::move(out));
}

Result<std::vector<bytes>> ReedSolomonFecService::recover_tuple(const std::vector<std::optional<bytes>>& members,
                                                                const std::vector<ParityShard>& parity) const {
    using R = Result<std::vector<bytes>>;
    if (members.empty()) {
        return R::Err(ErrorCode::NoBlocksToXor, "Tuple has no member slots");
    }
    size_t shard_len = 0;
    BRIGHTCHAIN_TRY(check_parity(parity, members.size(), shard_len));

    const size_t k = members.size();
    std::vector<size_t> lost;
    for (size_t i = 0; i < k; ++i) {
        if (!members[i]) {
            lost.push_back(i);
        } else if (members[i]->size() != shard_len) {
            return R::Err(ErrorCode::InvalidParityBlockSize,
                "Parity blocks have " + std::to_string(shard_len) + " bytes, tuple members " +
                std::to_string(members[i]->size()));
        }
    }
    if (lost.empty()) {
        return R::Err(ErrorCode::DamagedBlockRequired, "No tuple member is missing");
    }
    if (lost.size() > parity.size()) {
        return R::Err(ErrorCode::RecoveryFailedInsufficientParityData,
            std::to_string(lost.size()) + " missing members but only " + std::to_string(parity.size()) +
            " parity blocks");
    }

    const Matrix matrix = cauchy_matrix(k, parity_rows(parity));

    // Pick k surviving shards: every present member, then parity in the order given
    Matrix selected;
    selected.reserve(k * k);
    std::vector<const bytes*> sources;
    sources.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        if (members[i]) {
            selected.insert(selected.end(), matrix.begin() + static_cast<std::ptrdiff_t>(i * k),
                            matrix.begin() + static_cast<std::ptrdiff_t>((i + 1) * k));
            sources.push_back(&*members[i]);
        }
    }
    for (const auto& shard : parity) {
        if (sources.size() == k) {
            break;
        }
        const size_t row = k + shard.index;
        selected.insert(selected.end(), matrix.begin() + static_cast<std::ptrdiff_t>(row * k),
                        matrix.begin() + static_cast<std::ptrdiff_t>((row + 1) * k));
        sources.push_back(&shard.data);
    }

    Matrix inverse(k * k);
    if (gf_invert_matrix(selected.data(), inverse.data(), static_cast<int>(k)) < 0) {
        return R::Err(ErrorCode::RecoveryFailedInsufficientParityData,
            "Surviving shards do not determine the tuple (duplicate parity index?)");
    }

    // Rows of the inverse that produce the lost members
    Matrix decode_rows;
    decode_rows.reserve(lost.size() * k);
    for (size_t index : lost) {
        decode_rows.insert(decode_rows.end(), inverse.begin() + static_cast<std::ptrdiff_t>(index * k),
                           inverse.begin() + static_cast<std::ptrdiff_t>((index + 1) * k));
    }
    auto rebuilt = apply_rows(decode_rows, lost.size(), sources, shard_len);

    std::vector<bytes> out;
    out.reserve(k);
    size_t next = 0;
    for (size_t i = 0; i < k; ++i) {
        if (members[i]) {
            out.push_back(*members[i]);
        } else {
            out.push_back(std::move(rebuilt[next++]));
        }
    }
    BRIGHTCHAIN_LOG_DEBUG("Recovered {} of {} tuple members from parity", lost.size(), k);
    return R::Ok(std::move(out));
}

} // namespace brightchain::fec
