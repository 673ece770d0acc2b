#pragma once

#include "brightchain/error.hpp"
#include <optional>
#include <vector>

namespace brightchain::fec {

/**
 * One parity shard; index is its position among the parity rows
 */
struct ParityShard {
    uint32_t index = 0;
    bytes data;
};

/**
 * Erasure coding collaborator used by tuple recovery and the block store
 */
class IFecProvider {
public:
    virtual ~IFecProvider() = default;

    /**
     * Parity for a single block
     * @return parity_count shards, ParityBlocksRequired when parity_count is 0
     */
    virtual Result<std::vector<ParityShard>> encode(const bytes& block, size_t parity_count) const = 0;

    /**
     * Rebuild a single block from its parity; a damaged copy is treated as erased
     */
    virtual Result<bytes> recover(const std::optional<bytes>& damaged, const std::vector<ParityShard>& parity,
                                  size_t block_size) const = 0;

    /**
     * Parity across the members of a tuple (the data shards)
     */
    virtual Result<std::vector<ParityShard>> encode_tuple(const std::vector<bytes>& members,
                                                          size_t parity_count) const = 0;

    /**
     * Rebuild the missing tuple members
     * @return All members in order
     */
    virtual Result<std::vector<bytes>> recover_tuple(const std::vector<std::optional<bytes>>& members,
                                                     const std::vector<ParityShard>& parity) const = 0;
};

/**
 * Reed-Solomon implementation of IFecProvider on ISA-L
 *
 * Systematic code with a Cauchy parity matrix over GF(2^8). Parity shard i
 * is row k+i of the matrix, so any k of k+p shards rebuild the data.
 */
class ReedSolomonFecService : public IFecProvider {
public:
    Result<std::vector<ParityShard>> encode(const bytes& block, size_t parity_count) const override;
    Result<bytes> recover(const std::optional<bytes>& damaged, const std::vector<ParityShard>& parity,
                          size_t block_size) const override;
    Result<std::vector<ParityShard>> encode_tuple(const std::vector<bytes>& members,
                                                  size_t parity_count) const override;
    Result<std::vector<bytes>> recover_tuple(const std::vector<std::optional<bytes>>& members,
                                             const std::vector<ParityShard>& parity) const override;
};

} // namespace brightchain::fec
