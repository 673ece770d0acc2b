#pragma once

#include "blocks/block.hpp"
#include "fec/fec_service.hpp"
#include "utils/config.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace brightchain::services {

/**
 * Tuple whitening and reconstruction by XOR, with FEC fallback
 */
class XorTupleService {
public:
    explicit XorTupleService(const utils::EngineSettings& settings,
                             std::shared_ptr<const fec::IFecProvider> fec = nullptr);

    size_t tuple_size() const { return tuple_size_; }

    /**
     * @return Ok, InvalidTupleSize outside [min, max]
     */
    Result<void> validate_tuple_size(size_t size) const;

    /**
     * XOR of every member payload
     * @return Whitened block, NoBlocksToXor when empty, BlockSizeMismatch on mixed sizes
     */
    Result<blocks::Block> whiten(const std::vector<blocks::Block>& tuple) const;

    /**
     * Missing member from the whitened result and the other members
     * @return InvalidTupleSize unless known holds exactly tuple_size() - 1 members
     */
    Result<blocks::Block> reconstruct(const std::vector<blocks::Block>& known, const blocks::Block& whitened,
                                      blocks::BlockType type = blocks::BlockType::RawData) const;

    /**
     * Build [data ^ r1 ^ .. ^ r(n-1), r1, .., r(n-1)] for the configured tuple size
     * The data block is zero-padded to its size class first.
     */
    Result<std::vector<blocks::Block>> make_tuple_blocks(const blocks::Block& data) const;

    /**
     * Inverse of make_tuple_blocks
     */
    Result<blocks::Block> unwhiten(const blocks::Block& whitened, const std::vector<blocks::Block>& randomizers) const;

    /**
     * unwhiten for a tuple size declared elsewhere, such as a CBL header
     */
    Result<blocks::Block> unwhiten(const blocks::Block& whitened, const std::vector<blocks::Block>& randomizers,
                                   size_t tuple_size) const;

    /**
     * Fill missing tuple members
     * One missing member with the XOR parity present is reconstructed directly,
     * anything else goes to the FEC provider.
     * @return All members in order
     */
    Result<std::vector<bytes>> recover_with_fec(const std::vector<std::optional<bytes>>& members,
                                                const std::optional<bytes>& xor_parity,
                                                const std::vector<fec::ParityShard>& fec_parity) const;

private:
    Result<blocks::Block> reconstruct_member(const std::vector<blocks::Block>& known, const blocks::Block& whitened,
                                             size_t tuple_size, blocks::BlockType type) const;

    size_t tuple_size_;
    size_t tuple_min_size_;
    size_t tuple_max_size_;
    std::shared_ptr<const fec::IFecProvider> fec_;
};

} // namespace brightchain::services
