#include "block.hpp"
#include "crypto/sha3.hpp"

namespace brightchain::blocks {

Result<Block> Block::create(BlockSize size, BlockType type, bytes data) {
    if (size == BlockSize::Unknown) {
        return Result<Block>::Err(ErrorCode::InvalidBlockSize, "Block size class is unknown");
    }
    if (data.size() > block_size_bytes(size)) {
        return Result<Block>::Err(ErrorCode::DataTooLarge,
            std::to_string(data.size()) + " bytes exceed " + block_size_name(size) + " block");
    }
    return Result<Block>::Ok(Block(size, type, std::move(data)));
}

Checksum Block::checksum() const {
    return Checksum(crypto::Sha3::hash512(data_));
}

bytes Block::padded() const {
    bytes out = data_;
    out.resize(block_size_bytes(size_), 0);
    return out;
}

} // namespace brightchain::blocks
