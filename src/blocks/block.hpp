#pragma once

#include "block_size.hpp"
#include "block_type.hpp"

namespace brightchain::blocks {

/**
 * Immutable block: size class, type and payload
 * The payload never exceeds the size class.
 */
class Block {
public:
    /**
     * @return Block, DataTooLarge when data exceeds the size class,
     *         InvalidBlockSize for Unknown
     */
    static Result<Block> create(BlockSize size, BlockType type, bytes data);

    BlockSize size() const { return size_; }
    BlockType type() const { return type_; }
    const bytes& data() const { return data_; }
    uint32_t capacity() const { return block_size_bytes(size_); }

    /**
     * SHA3-512 of the payload, recomputed on every call
     */
    Checksum checksum() const;

    /**
     * Payload zero-padded to the full block size
     */
    bytes padded() const;

private:
    Block(BlockSize size, BlockType type, bytes data)
        : size_(size), type_(type), data_(std::move(data)) {}

    BlockSize size_;
    BlockType type_;
    bytes data_;
};

} // namespace brightchain::blocks
