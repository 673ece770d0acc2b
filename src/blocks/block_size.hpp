#pragma once

#include "brightchain/common.hpp"
#include <string>

namespace brightchain::blocks {

/**
 * Enumerated block sizes, values in bytes
 */
enum class BlockSize : uint32_t {
    Unknown = 0,
    Message = 512,
    Tiny = 1024,
    Small = 4096,
    Medium = 1024 * 1024,
    Large = 64 * 1024 * 1024,
    Huge = 256 * 1024 * 1024
};

inline uint32_t block_size_bytes(BlockSize size) {
    return static_cast<uint32_t>(size);
}

bool is_valid_block_size(uint32_t length);

/**
 * Size class whose byte length equals length exactly, Unknown otherwise
 */
BlockSize block_size_from_length(uint32_t length);

const char* block_size_name(BlockSize size);

} // namespace brightchain::blocks
