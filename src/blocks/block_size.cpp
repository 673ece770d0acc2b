#include "block_size.hpp"

namespace brightchain::blocks {

bool is_valid_block_size(uint32_t length) {
    return block_size_from_length(length) != BlockSize::Unknown;
}

BlockSize block_size_from_length(uint32_t length) {
    switch (length) {
        case static_cast<uint32_t>(BlockSize::Message): return BlockSize::Message;
        case static_cast<uint32_t>(BlockSize::Tiny): return BlockSize::Tiny;
        case static_cast<uint32_t>(BlockSize::Small): return BlockSize::Small;
        case static_cast<uint32_t>(BlockSize::Medium): return BlockSize::Medium;
        case static_cast<uint32_t>(BlockSize::Large): return BlockSize::Large;
        case static_cast<uint32_t>(BlockSize::Huge): return BlockSize::Huge;
        default: return BlockSize::Unknown;
    }
}

const char* block_size_name(BlockSize size) {
    switch (size) {
        case BlockSize::Unknown: return "Unknown";
        case BlockSize::Message: return "Message";
        case BlockSize::Tiny: return "Tiny";
        case BlockSize::Small: return "Small";
        case BlockSize::Medium: return "Medium";
        case BlockSize::Large: return "Large";
        case BlockSize::Huge: return "Huge";
    }
    return "Unknown";
}

} // namespace brightchain::blocks
