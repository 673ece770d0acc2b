#include "block_type.hpp"
#include "utils/crc.hpp"

namespace brightchain::blocks {

namespace {

bool is_known_structured_type(byte type) {
    switch (static_cast<StructuredBlockType>(type)) {
        case StructuredBlockType::ConstituentBlockList:
        case StructuredBlockType::SuperConstituentBlockList:
        case StructuredBlockType::ExtendedConstituentBlockList:
        case StructuredBlockType::MultiEncrypted:
        case StructuredBlockType::VaultConstituentBlockList:
            return true;
    }
    return false;
}

} // namespace

const char* block_type_name(BlockType type) {
    switch (type) {
        case BlockType::RawData: return "RawData";
        case BlockType::Random: return "Random";
        case BlockType::Whitened: return "Whitened";
        case BlockType::MultiEncrypted: return "MultiEncrypted";
        case BlockType::ConstituentBlockList: return "ConstituentBlockList";
        case BlockType::ExtendedConstituentBlockList: return "ExtendedConstituentBlockList";
        case BlockType::SuperConstituentBlockList: return "SuperConstituentBlockList";
    }
    return "Unknown";
}

fixed_bytes<constants::block_header::PREFIX_SIZE> make_structured_prefix(StructuredBlockType type, uint8_t version) {
    fixed_bytes<constants::block_header::PREFIX_SIZE> prefix{};
    prefix[0] = constants::block_header::MAGIC_PREFIX;
    prefix[1] = static_cast<byte>(type);
    prefix[2] = version;
    prefix[3] = utils::crc8(prefix.data(), 3);
    return prefix;
}

Result<StructuredPrefix> parse_structured_prefix(const byte* data, size_t len) {
    if (len < constants::block_header::PREFIX_SIZE) {
        return Result<StructuredPrefix>::Err(ErrorCode::InvalidBlockHeader, "Block too short for structured prefix");
    }
    if (data[0] != constants::block_header::MAGIC_PREFIX) {
        return Result<StructuredPrefix>::Err(ErrorCode::InvalidBlockHeader, "Missing structured block magic");
    }
    if (!is_known_structured_type(data[1])) {
        return Result<StructuredPrefix>::Err(ErrorCode::InvalidBlockHeader,
            "Unknown structured block type " + std::to_string(data[1]));
    }
    if (utils::crc8(data, 3) != data[3]) {
        return Result<StructuredPrefix>::Err(ErrorCode::InvalidBlockHeader, "Structured prefix CRC mismatch");
    }
    return Result<StructuredPrefix>::Ok(StructuredPrefix{static_cast<StructuredBlockType>(data[1]), data[2]});
}

Result<StructuredPrefix> parse_structured_prefix(const bytes& data) {
    return parse_structured_prefix(data.data(), data.size());
}

} // namespace brightchain::blocks
