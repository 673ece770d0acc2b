#pragma once

#include "brightchain/error.hpp"

namespace brightchain::blocks {

/**
 * What a stored block holds
 */
enum class BlockType : uint8_t {
    RawData,
    Random,
    Whitened,
    MultiEncrypted,
    ConstituentBlockList,
    ExtendedConstituentBlockList,
    SuperConstituentBlockList
};

const char* block_type_name(BlockType type);

/**
 * Discriminator in byte 1 of a structured block; 0x05 is retired
 */
enum class StructuredBlockType : uint8_t {
    ConstituentBlockList = 0x02,
    SuperConstituentBlockList = 0x03,
    ExtendedConstituentBlockList = 0x04,
    MultiEncrypted = 0x06,
    VaultConstituentBlockList = 0x07
};

struct StructuredPrefix {
    StructuredBlockType type;
    uint8_t version;
};

/**
 * [0xBC][type][version][crc8 of the first three bytes]
 */
fixed_bytes<constants::block_header::PREFIX_SIZE> make_structured_prefix(
    StructuredBlockType type, uint8_t version = constants::block_header::VERSION);

/**
 * Parse and check a structured prefix
 * @return Prefix fields, InvalidBlockHeader on bad magic, unknown type or CRC mismatch
 */
Result<StructuredPrefix> parse_structured_prefix(const byte* data, size_t len);
Result<StructuredPrefix> parse_structured_prefix(const bytes& data);

} // namespace brightchain::blocks
