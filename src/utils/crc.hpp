#pragma once

#include "brightchain/common.hpp"

namespace brightchain::utils {

/**
 * CRC-8, polynomial 0x07, init 0x00, no reflection
 * Guards the structured block prefix.
 */
uint8_t crc8(const byte* data, size_t len);
uint8_t crc8(const bytes& data);

/**
 * CRC-16/CCITT-FALSE, polynomial 0x1021, init 0xFFFF
 * Guards the multi-recipient plaintext.
 */
uint16_t crc16(const byte* data, size_t len);
uint16_t crc16(const bytes& data);

} // namespace brightchain::utils
