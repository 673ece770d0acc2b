#pragma once

#include "brightchain/common.hpp"

namespace brightchain::crypto {

/**
 * BLAKE3 wrapper
 */
class Blake3 {
public:
    /**
     * Hash data using BLAKE3
     * @param data The data to hash
     * @return 32-byte hash
     */
    static fixed_bytes<32> hash(const bytes& data);

    /**
     * Keystream from the derive-key mode, keyed by a buffer instance id
     * @param instance_id Random per-instance id
     * @param length Bytes of output (extendable)
     * @return Keystream bytes
     */
    static bytes keystream(const fixed_bytes<16>& instance_id, size_t length);
};

} // namespace brightchain::crypto
