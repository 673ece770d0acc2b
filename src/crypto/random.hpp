#pragma once

#include "brightchain/common.hpp"

namespace brightchain::crypto {

/**
 * Random number generation (CSPRNG)
 * Backed by libsodium; initialises the library on first use
 */
class Random {
public:
    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);

    /**
     * Generate random bytes into existing buffer
     * @param buffer Buffer to fill
     * @param size Buffer size
     */
    static void generate_into(byte* buffer, size_t size);

    /**
     * Generate uniform random integer in range [0, upper_bound)
     * @param upper_bound Exclusive upper bound
     * @return Random integer
     */
    static uint32_t uniform(uint32_t upper_bound);
};

} // namespace brightchain::crypto
