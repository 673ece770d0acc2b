#pragma once

#include "brightchain/error.hpp"
#include <string>
#include <vector>

namespace brightchain::storage {

/**
 * Locator for a whitened CBL stored as two blocks
 *
 * magnet:?xt=urn:brightchain:cbl&bs=<blockSize>&b1=<hex>&b2=<hex>[&p1=<hex,...>][&p2=<hex,...>][&enc=1]
 */
struct CblMagnet {
    uint32_t block_size = 0;
    Checksum block1;
    Checksum block2;
    std::vector<Checksum> block1_parity;
    std::vector<Checksum> block2_parity;
    bool encrypted = false;

    std::string to_uri() const;

    /**
     * Parse a magnet URI; unknown parameters are ignored
     * @return Components, or InvalidMagnetURL, InvalidMagnetURLXT, InvalidMagnetURLMissing,
     *         InvalidMagnetURLInvalidBlockSize
     */
    static Result<CblMagnet> parse(const std::string& uri);

    bool operator==(const CblMagnet& other) const;
};

} // namespace brightchain::storage
