#pragma once

#include "brightchain/error.hpp"
#include <istream>
#include <string>

namespace brightchain::services {

/**
 * SHA3-512 content addressing
 */
class ChecksumService {
public:
    static constexpr size_t STREAM_CHUNK_SIZE = 64 * 1024;

    Checksum calculate(const bytes& data) const;
    Checksum calculate(const byte* data, size_t len) const;

    /**
     * Digest a stream incrementally; equals calculate() over the same bytes
     * @return Checksum, InvalidArgument if the stream fails before EOF
     */
    Result<Checksum> calculate_stream(std::istream& in) const;

    /**
     * Recompute and compare
     */
    bool validate(const bytes& data, const Checksum& checksum) const;

    std::string to_hex(const Checksum& checksum) const { return checksum.to_hex(); }
    Result<Checksum> from_hex(const std::string& hex) const { return Checksum::from_hex(hex); }
};

} // namespace brightchain::services
