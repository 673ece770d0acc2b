#include "checksum_service.hpp"
#include "crypto/sha3.hpp"
#include <vector>

namespace brightchain::services {

Checksum ChecksumService::calculate(const bytes& data) const {
    return calculate(data.data(), data.size());
}

Checksum ChecksumService::calculate(const byte* data, size_t len) const {
    return Checksum(crypto::Sha3::hash512(data, len));
}

Result<Checksum> ChecksumService::calculate_stream(std::istream& in) const {
    crypto::Sha3_512Hasher hasher;
    std::vector<char> chunk(STREAM_CHUNK_SIZE);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            hasher.update(reinterpret_cast<const byte*>(chunk.data()), static_cast<size_t>(got));
        }
    }
    if (in.bad()) {
        return Result<Checksum>::Err(ErrorCode::InvalidArgument, "Stream read failed");
    }
    return Result<Checksum>::Ok(Checksum(hasher.finalize()));
}

bool ChecksumService::validate(const bytes& data, const Checksum& checksum) const {
    return calculate(data) == checksum;
}

} // namespace brightchain::services
