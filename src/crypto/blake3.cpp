#include "blake3.hpp"
#include <blake3.h>

namespace brightchain::crypto {

namespace {
    constexpr const char* KEYSTREAM_CONTEXT = "brightchain 2024 secure-buffer keystream";
}

fixed_bytes<32> Blake3::hash(const bytes& data) {
    fixed_bytes<32> result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

bytes Blake3::keystream(const fixed_bytes<16>& instance_id, size_t length) {
    bytes out(length);
    blake3_hasher hasher;
    blake3_hasher_init_derive_key(&hasher, KEYSTREAM_CONTEXT);
    blake3_hasher_update(&hasher, instance_id.data(), instance_id.size());
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return out;
}

} // namespace brightchain::crypto
