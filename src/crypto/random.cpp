#include "random.hpp"
#include "brightchain/error.hpp"
#include <sodium.h>

namespace brightchain::crypto {

namespace {
    void ensure_sodium() {
        static const bool initialized = [] {
            if (sodium_init() < 0) {
                throw CryptoException(ErrorCode::CryptoOperationFailed, "Failed to initialize libsodium");
            }
            return true;
        }();
        BRIGHTCHAIN_UNUSED(initialized);
    }
}

bytes Random::generate(size_t size) {
    bytes result(size);
    generate_into(result.data(), size);
    return result;
}

void Random::generate_into(byte* buffer, size_t size) {
    ensure_sodium();
    if (size > 0) {
        randombytes_buf(buffer, size);
    }
}

uint32_t Random::uniform(uint32_t upper_bound) {
    ensure_sodium();
    return randombytes_uniform(upper_bound);
}

} // namespace brightchain::crypto
