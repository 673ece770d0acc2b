#include "sha3.hpp"

namespace brightchain::crypto {

namespace {
    template<size_t N>
    fixed_bytes<N> digest(const EVP_MD* md, const byte* data, size_t len) {
        fixed_bytes<N> out;
        unsigned int out_len = 0;
        detail::ensure(EVP_Digest(data, len, out.data(), &out_len, md, nullptr) == 1 && out_len == N,
                       "SHA3 digest failed");
        return out;
    }
}

ChecksumBytes Sha3::hash512(const byte* data, size_t len) {
    return digest<constants::CHECKSUM_LENGTH>(EVP_sha3_512(), data, len);
}

ChecksumBytes Sha3::hash512(const bytes& data) {
    return hash512(data.data(), data.size());
}

fixed_bytes<32> Sha3::hash256(const byte* data, size_t len) {
    return digest<32>(EVP_sha3_256(), data, len);
}

fixed_bytes<32> Sha3::hash256(const bytes& data) {
    return hash256(data.data(), data.size());
}

Sha3_512Hasher::Sha3_512Hasher() : ctx_(EVP_MD_CTX_new()) {
    detail::ensure(ctx_ != nullptr, "SHA3 context allocation failed");
    detail::ensure(EVP_DigestInit_ex(ctx_.get(), EVP_sha3_512(), nullptr) == 1, "SHA3 init failed");
}

void Sha3_512Hasher::update(const byte* data, size_t len) {
    detail::ensure(!finalized_, "SHA3 hasher already finalized");
    if (len > 0) {
        detail::ensure(EVP_DigestUpdate(ctx_.get(), data, len) == 1, "SHA3 update failed");
    }
}

ChecksumBytes Sha3_512Hasher::finalize() {
    detail::ensure(!finalized_, "SHA3 hasher already finalized");
    ChecksumBytes out;
    unsigned int out_len = 0;
    detail::ensure(EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) == 1, "SHA3 final failed");
    finalized_ = true;
    return out;
}

} // namespace brightchain::crypto
