#include "bip32.hpp"
#include "secp256k1.hpp"
#include "openssl_utils.hpp"
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <algorithm>

namespace brightchain::crypto {

using detail::ensure;

namespace {
    constexpr const char* MASTER_KEY = "Bitcoin seed";

    fixed_bytes<64> hmac_sha512(const byte* key, size_t key_len, const bytes& data) {
        fixed_bytes<64> out;
        unsigned int out_len = 0;
        ensure(HMAC(EVP_sha512(), key, static_cast<int>(key_len), data.data(), data.size(),
                    out.data(), &out_len) != nullptr && out_len == out.size(),
               "HMAC-SHA512 failed");
        return out;
    }

    HdKey split(const fixed_bytes<64>& digest, const PrivateKeyBytes& key, uint8_t depth, uint32_t index) {
        HdKey out;
        out.private_key = key;
        std::copy(digest.begin() + 32, digest.end(), out.chain_code.begin());
        out.depth = depth;
        out.index = index;
        return out;
    }
}

bytes HdKey::public_key(bool compressed) const {
    return Secp256k1::public_key(private_key, compressed);
}

Result<HdKey> Bip32::master_from_seed(const bytes& seed) {
    if (seed.size() < 16 || seed.size() > 64) {
        return Result<HdKey>::Err(ErrorCode::InvalidArgument, "Seed must be 16 to 64 bytes");
    }
    auto digest = hmac_sha512(reinterpret_cast<const byte*>(MASTER_KEY), std::char_traits<char>::length(MASTER_KEY),
                              seed);
    PrivateKeyBytes key;
    std::copy(digest.begin(), digest.begin() + 32, key.begin());
    if (!Secp256k1::is_valid_private_key(key)) {
        OPENSSL_cleanse(digest.data(), digest.size());
        return Result<HdKey>::Err(ErrorCode::InvalidPrivateKey, "Seed yields an invalid master key");
    }
    HdKey master = split(digest, key, 0, 0);
    OPENSSL_cleanse(digest.data(), digest.size());
    OPENSSL_cleanse(key.data(), key.size());
    return Result<HdKey>::Ok(master);
}

Result<HdKey> Bip32::derive_child(const HdKey& parent, uint32_t index) {
    bytes data;
    data.reserve(37);
    if (index >= HARDENED_OFFSET) {
        data.push_back(0x00);
        data.insert(data.end(), parent.private_key.begin(), parent.private_key.end());
    } else {
        data = parent.public_key(true);
    }
    for (int shift = 24; shift >= 0; shift -= 8) {
        data.push_back(static_cast<byte>(index >> shift));
    }

    auto digest = hmac_sha512(parent.chain_code.data(), parent.chain_code.size(), data);
    OPENSSL_cleanse(data.data(), data.size());

    PrivateKeyBytes tweak;
    std::copy(digest.begin(), digest.begin() + 32, tweak.begin());
    auto child_key = Secp256k1::add_private_keys(tweak, parent.private_key);
    OPENSSL_cleanse(tweak.data(), tweak.size());
    if (!child_key) {
        OPENSSL_cleanse(digest.data(), digest.size());
        return Result<HdKey>::Err(ErrorCode::InvalidPrivateKey,
            "Child index " + std::to_string(index) + " yields an invalid key");
    }

    HdKey child = split(digest, *child_key, static_cast<uint8_t>(parent.depth + 1), index);
    OPENSSL_cleanse(digest.data(), digest.size());
    OPENSSL_cleanse(child_key->data(), child_key->size());
    return Result<HdKey>::Ok(child);
}

Result<HdKey> Bip32::derive_path(const HdKey& master, const std::string& path) {
    if (path.empty() || path[0] != 'm') {
        return Result<HdKey>::Err(ErrorCode::InvalidDerivationPath, "Path must start with 'm': " + path);
    }
    HdKey current = master;
    size_t pos = 1;
    while (pos < path.size()) {
        if (path[pos] != '/') {
            return Result<HdKey>::Err(ErrorCode::InvalidDerivationPath, "Expected '/' in path: " + path);
        }
        ++pos;
        uint64_t value = 0;
        size_t digits = 0;
        while (pos < path.size() && path[pos] >= '0' && path[pos] <= '9') {
            value = value * 10 + static_cast<uint64_t>(path[pos] - '0');
            if (value >= HARDENED_OFFSET) {
                return Result<HdKey>::Err(ErrorCode::InvalidDerivationPath, "Path index out of range: " + path);
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return Result<HdKey>::Err(ErrorCode::InvalidDerivationPath, "Empty path component: " + path);
        }
        uint32_t index = static_cast<uint32_t>(value);
        if (pos < path.size() && (path[pos] == '\'' || path[pos] == 'h' || path[pos] == 'H')) {
            index += HARDENED_OFFSET;
            ++pos;
        }
        BRIGHTCHAIN_TRY_UNWRAP(child, derive_child(current, index));
        current = child;
    }
    return Result<HdKey>::Ok(current);
}

} // namespace brightchain::crypto
