// EC_KEY and ECDSA_do_sign are deprecated in OpenSSL 3 but still the raw-scalar signing API
#define OPENSSL_SUPPRESS_DEPRECATED

#include "secp256k1.hpp"
#include "openssl_utils.hpp"
#include "random.hpp"
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <algorithm>

namespace brightchain::crypto {

using detail::ensure;
using detail::UniqueBignum;
using detail::UniqueBnCtx;
using detail::UniqueEcGroup;
using detail::UniqueEcPoint;

namespace {

struct EcKeyDeleter {
    void operator()(EC_KEY* key) const noexcept { EC_KEY_free(key); }
};

struct EcdsaSigDeleter {
    void operator()(ECDSA_SIG* sig) const noexcept { ECDSA_SIG_free(sig); }
};

using UniqueEcKey = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using UniqueEcdsaSig = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

/**
 * Curve group and constants, built once and shared read-only by every operation
 */
struct CurveParams {
    UniqueEcGroup group;
    UniqueBignum order;
    UniqueBignum half_order;
    UniqueBignum field;

    CurveParams()
        : group(EC_GROUP_new_by_curve_name(NID_secp256k1)),
          order(BN_new()),
          half_order(BN_new()),
          field(BN_new()) {
        ensure(group && order && half_order && field, "secp256k1 group allocation failed");
        UniqueBnCtx ctx(BN_CTX_new());
        ensure(ctx != nullptr, "BN_CTX allocation failed");
        ensure(EC_GROUP_get_order(group.get(), order.get(), ctx.get()) == 1, "secp256k1 order unavailable");
        ensure(EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr, ctx.get()) == 1,
               "secp256k1 field unavailable");
        ensure(BN_rshift1(half_order.get(), order.get()) == 1, "BN shift failed");
    }
};

const CurveParams& curve_params() {
    static const CurveParams params;
    return params;
}

// Shared curve plus a scratch context for one operation; BN_CTX is not thread safe
struct Curve {
    const EC_GROUP* group;
    const BIGNUM* order;
    const BIGNUM* field;
    UniqueBnCtx ctx;

    Curve()
        : group(curve_params().group.get()),
          order(curve_params().order.get()),
          field(curve_params().field.get()),
          ctx(BN_CTX_new()) {
        ensure(ctx != nullptr, "BN_CTX allocation failed");
    }

    UniqueEcPoint new_point() const {
        UniqueEcPoint point(EC_POINT_new(group));
        ensure(point != nullptr, "EC point allocation failed");
        return point;
    }
};

UniqueBignum new_bn() {
    UniqueBignum bn(BN_new());
    ensure(bn != nullptr, "BIGNUM allocation failed");
    return bn;
}

UniqueBignum bn_from(const byte* data, size_t len) {
    UniqueBignum bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    ensure(bn != nullptr, "BIGNUM conversion failed");
    return bn;
}

fixed_bytes<32> bn_to_32(const BIGNUM* bn) {
    fixed_bytes<32> out{};
    ensure(BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) == 32, "BIGNUM export failed");
    return out;
}

bool scalar_in_range(const BIGNUM* k) {
    return !BN_is_zero(k) && BN_cmp(k, curve_params().order.get()) < 0;
}

bytes encode_point(const Curve& curve, const EC_POINT* point, bool compressed) {
    const auto form = compressed ? POINT_CONVERSION_COMPRESSED : POINT_CONVERSION_UNCOMPRESSED;
    size_t len = EC_POINT_point2oct(curve.group, point, form, nullptr, 0, curve.ctx.get());
    ensure(len > 0, "EC point encoding failed");
    bytes out(len);
    ensure(EC_POINT_point2oct(curve.group, point, form, out.data(), out.size(), curve.ctx.get()) == len,
           "EC point encoding failed");
    return out;
}

UniqueEcPoint decode_point(const Curve& curve, const byte* data, size_t len) {
    bytes encoded;
    if (len == constants::ecies::RAW_PUBLIC_KEY_LENGTH) {
        encoded.reserve(constants::ecies::PUBLIC_KEY_LENGTH);
        encoded.push_back(constants::ecies::PUBLIC_KEY_MAGIC);
        encoded.insert(encoded.end(), data, data + len);
    } else if ((len == constants::ecies::PUBLIC_KEY_LENGTH && data[0] == constants::ecies::PUBLIC_KEY_MAGIC) ||
               (len == constants::ecies::COMPRESSED_PUBLIC_KEY_LENGTH && (data[0] == 0x02 || data[0] == 0x03))) {
        encoded.assign(data, data + len);
    } else {
        return nullptr;
    }

    UniqueEcPoint point = curve.new_point();
    if (EC_POINT_oct2point(curve.group, point.get(), encoded.data(), encoded.size(), curve.ctx.get()) != 1) {
        ERR_clear_error();
        return nullptr;
    }
    if (EC_POINT_is_at_infinity(curve.group, point.get()) ||
        EC_POINT_is_on_curve(curve.group, point.get(), curve.ctx.get()) != 1) {
        ERR_clear_error();
        return nullptr;
    }
    return point;
}

} // namespace

PrivateKeyBytes Secp256k1::generate_private_key() {
    PrivateKeyBytes key;
    do {
        Random::generate_into(key.data(), key.size());
    } while (!is_valid_private_key(key));
    return key;
}

bool Secp256k1::is_valid_private_key(const PrivateKeyBytes& private_key) {
    UniqueBignum k = bn_from(private_key.data(), private_key.size());
    return scalar_in_range(k.get());
}

bytes Secp256k1::public_key(const PrivateKeyBytes& private_key, bool compressed) {
    Curve curve;
    UniqueBignum d = bn_from(private_key.data(), private_key.size());
    if (!scalar_in_range(d.get())) {
        throw CryptoException(ErrorCode::InvalidPrivateKey, "Private key out of range");
    }
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);
    UniqueEcPoint q = curve.new_point();
    ensure(EC_POINT_mul(curve.group, q.get(), d.get(), nullptr, nullptr, curve.ctx.get()) == 1,
           "EC scalar multiplication failed");
    return encode_point(curve, q.get(), compressed);
}

std::optional<bytes> Secp256k1::normalize_public_key(const byte* data, size_t len) {
    if (data == nullptr || len == 0) {
        return std::nullopt;
    }
    Curve curve;
    UniqueEcPoint point = decode_point(curve, data, len);
    if (!point) {
        return std::nullopt;
    }
    return encode_point(curve, point.get(), false);
}

std::optional<fixed_bytes<32>> Secp256k1::ecdh(const PrivateKeyBytes& private_key, const bytes& public_key) {
    Curve curve;
    UniqueBignum d = bn_from(private_key.data(), private_key.size());
    if (!scalar_in_range(d.get())) {
        throw CryptoException(ErrorCode::InvalidPrivateKey, "Private key out of range");
    }
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);
    if (public_key.empty()) {
        return std::nullopt;
    }
    UniqueEcPoint peer = decode_point(curve, public_key.data(), public_key.size());
    if (!peer) {
        return std::nullopt;
    }

    UniqueEcPoint shared = curve.new_point();
    ensure(EC_POINT_mul(curve.group, shared.get(), nullptr, peer.get(), d.get(), curve.ctx.get()) == 1,
           "ECDH multiplication failed");
    if (EC_POINT_is_at_infinity(curve.group, shared.get())) {
        return std::nullopt;
    }

    UniqueBignum x = new_bn();
    ensure(EC_POINT_get_affine_coordinates(curve.group, shared.get(), x.get(), nullptr, curve.ctx.get()) == 1,
           "ECDH coordinate extraction failed");
    return bn_to_32(x.get());
}

SignatureBytes Secp256k1::sign_digest(const fixed_bytes<32>& digest, const PrivateKeyBytes& private_key) {
    Curve curve;
    UniqueBignum d = bn_from(private_key.data(), private_key.size());
    if (!scalar_in_range(d.get())) {
        throw CryptoException(ErrorCode::InvalidPrivateKey, "Private key out of range");
    }
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);

    UniqueEcKey key(EC_KEY_new());
    ensure(key != nullptr, "EC_KEY allocation failed");
    ensure(EC_KEY_set_group(key.get(), curve.group) == 1, "EC_KEY group setup failed");
    ensure(EC_KEY_set_private_key(key.get(), d.get()) == 1, "EC_KEY private key setup failed");
    UniqueEcPoint q = curve.new_point();
    ensure(EC_POINT_mul(curve.group, q.get(), d.get(), nullptr, nullptr, curve.ctx.get()) == 1,
           "EC scalar multiplication failed");
    ensure(EC_KEY_set_public_key(key.get(), q.get()) == 1, "EC_KEY public key setup failed");
    const bytes expected = encode_point(curve, q.get(), false);

    UniqueEcdsaSig sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), key.get()));
    ensure(sig != nullptr, "ECDSA signing failed");
    const BIGNUM* r = nullptr;
    const BIGNUM* s_raw = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s_raw);

    // Low-s form
    UniqueBignum s = new_bn();
    ensure(BN_copy(s.get(), s_raw) != nullptr, "BN copy failed");
    if (BN_cmp(s.get(), curve_params().half_order.get()) > 0) {
        ensure(BN_sub(s.get(), curve.order, s.get()) == 1, "BN sub failed");
    }

    SignatureBytes signature;
    auto r_bytes = bn_to_32(r);
    auto s_bytes = bn_to_32(s.get());
    std::copy(r_bytes.begin(), r_bytes.end(), signature.begin());
    std::copy(s_bytes.begin(), s_bytes.end(), signature.begin() + 32);

    // The recovery id is whichever candidate yields our own key
    for (byte recovery_id = 0; recovery_id < 4; ++recovery_id) {
        signature[64] = recovery_id;
        auto recovered = recover(digest, signature);
        if (recovered && *recovered == expected) {
            return signature;
        }
    }
    throw CryptoException(ErrorCode::CryptoOperationFailed, "No recovery id reproduces the signing key");
}

std::optional<bytes> Secp256k1::recover(const fixed_bytes<32>& digest, const SignatureBytes& signature) {
    int v = signature[64];
    if (v >= 27) {
        v -= 27;
    }
    if (v < 0 || v > 3) {
        return std::nullopt;
    }

    Curve curve;
    const BIGNUM* n = curve.order;
    BN_CTX* ctx = curve.ctx.get();

    UniqueBignum r = bn_from(signature.data(), 32);
    UniqueBignum s = bn_from(signature.data() + 32, 32);
    if (!scalar_in_range(r.get()) || !scalar_in_range(s.get())) {
        return std::nullopt;
    }

    UniqueBignum x = new_bn();
    ensure(BN_copy(x.get(), r.get()) != nullptr, "BN copy failed");
    if (v & 2) {
        ensure(BN_add(x.get(), x.get(), n) == 1, "BN add failed");
        if (BN_cmp(x.get(), curve.field) >= 0) {
            return std::nullopt;
        }
    }

    UniqueEcPoint big_r = curve.new_point();
    if (EC_POINT_set_compressed_coordinates(curve.group, big_r.get(), x.get(), v & 1, ctx) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    UniqueBignum r_inv(BN_mod_inverse(nullptr, r.get(), n, ctx));
    ensure(r_inv != nullptr, "BN inverse failed");

    // Q = r^-1 (s R - e G)
    UniqueBignum e = bn_from(digest.data(), digest.size());
    UniqueBignum u1 = new_bn();
    UniqueBignum u2 = new_bn();
    ensure(BN_mod_sub(u1.get(), n, e.get(), n, ctx) == 1, "BN sub failed");
    ensure(BN_mod_mul(u1.get(), u1.get(), r_inv.get(), n, ctx) == 1, "BN mul failed");
    ensure(BN_mod_mul(u2.get(), s.get(), r_inv.get(), n, ctx) == 1, "BN mul failed");

    UniqueEcPoint q = curve.new_point();
    ensure(EC_POINT_mul(curve.group, q.get(), u1.get(), big_r.get(), u2.get(), ctx) == 1,
           "EC multiplication failed");
    if (EC_POINT_is_at_infinity(curve.group, q.get())) {
        return std::nullopt;
    }
    return encode_point(curve, q.get(), false);
}

std::optional<PrivateKeyBytes> Secp256k1::add_private_keys(const PrivateKeyBytes& a, const PrivateKeyBytes& b) {
    Curve curve;
    UniqueBignum bn_a = bn_from(a.data(), a.size());
    UniqueBignum bn_b = bn_from(b.data(), b.size());
    if (BN_cmp(bn_a.get(), curve.order) >= 0 || BN_cmp(bn_b.get(), curve.order) >= 0) {
        return std::nullopt;
    }
    UniqueBignum sum = new_bn();
    ensure(BN_mod_add(sum.get(), bn_a.get(), bn_b.get(), curve.order, curve.ctx.get()) == 1,
           "BN add failed");
    if (BN_is_zero(sum.get())) {
        return std::nullopt;
    }
    return bn_to_32(sum.get());
}

} // namespace brightchain::crypto
