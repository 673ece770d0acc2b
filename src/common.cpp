#include "brightchain/common.hpp"
#include "brightchain/error.hpp"
#include "crypto/random.hpp"
#include <algorithm>

namespace brightchain {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const byte* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const bytes& data) {
    return to_hex(data.data(), data.size());
}

Result<bytes> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Result<bytes>::Err(ErrorCode::InvalidHexStringLength,
                                  "Hex string has odd length " + std::to_string(hex.size()));
    }

    bytes out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return Result<bytes>::Err(ErrorCode::InvalidHexString,
                                      "Non-hex character at offset " + std::to_string(i * 2));
        }
        out[i] = static_cast<byte>((hi << 4) | lo);
    }
    return Result<bytes>::Ok(std::move(out));
}

void xor_into(bytes& dst, const bytes& src) {
    if (dst.size() != src.size()) {
        throw BrightChainException(ErrorCode::BlockSizeMismatch,
            "XOR operands differ in length: " + std::to_string(dst.size()) + " and " + std::to_string(src.size()));
    }
    for (size_t i = 0; i < dst.size(); ++i) {
        dst[i] ^= src[i];
    }
}

bytes xor_bytes(const bytes& a, const bytes& b) {
    bytes out = a;
    xor_into(out, b);
    return out;
}

// Checksum implementation
std::string Checksum::to_hex() const {
    return brightchain::to_hex(value.data(), value.size());
}

Result<Checksum> Checksum::from_hex(const std::string& hex) {
    if (hex.size() != constants::CHECKSUM_HEX_LENGTH) {
        return Result<Checksum>::Err(ErrorCode::InvalidHexStringLength,
            "Checksum hex must be " + std::to_string(constants::CHECKSUM_HEX_LENGTH) +
            " characters, got " + std::to_string(hex.size()));
    }
    BRIGHTCHAIN_TRY_UNWRAP(raw, brightchain::from_hex(hex));
    return from_bytes(raw.data(), raw.size());
}

Result<Checksum> Checksum::from_bytes(const byte* data, size_t len) {
    if (len != constants::CHECKSUM_LENGTH) {
        return Result<Checksum>::Err(ErrorCode::InvalidArgument,
            "Checksum must be " + std::to_string(constants::CHECKSUM_LENGTH) + " bytes");
    }
    Checksum checksum;
    std::copy(data, data + len, checksum.value.begin());
    return Result<Checksum>::Ok(checksum);
}

// MemberId implementation
std::string MemberId::to_string() const {
    return brightchain::to_hex(id.data(), id.size());
}

Result<MemberId> MemberId::from_string(const std::string& str) {
    if (str.size() != constants::MEMBER_ID_LENGTH * 2) {
        return Result<MemberId>::Err(ErrorCode::InvalidHexStringLength, "Member id must be 32 hex characters");
    }
    BRIGHTCHAIN_TRY_UNWRAP(raw, brightchain::from_hex(str));
    MemberId member_id;
    std::copy(raw.begin(), raw.end(), member_id.id.begin());
    return Result<MemberId>::Ok(member_id);
}

MemberId MemberId::generate() {
    MemberId member_id;
    crypto::Random::generate_into(member_id.id.data(), member_id.id.size());
    // RFC 4122 version 4, variant 1
    member_id.id[6] = static_cast<byte>((member_id.id[6] & 0x0F) | 0x40);
    member_id.id[8] = static_cast<byte>((member_id.id[8] & 0x3F) | 0x80);
    return member_id;
}

} // namespace brightchain
