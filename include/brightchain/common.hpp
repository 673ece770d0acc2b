#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// BrightChain Engine Version
#define BRIGHTCHAIN_VERSION_MAJOR 0
#define BRIGHTCHAIN_VERSION_MINOR 3
#define BRIGHTCHAIN_VERSION_PATCH 0
#define BRIGHTCHAIN_VERSION_STRING "0.3.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef BRIGHTCHAIN_PLATFORM_WINDOWS
        #define BRIGHTCHAIN_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef BRIGHTCHAIN_PLATFORM_LINUX
        #define BRIGHTCHAIN_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef BRIGHTCHAIN_PLATFORM_MACOS
        #define BRIGHTCHAIN_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define BRIGHTCHAIN_UNUSED(x) (void)(x)
#define BRIGHTCHAIN_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define BRIGHTCHAIN_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define BRIGHTCHAIN_DISALLOW_COPY_AND_MOVE(TypeName) \
    BRIGHTCHAIN_DISALLOW_COPY(TypeName); \
    BRIGHTCHAIN_DISALLOW_MOVE(TypeName)

// Constants
namespace brightchain {
namespace constants {

// Checksum (SHA3-512)
constexpr size_t CHECKSUM_LENGTH = 64;
constexpr size_t CHECKSUM_HEX_LENGTH = CHECKSUM_LENGTH * 2;

// Wire integer sizes
constexpr size_t UINT8_SIZE = 1;
constexpr size_t UINT16_SIZE = 2;
constexpr size_t UINT32_SIZE = 4;
constexpr size_t UINT64_SIZE = 8;
constexpr uint32_t UINT16_MAX_VALUE = 0xFFFF;

// Member identifiers (GUID v4 sized)
constexpr size_t MEMBER_ID_LENGTH = 16;

namespace ecies {
constexpr const char* CURVE_NAME = "secp256k1";
constexpr const char* PRIMARY_KEY_DERIVATION_PATH = "m/44'/60'/0'/0/0";
constexpr size_t MNEMONIC_STRENGTH = 256;
constexpr uint8_t PUBLIC_KEY_MAGIC = 0x04;
constexpr size_t PUBLIC_KEY_LENGTH = 65;
constexpr size_t RAW_PUBLIC_KEY_LENGTH = 64;
constexpr size_t COMPRESSED_PUBLIC_KEY_LENGTH = 33;
constexpr size_t PRIVATE_KEY_LENGTH = 32;
constexpr size_t SIGNATURE_LENGTH = 65;
constexpr size_t ADDRESS_LENGTH = 20;
constexpr size_t IV_LENGTH = 16;
constexpr size_t AUTH_TAG_LENGTH = 16;
constexpr size_t SYMMETRIC_KEY_LENGTH = 32;
constexpr size_t OVERHEAD_LENGTH = PUBLIC_KEY_LENGTH + IV_LENGTH + AUTH_TAG_LENGTH;  // 97

namespace multiple {
constexpr uint8_t LAYOUT_VERSION = 0x02;
constexpr size_t DATA_LENGTH_SIZE = UINT64_SIZE;
constexpr size_t RECIPIENT_COUNT_SIZE = UINT16_SIZE;
constexpr size_t RECIPIENT_ID_SIZE = MEMBER_ID_LENGTH;
constexpr size_t ENCRYPTED_KEY_SIZE = OVERHEAD_LENGTH + SYMMETRIC_KEY_LENGTH;  // 129
constexpr size_t CRC16_SIZE = UINT16_SIZE;
constexpr size_t MAX_RECIPIENTS = UINT16_MAX_VALUE;
} // namespace multiple
} // namespace ecies

namespace tuple {
constexpr size_t SIZE = 3;
constexpr size_t MIN_SIZE = 2;
constexpr size_t MAX_SIZE = 5;
} // namespace tuple

namespace cbl {
constexpr size_t MAX_FILE_NAME_LENGTH = 255;
constexpr size_t MAX_MIME_TYPE_LENGTH = 127;
constexpr uint64_t MAX_INPUT_FILE_SIZE = 9007199254740991ULL;  // 2^53 - 1
constexpr uint64_t DEFAULT_MAX_NODE_FILE_SIZE = 1ULL << 40;   // 1 TiB
constexpr size_t MIN_ADDRESS_CAPACITY = 4;
constexpr uint32_t MAX_DEPTH = UINT16_MAX_VALUE;
} // namespace cbl

namespace block_header {
constexpr uint8_t MAGIC_PREFIX = 0xBC;
constexpr uint8_t VERSION = 0x01;
constexpr size_t PREFIX_SIZE = 4;
} // namespace block_header

namespace fec {
constexpr size_t DEFAULT_PARITY_COUNT = 2;
constexpr size_t MAX_TOTAL_SHARDS = 256;
} // namespace fec

} // namespace constants
} // namespace brightchain

// Core types
namespace brightchain {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using ChecksumBytes = fixed_bytes<constants::CHECKSUM_LENGTH>;
using PrivateKeyBytes = fixed_bytes<constants::ecies::PRIVATE_KEY_LENGTH>;
using SignatureBytes = fixed_bytes<constants::ecies::SIGNATURE_LENGTH>;
using Address = fixed_bytes<constants::ecies::ADDRESS_LENGTH>;

template<typename T> class Result;

// Content address of a block: SHA3-512 digest
struct Checksum {
    ChecksumBytes value{};

    Checksum() = default;
    explicit Checksum(const ChecksumBytes& digest) : value(digest) {}

    std::string to_hex() const;
    static Result<Checksum> from_hex(const std::string& hex);
    static Result<Checksum> from_bytes(const byte* data, size_t len);

    bytes to_bytes() const { return bytes(value.begin(), value.end()); }

    bool operator==(const Checksum& other) const { return value == other.value; }
    bool operator!=(const Checksum& other) const { return value != other.value; }
    bool operator<(const Checksum& other) const { return value < other.value; }
};

// Member identifier, random GUID v4 layout
struct MemberId {
    fixed_bytes<constants::MEMBER_ID_LENGTH> id{};

    MemberId() = default;
    explicit MemberId(const fixed_bytes<constants::MEMBER_ID_LENGTH>& raw) : id(raw) {}

    std::string to_string() const;
    static Result<MemberId> from_string(const std::string& str);
    static MemberId generate();

    bool operator==(const MemberId& other) const { return id == other.id; }
    bool operator!=(const MemberId& other) const { return id != other.id; }
    bool operator<(const MemberId& other) const { return id < other.id; }
};

// Hex encoding
std::string to_hex(const byte* data, size_t len);
std::string to_hex(const bytes& data);
Result<bytes> from_hex(const std::string& hex);

// XOR helpers; operands of different length throw BrightChainException(BlockSizeMismatch)
void xor_into(bytes& dst, const bytes& src);
bytes xor_bytes(const bytes& a, const bytes& b);

} // namespace brightchain

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<brightchain::Checksum> {
    size_t operator()(const brightchain::Checksum& c) const noexcept {
        // Digest bytes are uniformly distributed, the first 8 suffice
        size_t result = 0;
        for (size_t i = 0; i < sizeof(size_t); ++i) {
            result = (result << 8) | c.value[i];
        }
        return result;
    }
};

template<>
struct hash<brightchain::MemberId> {
    size_t operator()(const brightchain::MemberId& m) const noexcept {
        size_t result = 0;
        for (size_t i = 0; i < sizeof(size_t); ++i) {
            result = (result << 8) | m.id[i];
        }
        return result;
    }
};
} // namespace std
